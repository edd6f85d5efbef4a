// Copyright (c) 2025 VAM Live Scribe
#include "app/provider_chain.hpp"
#include "core/logging.hpp"
#include "core/text_utils.hpp"
#include "core/transcript_assembler.hpp"
#include "diar/diarization_reconciler.hpp"

#include <algorithm>

namespace app {

const char* to_string(Strategy strategy) {
    switch (strategy) {
    case Strategy::IntegratedDiarizing: return "integrated-diarizing";
    case Strategy::RecognitionPlusDiarization: return "recognition+diarization";
    case Strategy::RecognitionOnly: return "recognition-only";
    }
    return "unknown";
}

std::optional<Strategy> parse_strategy(const std::string& name) {
    if (name == "scribe" || name == "integrated") return Strategy::IntegratedDiarizing;
    if (name == "whisper+diarizer" || name == "recognition+diarization") return Strategy::RecognitionPlusDiarization;
    if (name == "whisper" || name == "recognition") return Strategy::RecognitionOnly;
    return std::nullopt;
}

// Per-request state: the baseline result is shared between the two baseline strategies
struct ProviderFallbackChain::Request {
    std::string audio_file;
    std::optional<asr::RecognitionResult> baseline;
};

ProviderFallbackChain::ProviderFallbackChain(ChainConfig config,
                                             std::shared_ptr<asr::IRecognizer> diarizing,
                                             std::shared_ptr<asr::IRecognizer> baseline,
                                             std::shared_ptr<diar::IDiarizer> diarizer,
                                             RetryPolicy retry)
    : config_(std::move(config)),
      diarizing_(std::move(diarizing)),
      baseline_(std::move(baseline)),
      diarizer_(std::move(diarizer)),
      retry_(std::move(retry)) {
    for (Strategy s : config_.order) {
        if (std::find(active_.begin(), active_.end(), s) != active_.end()) continue;
        if (is_available(s)) {
            active_.push_back(s);
            continue;
        }
        if (s == Strategy::RecognitionPlusDiarization && baseline_ && baseline_->available()) {
            core::log_warn_once("diarization-unavailable",
                                std::string("[chain] ") + core::to_string(core::ErrorKind::DiarizationUnavailable) +
                                    ": " + (diarizer_ ? diarizer_->name() + " not loaded" : "no diarizer configured"));
        } else {
            core::log_warn_once(std::string("strategy-unavailable-") + to_string(s),
                                std::string("[chain] skipping ") + to_string(s) + ": provider not available");
        }
    }
    std::string order;
    for (Strategy s : active_) order += (order.empty() ? "" : " -> ") + provider_name(s);
    core::log_info("[chain] providers: " + (order.empty() ? std::string("none") : order));
}

bool ProviderFallbackChain::is_available(Strategy strategy) const {
    switch (strategy) {
    case Strategy::IntegratedDiarizing:
        return diarizing_ && diarizing_->available();
    case Strategy::RecognitionPlusDiarization:
        return baseline_ && baseline_->available() && diarizer_ && diarizer_->available();
    case Strategy::RecognitionOnly:
        return baseline_ && baseline_->available();
    }
    return false;
}

std::string ProviderFallbackChain::provider_name(Strategy strategy) const {
    switch (strategy) {
    case Strategy::IntegratedDiarizing:
        return diarizing_ ? diarizing_->name() : to_string(strategy);
    case Strategy::RecognitionPlusDiarization:
        return (baseline_ ? baseline_->name() : std::string("?")) + "+" + (diarizer_ ? diarizer_->name() : std::string("?"));
    case Strategy::RecognitionOnly:
        return baseline_ ? baseline_->name() : to_string(strategy);
    }
    return to_string(strategy);
}

core::Result<asr::RecognitionResult> ProviderFallbackChain::recognize(asr::IRecognizer& recognizer,
                                                                      const std::string& audio_file) {
    return retry_.run<asr::RecognitionResult>(recognizer.name(), [&]() {
        return recognizer.recognize_file(audio_file, config_.language);
    });
}

core::Result<FileTranscription> ProviderFallbackChain::transcribe(const std::string& audio_file) {
    Request request;
    request.audio_file = audio_file;
    std::vector<FallbackEvent> request_events;
    std::vector<std::string> reasons;

    for (size_t i = 0; i < active_.size(); ++i) {
        const Strategy strategy = active_[i];
        const std::string name = provider_name(strategy);
        std::string reason;

        try {
            core::Result<FileTranscription> result = run_strategy(strategy, request);
            if (result.ok()) {
                FileTranscription out = result.take();
                if (out.segments.empty() && core::trim(out.full_text).empty()) {
                    reason = name + " returned empty result";
                } else {
                    out.provider = name;
                    out.fallbacks = request_events;
                    core::log_info("[chain] transcribed with " + name + (out.diarized ? " (diarized)" : ""));
                    return out;
                }
            } else if (result.error().kind == core::ErrorKind::ProviderExhausted) {
                reason = name + " exhausted retries";
            } else {
                reason = name + " failed: " + result.error().message;
            }
        } catch (const std::exception& e) {
            reason = name + " failed: " + e.what();
        }

        reasons.push_back(reason);
        core::log_warn("[chain] " + reason);
        if (i + 1 < active_.size()) {
            FallbackEvent ev{name, provider_name(active_[i + 1]), reason};
            request_events.push_back(ev);
            events_.push_back(ev);
            if (config_.on_fallback) {
                try {
                    config_.on_fallback(ev);
                } catch (const std::exception& e) {
                    core::log_error(std::string("[chain] fallback callback threw: ") + e.what());
                }
            }
        }
    }

    std::string message = active_.empty() ? "no provider available" : "all providers failed";
    for (const auto& r : reasons) message += "; " + r;
    return core::Result<FileTranscription>::fail(core::ErrorKind::AllProvidersExhausted, message);
}

core::Result<FileTranscription> ProviderFallbackChain::run_strategy(Strategy strategy, Request& request) {
    switch (strategy) {
    case Strategy::IntegratedDiarizing: {
        core::Result<asr::RecognitionResult> r = recognize(*diarizing_, request.audio_file);
        if (!r.ok()) return r.error();
        return from_integrated(r.value());
    }
    case Strategy::RecognitionPlusDiarization: {
        if (!request.baseline) {
            core::Result<asr::RecognitionResult> r = recognize(*baseline_, request.audio_file);
            if (!r.ok()) return r.error();
            request.baseline = r.take();
        }
        if (request.baseline->empty()) return from_baseline(*request.baseline, nullptr);

        core::Result<std::vector<core::DiarizationInterval>> intervals = diarizer_->diarize(request.audio_file);
        if (!intervals.ok()) {
            if (intervals.error().kind == core::ErrorKind::DiarizationUnavailable) {
                core::log_warn_once("diarization-unavailable", "[chain] " + intervals.error().describe());
            }
            return intervals.error();
        }
        return from_baseline(*request.baseline, &intervals.value());
    }
    case Strategy::RecognitionOnly: {
        if (!request.baseline) {
            core::Result<asr::RecognitionResult> r = recognize(*baseline_, request.audio_file);
            if (!r.ok()) return r.error();
            request.baseline = r.take();
        } else {
            core::log_debug("[chain] reusing baseline recognition");
        }
        return from_baseline(*request.baseline, nullptr);
    }
    }
    return core::Result<FileTranscription>::fail(core::ErrorKind::RecognitionFailed, "unknown strategy");
}

namespace {
std::vector<core::Word> sorted_words(const std::vector<core::Word>& words) {
    std::vector<core::Word> out = words;
    std::stable_sort(out.begin(), out.end(), [](const core::Word& a, const core::Word& b) { return a.start < b.start; });
    return out;
}

std::vector<core::TranscriptSegment> to_segments(const asr::RecognitionResult& r) {
    std::vector<core::TranscriptSegment> out;
    for (const auto& s : r.segments) {
        const std::string text = core::trim(s.text);
        if (text.empty()) continue;
        core::TranscriptSegment seg;
        seg.text = text;
        seg.start = s.start;
        seg.end = std::max(s.start, s.end);
        seg.confidence = s.confidence;
        out.push_back(seg);
    }
    if (out.empty() && !core::trim(r.text).empty()) {
        core::TranscriptSegment seg;
        seg.text = core::trim(r.text);
        if (!r.words.empty()) {
            seg.start = r.words.front().start;
            seg.end = r.words.back().end;
        }
        seg.confidence = r.confidence();
        out.push_back(seg);
    }
    return out;
}
} // namespace

FileTranscription ProviderFallbackChain::from_integrated(const asr::RecognitionResult& r) const {
    FileTranscription out;
    if (r.words.empty()) {
        out.segments = to_segments(r);
    } else {
        diar::SpeakerSegmenter segmenter(config_.segmenter);
        out.turns = segmenter.segment(sorted_words(r.words));
        for (const auto& turn : out.turns) {
            core::TranscriptSegment seg;
            seg.text = turn.text;
            seg.start = turn.start;
            seg.end = turn.end;
            seg.confidence = r.confidence();
            seg.speaker = turn.speaker_id;
            out.segments.push_back(seg);
        }
        out.diarized = r.diarized;
    }
    out.full_text = core::TranscriptAssembler::render_segments(out.segments, config_.paragraph_gap);
    if (out.full_text.empty()) out.full_text = core::trim(r.text);
    return out;
}

FileTranscription ProviderFallbackChain::from_baseline(const asr::RecognitionResult& r,
                                                       const std::vector<core::DiarizationInterval>* intervals) const {
    FileTranscription out;
    out.segments = to_segments(r);
    std::vector<core::Word> words = sorted_words(r.words);

    if (intervals) {
        diar::DiarizationReconciler::assign_speakers(out.segments, *intervals);
        diar::DiarizationReconciler::assign_word_speakers(words, *intervals);
        out.diarized = true;
    }
    if (!words.empty()) {
        diar::SpeakerSegmenter segmenter(config_.segmenter);
        out.turns = segmenter.segment(words);
    }
    out.full_text = core::TranscriptAssembler::render_segments(out.segments, config_.paragraph_gap);
    return out;
}

} // namespace app
