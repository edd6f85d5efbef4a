// Copyright (c) 2025 VAM Live Scribe
#pragma once

#include "app/retry_policy.hpp"
#include "asr/recognizer.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "diar/diarizer.hpp"
#include "diar/speaker_segmenter.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace app {

enum class Strategy {
    IntegratedDiarizing,          ///< One recognizer that also labels speakers
    RecognitionPlusDiarization,   ///< Baseline recognizer + standalone diarizer + reconciler
    RecognitionOnly               ///< Baseline recognizer, no speakers
};

const char* to_string(Strategy strategy);

// "scribe" / "whisper+diarizer" / "whisper" as used in STREAMSCRIBE_PROVIDER_ORDER
std::optional<Strategy> parse_strategy(const std::string& name);

struct FallbackEvent {
    std::string from;
    std::string to;
    std::string reason;
};

/**
 * @brief Result of one file transcription
 */
struct FileTranscription {
    std::vector<core::TranscriptSegment> segments;   ///< Speaker-labeled when diarized
    std::vector<core::SpeakerTurn> turns;            ///< Only when the provider returned words
    std::string full_text;
    std::string provider;                            ///< Provider that produced this result
    bool diarized = false;
    std::vector<FallbackEvent> fallbacks;            ///< Fallbacks taken for this request
};

struct ChainConfig {
    std::vector<Strategy> order = {Strategy::IntegratedDiarizing, Strategy::RecognitionPlusDiarization,
                                   Strategy::RecognitionOnly};
    std::string language = "en";
    double paragraph_gap = 2.0;
    diar::SpeakerSegmenter::Config segmenter;
    std::function<void(const FallbackEvent&)> on_fallback;
};

/**
 * @brief Transcribes a file with the best available provider, downgrading on failure
 *
 * Strategies are tried in the configured order, each at most once per request.
 * Inside a strategy, transient provider errors are retried by the RetryPolicy.
 * A failure, an exception or an empty result moves on to the next strategy.
 * Never throws; when everything fails the result is AllProvidersExhausted.
 */
class ProviderFallbackChain {
public:
    ProviderFallbackChain(ChainConfig config,
                          std::shared_ptr<asr::IRecognizer> diarizing,
                          std::shared_ptr<asr::IRecognizer> baseline,
                          std::shared_ptr<diar::IDiarizer> diarizer,
                          RetryPolicy retry = RetryPolicy());

    core::Result<FileTranscription> transcribe(const std::string& audio_file);

    // Strategies that passed the availability check, in order
    const std::vector<Strategy>& active_strategies() const { return active_; }

    // Every fallback recorded since construction
    const std::vector<FallbackEvent>& events() const { return events_; }

    std::string provider_name(Strategy strategy) const;

private:
    struct Request;

    bool is_available(Strategy strategy) const;
    core::Result<FileTranscription> run_strategy(Strategy strategy, Request& request);
    core::Result<asr::RecognitionResult> recognize(asr::IRecognizer& recognizer, const std::string& audio_file);

    FileTranscription from_integrated(const asr::RecognitionResult& r) const;
    FileTranscription from_baseline(const asr::RecognitionResult& r,
                                    const std::vector<core::DiarizationInterval>* intervals) const;

    ChainConfig config_;
    std::shared_ptr<asr::IRecognizer> diarizing_;
    std::shared_ptr<asr::IRecognizer> baseline_;
    std::shared_ptr<diar::IDiarizer> diarizer_;
    RetryPolicy retry_;
    std::vector<Strategy> active_;
    std::vector<FallbackEvent> events_;
};

} // namespace app
