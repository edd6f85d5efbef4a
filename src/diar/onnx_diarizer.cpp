#include "diar/onnx_diarizer.hpp"
#include "diar/speaker_cluster.hpp"
#include "audio/file_capture.hpp"
#include "core/logging.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifdef STREAMSCRIBE_ONNX_AVAILABLE
#include "diar/onnx_embedder.hpp"
#endif

namespace diar {

struct OnnxDiarizer::Impl {
#ifdef STREAMSCRIBE_ONNX_AVAILABLE
    std::unique_ptr<OnnxSpeakerEmbedder> embedder;
#endif
    std::string load_error;
};

OnnxDiarizer::OnnxDiarizer(const Config& config) : impl_(std::make_unique<Impl>()), config_(config) {
#ifdef STREAMSCRIBE_ONNX_AVAILABLE
    OnnxSpeakerEmbedder::Config ec;
    ec.model_path = config_.model_path;
    ec.sample_rate = core::kCanonicalSampleRate;
    ec.n_threads = config_.n_threads;
    try {
        impl_->embedder = std::make_unique<OnnxSpeakerEmbedder>(ec);
    } catch (const std::exception& e) {
        impl_->load_error = e.what();
        core::log_warn("[diarizer] " + impl_->load_error);
    }
#else
    impl_->load_error = "built without onnxruntime";
#endif
}

OnnxDiarizer::~OnnxDiarizer() = default;

bool OnnxDiarizer::available() const {
#ifdef STREAMSCRIBE_ONNX_AVAILABLE
    return impl_->embedder != nullptr;
#else
    return false;
#endif
}

std::string OnnxDiarizer::label_for(int speaker) {
    std::string label;
    int n = speaker;
    do {
        label.insert(label.begin(), static_cast<char>('A' + n % 26));
        n = n / 26 - 1;
    } while (n >= 0);
    return label;
}

double OnnxDiarizer::rms_dbfs(const int16_t* pcm16, size_t n) {
    if (!pcm16 || n == 0) return -120.0;
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double v = pcm16[i] / 32768.0;
        sum += v * v;
    }
    const double rms = std::sqrt(sum / static_cast<double>(n));
    return rms > 1e-6 ? 20.0 * std::log10(rms) : -120.0;
}

std::vector<core::DiarizationInterval> OnnxDiarizer::merge_windows(const std::vector<WindowLabel>& windows,
                                                                   double hop_seconds) {
    std::vector<core::DiarizationInterval> out;
    for (size_t i = 0; i < windows.size(); ++i) {
        const WindowLabel& w = windows[i];
        if (w.speaker < 0) continue;
        const bool last = i + 1 == windows.size();
        const double owned_end = last ? w.end : std::min(w.end, w.start + hop_seconds);
        const std::string label = label_for(w.speaker);

        if (!out.empty() && out.back().speaker_label == label && w.start <= out.back().end + 1e-6) {
            out.back().end = std::max(out.back().end, owned_end);
            continue;
        }
        out.push_back(core::DiarizationInterval{label, w.start, owned_end});
    }
    return out;
}

core::Result<std::vector<core::DiarizationInterval>> OnnxDiarizer::diarize(const std::string& audio_file) {
    if (!available()) {
        return core::Result<std::vector<core::DiarizationInterval>>::fail(
            core::ErrorKind::DiarizationUnavailable, "onnx diarizer unavailable: " + impl_->load_error);
    }

    audio::FileCapture capture;
    if (!capture.open(audio_file)) {
        return core::Result<std::vector<core::DiarizationInterval>>::fail(
            core::ErrorKind::RecognitionFailed, "cannot read " + audio_file + ": " + capture.last_error());
    }
    return diarize_samples(capture.samples_at(core::kCanonicalSampleRate));
}

core::Result<std::vector<core::DiarizationInterval>> OnnxDiarizer::diarize_samples(const std::vector<int16_t>& pcm16) {
    if (!available()) {
        return core::Result<std::vector<core::DiarizationInterval>>::fail(
            core::ErrorKind::DiarizationUnavailable, "onnx diarizer unavailable: " + impl_->load_error);
    }
#ifdef STREAMSCRIBE_ONNX_AVAILABLE
    const int sr = core::kCanonicalSampleRate;
    const size_t window = static_cast<size_t>(config_.window_seconds * sr);
    const size_t hop = std::max<size_t>(1, static_cast<size_t>(config_.hop_seconds * sr));

    SpeakerClusterer::Config cc;
    cc.max_speakers = config_.max_speakers;
    cc.sim_threshold = config_.sim_threshold;
    SpeakerClusterer clusterer(cc);

    std::vector<WindowLabel> windows;
    size_t skipped = 0;
    for (size_t pos = 0; pos < pcm16.size(); pos += hop) {
        const size_t n = std::min(window, pcm16.size() - pos);
        // Short trailing windows are covered by the previous one
        if (n < window / 2 && pos > 0) break;

        WindowLabel w;
        w.start = static_cast<double>(pos) / sr;
        w.end = static_cast<double>(pos + n) / sr;
        if (rms_dbfs(pcm16.data() + pos, n) <= config_.silence_dbfs) {
            skipped++;
            windows.push_back(w);
            continue;
        }
        std::vector<float> emb = impl_->embedder->compute_embedding(pcm16.data() + pos, n);
        w.speaker = emb.empty() ? -1 : clusterer.assign(emb);
        windows.push_back(w);
    }

    std::vector<core::DiarizationInterval> intervals = merge_windows(windows, config_.hop_seconds);
    core::log_info("[diarizer] " + std::to_string(windows.size()) + " windows, " + std::to_string(skipped) +
                   " silent, " + std::to_string(clusterer.num_speakers()) + " speakers, " +
                   std::to_string(intervals.size()) + " intervals");
    return intervals;
#else
    (void)pcm16;
    return core::Result<std::vector<core::DiarizationInterval>>::fail(core::ErrorKind::DiarizationUnavailable,
                                                                      "built without onnxruntime");
#endif
}

} // namespace diar
