#pragma once
#include "diar/diarizer.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace diar {

/**
 * @brief Local "who spoke when" pass: sliding-window ONNX embeddings + online clustering
 *
 * The file is resampled to 16 kHz and cut into overlapping windows. Silent windows
 * are skipped, the rest are embedded and assigned to a speaker cluster, and runs of
 * windows with the same cluster become one interval labeled "A", "B", ...
 *
 * Reports itself unavailable when built without onnxruntime or when the model
 * failed to load.
 */
class OnnxDiarizer : public IDiarizer {
public:
    struct Config {
        std::string model_path = "models/speaker_embedding.onnx";
        int max_speakers = 2;
        double window_seconds = 1.5;
        double hop_seconds = 0.75;
        double silence_dbfs = -55.0;   // Windows at or below this RMS level are skipped
        float sim_threshold = 0.60f;
        int n_threads = 4;
    };

    // One clustered analysis window
    struct WindowLabel {
        int speaker = -1;
        double start = 0.0;
        double end = 0.0;
    };

    explicit OnnxDiarizer(const Config& config);
    ~OnnxDiarizer() override;

    core::Result<std::vector<core::DiarizationInterval>> diarize(const std::string& audio_file) override;
    bool available() const override;
    std::string name() const override { return "onnx-diarizer"; }

    // Runs the windowing and clustering over samples already at 16 kHz
    core::Result<std::vector<core::DiarizationInterval>> diarize_samples(const std::vector<int16_t>& pcm16);

    // 0 -> "A", 25 -> "Z", 26 -> "AA"
    static std::string label_for(int speaker);
    static double rms_dbfs(const int16_t* pcm16, size_t n);

    // Each window owns [start, start + hop), the last one up to its end.
    // Adjacent windows with the same speaker become one interval.
    static std::vector<core::DiarizationInterval> merge_windows(const std::vector<WindowLabel>& windows,
                                                                double hop_seconds);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    Config config_;
};

} // namespace diar
