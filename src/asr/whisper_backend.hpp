#pragma once
#include "asr/recognizer.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace asr {

/**
 * @brief Baseline local recognizer on whisper.cpp
 *
 * One instance owns one model context plus a persistent decoding state. Load it
 * once at startup and share it; calls into the model are serialized. Built
 * without whisper.cpp the backend reports itself unavailable.
 */
class WhisperBackend : public IRecognizer {
public:
    struct Config {
        std::string model = "base.en";   ///< Model name under models/ or a path to .gguf/.bin
        int n_threads = 0;               ///< 0 = hardware concurrency
        bool word_timestamps = true;     ///< Token-level timing for words
    };

    WhisperBackend();
    ~WhisperBackend() override;

    WhisperBackend(const WhisperBackend&) = delete;
    WhisperBackend& operator=(const WhisperBackend&) = delete;

    // Loads the model; false if the file is missing or whisper is not compiled in
    bool load_model(const Config& config);

    core::Result<RecognitionResult> recognize(const int16_t* samples, size_t n,
                                              int sample_rate, const std::string& language) override;
    bool available() const override;
    std::string name() const override { return "whisper"; }

    // Candidate paths tried for a bare model name, in order
    static std::vector<std::string> model_candidates(const std::string& model_name);

private:
    struct State;
    std::unique_ptr<State> state_;
    std::mutex mutex_;
};

} // namespace asr
