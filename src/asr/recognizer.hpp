#pragma once
#include "core/result.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace asr {

struct RecognizedSegment {
    double start = 0.0;   ///< Seconds relative to the audio handed in
    double end = 0.0;
    std::string text;
    double confidence = core::kDefaultConfidence;
};

struct RecognitionResult {
    std::string text;
    std::vector<RecognizedSegment> segments;
    std::vector<core::Word> words;     ///< Empty when the provider has no word timing
    std::string language;
    bool diarized = false;             ///< Words carry speaker_id or channel_index

    // No usable output: neither text nor segments
    bool empty() const;
    // Mean segment confidence, or the default when there are no segments
    double confidence() const;
};

/**
 * @brief Speech recognition capability
 *
 * Implementations are created once and shared between workers through
 * std::shared_ptr. recognize() may be called concurrently only if the
 * implementation says so; the pipeline gives each worker its own call.
 */
class IRecognizer {
public:
    virtual ~IRecognizer() = default;

    virtual core::Result<RecognitionResult> recognize(const int16_t* samples, size_t n,
                                                      int sample_rate, const std::string& language) = 0;

    // Default: load the WAV, resample to 16 kHz and call recognize()
    virtual core::Result<RecognitionResult> recognize_file(const std::string& path, const std::string& language);

    virtual bool available() const = 0;
    virtual std::string name() const = 0;
    virtual bool diarizes() const { return false; }
};

} // namespace asr
