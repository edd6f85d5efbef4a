#pragma once
#include "core/types.hpp"
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace audio {

/**
 * @brief Splits a continuous PCM stream into fixed-duration chunks
 *
 * Input of any rate is resampled to the configured rate. Chunk i starts at
 * i * chunk_seconds on the stream timeline. A bounded history of the most
 * recent audio is kept for callers that want overlapping context.
 */
class AudioChunker {
public:
    struct Config {
        int sample_rate = core::kCanonicalSampleRate;
        double chunk_seconds = 3.0;
        double min_tail_seconds = 0.5;   ///< Shorter final chunks are dropped
        double history_seconds = 10.0;   ///< Cap for last_seconds()
    };

    AudioChunker();
    explicit AudioChunker(const Config& config);

    // Appends audio and returns every chunk completed by it
    std::vector<core::AudioChunk> feed(const int16_t* samples, size_t n, int input_rate);
    std::vector<core::AudioChunk> feed(const float* samples, size_t n, int input_rate);

    // End of stream: the buffered tail as a final chunk if it is long enough
    std::optional<core::AudioChunk> flush();

    // Most recent n seconds (at most history_seconds) at the chunker rate
    std::vector<int16_t> last_seconds(double seconds) const;

    size_t chunk_samples() const { return chunk_samples_; }
    size_t pending_samples() const { return pending_.size(); }
    uint64_t chunks_emitted() const { return next_index_; }
    const Config& config() const { return config_; }

    void reset();

private:
    core::AudioChunk make_chunk(std::vector<int16_t>&& samples);

    Config config_;
    size_t chunk_samples_;
    size_t history_cap_;
    std::vector<int16_t> pending_;
    std::deque<int16_t> history_;
    uint64_t next_index_ = 0;
};

} // namespace audio
