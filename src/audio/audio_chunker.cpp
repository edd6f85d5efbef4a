#include "audio/audio_chunker.hpp"
#include "audio/resample.hpp"
#include <algorithm>
#include <cmath>

namespace audio {

AudioChunker::AudioChunker() : AudioChunker(Config{}) {}

AudioChunker::AudioChunker(const Config& config)
    : config_(config)
{
    if (config_.sample_rate <= 0) config_.sample_rate = core::kCanonicalSampleRate;
    chunk_samples_ = std::max<size_t>(1, static_cast<size_t>(std::llround(config_.chunk_seconds * config_.sample_rate)));
    history_cap_ = static_cast<size_t>(std::llround(std::max(0.0, config_.history_seconds) * config_.sample_rate));
    pending_.reserve(chunk_samples_);
}

core::AudioChunk AudioChunker::make_chunk(std::vector<int16_t>&& samples) {
    core::AudioChunk chunk;
    chunk.samples = std::move(samples);
    chunk.sample_rate = config_.sample_rate;
    chunk.index = next_index_;
    chunk.start_time = static_cast<double>(next_index_) * config_.chunk_seconds;
    next_index_++;
    return chunk;
}

std::vector<core::AudioChunk> AudioChunker::feed(const int16_t* samples, size_t n, int input_rate) {
    std::vector<core::AudioChunk> out;
    if (!samples || n == 0) return out;

    std::vector<int16_t> resampled;
    if (input_rate > 0 && input_rate != config_.sample_rate) {
        resampled = resample_linear(samples, n, input_rate, config_.sample_rate);
        samples = resampled.data();
        n = resampled.size();
    }

    for (size_t i = 0; i < n; ++i) {
        history_.push_back(samples[i]);
    }
    while (history_.size() > history_cap_) history_.pop_front();

    size_t offset = 0;
    while (offset < n) {
        size_t take = std::min(chunk_samples_ - pending_.size(), n - offset);
        pending_.insert(pending_.end(), samples + offset, samples + offset + take);
        offset += take;
        if (pending_.size() == chunk_samples_) {
            std::vector<int16_t> full;
            full.swap(pending_);
            pending_.reserve(chunk_samples_);
            out.push_back(make_chunk(std::move(full)));
        }
    }
    return out;
}

std::vector<core::AudioChunk> AudioChunker::feed(const float* samples, size_t n, int input_rate) {
    if (!samples || n == 0) return {};
    std::vector<int16_t> pcm = float_to_pcm16(samples, n);
    return feed(pcm.data(), pcm.size(), input_rate);
}

std::optional<core::AudioChunk> AudioChunker::flush() {
    if (pending_.empty()) return std::nullopt;
    const double tail_seconds = static_cast<double>(pending_.size()) / config_.sample_rate;
    if (tail_seconds <= config_.min_tail_seconds) {
        pending_.clear();
        return std::nullopt;
    }
    std::vector<int16_t> tail;
    tail.swap(pending_);
    return make_chunk(std::move(tail));
}

std::vector<int16_t> AudioChunker::last_seconds(double seconds) const {
    if (seconds <= 0.0) return {};
    size_t want = static_cast<size_t>(std::llround(seconds * config_.sample_rate));
    want = std::min(want, history_.size());
    return std::vector<int16_t>(history_.end() - static_cast<std::ptrdiff_t>(want), history_.end());
}

void AudioChunker::reset() {
    pending_.clear();
    history_.clear();
    next_index_ = 0;
}

} // namespace audio
