#undef NDEBUG
#include <cassert>
#include <cmath>
#include <vector>
#include "audio/audio_chunker.hpp"

int main() {
    audio::AudioChunker::Config cfg;
    cfg.sample_rate = 16000;
    cfg.chunk_seconds = 1.0;
    cfg.min_tail_seconds = 0.5;
    cfg.history_seconds = 2.0;
    audio::AudioChunker chunker(cfg);
    assert(chunker.chunk_samples() == 16000);

    // 2.7 s arrives in uneven blocks: two full chunks, 0.7 s pending
    std::vector<int16_t> block(9000, 100);
    std::vector<core::AudioChunk> chunks;
    for (int i = 0; i < 4; ++i) {
        auto out = chunker.feed(block.data(), block.size(), 16000);
        for (auto& c : out) chunks.push_back(std::move(c));
    }
    // 36000 samples = 2 chunks + 4000 pending
    assert(chunks.size() == 2);
    assert(chunks[0].index == 0 && chunks[1].index == 1);
    assert(std::fabs(chunks[0].start_time - 0.0) < 1e-9);
    assert(std::fabs(chunks[1].start_time - 1.0) < 1e-9);
    assert(chunks[0].samples.size() == 16000);
    assert(chunker.pending_samples() == 4000);

    // 0.25 s tail is at most min_tail_seconds: dropped
    assert(!chunker.flush().has_value());
    assert(chunker.pending_samples() == 0);

    // A longer tail becomes a final short chunk
    std::vector<int16_t> tail(12000, 5);
    assert(chunker.feed(tail.data(), tail.size(), 16000).empty());
    auto last = chunker.flush();
    assert(last.has_value());
    assert(last->index == 2);
    assert(std::fabs(last->start_time - 2.0) < 1e-9);
    assert(std::fabs(last->duration_s() - 0.75) < 1e-9);

    // History is capped at history_seconds
    assert(chunker.last_seconds(10.0).size() == 32000);
    assert(chunker.last_seconds(0.5).size() == 8000);
    assert(chunker.last_seconds(0.5).back() == 5);

    // 48 kHz input is resampled to the chunker rate
    audio::AudioChunker resampling(cfg);
    std::vector<int16_t> hi(48000, 1000);
    auto out = resampling.feed(hi.data(), hi.size(), 48000);
    assert(out.size() == 1);
    assert(out[0].sample_rate == 16000);
    assert(out[0].samples.size() == 16000);

    // Float input is converted to PCM16
    audio::AudioChunker floats(cfg);
    std::vector<float> f(16000, 0.5f);
    auto fo = floats.feed(f.data(), f.size(), 16000);
    assert(fo.size() == 1);
    assert(std::abs(fo[0].samples[0] - 16384) <= 1);

    chunker.reset();
    assert(chunker.chunks_emitted() == 0);
    assert(chunker.last_seconds(1.0).empty());

    // Default construction gives 3 s chunks at the canonical rate
    audio::AudioChunker live;
    std::vector<int16_t> three_seconds(3 * 16000, 100);
    auto lc = live.feed(three_seconds.data(), three_seconds.size(), 16000);
    assert(lc.size() == 1);
    assert(lc[0].samples.size() == 48000);
    assert(lc[0].sample_rate == 16000);
    return 0;
}
