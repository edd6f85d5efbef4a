#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

// Linear interpolation resampler, good enough for speech going into 16 kHz models
std::vector<int16_t> resample_linear(const int16_t* in, size_t in_samples, int in_hz, int out_hz);

// [-1, 1] float to PCM16 with clipping
std::vector<int16_t> float_to_pcm16(const float* in, size_t n);

} // namespace audio
