#include "audio/resample.hpp"
#include <algorithm>
#include <cmath>

namespace audio {

std::vector<int16_t> resample_linear(const int16_t* in, size_t in_samples, int in_hz, int out_hz) {
    if (!in || in_samples == 0) return {};
    if (in_hz == out_hz || in_hz <= 0 || out_hz <= 0) {
        return std::vector<int16_t>(in, in + in_samples);
    }
    const double ratio = static_cast<double>(out_hz) / static_cast<double>(in_hz);
    const size_t out_len = static_cast<size_t>(std::llround(in_samples * ratio));
    std::vector<int16_t> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        double src_pos = i / ratio;
        size_t i0 = std::min(static_cast<size_t>(src_pos), in_samples - 1);
        size_t i1 = std::min(i0 + 1, in_samples - 1);
        double frac = src_pos - static_cast<double>(i0);
        double v = (1.0 - frac) * static_cast<double>(in[i0]) + frac * static_cast<double>(in[i1]);
        int vi = static_cast<int>(std::lrint(v));
        vi = std::clamp(vi, -32768, 32767);
        out[i] = static_cast<int16_t>(vi);
    }
    return out;
}

std::vector<int16_t> float_to_pcm16(const float* in, size_t n) {
    std::vector<int16_t> out(n);
    for (size_t i = 0; i < n; ++i) {
        float v = std::clamp(in[i], -1.0f, 1.0f);
        out[i] = static_cast<int16_t>(std::lrint(v * 32767.0f));
    }
    return out;
}

} // namespace audio
