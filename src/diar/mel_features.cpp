#include "diar/mel_features.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace diar {

void fft_radix2(std::vector<float>& re, std::vector<float>& im) {
    const size_t n = re.size();
    if (n == 0 || (n & (n - 1)) != 0 || im.size() != n) {
        throw std::invalid_argument("fft_radix2: size must be a power of two");
    }

    // Bit-reversal permutation
    for (size_t i = 1, j = 0; i < n; ++i) {
        size_t bit = n >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) {
            std::swap(re[i], re[j]);
            std::swap(im[i], im[j]);
        }
    }

    for (size_t len = 2; len <= n; len <<= 1) {
        const double angle = -2.0 * M_PI / static_cast<double>(len);
        const float w_re = static_cast<float>(std::cos(angle));
        const float w_im = static_cast<float>(std::sin(angle));
        for (size_t i = 0; i < n; i += len) {
            float cur_re = 1.0f, cur_im = 0.0f;
            for (size_t k = 0; k < len / 2; ++k) {
                const size_t a = i + k;
                const size_t b = a + len / 2;
                const float t_re = re[b] * cur_re - im[b] * cur_im;
                const float t_im = re[b] * cur_im + im[b] * cur_re;
                re[b] = re[a] - t_re;
                im[b] = im[a] - t_im;
                re[a] += t_re;
                im[a] += t_im;
                const float next_re = cur_re * w_re - cur_im * w_im;
                cur_im = cur_re * w_im + cur_im * w_re;
                cur_re = next_re;
            }
        }
    }
}

float MelFeatureExtractor::hz_to_mel(float hz) {
    return 2595.0f * std::log10(1.0f + hz / 700.0f);
}

float MelFeatureExtractor::mel_to_hz(float mel) {
    return 700.0f * (std::pow(10.0f, mel / 2595.0f) - 1.0f);
}

MelFeatureExtractor::MelFeatureExtractor() : MelFeatureExtractor(Config{}) {}

MelFeatureExtractor::MelFeatureExtractor(const Config& config) : m_config(config) {
    if (m_config.n_fft <= 0 || m_config.hop_length <= 0 || m_config.n_mels <= 0) {
        throw std::invalid_argument("MelFeatureExtractor: n_fft, hop_length and n_mels must be positive");
    }
    m_fft_size = 1;
    while (m_fft_size < m_config.n_fft) m_fft_size <<= 1;
    init_hann_window();
    init_mel_filters();
}

MelFeatureExtractor::~MelFeatureExtractor() = default;

void MelFeatureExtractor::init_hann_window() {
    m_hann_window.resize(m_config.n_fft);
    const int denom = std::max(1, m_config.n_fft - 1);
    for (int i = 0; i < m_config.n_fft; i++) {
        m_hann_window[i] = static_cast<float>(0.5 * (1.0 - std::cos(2.0 * M_PI * i / denom)));
    }
}

void MelFeatureExtractor::init_mel_filters() {
    const int n_bins = m_fft_size / 2 + 1;
    m_mel_filters.assign(static_cast<size_t>(m_config.n_mels) * n_bins, 0.0f);

    const float mel_min = hz_to_mel(m_config.fmin);
    const float mel_max = hz_to_mel(m_config.fmax);

    std::vector<int> bin_points(m_config.n_mels + 2);
    for (int i = 0; i < m_config.n_mels + 2; i++) {
        const float mel = mel_min + (mel_max - mel_min) * i / (m_config.n_mels + 1);
        const float hz = mel_to_hz(mel);
        const int bin = static_cast<int>(std::floor((m_fft_size + 1) * hz / m_config.sample_rate));
        bin_points[i] = std::min(std::max(bin, 0), n_bins - 1);
    }

    // Triangular filters
    for (int m = 0; m < m_config.n_mels; m++) {
        const int left = bin_points[m];
        const int center = bin_points[m + 1];
        const int right = bin_points[m + 2];
        float* row = &m_mel_filters[static_cast<size_t>(m) * n_bins];

        for (int k = left; k < center; k++) {
            row[k] = static_cast<float>(k - left) / (center - left);
        }
        for (int k = center; k < right; k++) {
            row[k] = static_cast<float>(right - k) / (right - center);
        }
        // Narrow low-frequency filters can collapse to a single bin
        if (left == center && center == right) row[center] = 1.0f;
    }
}

int MelFeatureExtractor::get_num_frames(int n_samples) const {
    if (n_samples < m_config.n_fft) {
        return 0;
    }
    return 1 + (n_samples - m_config.n_fft) / m_config.hop_length;
}

std::vector<float> MelFeatureExtractor::extract_features(const float* samples, int n_samples) const {
    const int n_frames = get_num_frames(n_samples);
    if (!samples || n_frames <= 0) {
        return {};
    }

    const int n_bins = m_fft_size / 2 + 1;
    std::vector<float> features(static_cast<size_t>(n_frames) * m_config.n_mels);
    std::vector<float> re(m_fft_size), im(m_fft_size), power(n_bins);

    for (int frame = 0; frame < n_frames; frame++) {
        const int offset = frame * m_config.hop_length;

        std::fill(re.begin(), re.end(), 0.0f);
        std::fill(im.begin(), im.end(), 0.0f);
        for (int i = 0; i < m_config.n_fft; i++) {
            re[i] = samples[offset + i] * m_hann_window[i];
        }

        fft_radix2(re, im);
        for (int k = 0; k < n_bins; k++) {
            power[k] = re[k] * re[k] + im[k] * im[k];
        }

        for (int m = 0; m < m_config.n_mels; m++) {
            const float* row = &m_mel_filters[static_cast<size_t>(m) * n_bins];
            float energy = 0.0f;
            for (int k = 0; k < n_bins; k++) {
                energy += power[k] * row[k];
            }
            features[static_cast<size_t>(frame) * m_config.n_mels + m] = 10.0f * std::log10(std::max(energy, 1e-10f));
        }
    }

    return features;
}

} // namespace diar
