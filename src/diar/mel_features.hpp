#pragma once

#include <vector>
#include <cstdint>

namespace diar {

/**
 * Log-mel filterbank (Fbank) features for speaker embedding models.
 *
 * Frames of n_fft samples are Hann-windowed, zero-padded to the next power of
 * two and transformed with a radix-2 FFT. The output is 80-dim Fbank by default,
 * which is what WeSpeaker-style ResNet embedders expect.
 */
class MelFeatureExtractor {
public:
    struct Config {
        int sample_rate = 16000;
        int n_fft = 400;           // 25ms at 16kHz
        int hop_length = 160;      // 10ms at 16kHz
        int n_mels = 80;
        float fmin = 0.0f;
        float fmax = 8000.0f;      // Nyquist at 16kHz
    };

    MelFeatureExtractor();
    explicit MelFeatureExtractor(const Config& config);
    ~MelFeatureExtractor();

    /**
     * @param samples Float audio in [-1, 1]
     * @return Row-major [n_frames, n_mels] log energies; empty when the input
     *         is shorter than one frame
     */
    std::vector<float> extract_features(const float* samples, int n_samples) const;

    int get_num_frames(int n_samples) const;
    int n_mels() const { return m_config.n_mels; }
    int fft_size() const { return m_fft_size; }

private:
    Config m_config;
    int m_fft_size = 512;
    std::vector<float> m_mel_filters;  // [n_mels x (fft_size/2 + 1)]
    std::vector<float> m_hann_window;

    void init_hann_window();
    void init_mel_filters();

    static float hz_to_mel(float hz);
    static float mel_to_hz(float mel);
};

// In-place iterative radix-2 FFT; size must be a power of two
void fft_radix2(std::vector<float>& re, std::vector<float>& im);

} // namespace diar
