#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

// WAV-backed audio source for the file path: decodes the whole file to mono PCM16.
class FileCapture {
public:
    bool open(const std::string& path);
    void close();

    int sample_rate() const { return sample_rate_; }
    const std::vector<int16_t>& samples() const { return mono_; }

    // Whole file resampled to target_hz
    std::vector<int16_t> samples_at(int target_hz) const;

    int channels() const { return channels_; }
    int bits_per_sample() const { return bits_per_sample_; }
    double duration_seconds() const { return duration_seconds_; }
    std::string source_path() const { return source_path_; }
    const std::string& last_error() const { return last_error_; }

private:
    bool fail(const std::string& why);

    std::string source_path_;
    std::string last_error_;
    std::vector<int16_t> mono_;
    int sample_rate_ = 0;
    int channels_ = 0;
    int bits_per_sample_ = 0;
    double duration_seconds_ = 0.0;
};

// 44-byte header + little-endian PCM16 mono payload
std::string encode_wav_pcm16(const int16_t* samples, size_t n, int sample_rate);
bool write_wav_pcm16(const std::string& path, const std::vector<int16_t>& samples, int sample_rate);

} // namespace audio
