#include "audio/file_capture.hpp"
#include "audio/resample.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>

namespace audio {

namespace {
struct WavHeader {
    char riff[4];
    uint32_t chunkSize;
    char wave[4];
    char fmt[4];
    uint32_t subchunk1Size;
    uint16_t audioFormat; // 1=PCM, 3=float
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};

void put_u32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}
void put_u16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}
} // namespace

bool FileCapture::fail(const std::string& why) {
    last_error_ = why;
    mono_.clear();
    sample_rate_ = 0;
    return false;
}

bool FileCapture::open(const std::string& path) {
    close();
    last_error_.clear();

    std::ifstream f(path, std::ios::binary);
    if (!f) return fail("cannot open " + path);
    WavHeader hdr{};
    if (!f.read(reinterpret_cast<char*>(&hdr), sizeof(hdr))) return fail("truncated WAV header");
    if (std::strncmp(hdr.riff, "RIFF", 4) != 0 || std::strncmp(hdr.wave, "WAVE", 4) != 0) {
        return fail("not a RIFF/WAVE file");
    }
    if (hdr.numChannels == 0 || hdr.sampleRate == 0) return fail("WAV header has no channels or sample rate");

    // Skip the fmt extension, then walk chunks until "data"
    uint32_t fmtExtra = hdr.subchunk1Size > 16 ? hdr.subchunk1Size - 16 : 0;
    if (fmtExtra) f.seekg(fmtExtra, std::ios::cur);

    char chunkId[4];
    uint32_t chunkSize = 0;
    bool found = false;
    while (f.read(chunkId, 4)) {
        if (!f.read(reinterpret_cast<char*>(&chunkSize), 4)) break;
        if (std::strncmp(chunkId, "data", 4) == 0) {
            found = true;
            break;
        }
        f.seekg(chunkSize + (chunkSize & 1u), std::ios::cur);
    }
    if (!found) return fail("WAV has no data chunk");

    const size_t bytesPerSample = hdr.bitsPerSample / 8;
    if (bytesPerSample == 0) return fail("unsupported bits per sample");
    const size_t frameCount = chunkSize / (bytesPerSample * hdr.numChannels);
    mono_.resize(frameCount);

    if (hdr.audioFormat == 1 && hdr.bitsPerSample == 16) {
        std::vector<int16_t> buf(frameCount * hdr.numChannels);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(int16_t))) {
            return fail("truncated PCM16 payload");
        }
        for (size_t i = 0; i < frameCount; ++i) {
            int sum = 0;
            for (uint16_t c = 0; c < hdr.numChannels; ++c) sum += buf[i * hdr.numChannels + c];
            mono_[i] = static_cast<int16_t>(sum / hdr.numChannels);
        }
    } else if (hdr.audioFormat == 3 && hdr.bitsPerSample == 32) {
        std::vector<float> buf(frameCount * hdr.numChannels);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(float))) {
            return fail("truncated float32 payload");
        }
        for (size_t i = 0; i < frameCount; ++i) {
            float sum = 0.0f;
            for (uint16_t c = 0; c < hdr.numChannels; ++c) sum += buf[i * hdr.numChannels + c];
            float v = std::clamp(sum / static_cast<float>(hdr.numChannels), -1.0f, 1.0f);
            mono_[i] = static_cast<int16_t>(std::lrint(v * 32767.0f));
        }
    } else {
        return fail("unsupported WAV encoding (format " + std::to_string(hdr.audioFormat) +
                    ", " + std::to_string(hdr.bitsPerSample) + " bits)");
    }

    sample_rate_ = static_cast<int>(hdr.sampleRate);
    channels_ = hdr.numChannels;
    bits_per_sample_ = hdr.bitsPerSample;
    duration_seconds_ = static_cast<double>(frameCount) / hdr.sampleRate;
    source_path_ = path;
    return true;
}

void FileCapture::close() {
    mono_.clear();
    sample_rate_ = 0;
    channels_ = 0;
    bits_per_sample_ = 0;
    duration_seconds_ = 0.0;
    source_path_.clear();
}

std::vector<int16_t> FileCapture::samples_at(int target_hz) const {
    return resample_linear(mono_.data(), mono_.size(), sample_rate_, target_hz);
}

std::string encode_wav_pcm16(const int16_t* samples, size_t n, int sample_rate) {
    const uint32_t data_bytes = static_cast<uint32_t>(n * sizeof(int16_t));
    std::string out;
    out.reserve(44 + data_bytes);
    out.append("RIFF");
    put_u32(out, 36 + data_bytes);
    out.append("WAVE");
    out.append("fmt ");
    put_u32(out, 16);
    put_u16(out, 1);
    put_u16(out, 1);
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate) * 2);
    put_u16(out, 2);
    put_u16(out, 16);
    out.append("data");
    put_u32(out, data_bytes);
    for (size_t i = 0; i < n; ++i) put_u16(out, static_cast<uint16_t>(samples[i]));
    return out;
}

bool write_wav_pcm16(const std::string& path, const std::vector<int16_t>& samples, int sample_rate) {
    std::ofstream f(path, std::ios::binary);
    if (!f) return false;
    const std::string bytes = encode_wav_pcm16(samples.data(), samples.size(), sample_rate);
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(f);
}

} // namespace audio
