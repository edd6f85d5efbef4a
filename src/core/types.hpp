#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace core {

constexpr int kCanonicalSampleRate = 16000;
constexpr double kDefaultConfidence = 0.8;
constexpr const char* kDefaultSpeaker = "speaker_1";
constexpr const char* kUnknownSpeaker = "Unknown";

// A fixed-duration slice of mono PCM16. Never modified after the chunker emits it.
struct AudioChunk {
    std::vector<int16_t> samples;
    int sample_rate = kCanonicalSampleRate;
    double start_time = 0.0;    ///< Seconds from stream start
    uint64_t index = 0;         ///< Position in the stream (0-based)

    double duration_s() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

struct Word {
    enum class Kind { Word, Event };

    std::string text;
    double start = 0.0;
    double end = 0.0;
    std::optional<std::string> speaker_id;  ///< Only from diarizing recognition
    std::optional<int> channel_index;       ///< Only for multi-channel audio
    Kind kind = Kind::Word;
};

/**
 * @brief A timestamped span of recognized text, the unit flowing through the live pipeline
 */
struct TranscriptSegment {
    std::string text;
    double start = 0.0;         ///< Seconds, start <= end
    double end = 0.0;
    double confidence = kDefaultConfidence;
    std::optional<std::string> speaker;

    double duration() const { return end - start; }
};

struct SpeakerTurn {
    std::string speaker_id;
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::optional<int> channel_index;

    double duration() const { return end - start; }
};

struct DiarizationInterval {
    std::string speaker_label;
    double start = 0.0;
    double end = 0.0;
};

// Chapter or summary to re-anchor on the transcript timeline.
struct AlignmentTarget {
    std::string title;
    std::string summary_text;
    std::optional<double> start_timestamp;
};

struct SpeakerStats {
    std::string speaker;
    double total_speaking_time_s = 0.0;
    int segment_count = 0;
    std::string last_text;
};

} // namespace core
