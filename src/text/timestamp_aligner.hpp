#pragma once
#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace text {

struct AlignmentStats {
    size_t attempted = 0;
    size_t aligned = 0;
    bool partial = true;        ///< Fewer than 80% of targets aligned
    size_t cache_hits = 0;      ///< Caption files served from the parse cache
};

/**
 * @brief Places summaries (chapters, highlights) on the transcript timeline
 *
 * Every segment is normalized (lowercase, punctuation to spaces, whitespace
 * collapsed) and concatenated into one corpus. Each target's cue, the first
 * 180 characters of its normalized summary (or title), is matched against the
 * corpus after the previous match with a longest-common-substring search, so
 * targets can only move forward in time. Weak matches leave the target
 * without a timestamp.
 */
class TimestampAligner {
public:
    struct Config {
        double threshold = 0.6;        ///< Fraction of the cue that must match
        size_t min_match_cap = 30;     ///< Never require more than this many chars
        size_t cue_chars = 180;
        double partial_ratio = 0.8;
        double monotonic_bump = 1.0;   ///< Seconds added when a timestamp goes backwards
    };

    TimestampAligner();
    explicit TimestampAligner(const Config& config);

    // Sets start_timestamp on the targets that align; returns the stats of this call
    AlignmentStats align(std::vector<core::AlignmentTarget>& targets,
                         const std::vector<core::TranscriptSegment>& segments) const;

    // Same, with segments from an SRT/VTT file (parsed once per path)
    core::Result<AlignmentStats> align_to_caption_file(std::vector<core::AlignmentTarget>& targets,
                                                       const std::string& path);

    static std::string normalize(const std::string& text);

    // Longest common substring; earliest position in `corpus` wins ties
    struct Match {
        size_t corpus_pos = 0;
        size_t length = 0;
    };
    static Match longest_common_substring(const std::string& corpus, size_t from, const std::string& cue);

    size_t cache_hits() const { return cache_hits_; }

private:
    Config config_;
    std::map<std::string, std::vector<core::TranscriptSegment>> cache_;
    size_t cache_hits_ = 0;
};

} // namespace text
