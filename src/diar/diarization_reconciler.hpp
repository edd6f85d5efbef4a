#pragma once
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace diar {

/**
 * @brief Attaches diarization labels to recognition output by midpoint lookup
 *
 * Each segment (or word) takes the label of the first interval, in the order
 * given, whose [start, end) contains its midpoint. This is an approximation:
 * a segment straddling a speaker change gets whichever speaker holds the
 * midpoint, and with overlapping intervals the earlier one in the list wins.
 */
class DiarizationReconciler {
public:
    // Label of the first interval containing t, if any
    static std::optional<std::string> label_at(double t, const std::vector<core::DiarizationInterval>& intervals);

    // Sets segment.speaker to "Speaker <label>" or "Unknown"
    static void assign_speakers(std::vector<core::TranscriptSegment>& segments,
                                const std::vector<core::DiarizationInterval>& intervals);

    // Same labels for words; words outside every interval keep their speaker_id
    static void assign_word_speakers(std::vector<core::Word>& words,
                                     const std::vector<core::DiarizationInterval>& intervals);

    // Per-speaker totals, in order of first appearance
    static std::vector<core::SpeakerStats> speaker_stats(const std::vector<core::TranscriptSegment>& segments);
};

} // namespace diar
