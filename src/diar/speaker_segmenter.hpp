#pragma once
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace diar {

/**
 * @brief Groups time-ordered words into speaker turns
 *
 * Pass 1 walks the words once and opens a new turn on a speaker change, a
 * channel change or a silence longer than max_gap. Pass 2 folds turns shorter
 * than min_merge_ms back into a preceding turn of the same speaker and channel.
 * Neither pass reorders anything; callers sort words by start first.
 *
 * Streaming use: push() words as they arrive, take_closed() finished turns,
 * finish() at end of input.
 */
class SpeakerSegmenter {
public:
    struct Config {
        double max_gap = 0.75;     ///< Seconds of silence that end a turn
        double min_merge_ms = 300; ///< 0 disables the merge pass
    };

    SpeakerSegmenter();
    explicit SpeakerSegmenter(const Config& config);

    // Batch: both passes over a sorted word list
    std::vector<core::SpeakerTurn> segment(const std::vector<core::Word>& words) const;

    void push(const core::Word& word);
    std::vector<core::SpeakerTurn> take_closed();
    std::vector<core::SpeakerTurn> finish();

    // speaker_id, else "channel_<i>", else the default single-speaker label
    static std::string speaker_identity(const core::Word& word);

    // Pass 2 on its own
    std::vector<core::SpeakerTurn> merge_short_turns(std::vector<core::SpeakerTurn> turns) const;

private:
    bool starts_new_turn(const core::Word& word) const;

    Config config_;
    std::optional<core::SpeakerTurn> current_;
    std::vector<core::SpeakerTurn> closed_;
};

} // namespace diar
