#include "diar/speaker_segmenter.hpp"

namespace diar {

SpeakerSegmenter::SpeakerSegmenter() : SpeakerSegmenter(Config{}) {}

SpeakerSegmenter::SpeakerSegmenter(const Config& config) : config_(config) {}

std::string SpeakerSegmenter::speaker_identity(const core::Word& word) {
    if (word.speaker_id && !word.speaker_id->empty()) return *word.speaker_id;
    if (word.channel_index) return "channel_" + std::to_string(*word.channel_index);
    return core::kDefaultSpeaker;
}

bool SpeakerSegmenter::starts_new_turn(const core::Word& word) const {
    if (!current_) return true;
    if (speaker_identity(word) != current_->speaker_id) return true;
    if (word.channel_index != current_->channel_index) return true;
    return word.start - current_->end > config_.max_gap;
}

void SpeakerSegmenter::push(const core::Word& word) {
    if (word.kind != core::Word::Kind::Word || word.text.empty()) return;

    if (starts_new_turn(word)) {
        if (current_) closed_.push_back(std::move(*current_));
        core::SpeakerTurn turn;
        turn.speaker_id = speaker_identity(word);
        turn.start = word.start;
        turn.end = word.end;
        turn.text = word.text;
        turn.channel_index = word.channel_index;
        current_ = std::move(turn);
        return;
    }
    current_->text += " " + word.text;
    current_->end = word.end;
}

std::vector<core::SpeakerTurn> SpeakerSegmenter::merge_short_turns(std::vector<core::SpeakerTurn> turns) const {
    if (config_.min_merge_ms <= 0 || turns.size() < 2) return turns;

    std::vector<core::SpeakerTurn> merged;
    merged.reserve(turns.size());
    for (auto& turn : turns) {
        if (!merged.empty()) {
            core::SpeakerTurn& prev = merged.back();
            const bool same_owner = prev.speaker_id == turn.speaker_id && prev.channel_index == turn.channel_index;
            if (same_owner && turn.duration() * 1000.0 < config_.min_merge_ms) {
                prev.text += " " + turn.text;
                prev.end = turn.end;
                continue;
            }
        }
        merged.push_back(std::move(turn));
    }
    return merged;
}

std::vector<core::SpeakerTurn> SpeakerSegmenter::take_closed() {
    if (closed_.empty()) return {};
    std::vector<core::SpeakerTurn> merged = merge_short_turns(std::move(closed_));
    closed_.clear();
    // The newest closed turn can still absorb a short follow-up turn
    closed_.push_back(std::move(merged.back()));
    merged.pop_back();
    return merged;
}

std::vector<core::SpeakerTurn> SpeakerSegmenter::finish() {
    if (current_) {
        closed_.push_back(std::move(*current_));
        current_.reset();
    }
    std::vector<core::SpeakerTurn> merged = merge_short_turns(std::move(closed_));
    closed_.clear();
    return merged;
}

std::vector<core::SpeakerTurn> SpeakerSegmenter::segment(const std::vector<core::Word>& words) const {
    // Pass 1: boundaries
    SpeakerSegmenter pass(config_);
    for (const auto& w : words) pass.push(w);
    std::vector<core::SpeakerTurn> turns = std::move(pass.closed_);
    if (pass.current_) turns.push_back(std::move(*pass.current_));

    // Pass 2: fold micro-turns
    return merge_short_turns(std::move(turns));
}

} // namespace diar
