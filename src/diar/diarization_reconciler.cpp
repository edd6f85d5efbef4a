#include "diar/diarization_reconciler.hpp"

namespace diar {

std::optional<std::string> DiarizationReconciler::label_at(double t,
                                                           const std::vector<core::DiarizationInterval>& intervals) {
    for (const auto& iv : intervals) {
        if (iv.start <= t && t < iv.end) return iv.speaker_label;
    }
    return std::nullopt;
}

void DiarizationReconciler::assign_speakers(std::vector<core::TranscriptSegment>& segments,
                                            const std::vector<core::DiarizationInterval>& intervals) {
    for (auto& seg : segments) {
        const double mid = (seg.start + seg.end) / 2.0;
        auto label = label_at(mid, intervals);
        seg.speaker = label ? "Speaker " + *label : std::string(core::kUnknownSpeaker);
    }
}

void DiarizationReconciler::assign_word_speakers(std::vector<core::Word>& words,
                                                 const std::vector<core::DiarizationInterval>& intervals) {
    for (auto& w : words) {
        auto label = label_at((w.start + w.end) / 2.0, intervals);
        if (label) w.speaker_id = "Speaker " + *label;
    }
}

std::vector<core::SpeakerStats> DiarizationReconciler::speaker_stats(const std::vector<core::TranscriptSegment>& segments) {
    std::vector<core::SpeakerStats> stats;
    for (const auto& seg : segments) {
        const std::string who = seg.speaker.value_or(core::kUnknownSpeaker);
        core::SpeakerStats* entry = nullptr;
        for (auto& s : stats) {
            if (s.speaker == who) {
                entry = &s;
                break;
            }
        }
        if (!entry) {
            stats.push_back(core::SpeakerStats{who, 0.0, 0, {}});
            entry = &stats.back();
        }
        entry->total_speaking_time_s += seg.duration();
        entry->segment_count++;
        entry->last_text = seg.text;
    }
    return stats;
}

} // namespace diar
