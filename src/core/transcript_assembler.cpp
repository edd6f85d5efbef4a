#include "core/transcript_assembler.hpp"
#include "core/text_utils.hpp"

#include <algorithm>

namespace core {

TranscriptAssembler::TranscriptAssembler() : TranscriptAssembler(Config{}) {}

TranscriptAssembler::TranscriptAssembler(const Config& config) : config_(config) {}

namespace {
// Sentence-final text is joined without an extra space
bool ends_with_terminal(const std::string& s) {
    if (s.empty()) return false;
    const char c = s.back();
    return c == '.' || c == '!' || c == '?' || c == '\n';
}
} // namespace

template <typename Container>
void TranscriptAssembler::insert_ordered(Container& c, const TranscriptSegment& segment) {
    if (c.empty() || c.back().start <= segment.start) {
        c.push_back(segment);
        return;
    }
    auto pos = std::upper_bound(c.begin(), c.end(), segment.start,
                                [](double start, const TranscriptSegment& s) { return start < s.start; });
    c.insert(pos, segment);
}

void TranscriptAssembler::add_segment(const TranscriptSegment& segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    insert_ordered(live_, segment);
    insert_ordered(full_, segment);

    double newest_end = 0.0;
    for (const auto& s : live_) newest_end = std::max(newest_end, s.end);
    const double cutoff = newest_end - config_.max_window;
    live_.erase(std::remove_if(live_.begin(), live_.end(),
                               [cutoff](const TranscriptSegment& s) { return s.end < cutoff; }),
                live_.end());
}

std::string TranscriptAssembler::render_segments(const std::vector<TranscriptSegment>& segments,
                                                 double paragraph_gap) {
    std::string out;
    const TranscriptSegment* prev = nullptr;
    for (const auto& seg : segments) {
        const std::string text = trim(seg.text);
        if (text.empty()) continue;
        if (prev) {
            if (seg.start - prev->end > paragraph_gap) {
                out += "\n\n";
            } else if (!ends_with_terminal(out)) {
                out += ' ';
            }
        }
        out += text;
        prev = &seg;
    }
    return out;
}

std::string TranscriptAssembler::render() const {
    return render_segments(live_segments(), config_.paragraph_gap);
}

std::string TranscriptAssembler::render_full() const {
    return render_segments(all_segments(), config_.paragraph_gap);
}

std::vector<TranscriptSegment> TranscriptAssembler::get_recent(double seconds) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TranscriptSegment> out;
    if (live_.empty()) return out;
    double newest_end = 0.0;
    for (const auto& s : live_) newest_end = std::max(newest_end, s.end);
    for (const auto& s : live_) {
        if (s.end >= newest_end - seconds) out.push_back(s);
    }
    return out;
}

std::string TranscriptAssembler::render_recent(double seconds) const {
    std::vector<std::string> parts;
    for (const auto& s : get_recent(seconds)) parts.push_back(trim(s.text));
    return join_words(parts);
}

std::vector<TranscriptSegment> TranscriptAssembler::live_segments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<TranscriptSegment>(live_.begin(), live_.end());
}

std::vector<TranscriptSegment> TranscriptAssembler::all_segments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return full_;
}

size_t TranscriptAssembler::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

void TranscriptAssembler::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    live_.clear();
    full_.clear();
}

void TranscriptAssembler::set_config(const Config& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

} // namespace core
