#pragma once

#include "core/types.hpp"

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace core {

/**
 * @brief Rolling transcript built from recognition segments
 *
 * Keeps two views: a live window bounded by max_window seconds, and the full
 * session transcript retained for export. Segments are kept ordered by start;
 * a late segment is inserted at its position instead of appended.
 *
 * Thread-safe. Rendering is a pure function of the stored segments.
 */
class TranscriptAssembler {
public:
    struct Config {
        double max_window = 300.0;        ///< Seconds of live history kept
        double paragraph_gap = 2.0;       ///< Silence that starts a new paragraph
    };

    TranscriptAssembler();
    explicit TranscriptAssembler(const Config& config);

    void add_segment(const TranscriptSegment& segment);

    // Live window / whole session
    std::string render() const;
    std::string render_full() const;

    // Segments ending within `seconds` of the newest segment's end
    std::vector<TranscriptSegment> get_recent(double seconds) const;
    std::string render_recent(double seconds) const;

    std::vector<TranscriptSegment> live_segments() const;
    std::vector<TranscriptSegment> all_segments() const;
    size_t size() const;

    void clear();
    void set_config(const Config& config);

    // Paragraph-aware join used by both views
    static std::string render_segments(const std::vector<TranscriptSegment>& segments, double paragraph_gap);

private:
    template <typename Container>
    static void insert_ordered(Container& c, const TranscriptSegment& segment);

    Config config_;
    mutable std::mutex mutex_;
    std::deque<TranscriptSegment> live_;
    std::vector<TranscriptSegment> full_;
};

} // namespace core
