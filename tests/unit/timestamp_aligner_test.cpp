#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include "text/timestamp_aligner.hpp"

using text::TimestampAligner;

namespace {
core::TranscriptSegment seg(const std::string& text, double start, double end) {
    core::TranscriptSegment s;
    s.text = text;
    s.start = start;
    s.end = end;
    return s;
}

core::AlignmentTarget target(const std::string& title, const std::string& summary) {
    core::AlignmentTarget t;
    t.title = title;
    t.summary_text = summary;
    return t;
}
} // namespace

int main() {
    assert(TimestampAligner::normalize("  Hello,   WORLD!! it's  ok ") == "hello world it s ok");
    assert(TimestampAligner::normalize("...").empty());
    // Unicode punctuation splits words like ASCII punctuation; letters survive
    assert(TimestampAligner::normalize("wait\u2014what") == "wait what");
    assert(TimestampAligner::normalize("\u201cQuoted\u201d \u00abtext\u00bb\u2026") == "quoted text");
    assert(TimestampAligner::normalize("\u00bfQu\u00e9 pas\u00f3?") == "qu\u00e9 pas\u00f3");
    assert(TimestampAligner::normalize("\u3001\u65e5\u672c\u3002") == "\u65e5\u672c");

    auto m = TimestampAligner::longest_common_substring("abc xyz abc", 0, "abc");
    assert(m.length == 3 && m.corpus_pos == 0);   // earliest wins
    m = TimestampAligner::longest_common_substring("abc xyz abc", 1, "abc");
    assert(m.length == 3 && m.corpus_pos == 8);
    assert(TimestampAligner::longest_common_substring("abc", 5, "abc").length == 0);

    const std::vector<core::TranscriptSegment> segments = {
        seg("Welcome to the show, today we talk about rust and memory safety.", 0.0, 10.0),
        seg("Our first guest builds compilers for embedded devices.", 10.0, 25.0),
        seg("Later we discuss the economics of open source maintenance.", 25.0, 40.0),
        seg("Thanks for listening and see you next week.", 40.0, 45.0),
    };

    TimestampAligner aligner;
    std::vector<core::AlignmentTarget> chapters = {
        target("Intro", "Today we talk about Rust and memory safety"),
        target("Guest", "Our first guest builds compilers for embedded devices"),
        target("Open source", "the economics of open source maintenance"),
        target("Unrelated", "quantum chromodynamics lattice gauge simulations"),
    };
    auto stats = aligner.align(chapters, segments);
    assert(stats.attempted == 4);
    assert(stats.aligned == 3);
    assert(stats.partial);   // 3 of 4 is below 80%
    assert(chapters[0].start_timestamp && *chapters[0].start_timestamp == 0.0);
    assert(*chapters[1].start_timestamp == 10.0);
    assert(*chapters[2].start_timestamp == 25.0);
    assert(!chapters[3].start_timestamp);

    // Search continues after the previous match, so a repeated phrase lands later
    std::vector<core::TranscriptSegment> repeated = {
        seg("news of the day", 0.0, 5.0),
        seg("weather report", 5.0, 10.0),
        seg("news of the day", 10.0, 15.0),
    };
    std::vector<core::AlignmentTarget> twice = {target("a", "weather report"), target("b", "news of the day")};
    auto rs = aligner.align(twice, repeated);
    assert(rs.aligned == 2 && !rs.partial);
    assert(*twice[0].start_timestamp == 5.0);
    assert(*twice[1].start_timestamp == 10.0);

    // Matches that land earlier in time than the previous one are bumped forward
    std::vector<core::TranscriptSegment> shuffled = {
        seg("the keynote opens with a product announcement", 50.0, 55.0),
        seg("questions from the audience about pricing", 10.0, 15.0),
    };
    std::vector<core::AlignmentTarget> ordered = {
        target("Keynote", "the keynote opens with a product announcement"),
        target("Q&A", "questions from the audience about pricing"),
    };
    auto bs = aligner.align(ordered, shuffled);
    assert(bs.aligned == 2);
    assert(*ordered[0].start_timestamp == 50.0);
    assert(*ordered[1].start_timestamp == 51.0);

    // Title is the cue when the summary is empty
    std::vector<core::AlignmentTarget> titled = {target("weather report", "")};
    aligner.align(titled, repeated);
    assert(titled[0].start_timestamp && *titled[0].start_timestamp == 5.0);

    // Nothing to align against
    std::vector<core::AlignmentTarget> none = {target("x", "anything")};
    auto empty_stats = aligner.align(none, {});
    assert(empty_stats.aligned == 0 && empty_stats.partial);

    // Caption files are parsed once per path
    const std::string path = "streamscribe_aligner_test.srt";
    {
        std::ofstream out(path);
        out << "1\n00:00:00,000 --> 00:00:05,000\nnews of the day\n\n"
               "2\n00:00:05,000 --> 00:00:10,000\nweather report\n\n";
    }
    TimestampAligner file_aligner;
    std::vector<core::AlignmentTarget> from_file = {target("w", "weather report")};
    auto fs1 = file_aligner.align_to_caption_file(from_file, path);
    assert(fs1.ok() && fs1.value().aligned == 1);
    assert(*from_file[0].start_timestamp == 5.0);
    auto fs2 = file_aligner.align_to_caption_file(from_file, path);
    assert(fs2.ok() && fs2.value().cache_hits == 1);
    assert(file_aligner.cache_hits() == 1);
    std::remove(path.c_str());

    assert(!file_aligner.align_to_caption_file(from_file, "missing.vtt").ok());
    return 0;
}
