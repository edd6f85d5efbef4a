#undef NDEBUG
#include <cassert>
#include <string>
#include "core/transcript_assembler.hpp"

namespace {
core::TranscriptSegment seg(const std::string& text, double start, double end) {
    core::TranscriptSegment s;
    s.text = text;
    s.start = start;
    s.end = end;
    return s;
}
} // namespace

int main() {
    core::TranscriptAssembler assembler;

    assembler.add_segment(seg("first", 0.0, 1.0));
    assembler.add_segment(seg("second", 1.2, 2.0));
    assert(assembler.render() == "first second");

    // Silence longer than the paragraph gap starts a new paragraph
    assembler.add_segment(seg("third", 5.0, 6.0));
    assert(assembler.render() == "first second\n\nthird");

    // A late segment lands at its position, not at the end
    assembler.add_segment(seg("between", 2.5, 2.8));
    auto all = assembler.all_segments();
    assert(all.size() == 4);
    assert(all[2].text == "between");
    assert(assembler.render() == "first second between\n\nthird");

    // Empty text is skipped when rendering
    assembler.add_segment(seg("   ", 6.5, 7.0));
    assert(assembler.render() == "first second between\n\nthird");

    assert(assembler.render_recent(1.5) == "third");
    assert(assembler.get_recent(100.0).size() == 5);

    // Live window evicts segments that ended before newest_end - max_window
    core::TranscriptAssembler::Config small;
    small.max_window = 10.0;
    core::TranscriptAssembler windowed(small);
    windowed.add_segment(seg("old", 0.0, 1.0));
    windowed.add_segment(seg("mid", 8.0, 9.0));
    windowed.add_segment(seg("new", 20.0, 21.0));
    assert(windowed.size() == 1);
    assert(windowed.render() == "new");
    // The full transcript keeps everything for export
    assert(windowed.all_segments().size() == 3);
    assert(windowed.render_full() == "old\n\nmid\n\nnew");

    windowed.clear();
    assert(windowed.size() == 0);
    assert(windowed.render_full().empty());

    assert(core::TranscriptAssembler::render_segments({}, 2.0).empty());

    // Terminal punctuation already separates sentences, so no space is added
    core::TranscriptAssembler punct;
    punct.add_segment(seg("Hello there.", 0.0, 1.0));
    punct.add_segment(seg("General Kenobi", 1.2, 2.0));
    assert(punct.render() == "Hello there.General Kenobi");
    punct.add_segment(seg("You are bold!", 2.1, 3.0));
    punct.add_segment(seg("Really?", 3.1, 3.5));
    punct.add_segment(seg("yes", 3.6, 4.0));
    assert(punct.render() == "Hello there.General Kenobi You are bold!Really?yes");
    // A paragraph break still wins over punctuation
    punct.add_segment(seg("Later.", 9.0, 10.0));
    assert(punct.render() == "Hello there.General Kenobi You are bold!Really?yes\n\nLater.");

    // Rendering without new segments in between is byte-identical
    const std::string once = punct.render();
    const std::string twice = punct.render();
    assert(once == twice);
    assert(punct.render_full() == punct.render_full());
    assert(punct.render_recent(5.0) == punct.render_recent(5.0));
    return 0;
}
