// Align chapter summaries onto a caption file's timeline
//
//   streamscribe_align <captions.srt|captions.vtt> <chapters.txt> [--threshold 0.6] [-v]
//
// chapters.txt: one block per chapter separated by blank lines; the first
// line is the title, the remaining lines the summary.
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "core/logging.hpp"
#include "core/text_utils.hpp"
#include "core/types.hpp"
#include "text/captions.hpp"
#include "text/timestamp_aligner.hpp"

namespace {
void usage() {
    std::cerr << "usage: streamscribe_align <captions.srt|.vtt> <chapters.txt> [--threshold T] [-v]\n";
}

std::vector<core::AlignmentTarget> read_chapters(std::istream& in) {
    std::vector<core::AlignmentTarget> out;
    core::AlignmentTarget current;
    bool open = false;
    std::string line;
    while (std::getline(in, line)) {
        line = core::trim(line);
        if (line.empty()) {
            if (open) out.push_back(current);
            current = core::AlignmentTarget{};
            open = false;
            continue;
        }
        if (!open) {
            current.title = line;
            open = true;
        } else {
            current.summary_text += (current.summary_text.empty() ? "" : " ") + line;
        }
    }
    if (open) out.push_back(current);
    return out;
}
} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> positional;
    text::TimestampAligner::Config acfg;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v" || a == "--verbose") { core::set_log_level(core::LogLevel::Debug); continue; }
        if (a == "-h" || a == "--help") { usage(); return 0; }
        if (a == "--threshold" && i + 1 < argc) { acfg.threshold = std::atof(argv[++i]); continue; }
        positional.push_back(a);
    }
    if (positional.size() != 2) {
        usage();
        return 2;
    }

    std::ifstream chapters_in(positional[1]);
    if (!chapters_in) {
        std::cerr << "[error] cannot open " << positional[1] << "\n";
        return 1;
    }
    std::vector<core::AlignmentTarget> chapters = read_chapters(chapters_in);
    if (chapters.empty()) {
        std::cerr << "[error] no chapters in " << positional[1] << "\n";
        return 1;
    }

    text::TimestampAligner aligner(acfg);
    core::Result<text::AlignmentStats> stats = aligner.align_to_caption_file(chapters, positional[0]);
    if (!stats.ok()) {
        std::cerr << "[error] " << stats.error().describe() << "\n";
        return 1;
    }

    for (const auto& c : chapters) {
        if (c.start_timestamp) {
            const std::string t = text::format_vtt_time(*c.start_timestamp);
            std::cout << t.substr(0, t.size() - 4) << "  " << c.title << "\n";
        } else {
            std::cout << "--:--:--  " << c.title << "\n";
        }
    }
    std::cerr << "[align] " << stats.value().aligned << "/" << stats.value().attempted << " aligned"
              << (stats.value().partial ? " (partial)" : "") << "\n";
    return 0;
}
