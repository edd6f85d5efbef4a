#include "text/captions.hpp"
#include "core/logging.hpp"
#include "core/text_utils.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <regex>
#include <sstream>

namespace text {

namespace {

std::string format_time(double seconds, char ms_sep) {
    if (seconds < 0.0) seconds = 0.0;
    const long long total_ms = std::llround(seconds * 1000.0);
    const long long h = total_ms / 3600000;
    const long long m = (total_ms / 60000) % 60;
    const long long s = (total_ms / 1000) % 60;
    const long long ms = total_ms % 1000;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld%c%03lld", h, m, s, ms_sep, ms);
    return buf;
}

bool show_speaker(const std::optional<std::string>& speaker) {
    return speaker && !speaker->empty() && *speaker != core::kDefaultSpeaker;
}

struct Cue {
    double start;
    double end;
    std::string text;
    std::optional<std::string> speaker;
};

std::string render_srt(const std::vector<Cue>& cues, bool include_speaker) {
    if (cues.empty()) return "";
    std::ostringstream os;
    int index = 1;
    for (const auto& c : cues) {
        std::string line = core::trim(c.text);
        if (include_speaker && show_speaker(c.speaker)) line = "[" + *c.speaker + "] " + line;
        os << index++ << "\n"
           << format_srt_time(c.start) << " --> " << format_srt_time(c.end) << "\n"
           << line << "\n\n";
    }
    return os.str();
}

std::string render_vtt(const std::vector<Cue>& cues, bool include_speaker) {
    std::ostringstream os;
    os << "WEBVTT\n\n";
    for (const auto& c : cues) {
        std::string line = core::trim(c.text);
        if (include_speaker && show_speaker(c.speaker)) line = "<v " + *c.speaker + ">" + line + "</v>";
        os << format_vtt_time(c.start) << " --> " << format_vtt_time(c.end) << "\n" << line << "\n\n";
    }
    return os.str();
}

std::vector<Cue> cues_from(const std::vector<core::TranscriptSegment>& segments) {
    std::vector<Cue> cues;
    for (const auto& s : segments) cues.push_back(Cue{s.start, s.end, s.text, s.speaker});
    return cues;
}

std::vector<Cue> cues_from(const std::vector<core::SpeakerTurn>& turns) {
    std::vector<Cue> cues;
    for (const auto& t : turns) cues.push_back(Cue{t.start, t.end, t.text, t.speaker_id});
    return cues;
}

// Blank-line separated blocks, trimmed lines, CRLF tolerated
std::vector<std::vector<std::string>> split_blocks(const std::string& content) {
    std::vector<std::vector<std::string>> blocks;
    std::vector<std::string> current;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        line = core::trim(line);
        if (line.empty()) {
            if (!current.empty()) blocks.push_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(line);
    }
    if (!current.empty()) blocks.push_back(std::move(current));
    return blocks;
}

double to_seconds(const std::smatch& m, size_t first) {
    return std::stoi(m[first].str()) * 3600.0 + std::stoi(m[first + 1].str()) * 60.0 + std::stoi(m[first + 2].str()) +
           std::stoi(m[first + 3].str()) / 1000.0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string format_srt_time(double seconds) { return format_time(seconds, ','); }
std::string format_vtt_time(double seconds) { return format_time(seconds, '.'); }

std::string to_srt(const std::vector<core::TranscriptSegment>& segments, bool include_speaker) {
    return render_srt(cues_from(segments), include_speaker);
}

std::string to_vtt(const std::vector<core::TranscriptSegment>& segments, bool include_speaker) {
    return render_vtt(cues_from(segments), include_speaker);
}

std::string to_srt(const std::vector<core::SpeakerTurn>& turns, bool include_speaker) {
    return render_srt(cues_from(turns), include_speaker);
}

std::string to_vtt(const std::vector<core::SpeakerTurn>& turns, bool include_speaker) {
    return render_vtt(cues_from(turns), include_speaker);
}

std::vector<core::TranscriptSegment> parse_srt(const std::string& content) {
    static const std::regex kTiming(R"((\d+):(\d{2}):(\d{2}),(\d{3})\s*-->\s*(\d+):(\d{2}):(\d{2}),(\d{3}))");
    static const std::regex kSpeaker(R"(^\[([^\]]+)\]\s*(.*)$)");

    std::vector<core::TranscriptSegment> out;
    for (const auto& block : split_blocks(content)) {
        if (block.size() < 3) continue;
        std::smatch m;
        if (!std::regex_search(block[1], m, kTiming)) continue;

        core::TranscriptSegment seg;
        seg.start = to_seconds(m, 1);
        seg.end = to_seconds(m, 5);
        std::vector<std::string> lines(block.begin() + 2, block.end());
        std::string body = core::join_words(lines);
        std::smatch sm;
        if (std::regex_match(body, sm, kSpeaker)) {
            seg.speaker = sm[1].str();
            body = sm[2].str();
        }
        seg.text = body;
        out.push_back(seg);
    }
    return out;
}

std::vector<core::TranscriptSegment> parse_vtt(const std::string& content) {
    static const std::regex kTiming(R"((\d+):(\d{2}):(\d{2})\.(\d{3})\s*-->\s*(\d+):(\d{2}):(\d{2})\.(\d{3}))");
    static const std::regex kVoice(R"(^<v\s+([^>]+)>(.*?)(</v>)?$)");

    std::vector<core::TranscriptSegment> out;
    bool header_seen = false;
    for (const auto& block : split_blocks(content)) {
        if (!header_seen) {
            if (block.front().rfind("WEBVTT", 0) == 0) {
                header_seen = true;
                continue;
            }
            // Missing header: treat the file as cues only
            header_seen = true;
        }

        core::TranscriptSegment seg;
        bool timed = false;
        std::vector<std::string> lines;
        for (const auto& line : block) {
            std::smatch m;
            if (!timed && line.find("-->") != std::string::npos) {
                if (!std::regex_search(line, m, kTiming)) break;
                seg.start = to_seconds(m, 1);
                seg.end = to_seconds(m, 5);
                timed = true;
                continue;
            }
            if (!timed) continue;  // cue identifier
            if (std::regex_match(line, m, kVoice)) {
                seg.speaker = core::trim(m[1].str());
                const std::string rest = core::trim(m[2].str());
                if (!rest.empty()) lines.push_back(rest);
                continue;
            }
            lines.push_back(line);
        }
        if (!timed || lines.empty()) continue;
        seg.text = core::join_words(lines);
        out.push_back(seg);
    }
    return out;
}

core::Result<std::vector<core::TranscriptSegment>> load_caption_file(const std::string& path) {
    using R = core::Result<std::vector<core::TranscriptSegment>>;
    const std::string lower = core::to_lower(path);
    const bool is_srt = ends_with(lower, ".srt");
    const bool is_vtt = ends_with(lower, ".vtt");
    if (!is_srt && !is_vtt) {
        return R::fail(core::ErrorKind::InvalidResponse, "unsupported caption format: " + path);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return R::fail(core::ErrorKind::InvalidResponse, "cannot open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    std::vector<core::TranscriptSegment> segments = is_srt ? parse_srt(ss.str()) : parse_vtt(ss.str());
    core::log_debug("[captions] " + path + ": " + std::to_string(segments.size()) + " cues");
    return segments;
}

core::Result<std::vector<std::string>> save_captions(const std::vector<core::TranscriptSegment>& segments,
                                                     const std::string& base_path) {
    using R = core::Result<std::vector<std::string>>;
    std::vector<std::string> written;
    const std::pair<const char*, std::string> outputs[] = {
        {".srt", to_srt(segments)},
        {".vtt", to_vtt(segments)},
    };
    for (const auto& o : outputs) {
        const std::string path = base_path + o.first;
        std::ofstream out(path, std::ios::binary);
        if (!out) {
            return R::fail(core::ErrorKind::InvalidResponse, "cannot write " + path);
        }
        out << o.second;
        written.push_back(path);
    }
    return written;
}

} // namespace text
