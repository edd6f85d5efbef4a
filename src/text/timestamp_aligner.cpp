#include "text/timestamp_aligner.hpp"
#include "text/captions.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cctype>

namespace text {

namespace {

// Length of the UTF-8 sequence at `pos`, or 0 when it is malformed
size_t decode_utf8(const std::string& s, size_t pos, char32_t& cp) {
    const unsigned char lead = static_cast<unsigned char>(s[pos]);
    size_t len = 0;
    if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
    } else {
        return 0;
    }
    if (pos + len > s.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        const unsigned char cont = static_cast<unsigned char>(s[pos + k]);
        if ((cont & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cont & 0x3F);
    }
    return len;
}

// Punctuation, symbols and spaces from the Latin-1, General Punctuation,
// CJK and fullwidth blocks
bool is_unicode_punctuation(char32_t cp) {
    if (cp >= 0xA0 && cp <= 0xBF) {
        // Letter-like and numeric Latin-1 characters are word characters
        return !(cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 || cp == 0xB9 || cp == 0xBA ||
                 (cp >= 0xBC && cp <= 0xBE));
    }
    if (cp == 0xD7 || cp == 0xF7) return true;
    if (cp >= 0x2000 && cp <= 0x206F) return true;
    if ((cp >= 0x3000 && cp <= 0x3004) || (cp >= 0x3008 && cp <= 0x3011) || (cp >= 0x3014 && cp <= 0x301F)) return true;
    if ((cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) || (cp >= 0xFF3B && cp <= 0xFF40) ||
        (cp >= 0xFF5B && cp <= 0xFF65)) {
        return cp != 0xFF3F;  // fullwidth low line is a word character
    }
    return false;
}

} // namespace

TimestampAligner::TimestampAligner() : TimestampAligner(Config{}) {}

TimestampAligner::TimestampAligner(const Config& config) : config_(config) {}

std::string TimestampAligner::normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    size_t i = 0;
    while (i < text.size()) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        bool word_char = false;
        if (c < 0x80) {
            word_char = std::isalnum(c) || c == '_';
        } else {
            char32_t cp = 0;
            len = decode_utf8(text, i, cp);
            // Non-ASCII letters and digits stay; Unicode punctuation splits words
            word_char = len == 0 || !is_unicode_punctuation(cp);
            if (len == 0) len = 1;
        }
        if (!word_char) {
            pending_space = true;
            i += len;
            continue;
        }
        if (pending_space && !out.empty()) out.push_back(' ');
        pending_space = false;
        if (c < 0x80) {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            out.append(text, i, len);
        }
        i += len;
    }
    return out;
}

TimestampAligner::Match TimestampAligner::longest_common_substring(const std::string& corpus, size_t from,
                                                                  const std::string& cue) {
    Match best;
    if (from >= corpus.size() || cue.empty()) return best;

    // prev[j] = length of the common suffix ending at corpus[i-1], cue[j-1]
    std::vector<size_t> prev(cue.size() + 1, 0), cur(cue.size() + 1, 0);
    for (size_t i = from; i < corpus.size(); ++i) {
        for (size_t j = 1; j <= cue.size(); ++j) {
            if (corpus[i] == cue[j - 1]) {
                cur[j] = prev[j - 1] + 1;
                if (cur[j] > best.length) {
                    best.length = cur[j];
                    best.corpus_pos = i + 1 - cur[j];
                }
            } else {
                cur[j] = 0;
            }
        }
        std::swap(prev, cur);
    }
    return best;
}

AlignmentStats TimestampAligner::align(std::vector<core::AlignmentTarget>& targets,
                                       const std::vector<core::TranscriptSegment>& segments) const {
    AlignmentStats stats;
    stats.attempted = targets.size();

    // Corpus plus the segment owning each character (separator included)
    std::string corpus;
    std::vector<size_t> owner;
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string norm = normalize(segments[i].text);
        if (norm.empty()) continue;
        if (!corpus.empty()) corpus.push_back(' ');
        corpus += norm;
        owner.insert(owner.end(), norm.size() + 1, i);
    }

    size_t last_pos = 0;
    if (!corpus.empty()) {
        for (size_t t = 0; t < targets.size(); ++t) {
            auto& target = targets[t];
            std::string cue = normalize(target.summary_text);
            if (cue.empty()) cue = normalize(target.title);
            if (cue.size() > config_.cue_chars) cue.resize(config_.cue_chars);
            if (cue.empty()) continue;

            const Match m = longest_common_substring(corpus, last_pos, cue);
            const double needed = std::min(cue.size() * config_.threshold, static_cast<double>(config_.min_match_cap));
            if (static_cast<double>(m.length) < needed || m.length == 0) {
                core::log_debug("[align] target " + std::to_string(t + 1) + " rejected (" +
                                core::to_string(core::ErrorKind::AlignmentRejected) + "): match " +
                                std::to_string(m.length) + " chars");
                continue;
            }
            target.start_timestamp = segments[owner[m.corpus_pos]].start;
            last_pos = std::max(last_pos, m.corpus_pos);
        }
    }

    // Non-decreasing timestamps
    std::optional<double> previous;
    for (auto& target : targets) {
        if (!target.start_timestamp) continue;
        if (previous && *target.start_timestamp < *previous) {
            target.start_timestamp = *previous + config_.monotonic_bump;
        }
        previous = target.start_timestamp;
        stats.aligned++;
    }

    stats.partial = stats.attempted == 0 ||
                    static_cast<double>(stats.aligned) < static_cast<double>(stats.attempted) * config_.partial_ratio;
    core::log_info("[align] " + std::to_string(stats.aligned) + "/" + std::to_string(stats.attempted) +
                   " targets aligned" + (stats.partial ? " (partial)" : ""));
    return stats;
}

core::Result<AlignmentStats> TimestampAligner::align_to_caption_file(std::vector<core::AlignmentTarget>& targets,
                                                                    const std::string& path) {
    auto it = cache_.find(path);
    if (it != cache_.end()) {
        cache_hits_++;
    } else {
        core::Result<std::vector<core::TranscriptSegment>> parsed = load_caption_file(path);
        if (!parsed.ok()) return parsed.error();
        it = cache_.emplace(path, parsed.take()).first;
    }
    AlignmentStats stats = align(targets, it->second);
    stats.cache_hits = cache_hits_;
    return stats;
}

} // namespace text
