#include "text/transcript_store.hpp"
#include "core/logging.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace text {

namespace {
using json = nlohmann::json;

json segment_json(const core::TranscriptSegment& s) {
    json j = {{"start", s.start}, {"end", s.end}, {"text", s.text}, {"confidence", s.confidence}};
    if (s.speaker) j["speaker"] = *s.speaker;
    return j;
}

json turn_json(const core::SpeakerTurn& t) {
    json j = {{"speaker_id", t.speaker_id}, {"start", t.start}, {"end", t.end}, {"text", t.text}};
    if (t.channel_index) j["channel_index"] = *t.channel_index;
    return j;
}

bool write_file(const std::filesystem::path& path, const std::string& body) {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;
    out << body;
    return static_cast<bool>(out);
}
} // namespace

TranscriptStore::TranscriptStore(std::string output_dir) : output_dir_(std::move(output_dir)) {}

std::string TranscriptStore::to_json(const StoredTranscript& transcript) {
    json segments = json::array();
    for (const auto& s : transcript.segments) segments.push_back(segment_json(s));
    json turns = json::array();
    for (const auto& t : transcript.turns) turns.push_back(turn_json(t));

    json root = {
        {"full_text", transcript.full_text},
        {"segments", segments},
        {"turns", turns},
        {"diarized", transcript.diarized},
    };
    if (!transcript.provider.empty()) root["provider"] = transcript.provider;
    return root.dump(2);
}

core::Result<StoredTranscript> TranscriptStore::from_json(const std::string& body) {
    using R = core::Result<StoredTranscript>;
    try {
        const json root = json::parse(body);
        if (!root.is_object()) return R::fail(core::ErrorKind::InvalidResponse, "transcript is not a JSON object");

        StoredTranscript out;
        out.full_text = root.value("full_text", std::string());
        out.provider = root.value("provider", std::string());
        out.diarized = root.value("diarized", false);

        if (root.contains("segments") && root["segments"].is_array()) {
            for (const auto& j : root["segments"]) {
                core::TranscriptSegment s;
                s.text = j.value("text", std::string());
                s.start = j.value("start", 0.0);
                s.end = j.value("end", s.start);
                s.confidence = j.value("confidence", core::kDefaultConfidence);
                if (j.contains("speaker") && j["speaker"].is_string()) s.speaker = j["speaker"].get<std::string>();
                out.segments.push_back(std::move(s));
            }
        }
        if (root.contains("turns") && root["turns"].is_array()) {
            for (const auto& j : root["turns"]) {
                core::SpeakerTurn t;
                t.speaker_id = j.value("speaker_id", std::string(core::kDefaultSpeaker));
                t.start = j.value("start", 0.0);
                t.end = j.value("end", t.start);
                t.text = j.value("text", std::string());
                if (j.contains("channel_index") && j["channel_index"].is_number_integer()) {
                    t.channel_index = j["channel_index"].get<int>();
                }
                out.turns.push_back(std::move(t));
            }
        }
        return out;
    } catch (const json::exception& e) {
        return R::fail(core::ErrorKind::InvalidResponse, std::string("bad transcript JSON: ") + e.what());
    }
}

core::Result<std::string> TranscriptStore::save(const std::string& name, const StoredTranscript& transcript) const {
    using R = core::Result<std::string>;
    namespace fs = std::filesystem;

    std::error_code ec;
    const fs::path dir(output_dir_.empty() ? "." : output_dir_);
    fs::create_directories(dir, ec);
    if (ec) return R::fail(core::ErrorKind::InvalidResponse, "cannot create " + dir.string() + ": " + ec.message());

    const fs::path json_path = dir / (name + ".json");
    const fs::path txt_path = dir / (name + ".txt");
    if (!write_file(json_path, to_json(transcript))) {
        return R::fail(core::ErrorKind::InvalidResponse, "cannot write " + json_path.string());
    }
    if (!write_file(txt_path, transcript.full_text + "\n")) {
        return R::fail(core::ErrorKind::InvalidResponse, "cannot write " + txt_path.string());
    }
    core::log_info("[store] saved " + json_path.string() + " (" + std::to_string(transcript.segments.size()) +
                   " segments)");
    return json_path.string();
}

core::Result<StoredTranscript> TranscriptStore::load(const std::string& json_path) {
    std::ifstream in(json_path, std::ios::binary);
    if (!in) return core::Result<StoredTranscript>::fail(core::ErrorKind::InvalidResponse, "cannot open " + json_path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return from_json(ss.str());
}

} // namespace text
