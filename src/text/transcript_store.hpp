#pragma once
#include "core/result.hpp"
#include "core/types.hpp"
#include <string>
#include <vector>

namespace text {

// The per-session transcript artifact
struct StoredTranscript {
    std::string full_text;
    std::vector<core::TranscriptSegment> segments;
    std::vector<core::SpeakerTurn> turns;
    std::string provider;
    bool diarized = false;
};

/**
 * @brief Writes and reads the persisted transcript
 *
 * <base>.json holds {"full_text", "segments":[...], "turns":[...]} and
 * <base>.txt the full text. Written once per session.
 */
class TranscriptStore {
public:
    explicit TranscriptStore(std::string output_dir);

    // Returns the JSON path; creates the output directory when missing
    core::Result<std::string> save(const std::string& name, const StoredTranscript& transcript) const;

    static core::Result<StoredTranscript> load(const std::string& json_path);

    static std::string to_json(const StoredTranscript& transcript);
    static core::Result<StoredTranscript> from_json(const std::string& body);

    const std::string& output_dir() const { return output_dir_; }

private:
    std::string output_dir_;
};

} // namespace text
