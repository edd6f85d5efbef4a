#pragma once
#include "core/result.hpp"
#include "core/types.hpp"
#include <string>
#include <vector>

namespace text {

// HH:MM:SS,mmm and HH:MM:SS.mmm, rounded to the nearest millisecond
std::string format_srt_time(double seconds);
std::string format_vtt_time(double seconds);

// Speaker labels are written as "[label] text" (SRT) or "<v label>text</v>" (VTT),
// except for a missing speaker or the default single-speaker label.
std::string to_srt(const std::vector<core::TranscriptSegment>& segments, bool include_speaker = true);
std::string to_vtt(const std::vector<core::TranscriptSegment>& segments, bool include_speaker = true);
std::string to_srt(const std::vector<core::SpeakerTurn>& turns, bool include_speaker = true);
std::string to_vtt(const std::vector<core::SpeakerTurn>& turns, bool include_speaker = true);

// Malformed blocks are skipped. Speaker labels written by to_srt/to_vtt are read back.
std::vector<core::TranscriptSegment> parse_srt(const std::string& content);
std::vector<core::TranscriptSegment> parse_vtt(const std::string& content);

// Chooses the parser by extension (.srt / .vtt)
core::Result<std::vector<core::TranscriptSegment>> load_caption_file(const std::string& path);

// Writes <base>.srt and <base>.vtt; returns the paths written
core::Result<std::vector<std::string>> save_captions(const std::vector<core::TranscriptSegment>& segments,
                                                     const std::string& base_path);

} // namespace text
