#include "asr/recognizer.hpp"
#include "audio/file_capture.hpp"
#include "core/text_utils.hpp"

namespace asr {

bool RecognitionResult::empty() const {
    if (!core::trim(text).empty()) return false;
    for (const auto& s : segments) {
        if (!core::trim(s.text).empty()) return false;
    }
    return true;
}

double RecognitionResult::confidence() const {
    if (segments.empty()) return core::kDefaultConfidence;
    double sum = 0.0;
    for (const auto& s : segments) sum += s.confidence;
    return sum / static_cast<double>(segments.size());
}

core::Result<RecognitionResult> IRecognizer::recognize_file(const std::string& path, const std::string& language) {
    audio::FileCapture file;
    if (!file.open(path)) {
        return core::Result<RecognitionResult>::fail(core::ErrorKind::RecognitionFailed,
                                                     "cannot read " + path + ": " + file.last_error());
    }
    const std::vector<int16_t> pcm = file.samples_at(core::kCanonicalSampleRate);
    return recognize(pcm.data(), pcm.size(), core::kCanonicalSampleRate, language);
}

} // namespace asr
