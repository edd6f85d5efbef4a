#pragma once
#include "asr/http_transport.hpp"
#include "asr/recognizer.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace asr {

/**
 * @brief Remote recognition with integrated diarization (ElevenLabs Scribe)
 *
 * Uploads audio as multipart/form-data and maps the word-level response onto
 * core::Word. Classification of failures:
 * - HTTP 429 / 5xx and transport errors: TransientProvider (retryable)
 * - HTTP 422: InvalidResponse, the request itself was rejected
 * - other HTTP errors: RecognitionFailed
 * - malformed JSON or a body without words: InvalidResponse
 */
class ScribeClient : public IRecognizer {
public:
    struct Config {
        std::string api_key;
        std::string base_url = "https://api.elevenlabs.io";
        std::string model_id = "scribe_v1";
        bool diarize = true;
        std::optional<int> num_speakers;
        std::optional<double> diarization_threshold;  ///< Sent only with diarize and no num_speakers
        bool use_multi_channel = false;
        long timeout_seconds = 300;
    };

    static constexpr uint64_t kMaxUploadBytes = 3ULL * 1024 * 1024 * 1024;

    ScribeClient(Config config, std::shared_ptr<IHttpTransport> transport);

    core::Result<RecognitionResult> recognize(const int16_t* samples, size_t n,
                                              int sample_rate, const std::string& language) override;
    core::Result<RecognitionResult> recognize_file(const std::string& path, const std::string& language) override;

    bool available() const override;
    std::string name() const override { return "elevenlabs-scribe"; }
    bool diarizes() const override { return config_.diarize || config_.use_multi_channel; }

    // Form fields in request order; booleans as "true"/"false"
    static std::vector<std::pair<std::string, std::string>> build_form_fields(const Config& config,
                                                                              const std::string& language);

private:
    core::Result<RecognitionResult> send(MultipartRequest request);

    Config config_;
    std::shared_ptr<IHttpTransport> transport_;
};

// Words from a Scribe response body. Multi-channel responses ("transcripts")
// tag each word with its channel; audio events are skipped.
core::Result<std::vector<core::Word>> parse_words_from_response(const std::string& body);

// Full recognition result (text, one covering segment, words, language)
core::Result<RecognitionResult> parse_scribe_response(const std::string& body);

} // namespace asr
