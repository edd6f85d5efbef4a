#include "asr/scribe_client.hpp"
#include "audio/file_capture.hpp"
#include "core/logging.hpp"
#include "core/text_utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace asr {

namespace {
using json = nlohmann::json;

std::string format_threshold(double v) {
    std::ostringstream os;
    os << v;
    return os.str();
}

// Appends every "word"-typed entry of a words array
void collect_words(const json& words, std::optional<int> channel, std::vector<core::Word>& out) {
    if (!words.is_array()) return;
    for (const auto& w : words) {
        if (!w.is_object()) continue;
        if (w.contains("type") && !w["type"].is_null() && w["type"].get<std::string>() != "word") continue;
        core::Word word;
        word.text = w.value("text", std::string());
        word.start = w.value("start", 0.0);
        word.end = w.value("end", word.start);
        if (w.contains("speaker_id") && w["speaker_id"].is_string()) {
            word.speaker_id = w["speaker_id"].get<std::string>();
        }
        word.channel_index = channel;
        out.push_back(std::move(word));
    }
}
} // namespace

ScribeClient::ScribeClient(Config config, std::shared_ptr<IHttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    if (config_.use_multi_channel && config_.diarize) {
        core::log_warn("[scribe] diarize with multi-channel audio is usually unnecessary; channels identify speakers");
    }
    if (config_.diarization_threshold && (!config_.diarize || config_.num_speakers)) {
        core::log_warn("[scribe] ignoring diarization_threshold (requires diarize and no num_speakers)");
    }
}

bool ScribeClient::available() const {
    return transport_ != nullptr && !config_.api_key.empty();
}

std::vector<std::pair<std::string, std::string>> ScribeClient::build_form_fields(const Config& config,
                                                                                 const std::string& language) {
    std::vector<std::pair<std::string, std::string>> fields;
    fields.emplace_back("model_id", config.model_id);
    fields.emplace_back("timestamps_granularity", "word");
    fields.emplace_back("diarize", config.diarize ? "true" : "false");
    if (config.use_multi_channel) fields.emplace_back("use_multi_channel", "true");
    if (config.num_speakers) fields.emplace_back("num_speakers", std::to_string(*config.num_speakers));
    // The API answers 422 when a threshold comes with num_speakers or without diarize
    if (config.diarize && !config.num_speakers && config.diarization_threshold) {
        fields.emplace_back("diarization_threshold", format_threshold(*config.diarization_threshold));
    }
    if (!language.empty()) fields.emplace_back("language_code", language);
    return fields;
}

core::Result<RecognitionResult> ScribeClient::recognize(const int16_t* samples, size_t n,
                                                        int sample_rate, const std::string& language) {
    if (!samples || n == 0) return RecognitionResult{};
    MultipartRequest req;
    req.file_name = "chunk.wav";
    req.file_bytes = audio::encode_wav_pcm16(samples, n, sample_rate);
    req.fields = build_form_fields(config_, language);
    return send(std::move(req));
}

core::Result<RecognitionResult> ScribeClient::recognize_file(const std::string& path, const std::string& language) {
    using R = core::Result<RecognitionResult>;
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) return R::fail(core::ErrorKind::RecognitionFailed, "cannot stat " + path + ": " + ec.message());
    if (size > kMaxUploadBytes) {
        return R::fail(core::ErrorKind::RecognitionFailed,
                       "audio file too large: " + std::to_string(size) + " bytes exceeds the 3 GB upload limit");
    }
    if (size > 2ULL * 1024 * 1024 * 1024) {
        core::log_warn("[scribe] large upload: " + std::to_string(size / (1024 * 1024)) + " MB");
    }
    MultipartRequest req;
    req.file_path = path;
    req.fields = build_form_fields(config_, language);
    return send(std::move(req));
}

core::Result<RecognitionResult> ScribeClient::send(MultipartRequest request) {
    using R = core::Result<RecognitionResult>;
    if (!available()) return R::fail(core::ErrorKind::RecognitionFailed, "no API key configured");

    request.url = config_.base_url + "/v1/speech-to-text";
    request.headers.push_back("xi-api-key: " + config_.api_key);
    request.timeout_seconds = config_.timeout_seconds;

    auto resp = transport_->post_multipart(request);
    if (!resp) return resp.error();

    const HttpResponse& r = resp.value();
    const int status = static_cast<int>(r.status);
    if (status == 429 || status >= 500) {
        return R::fail(core::ErrorKind::TransientProvider, "HTTP " + std::to_string(status), status);
    }
    if (status == 422) {
        std::string detail = "unknown validation error";
        try {
            const json j = json::parse(r.body);
            if (j.contains("detail")) detail = j["detail"].dump();
        } catch (const json::exception&) {
            detail = r.body.substr(0, 200);
        }
        return R::fail(core::ErrorKind::InvalidResponse, "API validation error (422): " + detail, status);
    }
    if (status < 200 || status >= 300) {
        return R::fail(core::ErrorKind::RecognitionFailed,
                       "HTTP " + std::to_string(status) + " - " + r.body.substr(0, 1000), status);
    }
    return parse_scribe_response(r.body);
}

core::Result<std::vector<core::Word>> parse_words_from_response(const std::string& body) {
    using R = core::Result<std::vector<core::Word>>;
    std::vector<core::Word> words;
    try {
        const json resp = json::parse(body);
        if (!resp.is_object()) return R::fail(core::ErrorKind::InvalidResponse, "response is not a JSON object");
        if (resp.contains("transcripts")) {
            for (const auto& t : resp["transcripts"]) {
                const int channel = t.value("channel_index", 0);
                if (t.contains("words")) collect_words(t["words"], channel, words);
            }
        } else if (resp.contains("words")) {
            collect_words(resp["words"], std::nullopt, words);
        } else {
            std::string keys;
            for (auto it = resp.begin(); it != resp.end(); ++it) {
                if (!keys.empty()) keys += ", ";
                keys += it.key();
            }
            return R::fail(core::ErrorKind::InvalidResponse, "no 'words' or 'transcripts' in response (keys: " + keys + ")");
        }
    } catch (const json::exception& e) {
        return R::fail(core::ErrorKind::InvalidResponse, std::string("malformed response: ") + e.what());
    }
    std::stable_sort(words.begin(), words.end(),
                     [](const core::Word& a, const core::Word& b) { return a.start < b.start; });
    return words;
}

core::Result<RecognitionResult> parse_scribe_response(const std::string& body) {
    auto words = parse_words_from_response(body);
    if (!words) return words.error();

    RecognitionResult result;
    result.words = words.take();
    result.diarized = std::any_of(result.words.begin(), result.words.end(), [](const core::Word& w) {
        return w.speaker_id.has_value() || w.channel_index.has_value();
    });
    try {
        const json resp = json::parse(body);
        if (resp.contains("language_code") && resp["language_code"].is_string()) {
            result.language = resp["language_code"].get<std::string>();
        }
        if (resp.contains("text") && resp["text"].is_string()) {
            result.text = core::trim(resp["text"].get<std::string>());
        }
    } catch (const json::exception& e) {
        return core::Result<RecognitionResult>::fail(core::ErrorKind::InvalidResponse, e.what());
    }

    if (result.text.empty()) {
        std::vector<std::string> parts;
        for (const auto& w : result.words) parts.push_back(w.text);
        result.text = core::join_words(parts);
    }
    if (!result.words.empty()) {
        RecognizedSegment seg;
        seg.start = result.words.front().start;
        seg.end = result.words.back().end;
        for (const auto& w : result.words) seg.end = std::max(seg.end, w.end);
        seg.text = result.text;
        result.segments.push_back(std::move(seg));
    }
    return result;
}

} // namespace asr
