#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <deque>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "asr/scribe_client.hpp"

namespace {
// Replays canned HTTP responses and records the requests
class FakeTransport : public asr::IHttpTransport {
public:
    core::Result<asr::HttpResponse> post_multipart(const asr::MultipartRequest& request) override {
        requests.push_back(request);
        if (responses.empty()) {
            return core::Result<asr::HttpResponse>::fail(core::ErrorKind::TransientProvider, "connection reset");
        }
        asr::HttpResponse r = responses.front();
        responses.pop_front();
        return r;
    }

    std::deque<asr::HttpResponse> responses;
    std::vector<asr::MultipartRequest> requests;
};

std::string field(const std::vector<std::pair<std::string, std::string>>& fields, const std::string& name) {
    for (const auto& f : fields) {
        if (f.first == name) return f.second;
    }
    return "<missing>";
}

const char* kDiarizedBody = R"json({
  "language_code": "en",
  "text": "Hi there. Hello!",
  "words": [
    {"text": "Hello!", "start": 1.2, "end": 1.6, "type": "word", "speaker_id": "speaker_1"},
    {"text": " ", "start": 0.9, "end": 1.2, "type": "spacing", "speaker_id": "speaker_0"},
    {"text": "Hi", "start": 0.0, "end": 0.3, "type": "word", "speaker_id": "speaker_0"},
    {"text": "there.", "start": 0.4, "end": 0.9, "type": "word", "speaker_id": "speaker_0"},
    {"text": "(laughs)", "start": 1.7, "end": 2.0, "type": "audio_event"}
  ]
})json";
} // namespace

int main() {
    using asr::ScribeClient;

    // Form fields
    {
        ScribeClient::Config cfg;
        cfg.diarization_threshold = 0.3;
        auto fields = ScribeClient::build_form_fields(cfg, "en");
        assert(fields.front().first == "model_id" && fields.front().second == "scribe_v1");
        assert(field(fields, "diarize") == "true");
        assert(field(fields, "timestamps_granularity") == "word");
        assert(field(fields, "diarization_threshold") == "0.3");
        assert(field(fields, "language_code") == "en");
        assert(field(fields, "num_speakers") == "<missing>");

        // A fixed speaker count suppresses the threshold
        cfg.num_speakers = 3;
        fields = ScribeClient::build_form_fields(cfg, "");
        assert(field(fields, "num_speakers") == "3");
        assert(field(fields, "diarization_threshold") == "<missing>");
        assert(field(fields, "language_code") == "<missing>");
    }

    // Response parsing: words sorted, spacing and events dropped
    {
        auto r = asr::parse_scribe_response(kDiarizedBody);
        assert(r.ok());
        const asr::RecognitionResult& res = r.value();
        assert(res.diarized);
        assert(res.language == "en");
        assert(res.text == "Hi there. Hello!");
        assert(res.words.size() == 3);
        assert(res.words[0].text == "Hi" && *res.words[0].speaker_id == "speaker_0");
        assert(res.words[2].text == "Hello!");
        assert(res.segments.size() == 1);
        assert(res.segments[0].start == 0.0 && res.segments[0].end == 1.6);
    }

    // Multi-channel responses tag words with their channel
    {
        const char* body = R"({"transcripts": [
            {"channel_index": 0, "words": [{"text": "left", "start": 0.0, "end": 0.5, "type": "word"}]},
            {"channel_index": 1, "words": [{"text": "right", "start": 0.2, "end": 0.6, "type": "word"}]}
        ]})";
        auto words = asr::parse_words_from_response(body);
        assert(words.ok() && words.value().size() == 2);
        assert(*words.value()[1].channel_index == 1);
        auto r = asr::parse_scribe_response(body);
        assert(r.ok() && r.value().text == "left right");
    }

    assert(asr::parse_words_from_response("not json").error().kind == core::ErrorKind::InvalidResponse);
    assert(asr::parse_words_from_response(R"({"detail": "x"})").error().kind == core::ErrorKind::InvalidResponse);

    // HTTP status classification
    {
        auto transport = std::make_shared<FakeTransport>();
        transport->responses = {
            {500, "upstream error"},
            {429, "slow down"},
            {422, R"({"detail": "bad num_speakers"})"},
            {401, "unauthorized"},
            {200, kDiarizedBody},
        };
        ScribeClient::Config cfg;
        cfg.api_key = "test-key";
        cfg.base_url = "http://localhost:9";
        ScribeClient client(cfg, transport);
        assert(client.available());
        assert(client.diarizes());
        assert(client.name() == "elevenlabs-scribe");

        std::vector<int16_t> pcm(1600, 100);
        auto r1 = client.recognize(pcm.data(), pcm.size(), 16000, "en");
        assert(r1.error().kind == core::ErrorKind::TransientProvider && r1.error().http_status == 500);
        auto r2 = client.recognize(pcm.data(), pcm.size(), 16000, "en");
        assert(r2.error().kind == core::ErrorKind::TransientProvider && r2.error().http_status == 429);
        auto r3 = client.recognize(pcm.data(), pcm.size(), 16000, "en");
        assert(r3.error().kind == core::ErrorKind::InvalidResponse);
        assert(r3.error().message.find("bad num_speakers") != std::string::npos);
        auto r4 = client.recognize(pcm.data(), pcm.size(), 16000, "en");
        assert(r4.error().kind == core::ErrorKind::RecognitionFailed && r4.error().http_status == 401);
        auto r5 = client.recognize(pcm.data(), pcm.size(), 16000, "en");
        assert(r5.ok() && r5.value().words.size() == 3);
        // Transport failure is transient
        auto r6 = client.recognize(pcm.data(), pcm.size(), 16000, "en");
        assert(r6.error().kind == core::ErrorKind::TransientProvider);

        const asr::MultipartRequest& sent = transport->requests.front();
        assert(sent.url == "http://localhost:9/v1/speech-to-text");
        assert(sent.headers.size() == 1 && sent.headers[0] == "xi-api-key: test-key");
        assert(sent.file_name == "chunk.wav");
        assert(sent.file_bytes.size() == 44 + pcm.size() * 2);
        assert(sent.file_bytes.compare(0, 4, "RIFF") == 0);
    }

    // Files are streamed from disk by path
    {
        auto transport = std::make_shared<FakeTransport>();
        transport->responses = {{200, kDiarizedBody}};
        ScribeClient::Config cfg;
        cfg.api_key = "k";
        ScribeClient client(cfg, transport);
        const std::string path = "streamscribe_scribe_test.wav";
        {
            std::ofstream out(path, std::ios::binary);
            out << "RIFF0000WAVE";
        }
        auto r = client.recognize_file(path, "en");
        assert(r.ok());
        assert(transport->requests[0].file_path == path);
        std::remove(path.c_str());
        assert(client.recognize_file("missing.wav", "en").error().kind == core::ErrorKind::RecognitionFailed);
    }

    // No key: unavailable, and calls fail without touching the network
    {
        auto transport = std::make_shared<FakeTransport>();
        ScribeClient client(ScribeClient::Config{}, transport);
        assert(!client.available());
        std::vector<int16_t> pcm(10, 1);
        assert(!client.recognize(pcm.data(), pcm.size(), 16000, "en").ok());
        assert(transport->requests.empty());
    }
    return 0;
}
