#undef NDEBUG
#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "app/provider_chain.hpp"

namespace {
// File-level recognizer with canned output
class FakeRecognizer : public asr::IRecognizer {
public:
    FakeRecognizer(std::string name, bool diarizing) : name_(std::move(name)), diarizing_(diarizing) {}

    core::Result<asr::RecognitionResult> recognize(const int16_t*, size_t, int, const std::string&) override {
        return core::Result<asr::RecognitionResult>::fail(core::ErrorKind::RecognitionFailed, "not used");
    }
    core::Result<asr::RecognitionResult> recognize_file(const std::string&, const std::string&) override {
        calls++;
        if (fail_with_status > 0) {
            return core::Result<asr::RecognitionResult>::fail(core::ErrorKind::TransientProvider,
                                                              "HTTP " + std::to_string(fail_with_status),
                                                              fail_with_status);
        }
        return result;
    }
    bool available() const override { return is_available; }
    std::string name() const override { return name_; }
    bool diarizes() const override { return diarizing_; }

    asr::RecognitionResult result;
    int fail_with_status = 0;
    bool is_available = true;
    int calls = 0;

private:
    std::string name_;
    bool diarizing_;
};

class FakeDiarizer : public diar::IDiarizer {
public:
    core::Result<std::vector<core::DiarizationInterval>> diarize(const std::string&) override {
        calls++;
        if (fail) {
            return core::Result<std::vector<core::DiarizationInterval>>::fail(core::ErrorKind::RecognitionFailed,
                                                                              "embedding failed");
        }
        return intervals;
    }
    bool available() const override { return true; }
    std::string name() const override { return "fake-diarizer"; }

    std::vector<core::DiarizationInterval> intervals;
    bool fail = false;
    int calls = 0;
};

core::Word word(const std::string& text, double start, double end, const std::string& speaker) {
    core::Word w;
    w.text = text;
    w.start = start;
    w.end = end;
    w.speaker_id = speaker;
    return w;
}

asr::RecognitionResult baseline_result() {
    asr::RecognitionResult r;
    r.text = "good morning everyone. thanks for having me.";
    r.segments.push_back(asr::RecognizedSegment{0.0, 2.0, "good morning everyone.", 0.9});
    r.segments.push_back(asr::RecognizedSegment{2.5, 4.0, "thanks for having me.", 0.7});
    return r;
}

app::RetryPolicy counting_policy(int& sleeps) {
    return app::RetryPolicy(app::RetryPolicy::Config{}, [&sleeps](std::chrono::milliseconds) { sleeps++; },
                            []() { return 0.0; });
}
} // namespace

int main() {
    assert(app::parse_strategy("scribe") == app::Strategy::IntegratedDiarizing);
    assert(app::parse_strategy("whisper+diarizer") == app::Strategy::RecognitionPlusDiarization);
    assert(app::parse_strategy("whisper") == app::Strategy::RecognitionOnly);
    assert(!app::parse_strategy("nope"));

    // Remote provider keeps failing with HTTP 500: three attempts, then the local pair
    {
        auto remote = std::make_shared<FakeRecognizer>("provider 1", true);
        remote->fail_with_status = 500;
        auto whisper = std::make_shared<FakeRecognizer>("whisper", false);
        whisper->result = baseline_result();
        auto diarizer = std::make_shared<FakeDiarizer>();
        diarizer->intervals = {{"A", 0.0, 2.2}, {"B", 2.2, 5.0}};

        int sleeps = 0;
        std::vector<app::FallbackEvent> seen;
        app::ChainConfig cfg;
        cfg.on_fallback = [&](const app::FallbackEvent& ev) { seen.push_back(ev); };
        app::ProviderFallbackChain chain(cfg, remote, whisper, diarizer, counting_policy(sleeps));
        assert(chain.active_strategies().size() == 3);

        auto r = chain.transcribe("talk.wav");
        assert(r.ok());
        assert(remote->calls == 3);
        assert(sleeps == 2);
        assert(whisper->calls == 1);
        assert(diarizer->calls == 1);

        const app::FileTranscription& t = r.value();
        assert(t.provider == "whisper+fake-diarizer");
        assert(t.diarized);
        assert(t.segments.size() == 2);
        assert(*t.segments[0].speaker == "Speaker A");
        assert(*t.segments[1].speaker == "Speaker B");
        assert(t.full_text == "good morning everyone.thanks for having me.");
        assert(t.fallbacks.size() == 1);
        assert(t.fallbacks[0].from == "provider 1");
        assert(t.fallbacks[0].to == "whisper+fake-diarizer");
        assert(t.fallbacks[0].reason == "provider 1 exhausted retries");
        assert(seen.size() == 1);
        assert(chain.events().size() == 1);
    }

    // Diarizer failure drops to recognition only, reusing the baseline result
    {
        auto whisper = std::make_shared<FakeRecognizer>("whisper", false);
        whisper->result = baseline_result();
        auto diarizer = std::make_shared<FakeDiarizer>();
        diarizer->fail = true;

        int sleeps = 0;
        app::ChainConfig cfg;
        app::ProviderFallbackChain chain(cfg, nullptr, whisper, diarizer, counting_policy(sleeps));
        assert(chain.active_strategies().size() == 2);

        auto r = chain.transcribe("talk.wav");
        assert(r.ok());
        assert(whisper->calls == 1);
        assert(r.value().provider == "whisper");
        assert(!r.value().diarized);
        assert(!r.value().segments[0].speaker);
        assert(r.value().fallbacks.size() == 1);
        assert(r.value().fallbacks[0].reason == "whisper+fake-diarizer failed: embedding failed");
    }

    // Integrated diarization: words become speaker turns
    {
        auto remote = std::make_shared<FakeRecognizer>("scribe", true);
        remote->result.text = "hi there hello";
        remote->result.diarized = true;
        remote->result.words = {word("hello", 1.2, 1.6, "speaker_1"), word("hi", 0.0, 0.4, "speaker_0"),
                                word("there", 0.5, 0.9, "speaker_0")};
        int sleeps = 0;
        app::ChainConfig cfg;
        app::ProviderFallbackChain chain(cfg, remote, nullptr, nullptr, counting_policy(sleeps));
        auto r = chain.transcribe("talk.wav");
        assert(r.ok());
        const app::FileTranscription& t = r.value();
        assert(t.provider == "scribe");
        assert(t.diarized);
        assert(t.turns.size() == 2);
        assert(t.turns[0].speaker_id == "speaker_0" && t.turns[0].text == "hi there");
        assert(t.segments.size() == 2);
        assert(*t.segments[1].speaker == "speaker_1");
        assert(t.fallbacks.empty());
    }

    // Empty result counts as a failure; everything failing is AllProvidersExhausted
    {
        auto remote = std::make_shared<FakeRecognizer>("scribe", true);
        auto whisper = std::make_shared<FakeRecognizer>("whisper", false);
        whisper->fail_with_status = 503;
        int sleeps = 0;
        app::ChainConfig cfg;
        cfg.order = {app::Strategy::IntegratedDiarizing, app::Strategy::RecognitionOnly};
        app::ProviderFallbackChain chain(cfg, remote, whisper, nullptr, counting_policy(sleeps));
        auto r = chain.transcribe("talk.wav");
        assert(!r.ok());
        assert(r.error().kind == core::ErrorKind::AllProvidersExhausted);
        assert(r.error().message.find("scribe returned empty result") != std::string::npos);
        assert(r.error().message.find("whisper exhausted retries") != std::string::npos);
        assert(chain.events().size() == 1);
        assert(chain.events()[0].reason == "scribe returned empty result");
    }

    // Unavailable providers are skipped up front
    {
        auto remote = std::make_shared<FakeRecognizer>("scribe", true);
        remote->is_available = false;
        int sleeps = 0;
        app::ProviderFallbackChain chain(app::ChainConfig{}, remote, nullptr, nullptr, counting_policy(sleeps));
        assert(chain.active_strategies().empty());
        auto r = chain.transcribe("talk.wav");
        assert(!r.ok());
        assert(r.error().kind == core::ErrorKind::AllProvidersExhausted);
        assert(remote->calls == 0);
    }
    return 0;
}
