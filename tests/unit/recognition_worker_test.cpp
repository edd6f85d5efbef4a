#undef NDEBUG
#include <cassert>
#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "core/recognition_worker.hpp"

namespace {
// Replies from a script, one entry per recognize() call
class ScriptedRecognizer : public asr::IRecognizer {
public:
    explicit ScriptedRecognizer(std::vector<std::string> replies) : replies_(std::move(replies)) {}

    core::Result<asr::RecognitionResult> recognize(const int16_t*, size_t, int, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string reply = next_ < replies_.size() ? replies_[next_] : "";
        next_++;
        if (reply == "!fail") {
            return core::Result<asr::RecognitionResult>::fail(core::ErrorKind::RecognitionFailed, "decoder error");
        }
        if (reply == "!throw") throw std::runtime_error("model crashed");
        asr::RecognitionResult r;
        r.text = reply;
        r.segments.push_back(asr::RecognizedSegment{0.0, 1.0, reply, 0.9});
        return r;
    }
    bool available() const override { return true; }
    std::string name() const override { return "scripted"; }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return next_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> replies_;
    size_t next_ = 0;
};

// Sleeps before answering; the first `slow_calls` calls are slower than real time
class PacedRecognizer : public asr::IRecognizer {
public:
    PacedRecognizer(size_t slow_calls, std::chrono::milliseconds delay) : slow_calls_(slow_calls), delay_(delay) {}

    core::Result<asr::RecognitionResult> recognize(const int16_t*, size_t, int, const std::string&) override {
        const size_t n = calls_++;
        if (n < slow_calls_) std::this_thread::sleep_for(delay_);
        asr::RecognitionResult r;
        r.text = "part " + std::to_string(n);
        return r;
    }
    bool available() const override { return true; }
    std::string name() const override { return "paced"; }

private:
    size_t slow_calls_;
    std::chrono::milliseconds delay_;
    size_t calls_ = 0;
};

core::AudioChunk speech_chunk(uint64_t index, double seconds = 1.0) {
    core::AudioChunk c;
    c.sample_rate = 16000;
    c.index = index;
    c.start_time = static_cast<double>(index);
    c.samples.assign(static_cast<size_t>(seconds * 16000), 3000);
    return c;
}
} // namespace

int main() {
    using core::RecognitionWorker;

    assert(RecognitionWorker::is_filler_only("um, uh... hmm"));
    assert(RecognitionWorker::is_filler_only(""));
    assert(!RecognitionWorker::is_filler_only("um hello"));
    assert(RecognitionWorker::mean_square_energy({}) == 0.0);
    assert(RecognitionWorker::mean_square_energy(std::vector<int16_t>(10, 0)) == 0.0);

    auto recognizer = std::make_shared<ScriptedRecognizer>(std::vector<std::string>{
        "Hello world",      // chunk 0: accepted
        "hello world",      // chunk 1: repeat of an accepted text
        "um uh",            // chunk 2: filler only
        "ok",               // chunk 3: too short
        "!fail",            // chunk 4: failed
        "!throw",           // chunk 5: failed
        "Second sentence",  // chunk 6: accepted
    });

    core::BoundedQueue<core::AudioChunk> input(32);
    core::BoundedQueue<core::TranscriptSegment> output(32);
    RecognitionWorker::Config cfg;
    std::vector<std::string> seen;
    cfg.on_segment = [&](const core::TranscriptSegment& s) { seen.push_back(s.text); };
    RecognitionWorker worker(recognizer, input, output, cfg);

    for (uint64_t i = 0; i < 7; ++i) input.push(speech_chunk(i));

    // Silent and too-short chunks never reach the recognizer
    core::AudioChunk silent = speech_chunk(7);
    std::fill(silent.samples.begin(), silent.samples.end(), 0);
    input.push(silent);
    input.push(speech_chunk(8, 0.2));

    input.stop();
    assert(worker.start());
    worker.join();
    assert(!worker.is_running());

    auto stats = worker.stats();
    assert(stats.processed == 9);
    assert(stats.accepted == 2);
    assert(stats.failed == 2);
    assert(stats.filtered == 5);
    assert(recognizer->calls() == 7);
    assert(stats.average_rtf > 0.0);

    auto segments = output.drain();
    assert(segments.size() == 2);
    assert(segments[0].text == "Hello world");
    assert(segments[0].start == 0.0 && segments[0].end == 1.0);
    assert(segments[0].confidence == 0.9);
    assert(segments[1].text == "Second sentence");
    assert(segments[1].start == 6.0);
    assert(seen.size() == 2);

    // Sustained slow recognition warns once, and again only after recovering
    {
        RecognitionWorker::Config paced_cfg;
        paced_cfg.min_chunk_seconds = 0.0;
        paced_cfg.min_text_chars = 1;

        // 20 ms chunks recognized in 60 ms: RTF about 0.33
        auto slow_only = std::make_shared<PacedRecognizer>(100, std::chrono::milliseconds(60));
        core::BoundedQueue<core::AudioChunk> in(16);
        core::BoundedQueue<core::TranscriptSegment> out(16);
        RecognitionWorker slow_worker(slow_only, in, out, paced_cfg);
        for (uint64_t i = 0; i < 8; ++i) in.push(speech_chunk(i, 0.02));
        in.stop();
        assert(slow_worker.start());
        slow_worker.join();
        auto ss = slow_worker.stats();
        assert(ss.processed == 8);
        assert(ss.average_rtf < 1.0);
        assert(ss.slow_warnings == 1);
        assert(ss.falling_behind);

        // Four slow chunks alone do not fill the window
        auto short_run = std::make_shared<PacedRecognizer>(100, std::chrono::milliseconds(60));
        core::BoundedQueue<core::AudioChunk> in2(16);
        core::BoundedQueue<core::TranscriptSegment> out2(16);
        RecognitionWorker short_worker(short_run, in2, out2, paced_cfg);
        for (uint64_t i = 0; i < 4; ++i) in2.push(speech_chunk(i, 0.02));
        in2.stop();
        assert(short_worker.start());
        short_worker.join();
        assert(short_worker.stats().slow_warnings == 0);
        assert(!short_worker.stats().falling_behind);

        // Seven slow chunks then fast ones: one warning, then recovery
        auto recovering = std::make_shared<PacedRecognizer>(7, std::chrono::milliseconds(60));
        core::BoundedQueue<core::AudioChunk> in3(16);
        core::BoundedQueue<core::TranscriptSegment> out3(16);
        RecognitionWorker recovering_worker(recovering, in3, out3, paced_cfg);
        for (uint64_t i = 0; i < 12; ++i) in3.push(speech_chunk(i, 0.02));
        in3.stop();
        assert(recovering_worker.start());
        recovering_worker.join();
        auto rs = recovering_worker.stats();
        assert(rs.processed == 12);
        assert(rs.slow_warnings == 1);
        assert(!rs.falling_behind);
    }

    // stop() on an idle worker returns promptly
    core::BoundedQueue<core::AudioChunk> idle_in(4);
    core::BoundedQueue<core::TranscriptSegment> idle_out(4);
    RecognitionWorker idle(recognizer, idle_in, idle_out, RecognitionWorker::Config{});
    assert(idle.start());
    assert(!idle.start());
    idle.stop();
    assert(!idle.is_running());
    return 0;
}
