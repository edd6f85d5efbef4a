// Live console: transcribe a media stream as it plays
//
//   streamscribe_live <locator> [--model base.en] [--chunk-seconds 3] [--workers 1]
//                     [--duration-seconds N] [--out-dir output] [--language en] [-v]
//
// The locator is handed to ffmpeg as-is (file path, http(s) URL, rtmp, ...).
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "asr/whisper_backend.hpp"
#include "core/config.hpp"
#include "core/live_session.hpp"
#include "core/logging.hpp"
#include "text/captions.hpp"
#include "text/transcript_store.hpp"

namespace {
std::atomic<bool> g_interrupted{false};

void on_sigint(int) { g_interrupted.store(true); }

void usage() {
    std::cerr << "usage: streamscribe_live <locator> [--model NAME] [--chunk-seconds S] [--workers N]\n"
                 "                         [--duration-seconds S] [--out-dir DIR] [--language CODE] [-v]\n";
}

std::string session_name() {
    std::time_t now = std::time(nullptr);
    char buf[32];
    std::strftime(buf, sizeof(buf), "live_%Y%m%d_%H%M%S", std::localtime(&now));
    return buf;
}
} // namespace

int main(int argc, char** argv) {
    const core::Config& cfg = core::get_config();

    std::string locator;
    std::string model = cfg.whisper_model;
    std::string language = cfg.language;
    std::string out_dir = cfg.output_dir;
    double chunk_seconds = cfg.live_chunk_seconds;
    int workers = 1;
    int duration_sec = 0;  // 0 = until the stream ends or Ctrl+C

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v" || a == "--verbose") { core::set_log_level(core::LogLevel::Debug); continue; }
        if (a == "-h" || a == "--help") { usage(); return 0; }
        if (a == "--model" && i + 1 < argc) { model = argv[++i]; continue; }
        if (a == "--language" && i + 1 < argc) { language = argv[++i]; continue; }
        if (a == "--out-dir" && i + 1 < argc) { out_dir = argv[++i]; continue; }
        if (a == "--chunk-seconds" && i + 1 < argc) { chunk_seconds = std::atof(argv[++i]); continue; }
        if (a == "--workers" && i + 1 < argc) { workers = std::atoi(argv[++i]); continue; }
        if (a == "--duration-seconds" && i + 1 < argc) { duration_sec = std::atoi(argv[++i]); continue; }
        if (locator.empty()) { locator = a; continue; }
        std::cerr << "[init] unexpected argument: " << a << "\n";
        usage();
        return 2;
    }
    if (locator.empty()) {
        usage();
        return 2;
    }
    for (const auto& issue : core::validate(cfg)) core::log_warn("[config] " + issue);

    auto whisper = std::make_shared<asr::WhisperBackend>();
    asr::WhisperBackend::Config wcfg;
    wcfg.model = model;
    wcfg.n_threads = cfg.n_threads;
    if (!whisper->load_model(wcfg)) {
        std::cerr << "[init] failed to load whisper model '" << model << "'\n";
        return 1;
    }

    core::LiveSession::Config scfg;
    scfg.source.locator = locator;
    scfg.source.program = cfg.ffmpeg_path;
    scfg.source.sample_rate = cfg.sample_rate;
    scfg.source.chunk_seconds = chunk_seconds;
    scfg.worker.language = language;
    scfg.chunk_queue_capacity = cfg.chunk_queue_capacity;
    scfg.result_queue_capacity = cfg.result_queue_capacity;
    scfg.workers = workers;
    scfg.on_status = [](const std::string& msg, bool is_error) {
        if (is_error) std::cerr << "\n[status] " << msg << "\n";
    };
    const std::string name = session_name();
    scfg.on_persist = [&out_dir, &whisper, name](const std::vector<core::TranscriptSegment>& segments,
                                                 const std::string& full_text) {
        if (segments.empty()) return;
        text::StoredTranscript stored;
        stored.full_text = full_text;
        stored.segments = segments;
        stored.provider = whisper->name();
        text::TranscriptStore store(out_dir);
        auto saved = store.save(name, stored);
        if (!saved.ok()) {
            core::log_error("[live] " + saved.error().describe());
            return;
        }
        const std::string base = (std::filesystem::path(out_dir) / name).string();
        auto written = text::save_captions(segments, base);
        if (!written.ok()) {
            core::log_error("[live] " + written.error().describe());
            return;
        }
        std::cerr << "[live] transcript saved to " << base << ".{json,txt,srt,vtt}\n";
    };

    core::LiveSession session(whisper);
    core::Status st = session.start(scfg);
    if (!st.ok()) {
        std::cerr << "[init] " << st.error().describe() << "\n";
        return 1;
    }

    std::signal(SIGINT, on_sigint);
    const auto started = std::chrono::steady_clock::now();
    core::TranscriptSegment seg;
    while (!g_interrupted.load()) {
        while (session.try_get_result(seg)) {
            std::cout << "[" << text::format_vtt_time(seg.start) << "] " << seg.text << std::endl;
        }
        if (session.source_ended() && session.wait_until_finished(std::chrono::milliseconds(0))) break;
        if (duration_sec > 0 &&
            std::chrono::steady_clock::now() - started >= std::chrono::seconds(duration_sec)) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    while (session.try_get_result(seg)) {
        std::cout << "[" << text::format_vtt_time(seg.start) << "] " << seg.text << std::endl;
    }

    session.stop();
    const auto m = session.get_performance_metrics();
    std::cerr << "[live] chunks=" << m.chunks_emitted << " processed=" << m.chunks_processed
              << " accepted=" << m.segments_accepted << " filtered=" << m.segments_filtered
              << " failed=" << m.chunks_failed << " dropped=" << m.chunks_dropped
              << " rtf=" << m.average_rtf << "\n";

    if (auto err = session.last_error()) {
        std::cerr << "[live] stream ended with error: " << err->describe() << "\n";
        return 1;
    }
    return 0;
}
