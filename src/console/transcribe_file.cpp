// File console: transcribe one audio file with speaker labels
//
//   streamscribe_file <audio.wav> [--order scribe,whisper+diarizer,whisper]
//                     [--model base.en] [--speaker-model PATH] [--num-speakers N]
//                     [--language en] [--out-dir output] [-v]
//
// Providers are tried in order; each failure falls back to the next one.
// Writes <out-dir>/<stem>.{json,txt,srt,vtt}.
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "app/provider_chain.hpp"
#include "app/retry_policy.hpp"
#include "asr/whisper_backend.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "diar/diarization_reconciler.hpp"
#include "diar/onnx_diarizer.hpp"
#include "text/captions.hpp"
#include "text/transcript_store.hpp"

#ifdef STREAMSCRIBE_SCRIBE_AVAILABLE
#include "asr/curl_transport.hpp"
#include "asr/scribe_client.hpp"
#endif

namespace {
void usage() {
    std::cerr << "usage: streamscribe_file <audio.wav> [--order LIST] [--model NAME] [--speaker-model PATH]\n"
                 "                         [--num-speakers N] [--language CODE] [--out-dir DIR] [-v]\n";
}

std::vector<std::string> split_commas(const std::string& s) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t comma = s.find(',', pos);
        if (comma == std::string::npos) comma = s.size();
        if (comma > pos) out.push_back(s.substr(pos, comma - pos));
        pos = comma + 1;
    }
    return out;
}
} // namespace

int main(int argc, char** argv) {
    const core::Config& cfg = core::get_config();

    std::string path;
    std::vector<std::string> order = cfg.provider_order;
    std::string model = cfg.whisper_model;
    std::string speaker_model = cfg.speaker_model;
    std::string language = cfg.language;
    std::string out_dir = cfg.output_dir;
    int num_speakers = 0;  // 0 = let the provider decide

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v" || a == "--verbose") { core::set_log_level(core::LogLevel::Debug); continue; }
        if (a == "-h" || a == "--help") { usage(); return 0; }
        if (a == "--order" && i + 1 < argc) { order = split_commas(argv[++i]); continue; }
        if (a == "--model" && i + 1 < argc) { model = argv[++i]; continue; }
        if (a == "--speaker-model" && i + 1 < argc) { speaker_model = argv[++i]; continue; }
        if (a == "--num-speakers" && i + 1 < argc) { num_speakers = std::atoi(argv[++i]); continue; }
        if (a == "--language" && i + 1 < argc) { language = argv[++i]; continue; }
        if (a == "--out-dir" && i + 1 < argc) { out_dir = argv[++i]; continue; }
        if (path.empty()) { path = a; continue; }
        std::cerr << "[init] unexpected argument: " << a << "\n";
        usage();
        return 2;
    }
    if (path.empty()) {
        usage();
        return 2;
    }
    for (const auto& issue : core::validate(cfg)) core::log_warn("[config] " + issue);

    app::ChainConfig chain_cfg;
    chain_cfg.order.clear();
    for (const auto& name : order) {
        if (auto s = app::parse_strategy(name)) {
            chain_cfg.order.push_back(*s);
        } else {
            std::cerr << "[init] unknown provider '" << name << "'\n";
            return 2;
        }
    }
    chain_cfg.language = language;
    chain_cfg.on_fallback = [](const app::FallbackEvent& ev) {
        std::cerr << "[fallback] " << ev.from << " -> " << ev.to << ": " << ev.reason << "\n";
    };

    std::shared_ptr<asr::IRecognizer> diarizing;
#ifdef STREAMSCRIBE_SCRIBE_AVAILABLE
    if (!cfg.elevenlabs_api_key.empty()) {
        asr::ScribeClient::Config sc;
        sc.api_key = cfg.elevenlabs_api_key;
        sc.base_url = cfg.elevenlabs_base_url;
        if (num_speakers > 0) sc.num_speakers = num_speakers;
        diarizing = std::make_shared<asr::ScribeClient>(sc, std::make_shared<asr::CurlTransport>());
    }
#endif

    auto whisper = std::make_shared<asr::WhisperBackend>();
    asr::WhisperBackend::Config wcfg;
    wcfg.model = model;
    wcfg.n_threads = cfg.n_threads;
    if (!whisper->load_model(wcfg)) {
        core::log_warn("[init] whisper model '" + model + "' not loaded; local recognition disabled");
    }

    diar::OnnxDiarizer::Config dcfg;
    dcfg.model_path = speaker_model;
    dcfg.max_speakers = num_speakers > 0 ? num_speakers : cfg.max_speakers;
    auto diarizer = std::make_shared<diar::OnnxDiarizer>(dcfg);

    app::RetryPolicy::Config rcfg;
    rcfg.max_attempts = cfg.retry_attempts;
    app::ProviderFallbackChain chain(chain_cfg, diarizing, whisper, diarizer, app::RetryPolicy(rcfg));

    core::Result<app::FileTranscription> result = chain.transcribe(path);
    if (!result.ok()) {
        std::cerr << "[error] " << result.error().describe() << "\n";
        return 1;
    }
    const app::FileTranscription& t = result.value();

    text::StoredTranscript stored;
    stored.full_text = t.full_text;
    stored.segments = t.segments;
    stored.turns = t.turns;
    stored.provider = t.provider;
    stored.diarized = t.diarized;

    const std::string stem = std::filesystem::path(path).stem().string();
    text::TranscriptStore store(out_dir);
    core::Result<std::string> saved = store.save(stem, stored);
    if (!saved.ok()) {
        std::cerr << "[error] " << saved.error().describe() << "\n";
        return 1;
    }
    core::Result<std::vector<std::string>> captions =
        text::save_captions(t.segments, (std::filesystem::path(out_dir) / stem).string());
    if (!captions.ok()) {
        std::cerr << "[error] " << captions.error().describe() << "\n";
        return 1;
    }

    std::cout << t.full_text << "\n\n";
    std::cout << "provider: " << t.provider << (t.diarized ? " (diarized)" : "") << "\n";
    if (t.diarized) {
        for (const auto& s : diar::DiarizationReconciler::speaker_stats(t.segments)) {
            std::cout << "  " << s.speaker << ": " << s.segment_count << " segments, "
                      << s.total_speaking_time_s << "s\n";
        }
    }
    std::cout << "saved: " << saved.value() << "\n";
    for (const auto& p : captions.value()) std::cout << "saved: " << p << "\n";
    return 0;
}
