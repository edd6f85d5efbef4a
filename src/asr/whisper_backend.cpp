#include "asr/whisper_backend.hpp"
#include "audio/resample.hpp"
#include "core/logging.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <thread>
#if defined(STREAMSCRIBE_WHISPER_AVAILABLE)
#include "whisper.h"
#include <cstdio>

namespace {
// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char* text, void*) {
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
    case GGML_LOG_LEVEL_WARN:
        std::fputs(text, stderr);
        break;
    default:
        if (core::is_verbose()) std::fputs(text, stderr);
        break;
    }
}

bool is_non_speech(const std::string& s) {
    if (s == "[BLANK_AUDIO]" || s == "[ Silence ]" || s == "[silence]" || s == "[ Silence]") return true;
    // A lone bracketed or parenthesized tag such as [MUSIC] or (applause)
    return s.size() > 2 && ((s.front() == '[' && s.back() == ']') || (s.front() == '(' && s.back() == ')'));
}
} // namespace
#endif // STREAMSCRIBE_WHISPER_AVAILABLE

namespace asr {

struct WhisperBackend::State {
#if defined(STREAMSCRIBE_WHISPER_AVAILABLE)
    whisper_context* ctx = nullptr;
    whisper_state* wstate = nullptr;
#endif
    Config config;
    unsigned n_threads = 0;
    bool loaded = false;
};

WhisperBackend::WhisperBackend() : state_(std::make_unique<State>()) {}

WhisperBackend::~WhisperBackend() {
#if defined(STREAMSCRIBE_WHISPER_AVAILABLE)
    if (state_->wstate) whisper_free_state(state_->wstate);
    if (state_->ctx) whisper_free(state_->ctx);
#endif
}

std::vector<std::string> WhisperBackend::model_candidates(const std::string& model_name) {
    const bool has_ext = (model_name.find(".gguf") != std::string::npos) || (model_name.find(".bin") != std::string::npos);
    if (has_ext) return {model_name};
    return {
        "models/" + model_name + ".gguf",
        "models/ggml-" + model_name + "-q5_1.gguf",
        "models/ggml-" + model_name + ".gguf",
        "models/" + model_name + ".bin",
        "models/ggml-" + model_name + ".bin",
        "models/ggml-" + model_name + "-q5_1.bin",
    };
}

bool WhisperBackend::available() const {
    return state_->loaded;
}

bool WhisperBackend::load_model(const Config& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_->loaded) return true;
    state_->config = config;
    state_->n_threads = config.n_threads <= 0 ? std::max(1u, std::thread::hardware_concurrency())
                                              : static_cast<unsigned>(config.n_threads);
#if defined(STREAMSCRIBE_WHISPER_AVAILABLE)
    const auto candidates = model_candidates(config.model);
    std::string path = candidates.front();
    for (const auto& c : candidates) {
        if (std::filesystem::exists(std::filesystem::u8path(c))) {
            path = c;
            break;
        }
    }
    // Set logging verbosity before creating context to suppress init spam when not verbose
    whisper_log_set(log_cb, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    core::log_info("[whisper] init from: " + path);
    state_->ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!state_->ctx) {
        core::log_error("[whisper] init FAILED for path: " + path);
        return false;
    }
    state_->wstate = whisper_init_state(state_->ctx);
    if (!state_->wstate) {
        core::log_error("[whisper] cannot allocate decoding state");
        whisper_free(state_->ctx);
        state_->ctx = nullptr;
        return false;
    }
    core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());
    state_->loaded = true;
    return true;
#else
    core::log_warn("[whisper] backend not available (built without whisper.cpp)");
    return false;
#endif
}

core::Result<RecognitionResult> WhisperBackend::recognize(const int16_t* samples, size_t n,
                                                          int sample_rate, const std::string& language) {
    using R = core::Result<RecognitionResult>;
    if (!samples || n == 0) return RecognitionResult{};
#if defined(STREAMSCRIBE_WHISPER_AVAILABLE)
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_->loaded) return R::fail(core::ErrorKind::RecognitionFailed, "whisper model not loaded");

    std::vector<int16_t> pcm16;
    if (sample_rate != WHISPER_SAMPLE_RATE) {
        pcm16 = audio::resample_linear(samples, n, sample_rate, WHISPER_SAMPLE_RATE);
        samples = pcm16.data();
        n = pcm16.size();
    }
    std::vector<float> pcm_f32(n);
    constexpr float scale = 1.0f / 32768.0f;
    for (size_t i = 0; i < n; ++i) pcm_f32[i] = static_cast<float>(samples[i]) * scale;

    const bool verbose = core::is_verbose();
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime   = false;
    wparams.print_progress   = verbose;
    wparams.print_timestamps = verbose;
    wparams.print_special    = false;
    wparams.translate        = false;
    wparams.language         = language.empty() ? "en" : language.c_str();
    wparams.detect_language  = false;
    wparams.n_threads        = static_cast<int>(state_->n_threads);
    wparams.token_timestamps = state_->config.word_timestamps;
    wparams.greedy.best_of   = 1;

    if (whisper_full_with_state(state_->ctx, state_->wstate, wparams, pcm_f32.data(), static_cast<int>(pcm_f32.size())) != 0) {
        return R::fail(core::ErrorKind::RecognitionFailed, "whisper_full failed");
    }

    RecognitionResult result;
    result.language = wparams.language;
    const whisper_token eot = whisper_token_eot(state_->ctx);
    const int n_segments = whisper_full_n_segments_from_state(state_->wstate);
    core::log_debug("[whisper] segments=" + std::to_string(n_segments));

    std::vector<std::string> texts;
    for (int i = 0; i < n_segments; ++i) {
        const char* txt = whisper_full_get_segment_text_from_state(state_->wstate, i);
        std::string s = core::trim(txt ? txt : "");
        if (s.empty() || is_non_speech(s)) continue;

        RecognizedSegment seg;
        seg.text = s;
        // whisper timestamps are in centiseconds
        seg.start = whisper_full_get_segment_t0_from_state(state_->wstate, i) / 100.0;
        seg.end = whisper_full_get_segment_t1_from_state(state_->wstate, i) / 100.0;

        double p_sum = 0.0;
        int p_count = 0;
        const int n_tokens = whisper_full_n_tokens_from_state(state_->wstate, i);
        for (int j = 0; j < n_tokens; ++j) {
            const whisper_token_data data = whisper_full_get_token_data_from_state(state_->wstate, i, j);
            if (data.id >= eot) continue;  // timestamps and other special tokens
            p_sum += data.p;
            p_count++;
            if (!state_->config.word_timestamps) continue;

            const char* tok = whisper_full_get_token_text_from_state(state_->ctx, state_->wstate, i, j);
            std::string piece = tok ? tok : "";
            if (piece.empty()) continue;
            // A leading space marks the start of a new word
            if (result.words.empty() || piece.front() == ' ') {
                core::Word w;
                w.text = core::trim(piece);
                w.start = data.t0 / 100.0;
                w.end = data.t1 / 100.0;
                if (!w.text.empty()) result.words.push_back(std::move(w));
            } else {
                result.words.back().text += piece;
                result.words.back().end = data.t1 / 100.0;
            }
        }
        if (p_count > 0) seg.confidence = std::clamp(p_sum / p_count, 0.0, 1.0);
        texts.push_back(seg.text);
        result.segments.push_back(std::move(seg));
    }
    result.text = core::join_words(texts);
    if (verbose) whisper_print_timings(state_->ctx);
    return result;
#else
    (void)sample_rate;
    (void)language;
    return R::fail(core::ErrorKind::RecognitionFailed, "whisper backend not available (built without whisper.cpp)");
#endif
}

} // namespace asr
