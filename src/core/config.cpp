#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/result.hpp"
#include <cmath>
#include <cstdlib>
#include <exception>
#include <sstream>
#include <string>
#include <type_traits>

namespace core {

namespace {
const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

// Whole-string number at or above `min_value`
Result<double> parse_number(const char* name, const std::string& text, double min_value) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &used);
    } catch (const std::exception&) {
        return Result<double>::fail(ErrorKind::InvalidResponse, std::string(name) + " is not a number: " + text);
    }
    if (used != text.size()) {
        return Result<double>::fail(ErrorKind::InvalidResponse, std::string(name) + " has trailing characters: " + text);
    }
    if (!std::isfinite(v)) {
        return Result<double>::fail(ErrorKind::InvalidResponse, std::string(name) + " is not finite: " + text);
    }
    if (v < min_value) {
        return Result<double>::fail(ErrorKind::InvalidResponse, std::string(name) + " must be at least " +
                                                                    std::to_string(static_cast<long long>(min_value)) +
                                                                    ", got " + text);
    }
    return v;
}

template <typename T>
void read_number(const char* name, T& out, double min_value) {
    const char* v = env(name);
    if (!v) return;
    Result<double> parsed = parse_number(name, v, min_value);
    if (!parsed.ok()) {
        log_warn("[config] ignoring " + parsed.error().message);
        return;
    }
    if (std::is_integral<T>::value && parsed.value() != std::floor(parsed.value())) {
        log_warn(std::string("[config] ignoring ") + name + ": expected a whole number, got " + v);
        return;
    }
    out = static_cast<T>(parsed.value());
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t a = item.find_first_not_of(" \t");
        size_t b = item.find_last_not_of(" \t");
        if (a != std::string::npos) out.push_back(item.substr(a, b - a + 1));
    }
    return out;
}
} // namespace

Config load_config_from_env() {
    Config cfg;
    if (const char* v = env("STREAMSCRIBE_WHISPER_MODEL")) cfg.whisper_model = v;
    if (const char* v = env("STREAMSCRIBE_SPEAKER_MODEL")) cfg.speaker_model = v;
    if (const char* v = env("STREAMSCRIBE_LANGUAGE")) cfg.language = v;
    if (const char* v = env("STREAMSCRIBE_FFMPEG")) cfg.ffmpeg_path = v;
    if (const char* v = env("STREAMSCRIBE_OUTPUT_DIR")) cfg.output_dir = v;
    if (const char* v = env("STREAMSCRIBE_PROVIDER_ORDER")) cfg.provider_order = split_list(v);

    read_number("STREAMSCRIBE_CHUNK_SECONDS", cfg.live_chunk_seconds, 0.0);
    read_number("STREAMSCRIBE_FILE_CHUNK_SECONDS", cfg.file_chunk_seconds, 0.0);
    read_number("STREAMSCRIBE_THREADS", cfg.n_threads, 0.0);
    // Capacities are unsigned; a negative value would wrap to an unbounded queue
    read_number("STREAMSCRIBE_CHUNK_QUEUE", cfg.chunk_queue_capacity, 1.0);
    read_number("STREAMSCRIBE_RESULT_QUEUE", cfg.result_queue_capacity, 1.0);
    read_number("STREAMSCRIBE_MAX_SPEAKERS", cfg.max_speakers, 1.0);
    read_number("STREAMSCRIBE_RETRY_ATTEMPTS", cfg.retry_attempts, 1.0);

    if (const char* v = env("ELEVENLABS_API_KEY")) cfg.elevenlabs_api_key = v;
    else if (const char* v2 = env("ELEVENLABS_SCRIBE_KEY")) cfg.elevenlabs_api_key = v2;
    if (const char* v = env("ELEVENLABS_BASE_URL")) cfg.elevenlabs_base_url = v;
    return cfg;
}

const Config& get_config() {
    static const Config cfg = load_config_from_env();
    return cfg;
}

std::vector<std::string> validate(const Config& config) {
    std::vector<std::string> issues;
    if (config.sample_rate <= 0) issues.push_back("sample_rate must be positive");
    if (config.live_chunk_seconds <= 0.5) issues.push_back("live chunk duration must exceed 0.5s");
    if (config.file_chunk_seconds <= 0.5) issues.push_back("file chunk duration must exceed 0.5s");
    if (config.chunk_queue_capacity == 0) issues.push_back("chunk queue capacity must be at least 1");
    if (config.result_queue_capacity == 0) issues.push_back("result queue capacity must be at least 1");
    if (config.retry_attempts < 1) issues.push_back("retry_attempts must be at least 1");
    if (config.provider_order.empty()) issues.push_back("provider_order is empty");
    for (const auto& p : config.provider_order) {
        if (p != "scribe" && p != "whisper+diarizer" && p != "whisper") {
            issues.push_back("unknown provider '" + p + "'");
        }
        if (p == "scribe" && config.elevenlabs_api_key.empty()) {
            issues.push_back("provider 'scribe' needs ELEVENLABS_API_KEY");
        }
    }
    return issues;
}

} // namespace core
