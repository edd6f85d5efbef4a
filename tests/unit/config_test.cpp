#undef NDEBUG
#include <cassert>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/result.hpp"
#include "core/text_utils.hpp"

int main() {
    setenv("STREAMSCRIBE_PROVIDER_ORDER", "whisper+diarizer, whisper", 1);
    setenv("STREAMSCRIBE_CHUNK_SECONDS", "4.5", 1);
    setenv("STREAMSCRIBE_RETRY_ATTEMPTS", "not-a-number", 1);
    setenv("ELEVENLABS_SCRIBE_KEY", "secondary", 1);
    unsetenv("ELEVENLABS_API_KEY");

    core::Config cfg = core::load_config_from_env();
    assert(cfg.provider_order.size() == 2);
    assert(cfg.provider_order[0] == "whisper+diarizer");
    assert(cfg.provider_order[1] == "whisper");
    assert(cfg.live_chunk_seconds == 4.5);
    assert(cfg.retry_attempts == 3);   // invalid value ignored
    assert(cfg.elevenlabs_api_key == "secondary");
    assert(core::validate(cfg).empty());

    // Negative, fractional and malformed numbers keep the defaults
    setenv("STREAMSCRIBE_CHUNK_QUEUE", "-5", 1);
    setenv("STREAMSCRIBE_RESULT_QUEUE", "0", 1);
    setenv("STREAMSCRIBE_THREADS", "2.5", 1);
    setenv("STREAMSCRIBE_MAX_SPEAKERS", "3x", 1);
    core::Config guarded = core::load_config_from_env();
    assert(guarded.chunk_queue_capacity == 10);
    assert(guarded.result_queue_capacity == 50);
    assert(guarded.n_threads == 0);
    assert(guarded.max_speakers == 2);
    setenv("STREAMSCRIBE_CHUNK_QUEUE", "4", 1);
    setenv("STREAMSCRIBE_THREADS", "8", 1);
    core::Config accepted = core::load_config_from_env();
    assert(accepted.chunk_queue_capacity == 4);
    assert(accepted.n_threads == 8);
    unsetenv("STREAMSCRIBE_CHUNK_QUEUE");
    unsetenv("STREAMSCRIBE_RESULT_QUEUE");
    unsetenv("STREAMSCRIBE_THREADS");
    unsetenv("STREAMSCRIBE_MAX_SPEAKERS");

    setenv("ELEVENLABS_API_KEY", "primary", 1);
    assert(core::load_config_from_env().elevenlabs_api_key == "primary");

    core::Config bad;
    bad.live_chunk_seconds = 0.5;
    bad.chunk_queue_capacity = 0;
    bad.provider_order = {"scribe", "bogus"};
    auto issues = core::validate(bad);
    assert(issues.size() == 4);

    // Result and error helpers
    core::Result<int> ok = 5;
    assert(ok.ok() && ok.value() == 5);
    auto failed = core::Result<int>::fail(core::ErrorKind::TransientProvider, "HTTP 503", 503);
    assert(!failed);
    assert(failed.error().http_status == 503);
    assert(failed.error().describe().find("HTTP 503") != std::string::npos);
    bool threw = false;
    try {
        (void)failed.value();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(core::ok_status().ok());

    assert(core::trim("  a b \n") == "a b");
    assert(core::tokenize_words("Hello, World-42!") == (std::vector<std::string>{"hello", "world", "42"}));
    assert(core::join_words({"a", "", "b"}) == "a b");

    core::set_log_level(core::LogLevel::Warn);
    assert(core::log_level() == core::LogLevel::Warn);
    assert(!core::is_verbose());
    core::log_warn_once("config-test", "printed once");
    core::log_warn_once("config-test", "never printed");
    return 0;
}
