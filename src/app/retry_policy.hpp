// Copyright (c) 2025 VAM Live Scribe
#pragma once

#include "core/logging.hpp"
#include "core/result.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace app {

/**
 * @brief Bounded retry with exponential backoff and jitter for provider calls
 *
 * Only TransientProvider errors (HTTP 429, 5xx, transport failures) are retried.
 * The wait before attempt k+1 (k = 0, 1, ...) is 2^k + uniform(0.2, 0.5) seconds.
 * When the attempts run out the error becomes ProviderExhausted.
 */
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Jitter = std::function<double()>;   ///< Uniform in [0, 1)

    struct Config {
        int max_attempts = 3;
        double jitter_min_s = 0.2;
        double jitter_max_s = 0.5;
    };

    RetryPolicy();
    explicit RetryPolicy(const Config& config, Sleeper sleeper = nullptr, Jitter jitter = nullptr);

    // Seconds to wait after failed attempt k (0-based)
    double backoff_seconds(int attempt) const;

    static bool is_retryable(const core::Error& error);

    template <typename T>
    core::Result<T> run(const std::string& provider, const std::function<core::Result<T>()>& call) const {
        for (int attempt = 0;; ++attempt) {
            core::Result<T> result = call();
            if (result.ok() || !is_retryable(result.error())) {
                return result;
            }
            if (attempt + 1 >= config_.max_attempts) {
                core::log_warn("[retry] " + provider + " exhausted retries after " + std::to_string(attempt + 1) +
                               " attempts: " + result.error().describe());
                return core::Result<T>::fail(core::ErrorKind::ProviderExhausted,
                                             provider + " exhausted retries (" + result.error().message + ")",
                                             result.error().http_status);
            }
            const double wait = backoff_seconds(attempt);
            core::log_info("[retry] " + provider + " attempt " + std::to_string(attempt + 1) + " failed (" +
                           result.error().message + "), retrying in " + std::to_string(wait) + "s");
            sleeper_(std::chrono::milliseconds(static_cast<long long>(wait * 1000.0)));
        }
    }

    const Config& config() const { return config_; }

private:
    Config config_;
    Sleeper sleeper_;
    Jitter jitter_;
};

} // namespace app
