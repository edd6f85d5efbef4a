// Copyright (c) 2025 VAM Live Scribe
#include "app/retry_policy.hpp"

#include <cmath>
#include <memory>
#include <random>
#include <thread>

namespace app {

RetryPolicy::RetryPolicy() : RetryPolicy(Config{}) {}

RetryPolicy::RetryPolicy(const Config& config, Sleeper sleeper, Jitter jitter)
    : config_(config), sleeper_(std::move(sleeper)), jitter_(std::move(jitter)) {
    if (config_.max_attempts < 1) config_.max_attempts = 1;
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    if (!jitter_) {
        auto rng = std::make_shared<std::mt19937>(std::random_device{}());
        jitter_ = [rng]() { return std::uniform_real_distribution<double>(0.0, 1.0)(*rng); };
    }
}

double RetryPolicy::backoff_seconds(int attempt) const {
    const double span = config_.jitter_max_s - config_.jitter_min_s;
    return std::pow(2.0, attempt) + config_.jitter_min_s + span * jitter_();
}

bool RetryPolicy::is_retryable(const core::Error& error) {
    return error.kind == core::ErrorKind::TransientProvider;
}

} // namespace app
