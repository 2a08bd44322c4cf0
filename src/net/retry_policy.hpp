#pragma once

#include "core/types.hpp"
#include "core/stop_token.hpp"
#include "core/log.hpp"
#include <chrono>
#include <cmath>
#include <functional>
#include <string>
#include <thread>

namespace chromadex {

// Bounded retry with a fixed wait, optionally growing by a multiplier.
class RetryPolicy {
public:
    struct Config {
        int max_attempts = 5;
        double wait_sec = 3.0;
        double backoff = 1.0;
    };

    using Predicate = std::function<bool(const Result&)>;

    RetryPolicy() : RetryPolicy(Config()) {}
    explicit RetryPolicy(const Config& config)
        : config_(config),
          retryable_([](const Result& r) { return r.error == ErrorCode::TRANSIENT_FETCH; }) {}
    RetryPolicy(const Config& config, Predicate retryable)
        : config_(config), retryable_(std::move(retryable)) {}

    // Runs attempt() until it succeeds, fails with a non-retryable result,
    // or max_attempts is reached. A stop request during the wait yields
    // CANCELLED.
    template <typename Attempt>
    Result run(Attempt&& attempt, const StopToken* stop = nullptr) const {
        const int attempts = config_.max_attempts < 1 ? 1 : config_.max_attempts;
        Result result;
        for (int n = 1; n <= attempts; ++n) {
            result = attempt();
            if (result.success() || !retryable_(result)) {
                return result;
            }
            if (n == attempts) break;

            log_debug("attempt " + std::to_string(n) + " failed: " + result.message + ", retrying");
            auto wait = std::chrono::duration<double>(delay_for(n));
            if (stop) {
                if (!stop->sleep_for(wait)) {
                    return Result::fail(ErrorCode::CANCELLED, "retry cancelled");
                }
            } else {
                std::this_thread::sleep_for(wait);
            }
        }
        return result;
    }

    // Wait before attempt n + 1.
    double delay_for(int n) const {
        if (config_.backoff <= 1.0) return config_.wait_sec;
        return config_.wait_sec * std::pow(config_.backoff, n - 1);
    }

    const Config& config() const { return config_; }

private:
    Config config_;
    Predicate retryable_;
};

}
