#ifndef LPM_RETRY_HPP
#define LPM_RETRY_HPP

#include <chrono>
#include <cmath>
#include <functional>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "config.hpp"
#include "errors.hpp"

namespace lpm {

// =============================================================================
// Bounded exponential backoff for idempotent reads
// =============================================================================

struct BackoffPolicy {
    int max_attempts = 4;
    std::chrono::milliseconds base_delay{2000};
    double multiplier = 2.0;

    static BackoffPolicy from_config(const RetryConfig& cfg) {
        BackoffPolicy p;
        p.max_attempts = cfg.max_attempts;
        p.base_delay = std::chrono::milliseconds(cfg.base_delay_ms);
        p.multiplier = cfg.multiplier;
        return p;
    }

    // Delay before retry number `attempt` (1-based)
    std::chrono::milliseconds delay_for(int attempt) const {
        double ms = static_cast<double>(base_delay.count()) * std::pow(multiplier, attempt - 1);
        return std::chrono::milliseconds(static_cast<int64_t>(ms));
    }
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void sleep_for(std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
}

class RetryPolicy {
public:
    explicit RetryPolicy(BackoffPolicy policy = {}, Sleeper sleeper = sleep_for)
        : policy_(policy), sleeper_(std::move(sleeper)) {}

    // Runs fn, retrying only TransientError. Every other error propagates on
    // the first throw; the last TransientError propagates once attempts run out.
    template <typename Fn>
    auto run(const std::string& what, Fn&& fn) -> decltype(fn()) {
        for (int attempt = 1;; ++attempt) {
            try {
                return fn();
            } catch (const TransientError& e) {
                if (attempt >= policy_.max_attempts) {
                    spdlog::error("{} failed after {} attempts: {}", what, attempt, e.what());
                    throw;
                }
                auto delay = policy_.delay_for(attempt);
                spdlog::warn("{} rate-limited (attempt {}/{}), retrying in {}ms: {}",
                             what, attempt, policy_.max_attempts, delay.count(), e.what());
                sleeper_(delay);
            }
        }
    }

    const BackoffPolicy& policy() const { return policy_; }

private:
    BackoffPolicy policy_;
    Sleeper sleeper_;
};

} // namespace lpm

#endif // LPM_RETRY_HPP
