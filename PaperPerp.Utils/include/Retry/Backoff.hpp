#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace PaperPerp::Utils::Retry
{
    // Raised by collaborators for failures worth another attempt
    // (timeouts, rate limiting, a dropped connection).
    class TransientError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct RetryPolicy {
        int max_attempts = 3;
        std::chrono::milliseconds initial_delay{ 200 };
        double multiplier = 2.0;
        std::chrono::milliseconds max_delay{ 5000 };

        // Delay to wait after the given failed attempt (1-based)
        std::chrono::milliseconds delay_for(int attempt) const {
            double delay = static_cast<double>(initial_delay.count());
            for (int i = 1; i < attempt; ++i) {
                delay *= multiplier;
            }
            auto capped = std::min<double>(delay, static_cast<double>(max_delay.count()));
            return std::chrono::milliseconds(static_cast<long long>(capped));
        }
    };

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    inline void sleep_for(std::chrono::milliseconds delay) {
        std::this_thread::sleep_for(delay);
    }

    /**
     * Calls fn until it returns without throwing TransientError or the policy
     * runs out of attempts. The last TransientError is rethrown on exhaustion;
     * any other exception propagates immediately.
     */
    template <typename Fn>
    auto with_backoff(const RetryPolicy& policy, const std::string& what, Fn&& fn,
        const Sleeper& sleeper = sleep_for) -> decltype(fn())
    {
        int attempts = std::max(1, policy.max_attempts);
        for (int attempt = 1;; ++attempt) {
            try {
                return fn();
            }
            catch (const TransientError& e) {
                if (attempt >= attempts) {
                    std::cerr << "[with_backoff] " << what << " failed after " << attempt
                        << " attempts: " << e.what() << "\n";
                    throw;
                }
                auto delay = policy.delay_for(attempt);
                std::cerr << "[with_backoff] " << what << " attempt " << attempt << " failed ("
                    << e.what() << "), retrying in " << delay.count() << "ms\n";
                sleeper(delay);
            }
        }
    }
}
