#pragma once

#include <atomic>
#include <chrono>
#include "RunHandle.hpp"

namespace PaperPerp::Runner {
    // Time source of the live loop; epoch milliseconds
    class IClock {
    public:
        virtual ~IClock() = default;

        virtual long long now_ms() const = 0;

        // Plain delay, used between retry attempts
        virtual void sleep(std::chrono::milliseconds delay) = 0;

        // Delay that ends early on a stop request or a trapped signal
        virtual void wait(std::chrono::milliseconds delay, const RunHandle& handle) = 0;
    };

    class SystemClock : public IClock {
    public:
        long long now_ms() const override;
        void sleep(std::chrono::milliseconds delay) override;
        void wait(std::chrono::milliseconds delay, const RunHandle& handle) override;
    };

    // Never blocks: sleeping and waiting just move the time forward
    class ManualClock : public IClock {
    public:
        explicit ManualClock(long long start_ms = 0) : now_(start_ms) {}

        long long now_ms() const override { return now_.load(); }
        void sleep(std::chrono::milliseconds delay) override { advance(delay); }
        void wait(std::chrono::milliseconds delay, const RunHandle&) override { advance(delay); }

        void advance(std::chrono::milliseconds delay) { now_ += delay.count(); }
        void set(long long now_ms) { now_.store(now_ms); }

    private:
        std::atomic<long long> now_;
    };
}
