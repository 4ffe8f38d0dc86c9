#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace PaperPerp::Runner {
    enum class RunState {
        Idle,
        Running,
        StoppedByTimeLimit,
        StoppedByLossLimit,
        StoppedBySignal,
        Completed,      // backtest reached the end of its data
        Error
    };

    std::string to_string(RunState state);
    bool is_terminal(RunState state);

    /**
     * Lifecycle of one bot run, shared by reference between the loop and
     * whoever controls it. Transitions: Idle -> Running -> one terminal state.
     * All members are thread-safe.
     */
    class RunHandle {
    public:
        RunHandle() = default;
        RunHandle(const RunHandle&) = delete;
        RunHandle& operator=(const RunHandle&) = delete;

        RunState state() const;
        std::string stop_reason() const;

        // Idle -> Running; throws std::logic_error from any other state
        void begin();

        // Running -> terminal, first call wins
        void finish(RunState state, const std::string& reason);

        // Asks the loop to end as StoppedBySignal at its next check
        void request_stop(const std::string& reason = "stop requested");
        bool stop_requested() const;
        std::string requested_reason() const;

        // Returns true early when a stop is requested during the wait
        bool wait_for(std::chrono::milliseconds timeout) const;

        // Blocks until a terminal state is reached
        RunState wait() const;

    private:
        mutable std::mutex mtx_;
        mutable std::condition_variable cv_;
        RunState state_ = RunState::Idle;
        std::string stop_reason_;
        bool stop_requested_ = false;
        std::string requested_reason_;
    };
}
