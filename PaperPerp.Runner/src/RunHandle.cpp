#include "RunHandle.hpp"
#include <iostream>
#include <stdexcept>

namespace PaperPerp::Runner {
    std::string to_string(RunState state) {
        switch (state) {
        case RunState::Idle: return "IDLE";
        case RunState::Running: return "RUNNING";
        case RunState::StoppedByTimeLimit: return "STOPPED_BY_TIME_LIMIT";
        case RunState::StoppedByLossLimit: return "STOPPED_BY_LOSS_LIMIT";
        case RunState::StoppedBySignal: return "STOPPED_BY_SIGNAL";
        case RunState::Completed: return "COMPLETED";
        case RunState::Error: return "ERROR";
        }
        return "UNKNOWN";
    }

    bool is_terminal(RunState state) {
        return state != RunState::Idle && state != RunState::Running;
    }

    RunState RunHandle::state() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return state_;
    }

    std::string RunHandle::stop_reason() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return stop_reason_;
    }

    void RunHandle::begin() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != RunState::Idle) {
            throw std::logic_error("run already started, state " + to_string(state_));
        }
        state_ = RunState::Running;
    }

    void RunHandle::finish(RunState state, const std::string& reason) {
        if (!is_terminal(state)) {
            throw std::invalid_argument("finish needs a terminal state, got " + to_string(state));
        }
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (is_terminal(state_)) {
                return;
            }
            state_ = state;
            stop_reason_ = reason;
        }
        std::cout << "[RunHandle::finish] " << to_string(state) << " (" << reason << ")" << std::endl;
        cv_.notify_all();
    }

    void RunHandle::request_stop(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (stop_requested_) {
                return;
            }
            stop_requested_ = true;
            requested_reason_ = reason;
        }
        cv_.notify_all();
    }

    bool RunHandle::stop_requested() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return stop_requested_;
    }

    std::string RunHandle::requested_reason() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return requested_reason_;
    }

    bool RunHandle::wait_for(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mtx_);
        return cv_.wait_for(lock, timeout, [this] { return stop_requested_; });
    }

    RunState RunHandle::wait() const {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return is_terminal(state_); });
        return state_;
    }
}
