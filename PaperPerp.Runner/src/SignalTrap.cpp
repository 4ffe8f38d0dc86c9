#include "SignalTrap.hpp"
#include <iostream>

namespace PaperPerp::Runner {
    std::atomic<int> SignalTrap::signal_{ 0 };

    namespace {
        void on_signal(int signal) {
            SignalTrap::notify(signal);
        }
    }

    SignalTrap::SignalTrap() {
        previous_int_ = std::signal(SIGINT, on_signal);
        previous_term_ = std::signal(SIGTERM, on_signal);
        if (previous_int_ == SIG_ERR || previous_term_ == SIG_ERR) {
            std::cerr << "[SignalTrap] could not install signal handlers" << std::endl;
        }
    }

    SignalTrap::~SignalTrap() {
        if (previous_int_ != SIG_ERR) std::signal(SIGINT, previous_int_);
        if (previous_term_ != SIG_ERR) std::signal(SIGTERM, previous_term_);
    }

    bool SignalTrap::triggered() {
        return signal_.load() != 0;
    }

    int SignalTrap::last_signal() {
        return signal_.load();
    }

    void SignalTrap::reset() {
        signal_.store(0);
    }

    void SignalTrap::notify(int signal) {
        signal_.store(signal);
    }
}
