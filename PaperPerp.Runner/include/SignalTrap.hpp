#pragma once

#include <atomic>
#include <csignal>

namespace PaperPerp::Runner {
    /**
     * Installs SIGINT / SIGTERM handlers for its lifetime and restores the
     * previous ones on destruction. The handler only records the signal; the
     * loop polls triggered() and turns it into a stop request.
     */
    class SignalTrap {
    public:
        SignalTrap();
        ~SignalTrap();

        SignalTrap(const SignalTrap&) = delete;
        SignalTrap& operator=(const SignalTrap&) = delete;

        static bool triggered();
        static int last_signal();

        // Clears the flag, and lets tests simulate a delivery without raise()
        static void reset();
        static void notify(int signal);

    private:
        using Handler = void (*)(int);
        Handler previous_int_;
        Handler previous_term_;

        static std::atomic<int> signal_;
    };
}
