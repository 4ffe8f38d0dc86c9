#include "Clock.hpp"
#include <algorithm>
#include <boost/thread.hpp>
#include "SignalTrap.hpp"

namespace PaperPerp::Runner {
    namespace {
        // How late a trapped signal can be noticed during a wait
        constexpr std::chrono::milliseconds kSignalPoll{ 100 };
    }

    long long SystemClock::now_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    void SystemClock::sleep(std::chrono::milliseconds delay) {
        boost::this_thread::sleep_for(boost::chrono::milliseconds(delay.count()));
    }

    void SystemClock::wait(std::chrono::milliseconds delay, const RunHandle& handle) {
        const auto deadline = std::chrono::steady_clock::now() + delay;
        while (!SignalTrap::triggered()) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                return;
            }
            if (handle.wait_for(std::min(left, kSignalPoll))) {
                return;
            }
        }
    }
}
