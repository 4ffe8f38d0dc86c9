#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <utility>
#include <vector>
#include <boost/thread.hpp>
#include "IStrategy.hpp"

namespace PaperPerp::Strategy {
    /**
     * Runs the inner strategy's evaluate() on its own boost::thread and waits at
     * most `timeout` for the answer. A late answer is discarded and HOLD is
     * returned; while the late call is still running every further evaluate()
     * also answers HOLD. On timeout the worker is interrupted, so inner code
     * that waits through boost interruption points is cancelled.
     */
    class TimeBoxedStrategy : public IStrategy {
    public:
        TimeBoxedStrategy(std::shared_ptr<IStrategy> inner, std::chrono::milliseconds timeout);
        ~TimeBoxedStrategy() override;

        TimeBoxedStrategy(const TimeBoxedStrategy&) = delete;
        TimeBoxedStrategy& operator=(const TimeBoxedStrategy&) = delete;

        Decision evaluate(const MarketView& view, const std::optional<PositionView>& position) override;
        void configure(const boost::property_tree::ptree& options) override;
        std::size_t minimum_bars_required() const override;
        const std::string& name() const override;
        void on_position_closed(const std::string& symbol, long long timestamp) override;

        int timeouts() const { return timeouts_; }
        bool busy() const;
        std::chrono::milliseconds timeout() const { return timeout_; }

    private:
        void reap();
        void apply_deferred_closes();

        std::shared_ptr<IStrategy> inner_;
        std::chrono::milliseconds timeout_;
        boost::thread worker_;
        std::future<Decision> pending_;
        std::vector<std::pair<std::string, long long>> deferred_closes_;   // replayed once the worker is idle
        int timeouts_ = 0;
    };
}
