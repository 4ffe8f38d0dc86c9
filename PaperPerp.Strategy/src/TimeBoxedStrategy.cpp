#include "TimeBoxedStrategy.hpp"
#include <iostream>
#include <stdexcept>

namespace PaperPerp::Strategy {
    TimeBoxedStrategy::TimeBoxedStrategy(std::shared_ptr<IStrategy> inner, std::chrono::milliseconds timeout)
        : inner_(std::move(inner)), timeout_(timeout)
    {
        if (!inner_) {
            throw std::invalid_argument("TimeBoxedStrategy needs an inner strategy");
        }
        if (timeout_.count() <= 0) {
            throw std::invalid_argument("evaluate_timeout_ms must be > 0");
        }
    }

    TimeBoxedStrategy::~TimeBoxedStrategy() {
        if (worker_.joinable()) {
            worker_.interrupt();
            if (!worker_.try_join_for(boost::chrono::milliseconds(timeout_.count()))) {
                // the task owns a reference to the inner strategy, so it may outlive us
                worker_.detach();
            }
        }
    }

    bool TimeBoxedStrategy::busy() const {
        return pending_.valid() && pending_.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
    }

    void TimeBoxedStrategy::reap() {
        pending_ = std::future<Decision>();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void TimeBoxedStrategy::apply_deferred_closes() {
        for (const auto& [symbol, timestamp] : deferred_closes_) {
            inner_->on_position_closed(symbol, timestamp);
        }
        deferred_closes_.clear();
    }

    Decision TimeBoxedStrategy::evaluate(const MarketView& view, const std::optional<PositionView>& position) {
        if (busy()) {
            std::cerr << "[TimeBoxedStrategy::evaluate] " << inner_->name()
                << " still running a previous evaluation, HOLD on " << view.symbol << std::endl;
            return HoldDecision{};
        }
        reap();
        apply_deferred_closes();

        auto inner = inner_;
        auto task = std::make_shared<std::packaged_task<Decision()>>(
            [inner, view, position]() { return inner->evaluate(view, position); });
        pending_ = task->get_future();
        worker_ = boost::thread([task]() { (*task)(); });

        if (pending_.wait_for(timeout_) == std::future_status::ready) {
            Decision decision = pending_.get();
            reap();
            return decision;
        }

        ++timeouts_;
        worker_.interrupt();
        std::cerr << "[TimeBoxedStrategy::evaluate] " << inner_->name() << " exceeded "
            << timeout_.count() << " ms on " << view.symbol << ", HOLD" << std::endl;
        return HoldDecision{};
    }

    void TimeBoxedStrategy::configure(const boost::property_tree::ptree& options) {
        if (busy()) {
            throw std::logic_error("cannot configure " + inner_->name() + " while an evaluation is running");
        }
        reap();
        inner_->configure(options);
    }

    std::size_t TimeBoxedStrategy::minimum_bars_required() const {
        return inner_->minimum_bars_required();
    }

    const std::string& TimeBoxedStrategy::name() const {
        return inner_->name();
    }

    void TimeBoxedStrategy::on_position_closed(const std::string& symbol, long long timestamp) {
        if (busy()) {
            deferred_closes_.emplace_back(symbol, timestamp);
            return;
        }
        inner_->on_position_closed(symbol, timestamp);
    }
}
