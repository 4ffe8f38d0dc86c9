#include "StrategyFactory.hpp"
#include <chrono>
#include <stdexcept>
#include "Breakout/BreakoutStrategy.hpp"
#include "FundingCarry/FundingCarryStrategy.hpp"
#include "MeanReversion/MeanReversionStrategy.hpp"
#include "Options.hpp"
#include "TimeBoxedStrategy.hpp"

namespace PaperPerp::Strategy {
    std::shared_ptr<IStrategy> StrategyFactory::create(const std::string& name, const boost::property_tree::ptree& options,
        bool allow_time_box)
    {
        std::shared_ptr<IStrategy> strategy;
        if (name == "breakout") {
            strategy = std::make_shared<Breakout::BreakoutStrategy>(Breakout::BreakoutConfig::from_ptree(options));
        }
        else if (name == "mean_reversion") {
            strategy = std::make_shared<MeanReversion::MeanReversionStrategy>(MeanReversion::MeanReversionConfig::from_ptree(options));
        }
        else if (name == "funding_carry") {
            strategy = std::make_shared<FundingCarry::FundingCarryStrategy>(FundingCarry::FundingCarryConfig::from_ptree(options));
        }
        else {
            throw std::invalid_argument("unknown strategy '" + name + "'");
        }

        const long long timeout_ms = read_option<long long>(options, "evaluate_timeout_ms", 0);
        if (timeout_ms < 0) {
            throw std::invalid_argument("evaluate_timeout_ms must be >= 0");
        }
        if (timeout_ms > 0 && allow_time_box) {
            return std::make_shared<TimeBoxedStrategy>(strategy, std::chrono::milliseconds(timeout_ms));
        }
        return strategy;
    }

    std::vector<std::string> StrategyFactory::names() {
        return { "breakout", "mean_reversion", "funding_carry" };
    }
}
