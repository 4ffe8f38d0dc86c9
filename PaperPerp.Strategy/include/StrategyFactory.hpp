#pragma once

#include <memory>
#include <string>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include "IStrategy.hpp"

namespace PaperPerp::Strategy {
    class StrategyFactory {
    public:
        /// Builds the named family ("breakout", "mean_reversion", "funding_carry")
        /// configured from `options`. A positive `evaluate_timeout_ms` option wraps
        /// the result in a TimeBoxedStrategy unless `allow_time_box` is false, as a
        /// replay needs evaluate() on the calling thread. Throws
        /// std::invalid_argument on an unknown name or a bad option.
        static std::shared_ptr<IStrategy> create(const std::string& name,
            const boost::property_tree::ptree& options = boost::property_tree::ptree(),
            bool allow_time_box = true);

        static std::vector<std::string> names();
    };
}
