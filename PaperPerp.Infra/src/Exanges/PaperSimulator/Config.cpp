#include "Exanges/PaperSimulator/Config.hpp"

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    using PaperPerp::Utils::Numeric::from_double;

    const MarginTier& tier_for(const Decimal& notional) {
        double value = notional.convert_to<double>();
        for (const auto& tier : margin_tiers) {
            if (value <= tier.notional_upper) {
                return tier;
            }
        }
        return margin_tiers.back();
    }

    EngineConfig EngineConfig::for_vip_level(int vip_level) {
        auto it = vip_fee_rates.find(vip_level);
        if (it == vip_fee_rates.end()) {
            throw std::invalid_argument("vip_level must be between 0 and 9, got " + std::to_string(vip_level));
        }
        EngineConfig config;
        config.maker_fee_rate = from_double(it->second.maker_fee_rate);
        config.taker_fee_rate = from_double(it->second.taker_fee_rate);
        return config;
    }

    void EngineConfig::validate() const {
        if (maker_fee_rate < 0 || maker_fee_rate >= 1)
            throw std::invalid_argument("maker_fee_rate must be in [0, 1)");
        if (taker_fee_rate < 0 || taker_fee_rate >= 1)
            throw std::invalid_argument("taker_fee_rate must be in [0, 1)");
        if (slippage_rate < 0 || slippage_rate >= 1)
            throw std::invalid_argument("slippage_rate must be in [0, 1)");
        if (tick_size < 0)
            throw std::invalid_argument("tick_size must be >= 0");
        if (lot_step < 0)
            throw std::invalid_argument("lot_step must be >= 0");
        if (max_leverage < 1.0 || max_leverage > margin_tiers.front().max_leverage)
            throw std::invalid_argument("max_leverage must be in [1, 125]");
        if (max_open_positions < 0)
            throw std::invalid_argument("max_open_positions must be >= 0");
    }
}
