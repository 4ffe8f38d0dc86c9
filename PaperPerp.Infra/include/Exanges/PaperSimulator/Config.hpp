#pragma once

#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "Numeric/Decimal.hpp"

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    using PaperPerp::Utils::Numeric::Decimal;

    // Fee rate structure for maker/taker
    struct FeeRate {
        double maker_fee_rate;
        double taker_fee_rate;
    };

    // Mapping from VIP level to fee rates (USDT-margined perpetuals)
    const std::map<int, FeeRate> vip_fee_rates = {
        {0, {0.00020, 0.00050}},
        {1, {0.00016, 0.00040}},
        {2, {0.00014, 0.00035}},
        {3, {0.00012, 0.00032}},
        {4, {0.00010, 0.00030}},
        {5, {0.00008, 0.00027}},
        {6, {0.00006, 0.00025}},
        {7, {0.00004, 0.00022}},
        {8, {0.00002, 0.00020}},
        {9, {0.00000, 0.00017}}
    };

    // Notional bracket and the highest leverage allowed inside it
    struct MarginTier {
        double notional_upper;
        double maintenance_margin_rate;
        double max_leverage;
    };

    const std::vector<MarginTier> margin_tiers = {
        {50000,      0.0040, 125},
        {600000,     0.0050, 100},
        {3000000,    0.0065,  75},
        {12000000,   0.0100,  50},
        {70000000,   0.0200,  25},
        {100000000,  0.0250,  20},
        {230000000,  0.0500,  10},
        {480000000,  0.1000,   5},
        {600000000,  0.1250,   4},
        {800000000,  0.1500,   3},
        {1200000000, 0.2500,   2},
        {std::numeric_limits<double>::max(), 0.5000, 1}
    };

    const MarginTier& tier_for(const Decimal& notional);

    struct EngineConfig {
        Decimal maker_fee_rate{ "0.0002" };
        Decimal taker_fee_rate{ "0.0005" };
        Decimal slippage_rate{ "0.001" };     // fraction of the reference price
        Decimal tick_size{ "0.01" };
        Decimal lot_step{ "0.00001" };
        double  max_leverage = 20.0;
        int     max_open_positions = 3;         // 0 = no cap

        // Fee rates taken from the VIP table, everything else default
        static EngineConfig for_vip_level(int vip_level);

        // Throws std::invalid_argument naming the offending field
        void validate() const;
    };
}
