#pragma once

#include <optional>
#include <string>
#include <variant>
#include "Dto/Types.hpp"

namespace PaperPerp::Strategy {
    struct HoldDecision {
    };

    struct OpenDecision {
        Dto::Direction          direction = Dto::Direction::Long;
        double                  confidence = 0.0;       // 0 .. 1
        std::optional<double>   stop_loss;
        std::optional<double>   take_profit;
        std::optional<double>   size_percent;           // of free balance; driver default when empty
        std::optional<double>   trailing_distance;      // absolute price distance
        std::string             reason;
    };

    struct CloseDecision {
        std::string reason;
    };

    // Default-constructed Decision is HOLD
    using Decision = std::variant<HoldDecision, OpenDecision, CloseDecision>;

    inline bool is_hold(const Decision& decision) { return std::holds_alternative<HoldDecision>(decision); }
    inline bool is_open(const Decision& decision) { return std::holds_alternative<OpenDecision>(decision); }
    inline bool is_close(const Decision& decision) { return std::holds_alternative<CloseDecision>(decision); }

    std::string to_string(const Decision& decision);
}
