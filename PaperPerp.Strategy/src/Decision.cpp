#include "Decision.hpp"
#include <sstream>

namespace PaperPerp::Strategy {
    std::string to_string(const Decision& decision) {
        if (const auto* open = std::get_if<OpenDecision>(&decision)) {
            std::ostringstream oss;
            oss << "OPEN " << Dto::to_string(open->direction) << " conf=" << open->confidence;
            if (open->stop_loss) oss << " sl=" << *open->stop_loss;
            if (open->take_profit) oss << " tp=" << *open->take_profit;
            if (!open->reason.empty()) oss << " (" << open->reason << ")";
            return oss.str();
        }
        if (const auto* close = std::get_if<CloseDecision>(&decision)) {
            return "CLOSE (" + close->reason + ")";
        }
        return "HOLD";
    }
}
