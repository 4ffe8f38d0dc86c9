#pragma once

#include <ostream>
#include <string>
#include "Analytics/Statistics.hpp"
#include "Exanges/PaperSimulator/Engine/SimulationEngine.hpp"

namespace PaperPerp::Runner {
    void print_summary(std::ostream& os, const Infra::Exanges::PaperSimulator::AccountSummary& summary,
        const std::string& title);

    void print_statistics(std::ostream& os, const Infra::Analytics::TradeStatistics& stats);
}
