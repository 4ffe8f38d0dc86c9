#pragma once

#include <optional>
#include <string>
#include <vector>
#include "Dto/Market/Base.hpp"

namespace PaperPerp::Dto::Market {
    struct BarDto : BaseMarketDto {
        double OpenPrice;
        double HighPrice;
        double LowPrice;
        double ClosePrice;
        double Volume;
        std::optional<double> FundingRate;  // in percent per funding period, when recorded
    };

    using BarSeries = std::vector<BarDto>;
}
