#pragma once

#include "Dto/Market/Base.hpp"

namespace PaperPerp::Dto::Market {
    struct SentimentDto : BaseMarketDto {
        double Score;       // -1 (bearish) .. +1 (bullish)
        double Confidence;  // 0 .. 1
    };
}
