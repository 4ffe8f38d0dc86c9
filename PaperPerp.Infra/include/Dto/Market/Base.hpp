#pragma once

namespace PaperPerp::Dto::Market {
    struct BaseMarketDto {
        long long Timestamp;    // bar open time, epoch milliseconds
    };
}
