#pragma once

#include <optional>
#include <string>
#include "Exanges/PaperSimulator/Ledger/Ledger.hpp"

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    // Persistence of the four relations (accounts, positions, trades, orders).
    // Implementations must refuse a snapshot with two open positions for one
    // (account, symbol) by throwing LedgerIntegrityError.
    class ILedgerStore {
    public:
        virtual ~ILedgerStore() = default;

        virtual std::optional<Ledger> load(const std::string& account) = 0;
        // Replaces the stored snapshot of ledger.name() as one unit
        virtual void save(const Ledger& ledger) = 0;
    };

    // Shared by both stores: unique open position per (account, symbol)
    void check_unique_open_positions(const std::string& account, const std::vector<Dto::Position>& positions);
}
