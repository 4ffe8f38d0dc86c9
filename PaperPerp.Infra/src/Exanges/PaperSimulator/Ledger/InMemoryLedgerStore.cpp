#include "Exanges/PaperSimulator/Ledger/InMemoryLedgerStore.hpp"

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    void check_unique_open_positions(const std::string& account, const std::vector<Dto::Position>& positions) {
        std::map<std::string, long long> open_by_symbol;
        for (const auto& pos : positions) {
            if (pos.account != account) {
                throw LedgerIntegrityError("Position " + std::to_string(pos.id) + " belongs to account " + pos.account
                    + ", not " + account);
            }
            if (pos.status != Dto::PositionStatus::Open) continue;
            auto [it, inserted] = open_by_symbol.emplace(pos.symbol, pos.id);
            if (!inserted) {
                throw LedgerIntegrityError("Duplicate open position for " + account + "/" + pos.symbol
                    + " (ids " + std::to_string(it->second) + " and " + std::to_string(pos.id) + ")");
            }
        }
    }

    std::optional<Ledger> InMemoryLedgerStore::load(const std::string& account) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = snapshots_.find(account);
        if (it == snapshots_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void InMemoryLedgerStore::save(const Ledger& ledger) {
        check_unique_open_positions(ledger.name(), ledger.all_positions());
        std::lock_guard<std::mutex> lock(mtx_);
        snapshots_.insert_or_assign(ledger.name(), ledger);
        ++saves_;
    }

    int InMemoryLedgerStore::save_count() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return saves_;
    }
}
