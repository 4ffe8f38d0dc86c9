#pragma once

#include <map>
#include <mutex>
#include "Exanges/PaperSimulator/Ledger/ILedgerStore.hpp"

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    class InMemoryLedgerStore : public ILedgerStore {
    public:
        std::optional<Ledger> load(const std::string& account) override;
        void save(const Ledger& ledger) override;

        int save_count() const;

    private:
        mutable std::mutex mtx_;
        std::map<std::string, Ledger> snapshots_;
        int saves_ = 0;
    };
}
