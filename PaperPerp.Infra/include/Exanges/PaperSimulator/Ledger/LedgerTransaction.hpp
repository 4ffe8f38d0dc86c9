#pragma once

#include <functional>
#include <memory>
#include "Exanges/PaperSimulator/Ledger/ILedgerStore.hpp"
#include "Exanges/PaperSimulator/Ledger/Ledger.hpp"

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    /**
     * Scope guard around ledger mutations.
     *  - Construction takes a checkpoint.
     *  - commit() on the outermost scope saves the ledger to the store and then
     *    runs on_commit; inner scopes only mark themselves done.
     *  - Leaving a scope without commit() (early return, exception) restores
     *    the checkpoint. The outermost one also runs on_rollback.
     * A failed save restores the checkpoint and rethrows.
     */
    class LedgerTransaction {
    public:
        struct Hooks {
            std::function<void()> on_commit;
            std::function<void()> on_rollback;
        };

        LedgerTransaction(Ledger& ledger, std::shared_ptr<ILedgerStore> store, Hooks hooks = {});
        ~LedgerTransaction();

        LedgerTransaction(const LedgerTransaction&) = delete;
        LedgerTransaction& operator=(const LedgerTransaction&) = delete;

        void commit();
        void rollback();

        bool outermost() const { return outermost_; }
        bool finished() const { return finished_; }

    private:
        Ledger& ledger_;
        std::shared_ptr<ILedgerStore> store_;
        Hooks hooks_;
        Ledger::Checkpoint checkpoint_;
        bool outermost_;
        bool finished_ = false;
    };
}
