#include "Exanges/PaperSimulator/Ledger/LedgerTransaction.hpp"
#include <iostream>

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    LedgerTransaction::LedgerTransaction(Ledger& ledger, std::shared_ptr<ILedgerStore> store, Hooks hooks)
        : ledger_(ledger),
        store_(std::move(store)),
        hooks_(std::move(hooks)),
        checkpoint_(ledger.checkpoint()),
        outermost_(ledger.enter_transaction() == 1)
    {
    }

    LedgerTransaction::~LedgerTransaction() {
        if (!finished_) {
            rollback();
        }
    }

    void LedgerTransaction::commit() {
        if (finished_) return;

        if (outermost_ && store_) {
            try {
                store_->save(ledger_);
            }
            catch (const std::exception& e) {
                std::cerr << "[LedgerTransaction::commit] save failed for " << ledger_.name()
                    << ", rolling back: " << e.what() << "\n";
                rollback();
                throw;
            }
        }
        finished_ = true;
        ledger_.leave_transaction();
        if (outermost_ && hooks_.on_commit) {
            hooks_.on_commit();
        }
    }

    void LedgerTransaction::rollback() {
        if (finished_) return;
        ledger_.rollback_to(checkpoint_);
        finished_ = true;
        ledger_.leave_transaction();
        if (outermost_ && hooks_.on_rollback) {
            hooks_.on_rollback();
        }
    }
}
