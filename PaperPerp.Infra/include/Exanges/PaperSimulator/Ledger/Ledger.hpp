#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "Dto/Account.hpp"
#include "Dto/Order.hpp"
#include "Dto/Position.hpp"
#include "Dto/Trade.hpp"

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    using PaperPerp::Utils::Numeric::Decimal;

    // A second open position for one (account, symbol), or rows that do not
    // belong together, reached the ledger or its storage.
    class LedgerIntegrityError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * In-memory state of one account: the account row, its open positions
     * keyed by symbol, and the append-only histories (closed positions,
     * trades, orders). Only SimulationEngine mutates it.
     */
    class Ledger {
    public:
        // Restorable copy of everything a tick may change. Histories are
        // append-only, so their lengths are enough to roll them back.
        struct Checkpoint {
            Dto::Account account;
            std::map<std::string, Dto::Position> open_positions;
            std::size_t closed_count;
            std::size_t trade_count;
            std::size_t order_count;
            long long next_position_id;
            long long next_trade_id;
            long long next_order_id;
        };

        explicit Ledger(Dto::Account account);

        static Ledger create(const std::string& name, const Decimal& starting_equity, double default_leverage,
            const Decimal& maker_fee_rate, const Decimal& taker_fee_rate, long long now);

        // Rebuild from persisted rows; throws LedgerIntegrityError on
        // duplicate open positions or rows of another account.
        static Ledger restore(Dto::Account account, const std::vector<Dto::Position>& positions,
            std::vector<Dto::Trade> trades, std::vector<Dto::Order> orders);

        const Dto::Account& account() const { return account_; }
        Dto::Account& account() { return account_; }
        const std::string& name() const { return account_.name; }

        const std::map<std::string, Dto::Position>& open_positions() const { return open_positions_; }
        const Dto::Position* find_open(const std::string& symbol) const;
        Dto::Position* find_open(const std::string& symbol);
        const Dto::Position* find_open_by_id(long long position_id) const;
        bool was_closed(long long position_id) const;

        void add_open_position(Dto::Position position);
        // Removes the open position, marks it closed and appends it to history
        Dto::Position close_position(const std::string& symbol);
        // Every position row, open ones last
        std::vector<Dto::Position> all_positions() const;

        const std::vector<Dto::Position>& closed_positions() const { return closed_positions_; }
        const std::vector<Dto::Trade>& trades() const { return trades_; }
        const std::vector<Dto::Order>& orders() const { return orders_; }
        void append_trade(Dto::Trade trade);
        void append_order(Dto::Order order);

        long long next_position_id() { return next_position_id_++; }
        long long next_trade_id() { return next_trade_id_++; }
        long long next_order_id() { return next_order_id_++; }

        Decimal open_margin() const;
        Decimal open_entry_fees() const;
        Decimal unrealized_pnl() const;

        Checkpoint checkpoint() const;
        void rollback_to(const Checkpoint& checkpoint);

        // Nesting depth of LedgerTransaction scopes currently alive
        int enter_transaction() { return ++transaction_depth_.value; }
        int leave_transaction() { return --transaction_depth_.value; }
        bool in_transaction() const { return transaction_depth_.value > 0; }

    private:
        Dto::Account account_;
        std::map<std::string, Dto::Position> open_positions_;
        std::vector<Dto::Position> closed_positions_;
        std::vector<Dto::Trade> trades_;
        std::vector<Dto::Order> orders_;
        long long next_position_id_ = 1;
        long long next_trade_id_ = 1;
        long long next_order_id_ = 1;

        // Copies (stored snapshots) start outside any transaction
        struct ScopeDepth {
            int value = 0;
            ScopeDepth() = default;
            ScopeDepth(const ScopeDepth&) {}
            ScopeDepth& operator=(const ScopeDepth&) { return *this; }
        };
        ScopeDepth transaction_depth_;
    };
}
