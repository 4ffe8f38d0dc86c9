#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Analytics/Statistics.hpp"
#include "Dto/Market/Bar.hpp"
#include "Exanges/PaperSimulator/Config.hpp"
#include "Exanges/PaperSimulator/Engine/Outcome.hpp"
#include "Exanges/PaperSimulator/Ledger/ILedgerStore.hpp"
#include "Exanges/PaperSimulator/Ledger/LedgerTransaction.hpp"

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    using PaperPerp::Utils::Numeric::Decimal;

    // How much to open: base units, quote notional, or percent of free balance
    struct PositionSize {
        enum class Kind { Units, Notional, PercentOfBalance };
        Kind    kind = Kind::Units;
        Decimal value;

        static PositionSize units(const Decimal& units) { return { Kind::Units, units }; }
        static PositionSize notional(const Decimal& quote) { return { Kind::Notional, quote }; }
        static PositionSize percent_of_balance(const Decimal& percent) { return { Kind::PercentOfBalance, percent }; }
    };

    struct OpenRequest {
        std::string symbol;
        Dto::Direction direction = Dto::Direction::Long;
        PositionSize size;
        Decimal reference_price;                // price the fill is derived from
        std::optional<double> leverage;         // account default when empty
        std::optional<Decimal> stop_loss;
        std::optional<Decimal> take_profit;
        std::optional<Decimal> trailing_distance;
        std::string strategy;
        long long timestamp = 0;
    };

    struct RiskTrigger {
        Dto::CloseReason reason;
        Decimal reference_price;                // level the close is filled from
    };

    struct AccountSummary {
        std::string name;
        Decimal starting_equity;
        Decimal balance;
        Decimal used_margin;
        Decimal equity;                         // balance + margin + unrealized
        Decimal realized_pnl;                   // sum of net PnL of closed trades
        Decimal unrealized_pnl;
        Decimal total_pnl;                      // equity - starting equity
        Decimal total_fees;
        double  roi = 0.0;                      // percent
        int     total_trades = 0;
        int     winning_trades = 0;
        int     losing_trades = 0;
        double  win_rate = 0.0;
        double  current_drawdown = 0.0;         // percent below the high-water mark
        double  max_drawdown = 0.0;
        std::vector<Dto::Position> open_positions;
        std::map<RejectionKind, int> rejections;
    };

    /**
     * Applies open/close requests to one account's Ledger.
     * Every accepted mutation runs inside a LedgerTransaction; when a caller
     * already holds one (see transaction()), the whole group is persisted and
     * published once at the outer commit.
     *
     * Balance bookkeeping:
     *   open : balance -= margin + entry_fee
     *   close: balance += margin + gross_pnl - exit_fee
     * so balance + open margin + open entry fees == starting equity + sum(net_pnl).
     */
    class SimulationEngine {
    public:
        using TradeCallback = std::function<void(const Dto::Trade&)>;
        using PositionCallback = std::function<void(const Dto::Position&)>;

        SimulationEngine(Ledger ledger, EngineConfig config, std::shared_ptr<ILedgerStore> store = nullptr);

        SimulationEngine(const SimulationEngine&) = delete;
        SimulationEngine& operator=(const SimulationEngine&) = delete;

        // Loads the named account from the store, or creates and saves it
        static std::unique_ptr<SimulationEngine> for_account(const std::string& name, const Decimal& starting_equity,
            double default_leverage, EngineConfig config, std::shared_ptr<ILedgerStore> store, long long now);

        Outcome<Dto::Position> open(const OpenRequest& request);
        Outcome<Dto::Trade> close(long long position_id, const Decimal& reference_price,
            Dto::CloseReason reason, long long timestamp);
        Outcome<Dto::Trade> close_symbol(const std::string& symbol, const Decimal& reference_price,
            Dto::CloseReason reason, long long timestamp);

        Decimal mark_to_market(const Dto::Position& position, const Decimal& price) const;
        // Refreshes the cached unrealized PnL / mark price of the open position
        Decimal mark(const std::string& symbol, const Decimal& price);

        std::optional<RiskTrigger> check_risk_triggers(const Dto::Position& position, const Decimal& price) const;
        std::optional<RiskTrigger> check_risk_triggers(const Dto::Position& position, const Dto::Market::BarDto& bar) const;

        // Moves the stop towards the price by the trailing distance, never back
        bool update_trailing_stop(const std::string& symbol, const Decimal& price);

        void reset_account(const std::optional<Decimal>& starting_equity = std::nullopt, long long now = 0);

        AccountSummary summary() const;
        Analytics::TradeStatistics performance() const;

        // Read-only from now on: every mutating request is rejected as Halted
        void halt();
        bool is_halted() const { return halted_; }

        // Opens a scope grouping several engine calls into one persisted unit
        LedgerTransaction transaction();

        void on_trade_closed(TradeCallback callback);
        void on_position_opened(PositionCallback callback);

        const Ledger& ledger() const { return ledger_; }
        const EngineConfig& config() const { return config_; }
        const std::vector<Dto::Order>& rejected_orders() const { return rejected_orders_; }
        int rejection_count(RejectionKind kind) const;

    private:
        Ledger ledger_;
        EngineConfig config_;
        std::shared_ptr<ILedgerStore> store_;
        bool halted_ = false;

        std::vector<TradeCallback> trade_callbacks_;
        std::vector<PositionCallback> position_callbacks_;
        std::vector<Dto::Trade> pending_trades_;
        std::vector<Dto::Position> pending_positions_;

        std::vector<Dto::Order> rejected_orders_;
        std::map<RejectionKind, int> rejection_counts_;

        Decimal entry_fill(Dto::Direction direction, const Decimal& reference) const;
        Decimal exit_fill(Dto::Direction direction, const Decimal& reference) const;
        Rejection reject(RejectionKind kind, const std::string& reason, const std::string& symbol,
            Dto::Direction direction, Dto::OrderType type, const Decimal& price, long long timestamp);
        void publish_pending();
        void discard_pending();
    };
}
