#include "Exanges/PaperSimulator/Ledger/Ledger.hpp"
#include "Exanges/PaperSimulator/Ledger/ILedgerStore.hpp"
#include <algorithm>

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    Ledger::Ledger(Dto::Account account)
        : account_(std::move(account))
    {
    }

    Ledger Ledger::create(const std::string& name, const Decimal& starting_equity, double default_leverage,
        const Decimal& maker_fee_rate, const Decimal& taker_fee_rate, long long now)
    {
        if (name.empty())
            throw std::invalid_argument("Account name must not be empty.");
        if (starting_equity <= 0)
            throw std::invalid_argument("Starting equity must be > 0.");
        if (default_leverage <= 0)
            throw std::invalid_argument("Leverage must be > 0.");

        Dto::Account account;
        account.name = name;
        account.starting_equity = starting_equity;
        account.balance = starting_equity;
        account.default_leverage = default_leverage;
        account.maker_fee_rate = maker_fee_rate;
        account.taker_fee_rate = taker_fee_rate;
        account.peak_equity = starting_equity;
        account.created_at = now;
        account.updated_at = now;
        return Ledger(std::move(account));
    }

    Ledger Ledger::restore(Dto::Account account, const std::vector<Dto::Position>& positions,
        std::vector<Dto::Trade> trades, std::vector<Dto::Order> orders)
    {
        check_unique_open_positions(account.name, positions);

        Ledger ledger(std::move(account));
        long long max_position = 0;
        for (const auto& pos : positions) {
            max_position = std::max(max_position, pos.id);
            if (pos.status == Dto::PositionStatus::Open) {
                ledger.open_positions_.emplace(pos.symbol, pos);
            }
            else {
                ledger.closed_positions_.push_back(pos);
            }
        }
        for (const auto& trade : trades) {
            if (trade.account != ledger.name())
                throw LedgerIntegrityError("Trade " + std::to_string(trade.id) + " belongs to account " + trade.account);
            ledger.next_trade_id_ = std::max(ledger.next_trade_id_, trade.id + 1);
        }
        for (const auto& order : orders) {
            if (order.account != ledger.name())
                throw LedgerIntegrityError("Order " + std::to_string(order.id) + " belongs to account " + order.account);
            ledger.next_order_id_ = std::max(ledger.next_order_id_, order.id + 1);
        }
        ledger.next_position_id_ = max_position + 1;
        ledger.trades_ = std::move(trades);
        ledger.orders_ = std::move(orders);
        return ledger;
    }

    const Dto::Position* Ledger::find_open(const std::string& symbol) const {
        auto it = open_positions_.find(symbol);
        return it == open_positions_.end() ? nullptr : &it->second;
    }

    Dto::Position* Ledger::find_open(const std::string& symbol) {
        auto it = open_positions_.find(symbol);
        return it == open_positions_.end() ? nullptr : &it->second;
    }

    const Dto::Position* Ledger::find_open_by_id(long long position_id) const {
        for (const auto& [symbol, pos] : open_positions_) {
            if (pos.id == position_id) return &pos;
        }
        return nullptr;
    }

    bool Ledger::was_closed(long long position_id) const {
        return std::any_of(closed_positions_.begin(), closed_positions_.end(),
            [position_id](const Dto::Position& p) { return p.id == position_id; });
    }

    void Ledger::add_open_position(Dto::Position position) {
        if (position.account != account_.name) {
            throw LedgerIntegrityError("Position for account " + position.account + " added to ledger " + account_.name);
        }
        if (open_positions_.count(position.symbol)) {
            throw LedgerIntegrityError("Open position already exists for " + account_.name + "/" + position.symbol);
        }
        position.status = Dto::PositionStatus::Open;
        open_positions_.emplace(position.symbol, std::move(position));
    }

    Dto::Position Ledger::close_position(const std::string& symbol) {
        auto it = open_positions_.find(symbol);
        if (it == open_positions_.end()) {
            throw LedgerIntegrityError("No open position for " + account_.name + "/" + symbol);
        }
        Dto::Position pos = std::move(it->second);
        open_positions_.erase(it);
        pos.status = Dto::PositionStatus::Closed;
        closed_positions_.push_back(pos);
        return pos;
    }

    std::vector<Dto::Position> Ledger::all_positions() const {
        std::vector<Dto::Position> rows = closed_positions_;
        for (const auto& [symbol, pos] : open_positions_) {
            rows.push_back(pos);
        }
        return rows;
    }

    void Ledger::append_trade(Dto::Trade trade) {
        trades_.push_back(std::move(trade));
    }

    void Ledger::append_order(Dto::Order order) {
        orders_.push_back(std::move(order));
    }

    Decimal Ledger::open_margin() const {
        Decimal total = 0;
        for (const auto& [symbol, pos] : open_positions_) total += pos.margin;
        return total;
    }

    Decimal Ledger::open_entry_fees() const {
        Decimal total = 0;
        for (const auto& [symbol, pos] : open_positions_) total += pos.entry_fee;
        return total;
    }

    Decimal Ledger::unrealized_pnl() const {
        Decimal total = 0;
        for (const auto& [symbol, pos] : open_positions_) total += pos.unrealized_pnl;
        return total;
    }

    Ledger::Checkpoint Ledger::checkpoint() const {
        return Checkpoint{
            account_,
            open_positions_,
            closed_positions_.size(),
            trades_.size(),
            orders_.size(),
            next_position_id_,
            next_trade_id_,
            next_order_id_
        };
    }

    void Ledger::rollback_to(const Checkpoint& checkpoint) {
        account_ = checkpoint.account;
        open_positions_ = checkpoint.open_positions;
        if (closed_positions_.size() > checkpoint.closed_count) closed_positions_.resize(checkpoint.closed_count);
        if (trades_.size() > checkpoint.trade_count) trades_.resize(checkpoint.trade_count);
        if (orders_.size() > checkpoint.order_count) orders_.resize(checkpoint.order_count);
        next_position_id_ = checkpoint.next_position_id;
        next_trade_id_ = checkpoint.next_trade_id;
        next_order_id_ = checkpoint.next_order_id;
    }
}
