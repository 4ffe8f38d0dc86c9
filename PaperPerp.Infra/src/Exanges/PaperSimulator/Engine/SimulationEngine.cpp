#include "Exanges/PaperSimulator/Engine/SimulationEngine.hpp"
#include <algorithm>
#include <iostream>

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    using PaperPerp::Utils::Numeric::floor_to_step;
    using PaperPerp::Utils::Numeric::from_double;
    using PaperPerp::Utils::Numeric::round_to_tick;
    using PaperPerp::Utils::Numeric::to_double;
    using PaperPerp::Utils::Numeric::to_string;

    std::string to_string(RejectionKind kind) {
        switch (kind) {
        case RejectionKind::InvalidRequest:      return "invalid_request";
        case RejectionKind::InsufficientMargin:  return "insufficient_margin";
        case RejectionKind::LeverageOutOfBounds: return "leverage_out_of_bounds";
        case RejectionKind::DuplicateOpen:       return "duplicate_open";
        case RejectionKind::MaxPositions:        return "max_positions";
        case RejectionKind::AlreadyClosed:       return "already_closed";
        case RejectionKind::UnknownPosition:     return "unknown_position";
        case RejectionKind::Halted:              return "halted";
        }
        return "unknown";
    }

    // --------------------------------------------
    //  Construction
    // --------------------------------------------
    SimulationEngine::SimulationEngine(Ledger ledger, EngineConfig config, std::shared_ptr<ILedgerStore> store)
        : ledger_(std::move(ledger)),
        config_(std::move(config)),
        store_(std::move(store))
    {
        config_.validate();
    }

    std::unique_ptr<SimulationEngine> SimulationEngine::for_account(const std::string& name,
        const Decimal& starting_equity, double default_leverage, EngineConfig config,
        std::shared_ptr<ILedgerStore> store, long long now)
    {
        if (store) {
            std::optional<Ledger> loaded = store->load(name);
            if (loaded) {
                std::cout << "[for_account] Loaded account " << name << " balance="
                    << to_string(loaded->account().balance, 2) << " open=" << loaded->open_positions().size() << "\n";
                return std::make_unique<SimulationEngine>(std::move(*loaded), std::move(config), store);
            }
        }

        Ledger ledger = Ledger::create(name, starting_equity, default_leverage,
            config.maker_fee_rate, config.taker_fee_rate, now);
        auto engine = std::make_unique<SimulationEngine>(std::move(ledger), std::move(config), store);
        if (store) {
            store->save(engine->ledger());
        }
        std::cout << "[for_account] Created account " << name << " with " << to_string(starting_equity, 2) << "\n";
        return engine;
    }

    LedgerTransaction SimulationEngine::transaction() {
        return LedgerTransaction(ledger_, store_, {
            [this] { publish_pending(); },
            [this] { discard_pending(); }
        });
    }

    void SimulationEngine::on_trade_closed(TradeCallback callback) {
        trade_callbacks_.push_back(std::move(callback));
    }

    void SimulationEngine::on_position_opened(PositionCallback callback) {
        position_callbacks_.push_back(std::move(callback));
    }

    void SimulationEngine::publish_pending() {
        auto positions = std::move(pending_positions_);
        auto trades = std::move(pending_trades_);
        pending_positions_.clear();
        pending_trades_.clear();
        for (const auto& pos : positions) {
            for (const auto& cb : position_callbacks_) cb(pos);
        }
        for (const auto& trade : trades) {
            for (const auto& cb : trade_callbacks_) cb(trade);
        }
    }

    void SimulationEngine::discard_pending() {
        pending_positions_.clear();
        pending_trades_.clear();
    }

    void SimulationEngine::halt() {
        if (!halted_) {
            std::cout << "[halt] Engine for " << ledger_.name() << " is now read-only\n";
        }
        halted_ = true;
    }

    int SimulationEngine::rejection_count(RejectionKind kind) const {
        auto it = rejection_counts_.find(kind);
        return it == rejection_counts_.end() ? 0 : it->second;
    }

    // --------------------------------------------
    //  Fill price helpers
    // --------------------------------------------
    Decimal SimulationEngine::entry_fill(Dto::Direction direction, const Decimal& reference) const {
        Decimal factor = direction == Dto::Direction::Long ? 1 + config_.slippage_rate : 1 - config_.slippage_rate;
        return round_to_tick(reference * factor, config_.tick_size);
    }

    Decimal SimulationEngine::exit_fill(Dto::Direction direction, const Decimal& reference) const {
        Decimal factor = direction == Dto::Direction::Long ? 1 - config_.slippage_rate : 1 + config_.slippage_rate;
        return round_to_tick(reference * factor, config_.tick_size);
    }

    Rejection SimulationEngine::reject(RejectionKind kind, const std::string& reason, const std::string& symbol,
        Dto::Direction direction, Dto::OrderType type, const Decimal& price, long long timestamp)
    {
        Dto::Order order;
        order.account = ledger_.name();
        order.symbol = symbol;
        order.direction = direction;
        order.type = type;
        order.requested_price = price;
        order.status = Dto::OrderStatus::Rejected;
        order.timestamp = timestamp;
        order.reason = to_string(kind) + ": " + reason;
        rejected_orders_.push_back(order);
        ++rejection_counts_[kind];

        std::cerr << "[" << (type == Dto::OrderType::MarketOpen ? "open" : "close") << "] Rejected "
            << Dto::to_string(direction) << " " << symbol << " (" << to_string(kind) << "): " << reason << "\n";
        return Rejection{ kind, reason };
    }

    // --------------------------------------------
    //  open
    // --------------------------------------------
    Outcome<Dto::Position> SimulationEngine::open(const OpenRequest& request) {
        const std::string& symbol = request.symbol;
        const bool is_long = request.direction == Dto::Direction::Long;
        auto refuse = [&](RejectionKind kind, const std::string& reason) {
            return reject(kind, reason, symbol, request.direction, Dto::OrderType::MarketOpen,
                request.reference_price, request.timestamp);
        };

        if (halted_)
            return refuse(RejectionKind::Halted, "engine is halted");
        if (symbol.empty())
            return refuse(RejectionKind::InvalidRequest, "symbol is empty");
        if (request.reference_price <= 0)
            return refuse(RejectionKind::InvalidRequest, "reference price must be > 0");
        if (request.size.value <= 0)
            return refuse(RejectionKind::InvalidRequest, "size must be > 0");
        if (request.size.kind == PositionSize::Kind::PercentOfBalance && request.size.value > 100)
            return refuse(RejectionKind::InvalidRequest, "percent of balance must be <= 100");

        if (ledger_.find_open(symbol))
            return refuse(RejectionKind::DuplicateOpen, "an open position already exists for " + symbol);
        if (config_.max_open_positions > 0
            && static_cast<int>(ledger_.open_positions().size()) >= config_.max_open_positions)
            return refuse(RejectionKind::MaxPositions,
                "already " + std::to_string(config_.max_open_positions) + " open positions");

        double leverage = request.leverage.value_or(ledger_.account().default_leverage);
        if (!(leverage >= 1.0) || leverage > config_.max_leverage)
            return refuse(RejectionKind::LeverageOutOfBounds, "leverage " + std::to_string(leverage)
                + " outside [1, " + std::to_string(config_.max_leverage) + "]");

        const Decimal& ref = request.reference_price;
        if (request.stop_loss && (*request.stop_loss <= 0 || (is_long ? *request.stop_loss >= ref : *request.stop_loss <= ref)))
            return refuse(RejectionKind::InvalidRequest, "stop-loss " + to_string(*request.stop_loss)
                + " is on the wrong side of " + to_string(ref));
        if (request.take_profit && (*request.take_profit <= 0 || (is_long ? *request.take_profit <= ref : *request.take_profit >= ref)))
            return refuse(RejectionKind::InvalidRequest, "take-profit " + to_string(*request.take_profit)
                + " is on the wrong side of " + to_string(ref));
        if (request.trailing_distance && *request.trailing_distance <= 0)
            return refuse(RejectionKind::InvalidRequest, "trailing distance must be > 0");

        auto& account = ledger_.account();
        Decimal size;
        switch (request.size.kind) {
        case PositionSize::Kind::Units:
            size = request.size.value;
            break;
        case PositionSize::Kind::Notional:
            size = request.size.value / ref;
            break;
        case PositionSize::Kind::PercentOfBalance:
            size = account.balance * request.size.value / 100 / ref;
            break;
        }
        size = floor_to_step(size, config_.lot_step);
        if (size <= 0)
            return refuse(RejectionKind::InvalidRequest, "size rounds to zero at lot step " + to_string(config_.lot_step));

        Decimal fill = entry_fill(request.direction, ref);
        Decimal notional = size * fill;
        const MarginTier& tier = tier_for(notional);
        if (leverage > tier.max_leverage)
            return refuse(RejectionKind::LeverageOutOfBounds, "leverage " + std::to_string(leverage)
                + " above tier maximum " + std::to_string(tier.max_leverage) + " for notional " + to_string(notional, 2));

        Decimal margin = notional / from_double(leverage);
        Decimal fee = notional * account.taker_fee_rate;
        if (margin + fee > account.balance)
            return refuse(RejectionKind::InsufficientMargin, "needs " + to_string(margin + fee, 4)
                + " but balance is " + to_string(account.balance, 4));

        LedgerTransaction tx = transaction();

        account.balance -= margin + fee;
        account.updated_at = request.timestamp;

        Dto::Position pos;
        pos.id = ledger_.next_position_id();
        pos.account = account.name;
        pos.symbol = symbol;
        pos.direction = request.direction;
        pos.size = size;
        pos.entry_price = fill;
        pos.leverage = leverage;
        pos.margin = margin;
        pos.entry_fee = fee;
        pos.stop_loss = request.stop_loss
            ? std::optional<Decimal>(round_to_tick(*request.stop_loss, config_.tick_size)) : std::nullopt;
        pos.take_profit = request.take_profit
            ? std::optional<Decimal>(round_to_tick(*request.take_profit, config_.tick_size)) : std::nullopt;
        pos.trailing_distance = request.trailing_distance;
        pos.opened_at = request.timestamp;
        pos.strategy = request.strategy;
        pos.mark_price = fill;
        ledger_.add_open_position(pos);

        Dto::Order order;
        order.id = ledger_.next_order_id();
        order.account = account.name;
        order.symbol = symbol;
        order.direction = request.direction;
        order.type = Dto::OrderType::MarketOpen;
        order.requested_price = ref;
        order.fill_price = fill;
        order.size = size;
        order.slippage = PaperPerp::Utils::Numeric::abs(fill - ref);
        order.fee = fee;
        order.position_id = pos.id;
        order.timestamp = request.timestamp;
        order.reason = request.strategy;
        ledger_.append_order(order);

        pending_positions_.push_back(pos);
        tx.commit();

        std::cout << "[open] #" << pos.id << " " << (is_long ? "LONG " : "SHORT ") << to_string(size) << " " << symbol
            << " @ " << to_string(fill) << " (ref " << to_string(ref) << ") lev=" << leverage << "x"
            << " margin=" << to_string(margin, 4) << " fee=" << to_string(fee, 4)
            << " balance=" << to_string(account.balance, 4) << "\n";
        return pos;
    }

    // --------------------------------------------
    //  close
    // --------------------------------------------
    Outcome<Dto::Trade> SimulationEngine::close(long long position_id, const Decimal& reference_price,
        Dto::CloseReason reason, long long timestamp)
    {
        const Dto::Position* found = ledger_.find_open_by_id(position_id);
        std::string symbol = found ? found->symbol : std::string();
        Dto::Direction direction = found ? found->direction : Dto::Direction::Long;
        auto refuse = [&](RejectionKind kind, const std::string& why) {
            return reject(kind, why, symbol, direction, Dto::order_type_for(reason), reference_price, timestamp);
        };

        if (halted_)
            return refuse(RejectionKind::Halted, "engine is halted");
        if (!found) {
            if (ledger_.was_closed(position_id))
                return refuse(RejectionKind::AlreadyClosed, "position #" + std::to_string(position_id) + " is already closed");
            return refuse(RejectionKind::UnknownPosition, "no position #" + std::to_string(position_id));
        }
        if (reference_price <= 0)
            return refuse(RejectionKind::InvalidRequest, "reference price must be > 0");

        const Dto::Position pos = *found;
        auto& account = ledger_.account();
        Decimal fill = exit_fill(pos.direction, reference_price);
        Decimal gross = (fill - pos.entry_price) * pos.size * Dto::sign(pos.direction);
        Decimal exit_fee = pos.size * fill * account.taker_fee_rate;
        Decimal net = gross - pos.entry_fee - exit_fee;

        LedgerTransaction tx = transaction();

        ledger_.close_position(pos.symbol);
        account.balance += pos.margin + gross - exit_fee;
        account.realized_pnl += gross;
        account.total_fees += pos.entry_fee + exit_fee;
        account.total_trades += 1;
        if (net > 0) account.winning_trades += 1;
        else account.losing_trades += 1;
        account.updated_at = timestamp;

        Decimal realized_equity = account.balance + ledger_.open_margin() + ledger_.open_entry_fees();
        if (realized_equity > account.peak_equity) {
            account.peak_equity = realized_equity;
        }
        if (account.peak_equity > 0) {
            Decimal drawdown = (account.peak_equity - realized_equity) / account.peak_equity * 100;
            if (drawdown > account.max_drawdown_pct) account.max_drawdown_pct = drawdown;
        }

        Dto::Trade trade;
        trade.id = ledger_.next_trade_id();
        trade.position_id = pos.id;
        trade.account = account.name;
        trade.symbol = pos.symbol;
        trade.strategy = pos.strategy;
        trade.direction = pos.direction;
        trade.size = pos.size;
        trade.leverage = pos.leverage;
        trade.entry_price = pos.entry_price;
        trade.exit_price = fill;
        trade.entry_time = pos.opened_at;
        trade.exit_time = timestamp;
        trade.gross_pnl = gross;
        trade.entry_fee = pos.entry_fee;
        trade.exit_fee = exit_fee;
        trade.net_pnl = net;
        trade.pnl_percent = pos.margin > 0 ? Decimal(net / pos.margin * 100) : Decimal(0);
        trade.reason = reason;
        ledger_.append_trade(trade);

        Dto::Order order;
        order.id = ledger_.next_order_id();
        order.account = account.name;
        order.symbol = pos.symbol;
        order.direction = pos.direction;
        order.type = Dto::order_type_for(reason);
        order.requested_price = reference_price;
        order.fill_price = fill;
        order.size = pos.size;
        order.slippage = PaperPerp::Utils::Numeric::abs(fill - reference_price);
        order.fee = exit_fee;
        order.position_id = pos.id;
        order.timestamp = timestamp;
        order.reason = Dto::to_string(reason);
        ledger_.append_order(order);

        pending_trades_.push_back(trade);
        tx.commit();

        std::cout << "[close] #" << pos.id << " " << pos.symbol << " " << Dto::to_string(reason)
            << " @ " << to_string(fill) << " gross=" << to_string(gross, 4) << " net=" << to_string(net, 4)
            << " balance=" << to_string(account.balance, 4) << "\n";
        return trade;
    }

    Outcome<Dto::Trade> SimulationEngine::close_symbol(const std::string& symbol, const Decimal& reference_price,
        Dto::CloseReason reason, long long timestamp)
    {
        const Dto::Position* pos = ledger_.find_open(symbol);
        if (!pos) {
            return reject(RejectionKind::UnknownPosition, "no open position for " + symbol, symbol,
                Dto::Direction::Long, Dto::order_type_for(reason), reference_price, timestamp);
        }
        return close(pos->id, reference_price, reason, timestamp);
    }

    // --------------------------------------------
    //  Marking and risk triggers
    // --------------------------------------------
    Decimal SimulationEngine::mark_to_market(const Dto::Position& position, const Decimal& price) const {
        return (price - position.entry_price) * position.size * Dto::sign(position.direction);
    }

    Decimal SimulationEngine::mark(const std::string& symbol, const Decimal& price) {
        Dto::Position* pos = ledger_.find_open(symbol);
        if (!pos) return 0;
        pos->unrealized_pnl = mark_to_market(*pos, price);
        pos->mark_price = price;
        return pos->unrealized_pnl;
    }

    std::optional<RiskTrigger> SimulationEngine::check_risk_triggers(const Dto::Position& position,
        const Decimal& price) const
    {
        if (position.status != Dto::PositionStatus::Open) return std::nullopt;
        const bool is_long = position.direction == Dto::Direction::Long;

        if (position.stop_loss) {
            const Decimal& stop = *position.stop_loss;
            if (is_long ? price <= stop : price >= stop) {
                auto reason = position.trailing_active ? Dto::CloseReason::TrailingStop : Dto::CloseReason::StopLoss;
                return RiskTrigger{ reason, price };
            }
        }
        if (position.take_profit) {
            const Decimal& target = *position.take_profit;
            if (is_long ? price >= target : price <= target) {
                return RiskTrigger{ Dto::CloseReason::TakeProfit, target };
            }
        }
        return std::nullopt;
    }

    std::optional<RiskTrigger> SimulationEngine::check_risk_triggers(const Dto::Position& position,
        const Dto::Market::BarDto& bar) const
    {
        if (position.status != Dto::PositionStatus::Open) return std::nullopt;
        const bool is_long = position.direction == Dto::Direction::Long;
        const Decimal open = from_double(bar.OpenPrice);
        const Decimal high = from_double(bar.HighPrice);
        const Decimal low = from_double(bar.LowPrice);

        // Both levels inside one bar: assume the stop was hit first
        if (position.stop_loss) {
            const Decimal& stop = *position.stop_loss;
            auto reason = position.trailing_active ? Dto::CloseReason::TrailingStop : Dto::CloseReason::StopLoss;
            if (is_long && low <= stop) {
                return RiskTrigger{ reason, std::min(stop, open) };
            }
            if (!is_long && high >= stop) {
                return RiskTrigger{ reason, std::max(stop, open) };
            }
        }
        if (position.take_profit) {
            const Decimal& target = *position.take_profit;
            if (is_long ? high >= target : low <= target) {
                return RiskTrigger{ Dto::CloseReason::TakeProfit, target };
            }
        }
        return std::nullopt;
    }

    bool SimulationEngine::update_trailing_stop(const std::string& symbol, const Decimal& price) {
        if (halted_) return false;
        Dto::Position* pos = ledger_.find_open(symbol);
        if (!pos || !pos->trailing_distance) return false;

        const bool is_long = pos->direction == Dto::Direction::Long;
        Decimal candidate = round_to_tick(is_long ? price - *pos->trailing_distance : price + *pos->trailing_distance,
            config_.tick_size);
        if (candidate <= 0) return false;
        bool tighter = !pos->stop_loss || (is_long ? candidate > *pos->stop_loss : candidate < *pos->stop_loss);
        if (!tighter) return false;

        LedgerTransaction tx = transaction();
        Decimal previous = pos->stop_loss.value_or(Decimal(0));
        pos->stop_loss = candidate;
        pos->trailing_active = true;
        tx.commit();

        std::cout << "[update_trailing_stop] " << symbol << " stop " << to_string(previous) << " -> "
            << to_string(candidate) << "\n";
        return true;
    }

    // --------------------------------------------
    //  Account level
    // --------------------------------------------
    void SimulationEngine::reset_account(const std::optional<Decimal>& starting_equity, long long now) {
        if (starting_equity && *starting_equity <= 0) {
            throw std::invalid_argument("Starting equity must be > 0.");
        }

        LedgerTransaction tx = transaction();
        std::vector<std::string> symbols;
        for (const auto& [symbol, pos] : ledger_.open_positions()) symbols.push_back(symbol);
        for (const auto& symbol : symbols) ledger_.close_position(symbol);

        auto& account = ledger_.account();
        if (starting_equity) account.starting_equity = *starting_equity;
        account.balance = account.starting_equity;
        account.realized_pnl = 0;
        account.total_fees = 0;
        account.total_trades = 0;
        account.winning_trades = 0;
        account.losing_trades = 0;
        account.peak_equity = account.starting_equity;
        account.max_drawdown_pct = 0;
        account.updated_at = now;
        tx.commit();

        std::cout << "[reset_account] " << account.name << " reset to " << to_string(account.balance, 2)
            << ", dropped " << symbols.size() << " open positions\n";
    }

    AccountSummary SimulationEngine::summary() const {
        const auto& account = ledger_.account();
        AccountSummary s;
        s.name = account.name;
        s.starting_equity = account.starting_equity;
        s.balance = account.balance;
        s.used_margin = ledger_.open_margin();
        s.unrealized_pnl = ledger_.unrealized_pnl();
        s.equity = s.balance + s.used_margin + s.unrealized_pnl;
        s.total_pnl = s.equity - account.starting_equity;
        s.realized_pnl = account.realized_pnl - account.total_fees;
        s.total_fees = account.total_fees;
        s.total_trades = account.total_trades;
        s.winning_trades = account.winning_trades;
        s.losing_trades = account.losing_trades;
        if (account.total_trades > 0) {
            s.win_rate = 100.0 * account.winning_trades / account.total_trades;
        }
        if (account.starting_equity > 0) {
            s.roi = to_double(s.total_pnl / account.starting_equity * 100);
        }
        Decimal peak = std::max(account.peak_equity, s.equity);
        if (peak > 0 && s.equity < peak) {
            s.current_drawdown = to_double((peak - s.equity) / peak * 100);
        }
        s.max_drawdown = std::max(to_double(account.max_drawdown_pct), s.current_drawdown);
        for (const auto& [symbol, pos] : ledger_.open_positions()) {
            s.open_positions.push_back(pos);
        }
        s.rejections = rejection_counts_;
        return s;
    }

    Analytics::TradeStatistics SimulationEngine::performance() const {
        return Analytics::compute_statistics(ledger_.trades(), ledger_.account().starting_equity);
    }
}
