#include "SummaryPrinter.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace PaperPerp::Runner {
    using PaperPerp::Utils::Numeric::to_string;

    namespace {
        std::string percent(double value) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2) << value << "%";
            return oss.str();
        }
    }

    void print_summary(std::ostream& os, const Infra::Exanges::PaperSimulator::AccountSummary& s, const std::string& title) {
        os << "==== " << title << " [" << s.name << "] ====\n"
           << "  balance        " << to_string(s.balance, 2) << "\n"
           << "  used margin    " << to_string(s.used_margin, 2) << "\n"
           << "  equity         " << to_string(s.equity, 2) << " (start " << to_string(s.starting_equity, 2) << ")\n"
           << "  realized pnl   " << to_string(s.realized_pnl, 2) << "\n"
           << "  unrealized pnl " << to_string(s.unrealized_pnl, 2) << "\n"
           << "  total pnl      " << to_string(s.total_pnl, 2) << " / roi " << percent(s.roi) << "\n"
           << "  fees           " << to_string(s.total_fees, 2) << "\n"
           << "  trades         " << s.total_trades << " (" << s.winning_trades << " won, "
           << s.losing_trades << " lost, win rate " << percent(s.win_rate) << ")\n"
           << "  drawdown       " << percent(s.current_drawdown) << " (max " << percent(s.max_drawdown) << ")\n";

        if (s.open_positions.empty()) {
            os << "  open positions none\n";
        }
        for (const auto& p : s.open_positions) {
            os << "  open " << p.symbol << " " << Dto::to_string(p.direction) << " " << to_string(p.size)
               << " @ " << to_string(p.entry_price) << " mark " << to_string(p.mark_price)
               << " upnl " << to_string(p.unrealized_pnl, 2) << "\n";
        }
        for (const auto& [kind, count] : s.rejections) {
            os << "  rejected " << Infra::Exanges::PaperSimulator::to_string(kind) << " x" << count << "\n";
        }
        os.flush();
    }

    void print_statistics(std::ostream& os, const Infra::Analytics::TradeStatistics& st) {
        const std::string pf = std::isinf(st.profit_factor) ? "inf" : std::to_string(st.profit_factor);
        os << "==== Backtest statistics ====\n"
           << "  trades          " << st.total_trades << " (" << st.winning_trades << " won, "
           << st.losing_trades << " lost)\n"
           << "  win rate        " << percent(st.win_rate) << "\n"
           << "  profit factor   " << pf << "\n"
           << "  net pnl         " << to_string(st.total_net_pnl, 2) << " / return " << percent(st.total_return) << "\n"
           << "  final equity    " << to_string(st.final_equity, 2) << "\n"
           << "  avg win / loss  " << to_string(st.average_win, 2) << " / " << to_string(st.average_loss, 2) << "\n"
           << "  largest win     " << to_string(st.largest_win, 2) << "\n"
           << "  largest loss    " << to_string(st.largest_loss, 2) << "\n"
           << "  fees            " << to_string(st.total_fees, 2) << "\n"
           << "  max drawdown    " << percent(st.max_drawdown) << "\n"
           << "  sharpe          " << st.sharpe_ratio << "\n"
           << "  streaks         " << st.max_consecutive_wins << " wins / " << st.max_consecutive_losses << " losses\n"
           << "  avg duration    " << st.average_duration_seconds << " s\n";
        os.flush();
    }
}
