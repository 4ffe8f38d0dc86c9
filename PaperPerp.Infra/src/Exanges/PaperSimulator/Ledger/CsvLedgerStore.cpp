#include "Exanges/PaperSimulator/Ledger/CsvLedgerStore.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/stream.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = boost::filesystem;

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    using PaperPerp::Utils::Numeric::from_string;
    using PaperPerp::Utils::Numeric::to_string;

    namespace {
        const char* kAccountsHeader = "name,starting_equity,balance,default_leverage,maker_fee_rate,taker_fee_rate,"
            "realized_pnl,total_fees,total_trades,winning_trades,losing_trades,peak_equity,max_drawdown_pct,"
            "created_at,updated_at";
        const char* kPositionsHeader = "id,account,symbol,direction,size,entry_price,leverage,margin,entry_fee,"
            "stop_loss,take_profit,trailing_distance,trailing_active,opened_at,strategy,status,unrealized_pnl,mark_price";
        const char* kTradesHeader = "id,position_id,account,symbol,strategy,direction,size,leverage,entry_price,"
            "exit_price,entry_time,exit_time,gross_pnl,entry_fee,exit_fee,net_pnl,pnl_percent,reason";
        const char* kOrdersHeader = "id,account,symbol,direction,type,requested_price,fill_price,size,slippage,fee,"
            "status,position_id,timestamp,reason";

        const int kDecimals = 18;

        // Free text never contains the separator or a line break on disk
        std::string text(const std::string& value) {
            std::string out = value;
            std::replace(out.begin(), out.end(), ',', ';');
            std::replace(out.begin(), out.end(), '\n', ' ');
            std::replace(out.begin(), out.end(), '\r', ' ');
            return out;
        }

        std::string num(const Decimal& value) {
            return to_string(value, kDecimals);
        }

        std::string num(double value) {
            std::ostringstream oss;
            oss << std::setprecision(15) << value;
            return oss.str();
        }

        std::string opt(const std::optional<Decimal>& value) {
            return value ? num(*value) : std::string();
        }

        std::optional<Decimal> parse_opt(const std::string& token) {
            if (token.empty()) return std::nullopt;
            return from_string(token);
        }

        using Rows = std::vector<std::vector<std::string>>;

        Rows read_rows(const fs::path& file, std::size_t columns) {
            namespace io = boost::iostreams;
            io::file_source source(file.string());
            if (!source.is_open()) {
                throw std::runtime_error("Cannot open file: " + file.string());
            }
            io::stream<io::file_source> in(source);
            std::string line;
            if (!std::getline(in, line)) {
                throw std::runtime_error("Missing header in " + file.string());
            }

            Rows rows;
            while (std::getline(in, line)) {
                boost::trim_right_if(line, boost::is_any_of("\r"));
                if (line.empty()) continue;
                std::vector<std::string> tokens;
                boost::split(tokens, line, boost::is_any_of(","));
                if (tokens.size() != columns) {
                    throw std::runtime_error("Malformed row in " + file.string() + ": " + line);
                }
                rows.push_back(std::move(tokens));
            }
            return rows;
        }

        void check_written(const fs::ofstream& out, const fs::path& file) {
            if (!out) {
                throw std::runtime_error("Failed writing " + file.string());
            }
        }
    }

    CsvLedgerStore::CsvLedgerStore(const std::string& root, int keep_generations)
        : root_(root), keep_generations_(keep_generations < 1 ? 1 : keep_generations)
    {
        fs::create_directories(root_);
    }

    fs::path CsvLedgerStore::account_dir(const std::string& account) const {
        if (account.empty() || account.find_first_of("/\\") != std::string::npos || account == "." || account == "..") {
            throw std::invalid_argument("Account name cannot be used as a directory: '" + account + "'");
        }
        return root_ / account;
    }

    int CsvLedgerStore::current_generation_number(const std::string& account) const {
        fs::path pointer = account_dir(account) / "CURRENT";
        if (!fs::exists(pointer)) return 0;

        fs::ifstream in(pointer);
        std::string name;
        std::getline(in, name);
        boost::trim(name);
        if (!boost::starts_with(name, "gen-")) {
            throw std::runtime_error("Corrupt CURRENT pointer in " + account_dir(account).string());
        }
        return std::stoi(name.substr(4));
    }

    fs::path CsvLedgerStore::current_generation(const std::string& account) const {
        int generation = current_generation_number(account);
        if (generation == 0) return {};
        return account_dir(account) / ("gen-" + std::to_string(generation));
    }

    void CsvLedgerStore::save(const Ledger& ledger) {
        const std::string& account = ledger.name();
        std::vector<Dto::Position> positions = ledger.all_positions();
        check_unique_open_positions(account, positions);

        int generation = current_generation_number(account) + 1;
        fs::path dir = account_dir(account) / ("gen-" + std::to_string(generation));
        if (fs::exists(dir)) {
            fs::remove_all(dir);
        }
        fs::create_directories(dir);

        {
            const auto& a = ledger.account();
            fs::path file = dir / "accounts.csv";
            fs::ofstream out(file);
            out << kAccountsHeader << "\n"
                << text(a.name) << "," << num(a.starting_equity) << "," << num(a.balance) << ","
                << num(a.default_leverage) << "," << num(a.maker_fee_rate) << "," << num(a.taker_fee_rate) << ","
                << num(a.realized_pnl) << "," << num(a.total_fees) << "," << a.total_trades << ","
                << a.winning_trades << "," << a.losing_trades << "," << num(a.peak_equity) << ","
                << num(a.max_drawdown_pct) << "," << a.created_at << "," << a.updated_at << "\n";
            out.flush();
            check_written(out, file);
        }
        {
            fs::path file = dir / "positions.csv";
            fs::ofstream out(file);
            out << kPositionsHeader << "\n";
            for (const auto& p : positions) {
                out << p.id << "," << text(p.account) << "," << text(p.symbol) << "," << Dto::to_string(p.direction) << ","
                    << num(p.size) << "," << num(p.entry_price) << "," << num(p.leverage) << "," << num(p.margin) << ","
                    << num(p.entry_fee) << "," << opt(p.stop_loss) << "," << opt(p.take_profit) << ","
                    << opt(p.trailing_distance) << "," << (p.trailing_active ? 1 : 0) << "," << p.opened_at << ","
                    << text(p.strategy) << "," << Dto::to_string(p.status) << "," << num(p.unrealized_pnl) << ","
                    << num(p.mark_price) << "\n";
            }
            out.flush();
            check_written(out, file);
        }
        {
            fs::path file = dir / "trades.csv";
            fs::ofstream out(file);
            out << kTradesHeader << "\n";
            for (const auto& t : ledger.trades()) {
                out << t.id << "," << t.position_id << "," << text(t.account) << "," << text(t.symbol) << ","
                    << text(t.strategy) << "," << Dto::to_string(t.direction) << "," << num(t.size) << ","
                    << num(t.leverage) << "," << num(t.entry_price) << "," << num(t.exit_price) << ","
                    << t.entry_time << "," << t.exit_time << "," << num(t.gross_pnl) << "," << num(t.entry_fee) << ","
                    << num(t.exit_fee) << "," << num(t.net_pnl) << "," << num(t.pnl_percent) << ","
                    << Dto::to_string(t.reason) << "\n";
            }
            out.flush();
            check_written(out, file);
        }
        {
            fs::path file = dir / "orders.csv";
            fs::ofstream out(file);
            out << kOrdersHeader << "\n";
            for (const auto& o : ledger.orders()) {
                out << o.id << "," << text(o.account) << "," << text(o.symbol) << "," << Dto::to_string(o.direction) << ","
                    << Dto::to_string(o.type) << "," << num(o.requested_price) << "," << num(o.fill_price) << ","
                    << num(o.size) << "," << num(o.slippage) << "," << num(o.fee) << "," << Dto::to_string(o.status) << ","
                    << o.position_id << "," << o.timestamp << "," << text(o.reason) << "\n";
            }
            out.flush();
            check_written(out, file);
        }

        fs::path pointer = account_dir(account) / "CURRENT";
        fs::path staged = account_dir(account) / "CURRENT.tmp";
        {
            fs::ofstream out(staged, std::ios::trunc);
            out << "gen-" << generation << "\n";
            out.flush();
            check_written(out, staged);
        }
        fs::rename(staged, pointer);

        prune(account, generation);
    }

    void CsvLedgerStore::prune(const std::string& account, int current) const {
        std::vector<fs::path> stale;
        for (fs::directory_iterator it(account_dir(account)), end; it != end; ++it) {
            std::string name = it->path().filename().string();
            if (!fs::is_directory(it->path()) || !boost::starts_with(name, "gen-")) continue;
            int generation = 0;
            try {
                generation = std::stoi(name.substr(4));
            }
            catch (const std::exception&) {
                continue;
            }
            if (generation <= current - keep_generations_ || generation > current) {
                stale.push_back(it->path());
            }
        }

        for (const auto& dir : stale) {
            boost::system::error_code ec;
            fs::remove_all(dir, ec);
            if (ec) {
                std::cerr << "[CsvLedgerStore::prune] Cannot remove " << dir.string() << ": " << ec.message() << "\n";
            }
        }
    }

    std::optional<Ledger> CsvLedgerStore::load(const std::string& account) {
        fs::path dir = current_generation(account);
        if (dir.empty()) {
            return std::nullopt;
        }

        Rows account_rows = read_rows(dir / "accounts.csv", 15);
        if (account_rows.size() != 1) {
            throw LedgerIntegrityError("Expected one account row in " + dir.string());
        }
        const auto& r = account_rows.front();
        Dto::Account a;
        a.name = r[0];
        if (a.name != account) {
            throw LedgerIntegrityError("Snapshot in " + dir.string() + " belongs to account " + a.name);
        }
        a.starting_equity = from_string(r[1]);
        a.balance = from_string(r[2]);
        a.default_leverage = std::stod(r[3]);
        a.maker_fee_rate = from_string(r[4]);
        a.taker_fee_rate = from_string(r[5]);
        a.realized_pnl = from_string(r[6]);
        a.total_fees = from_string(r[7]);
        a.total_trades = std::stoi(r[8]);
        a.winning_trades = std::stoi(r[9]);
        a.losing_trades = std::stoi(r[10]);
        a.peak_equity = from_string(r[11]);
        a.max_drawdown_pct = from_string(r[12]);
        a.created_at = std::stoll(r[13]);
        a.updated_at = std::stoll(r[14]);

        std::vector<Dto::Position> positions;
        for (const auto& t : read_rows(dir / "positions.csv", 18)) {
            Dto::Position p;
            p.id = std::stoll(t[0]);
            p.account = t[1];
            p.symbol = t[2];
            p.direction = Dto::parse_direction(t[3]);
            p.size = from_string(t[4]);
            p.entry_price = from_string(t[5]);
            p.leverage = std::stod(t[6]);
            p.margin = from_string(t[7]);
            p.entry_fee = from_string(t[8]);
            p.stop_loss = parse_opt(t[9]);
            p.take_profit = parse_opt(t[10]);
            p.trailing_distance = parse_opt(t[11]);
            p.trailing_active = t[12] == "1";
            p.opened_at = std::stoll(t[13]);
            p.strategy = t[14];
            p.status = Dto::parse_position_status(t[15]);
            p.unrealized_pnl = from_string(t[16]);
            p.mark_price = from_string(t[17]);
            positions.push_back(std::move(p));
        }

        std::vector<Dto::Trade> trades;
        for (const auto& t : read_rows(dir / "trades.csv", 18)) {
            Dto::Trade tr;
            tr.id = std::stoll(t[0]);
            tr.position_id = std::stoll(t[1]);
            tr.account = t[2];
            tr.symbol = t[3];
            tr.strategy = t[4];
            tr.direction = Dto::parse_direction(t[5]);
            tr.size = from_string(t[6]);
            tr.leverage = std::stod(t[7]);
            tr.entry_price = from_string(t[8]);
            tr.exit_price = from_string(t[9]);
            tr.entry_time = std::stoll(t[10]);
            tr.exit_time = std::stoll(t[11]);
            tr.gross_pnl = from_string(t[12]);
            tr.entry_fee = from_string(t[13]);
            tr.exit_fee = from_string(t[14]);
            tr.net_pnl = from_string(t[15]);
            tr.pnl_percent = from_string(t[16]);
            tr.reason = Dto::parse_close_reason(t[17]);
            trades.push_back(std::move(tr));
        }

        std::vector<Dto::Order> orders;
        for (const auto& t : read_rows(dir / "orders.csv", 14)) {
            Dto::Order o;
            o.id = std::stoll(t[0]);
            o.account = t[1];
            o.symbol = t[2];
            o.direction = Dto::parse_direction(t[3]);
            o.type = Dto::parse_order_type(t[4]);
            o.requested_price = from_string(t[5]);
            o.fill_price = from_string(t[6]);
            o.size = from_string(t[7]);
            o.slippage = from_string(t[8]);
            o.fee = from_string(t[9]);
            o.status = Dto::parse_order_status(t[10]);
            o.position_id = std::stoll(t[11]);
            o.timestamp = std::stoll(t[12]);
            o.reason = t[13];
            orders.push_back(std::move(o));
        }

        std::cout << "[CsvLedgerStore::load] " << account << " from " << dir.filename().string()
            << " (" << positions.size() << " positions, " << trades.size() << " trades)\n";
        return Ledger::restore(std::move(a), positions, std::move(trades), std::move(orders));
    }
}
