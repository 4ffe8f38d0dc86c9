#include "RunnerConfig.hpp"
#include <iostream>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ini_parser.hpp>

namespace PaperPerp::Runner {
    using boost::property_tree::ptree;
    using PaperPerp::Utils::Numeric::from_string;

    namespace {
        template <typename T>
        T get(const ptree& tree, const std::string& path, const T& fallback) {
            try {
                return tree.get<T>(path, fallback);
            }
            catch (const boost::property_tree::ptree_bad_data&) {
                throw std::invalid_argument("[" + path + "] has an invalid value '"
                    + tree.get<std::string>(path, "") + "'");
            }
        }

        Decimal get_decimal(const ptree& tree, const std::string& path, const Decimal& fallback) {
            auto text = tree.get_optional<std::string>(path);
            if (!text) {
                return fallback;
            }
            try {
                return from_string(boost::algorithm::trim_copy(*text));
            }
            catch (const std::invalid_argument&) {
                throw std::invalid_argument("[" + path + "] is not a number: '" + *text + "'");
            }
        }

        void require(bool condition, const std::string& field, const std::string& rule) {
            if (!condition) {
                throw std::invalid_argument(field + " " + rule);
            }
        }
    }

    std::vector<std::string> split_list(const std::string& text) {
        std::vector<std::string> parts;
        boost::split(parts, text, boost::is_any_of(","));
        std::vector<std::string> out;
        for (auto& part : parts) {
            boost::algorithm::trim(part);
            if (!part.empty()) {
                out.push_back(part);
            }
        }
        return out;
    }

    std::map<std::string, std::string> parse_data_files(const std::string& text) {
        std::map<std::string, std::string> files;
        for (const auto& entry : split_list(text)) {
            auto colon = entry.find(':');
            if (colon == std::string::npos || colon == 0 || colon + 1 == entry.size()) {
                throw std::invalid_argument("data entry '" + entry + "' is not SYMBOL:path");
            }
            std::string symbol = boost::algorithm::trim_copy(entry.substr(0, colon));
            std::string path = boost::algorithm::trim_copy(entry.substr(colon + 1));
            if (!files.emplace(symbol, path).second) {
                throw std::invalid_argument("data lists " + symbol + " twice");
            }
        }
        return files;
    }

    void RunnerConfig::validate() const {
        require(!account.name.empty(), "account.name", "must not be empty");
        require(account.starting_equity > 0, "account.starting_equity", "must be > 0");
        require(account.leverage >= 1.0, "account.leverage", "must be >= 1");
        require(account.size_percent > 0.0 && account.size_percent <= 100.0, "account.size_percent", "must be in (0, 100]");
        engine.validate();
        require(bot.tick_interval.count() > 0, "bot.tick_interval_seconds", "must be > 0");
        require(bot.duration.count() >= 0, "bot.duration_minutes", "must be >= 0");
        require(bot.max_loss >= 0.0, "bot.max_loss", "must be >= 0");
        require(bot.summary_every_ticks >= 1, "bot.summary_every_ticks", "must be >= 1");
        require(bot.bars_limit >= 1, "bot.bars_limit", "must be >= 1");
        require(bot.fetch_workers >= 1, "bot.fetch_workers", "must be >= 1");
        require(bot.retry.max_attempts >= 1, "bot.retry_attempts", "must be >= 1");
        require(bot.retry.initial_delay.count() >= 0, "bot.retry_initial_delay_ms", "must be >= 0");
        require(bot.retry.max_delay >= bot.retry.initial_delay, "bot.retry_max_delay_ms", "must be >= retry_initial_delay_ms");
        require(backtest.window_bars >= 1, "backtest.window_bars", "must be >= 1");
        require(backtest.max_loss >= 0.0, "backtest.max_loss", "must be >= 0");
        require(!strategy.name.empty(), "strategy.name", "must not be empty");
    }

    RunnerConfig RunnerConfig::from_ptree(const ptree& tree) {
        RunnerConfig cfg;

        cfg.account.name = get<std::string>(tree, "account.name", cfg.account.name);
        cfg.account.starting_equity = get_decimal(tree, "account.starting_equity", cfg.account.starting_equity);
        cfg.account.leverage = get(tree, "account.leverage", cfg.account.leverage);
        cfg.account.size_percent = get(tree, "account.size_percent", cfg.account.size_percent);
        cfg.account.store_dir = get<std::string>(tree, "account.store_dir", cfg.account.store_dir);

        cfg.engine = Infra::Exanges::PaperSimulator::EngineConfig::for_vip_level(get(tree, "engine.vip_level", 0));
        cfg.engine.slippage_rate = get_decimal(tree, "engine.slippage_rate", cfg.engine.slippage_rate);
        cfg.engine.tick_size = get_decimal(tree, "engine.tick_size", cfg.engine.tick_size);
        cfg.engine.lot_step = get_decimal(tree, "engine.lot_step", cfg.engine.lot_step);
        cfg.engine.max_leverage = get(tree, "engine.max_leverage", cfg.engine.max_leverage);
        cfg.engine.max_open_positions = get(tree, "engine.max_open_positions", cfg.engine.max_open_positions);

        cfg.bot.symbols = split_list(get<std::string>(tree, "bot.symbols", ""));
        cfg.bot.tick_interval = std::chrono::milliseconds(static_cast<long long>(
            get(tree, "bot.tick_interval_seconds", cfg.bot.tick_interval.count() / 1000.0) * 1000.0));
        cfg.bot.duration = std::chrono::seconds(static_cast<long long>(
            get(tree, "bot.duration_minutes", cfg.bot.duration.count() / 60.0) * 60.0));
        cfg.bot.max_loss = get(tree, "bot.max_loss", cfg.bot.max_loss);
        cfg.bot.summary_every_ticks = get(tree, "bot.summary_every_ticks", cfg.bot.summary_every_ticks);
        cfg.bot.bars_limit = get(tree, "bot.bars_limit", cfg.bot.bars_limit);
        cfg.bot.fetch_workers = get(tree, "bot.fetch_workers", cfg.bot.fetch_workers);
        cfg.bot.retry.max_attempts = get(tree, "bot.retry_attempts", cfg.bot.retry.max_attempts);
        cfg.bot.retry.initial_delay = std::chrono::milliseconds(
            get<long long>(tree, "bot.retry_initial_delay_ms", cfg.bot.retry.initial_delay.count()));
        cfg.bot.retry.max_delay = std::chrono::milliseconds(
            get<long long>(tree, "bot.retry_max_delay_ms", cfg.bot.retry.max_delay.count()));
        cfg.bot.warmup_bars = get(tree, "bot.warmup_bars", cfg.bot.warmup_bars);

        cfg.backtest.data_files = parse_data_files(get<std::string>(tree, "backtest.data", ""));
        cfg.backtest.window_bars = get(tree, "backtest.window_bars", cfg.backtest.window_bars);
        cfg.backtest.max_loss = get(tree, "backtest.max_loss", cfg.backtest.max_loss);

        if (auto section = tree.get_child_optional("strategy")) {
            for (const auto& [key, value] : *section) {
                if (key == "name") {
                    cfg.strategy.name = boost::algorithm::trim_copy(value.data());
                }
                else {
                    cfg.strategy.options.put(key, boost::algorithm::trim_copy(value.data()));
                }
            }
        }

        cfg.validate();
        return cfg;
    }

    RunnerConfig RunnerConfig::load(const std::string& ini_file) {
        ptree tree;
        try {
            boost::property_tree::ini_parser::read_ini(ini_file, tree);
        }
        catch (const boost::property_tree::ini_parser_error& e) {
            throw std::runtime_error("cannot read config " + ini_file + ": " + e.what());
        }
        std::cout << "[RunnerConfig::load] " << ini_file << std::endl;
        return from_ptree(tree);
    }
}
