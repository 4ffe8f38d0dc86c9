#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include "Exanges/PaperSimulator/Config.hpp"
#include "Numeric/Decimal.hpp"
#include "Retry/Backoff.hpp"

namespace PaperPerp::Runner {
    using PaperPerp::Utils::Numeric::Decimal;

    struct AccountSettings {
        std::string name = "paper";
        Decimal     starting_equity{ 10000 };
        double      leverage = 2.0;
        double      size_percent = 10.0;    // default position size when a strategy leaves it open
        std::string store_dir;              // empty keeps the ledger in memory
    };

    struct BotSettings {
        std::vector<std::string>    symbols;
        std::chrono::milliseconds   tick_interval{ 60000 };
        std::chrono::seconds        duration{ 0 };      // 0 runs until stopped
        double                      max_loss = 0.0;     // currency; 0 disables the loss floor
        int                         summary_every_ticks = 10;
        std::size_t                 bars_limit = 100;
        std::size_t                 fetch_workers = 4;
        Utils::Retry::RetryPolicy   retry;
        std::size_t                 warmup_bars = 0;    // recorded-data source only
    };

    struct BacktestSettings {
        std::map<std::string, std::string>  data_files;     // symbol -> csv
        std::size_t                         window_bars = 200;
        double                              max_loss = 0.0;
    };

    struct StrategySettings {
        std::string                 name = "breakout";
        boost::property_tree::ptree options;    // every other key of [strategy]
    };

    /**
     * Whole runtime configuration, read from an INI file:
     *   [account] name, starting_equity, leverage, size_percent, store_dir
     *   [engine] vip_level, slippage_rate, tick_size, lot_step, max_leverage, max_open_positions
     *   [bot] symbols, tick_interval_seconds, duration_minutes, max_loss, summary_every_ticks,
     *         bars_limit, fetch_workers, retry_attempts, retry_initial_delay_ms, retry_max_delay_ms,
     *         warmup_bars
     *   [backtest] data (SYMBOL:path, comma separated), window_bars, max_loss
     *   [strategy] name plus the family's options
     * Missing keys keep their defaults. Lists are comma separated.
     */
    struct RunnerConfig {
        AccountSettings                                 account;
        Infra::Exanges::PaperSimulator::EngineConfig    engine;
        BotSettings                                     bot;
        BacktestSettings                                backtest;
        StrategySettings                                strategy;

        // Throws std::invalid_argument naming the section and field
        void validate() const;

        static RunnerConfig from_ptree(const boost::property_tree::ptree& tree);
        static RunnerConfig load(const std::string& ini_file);
    };

    std::vector<std::string> split_list(const std::string& text);
    std::map<std::string, std::string> parse_data_files(const std::string& text);
}
