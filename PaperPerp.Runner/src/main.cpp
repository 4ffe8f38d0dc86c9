#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include "BacktestReplayer.hpp"
#include "Clock.hpp"
#include "Exanges/PaperSimulator/DataProvider/HistoricalDataSource.hpp"
#include "Exanges/PaperSimulator/Ledger/CsvLedgerStore.hpp"
#include "Exanges/PaperSimulator/Ledger/InMemoryLedgerStore.hpp"
#include "LiveBot.hpp"
#include "RunnerConfig.hpp"
#include "SignalTrap.hpp"
#include "StrategyFactory.hpp"

namespace po = boost::program_options;
using namespace PaperPerp::Runner;
using namespace PaperPerp::Infra::Exanges::PaperSimulator;

namespace {
    std::shared_ptr<ILedgerStore> make_store(const AccountSettings& account) {
        if (account.store_dir.empty()) {
            return std::make_shared<InMemoryLedgerStore>();
        }
        return std::make_shared<CsvLedgerStore>(account.store_dir);
    }

    std::unique_ptr<SimulationEngine> make_live_engine(const RunnerConfig& cfg, long long now) {
        return SimulationEngine::for_account(cfg.account.name, cfg.account.starting_equity, cfg.account.leverage,
            cfg.engine, make_store(cfg.account), now);
    }

    int run_backtest(const RunnerConfig& cfg) {
        if (cfg.backtest.data_files.empty()) {
            std::cerr << "[backtest] no data files, set [backtest] data or pass --data" << std::endl;
            return 2;
        }
        if (!cfg.account.store_dir.empty()) {
            std::cout << "[backtest] store_dir is not used, replays start from a new in-memory account" << std::endl;
        }
        auto strategy = BacktestReplayer::make_strategy(cfg.strategy);
        auto engine = BacktestReplayer::make_engine(cfg);

        BacktestReplayer replayer(*engine, strategy, cfg.backtest, cfg.account.size_percent);
        for (const auto& [symbol, file] : cfg.backtest.data_files) {
            replayer.add(MarketData(symbol, file));
        }

        SignalTrap trap;
        RunHandle handle;
        auto result = replayer.run(handle);
        return result.state == RunState::Error ? 1 : 0;
    }

    int run_live(const RunnerConfig& cfg) {
        if (cfg.backtest.data_files.empty()) {
            std::cerr << "[live] the live loop replays recorded data, set [backtest] data or pass --data" << std::endl;
            return 2;
        }
        auto source = std::make_shared<HistoricalDataSource>(cfg.bot.warmup_bars);
        for (const auto& [symbol, file] : cfg.backtest.data_files) {
            source->add(MarketData(symbol, file));
        }
        BotSettings bot = cfg.bot;
        if (bot.symbols.empty()) {
            for (const auto& [symbol, file] : cfg.backtest.data_files) {
                bot.symbols.push_back(symbol);
            }
        }

        auto clock = std::make_shared<SystemClock>();
        auto strategy = PaperPerp::Strategy::StrategyFactory::create(cfg.strategy.name, cfg.strategy.options);
        auto engine = make_live_engine(cfg, clock->now_ms());

        SignalTrap trap;
        RunHandle handle;
        LiveBot bot_loop(*engine, strategy, source, bot, cfg.account.size_percent, clock);
        bot_loop.run(handle);
        return handle.state() == RunState::Error ? 1 : 0;
    }
}

int main(int argc, char* argv[]) {
    po::options_description desc("paperperp <backtest|live> [options]");
    desc.add_options()
        ("help,h", "show this help")
        ("command", po::value<std::string>(), "backtest or live")
        ("config,c", po::value<std::string>(), "INI configuration file")
        ("strategy,s", po::value<std::string>(), "strategy family: breakout, mean_reversion, funding_carry")
        ("data,d", po::value<std::vector<std::string>>()->composing(), "SYMBOL:file.csv, repeatable")
        ("symbols", po::value<std::string>(), "comma separated symbols for the live loop")
        ("balance", po::value<std::string>(), "starting equity of a new account")
        ("account", po::value<std::string>(), "account name")
        ("store-dir", po::value<std::string>(), "persist the ledger as CSV under this directory")
        ("max-loss", po::value<double>(), "loss floor in account currency")
        ("duration-minutes", po::value<double>(), "live time limit")
        ("tick-seconds", po::value<double>(), "live polling interval")
        ("window", po::value<std::size_t>(), "backtest evaluation window in bars");

    po::positional_options_description positional;
    positional.add("command", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        po::notify(vm);
    }
    catch (const po::error& e) {
        std::cerr << "[main] " << e.what() << "\n" << desc << std::endl;
        return 2;
    }

    if (vm.count("help") || !vm.count("command")) {
        std::cout << desc << std::endl;
        return vm.count("help") ? 0 : 2;
    }
    const std::string command = vm["command"].as<std::string>();
    if (command != "backtest" && command != "live") {
        std::cerr << "[main] unknown command '" << command << "'\n" << desc << std::endl;
        return 2;
    }

    try {
        boost::property_tree::ptree tree;
        if (vm.count("config")) {
            boost::property_tree::ini_parser::read_ini(vm["config"].as<std::string>(), tree);
        }
        // command line wins over the file
        if (vm.count("strategy")) tree.put("strategy.name", vm["strategy"].as<std::string>());
        if (vm.count("symbols")) tree.put("bot.symbols", vm["symbols"].as<std::string>());
        if (vm.count("balance")) tree.put("account.starting_equity", vm["balance"].as<std::string>());
        if (vm.count("account")) tree.put("account.name", vm["account"].as<std::string>());
        if (vm.count("store-dir")) tree.put("account.store_dir", vm["store-dir"].as<std::string>());
        if (vm.count("duration-minutes")) tree.put("bot.duration_minutes", vm["duration-minutes"].as<double>());
        if (vm.count("tick-seconds")) tree.put("bot.tick_interval_seconds", vm["tick-seconds"].as<double>());
        if (vm.count("window")) tree.put("backtest.window_bars", vm["window"].as<std::size_t>());
        if (vm.count("max-loss")) {
            tree.put("bot.max_loss", vm["max-loss"].as<double>());
            tree.put("backtest.max_loss", vm["max-loss"].as<double>());
        }
        if (vm.count("data")) {
            std::string joined;
            for (const auto& entry : vm["data"].as<std::vector<std::string>>()) {
                joined += (joined.empty() ? "" : ",") + entry;
            }
            tree.put("backtest.data", joined);
        }

        const RunnerConfig cfg = RunnerConfig::from_ptree(tree);
        return command == "backtest" ? run_backtest(cfg) : run_live(cfg);
    }
    catch (const std::exception& e) {
        std::cerr << "[main] " << e.what() << std::endl;
        return 1;
    }
}
