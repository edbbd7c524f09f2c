#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"
#include "backtest/MarketDataSources.h"
#include "core/state/PortfolioStateStoreJson.h"
#include "engine/AutomationScheduler.h"
#include "engine/Engine.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

using namespace stocktrade;

// Shared with the signal handler (Ctrl+C stops a backtest or the automation loop)
std::shared_ptr<engine::CancelToken> g_cancel_token;

void signalHandler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_cancel_token) {
        g_cancel_token->cancel();
    }
}

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitUsage = 2;

struct CliArgs {
    std::string command;
    std::string config_path = "config/config.json";
    std::string output_path;
};

void printUsage() {
    std::cerr << "usage:\n"
              << "  stocktrade backtest --config <file> [--output <file>]\n"
              << "  stocktrade tick --config <file>\n"
              << "  stocktrade run --config <file>\n";
}

bool parseArgs(int argc, char* argv[], CliArgs& out) {
    if (argc < 2) {
        return false;
    }
    out.command = argv[1];
    if (out.command != "backtest" && out.command != "tick" && out.command != "run") {
        return false;
    }
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            out.config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc && out.command == "backtest") {
            out.output_path = argv[++i];
        } else {
            std::cerr << "unknown or incomplete argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::filesystem::path resolvePath(const std::string& path) {
    std::filesystem::path p(path);
    return p.is_absolute() ? p : utils::PathUtils::resolveRelativePath(path);
}

engine::RunContext wireContext(const AppConfig& cfg) {
    engine::RunContext ctx = cfg.run;
    ctx.data_source = std::make_shared<backtest::CsvMarketDataSource>(resolvePath(cfg.data_dir));
    ctx.cancel_token = g_cancel_token;
    return ctx;
}

long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void printSummary(const engine::RunReport& report) {
    const auto& p = report.performance;
    auto opt = [](const std::optional<double>& v, double scale = 1.0) {
        std::ostringstream oss;
        if (v) {
            oss << std::fixed << std::setprecision(3) << (*v * scale);
        } else {
            oss << "n/a";
        }
        return oss.str();
    };

    std::cout << "Backtest result (" << report.strategy_id << " / " << report.profile_id << ")\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Initial capital:  " << report.initial_capital << "\n";
    std::cout << "Final value:      " << report.final_value << "\n";
    std::cout << "Total return:     " << (p.total_return * 100.0) << "%\n";
    std::cout << "Max drawdown:     " << (p.drawdown.max_drawdown * 100.0) << "%\n";
    std::cout << "Trades:           " << p.total_trades
              << " (win " << p.winning_trades << " / loss " << p.losing_trades << ")\n";
    std::cout << "Win rate:         " << opt(p.win_rate, 100.0) << "%\n";
    std::cout << "Sharpe:           " << opt(p.sharpe) << "\n";
    std::cout << "Sortino:          " << opt(p.sortino) << "\n";
    std::cout << "Profit factor:    " << opt(p.profit_factor) << "\n";
    std::cout << "Rejected signals: " << report.rejected_signals.size() << "\n";
    if (report.cancelled) {
        std::cout << "(cancelled before the end of the range)\n";
    }
    std::cout << "---------------------------------------------\n";
}

int runBacktest(const AppConfig& cfg, const CliArgs& args) {
    engine::Engine engine(wireContext(cfg));
    engine::RunReport report = engine.runBacktest();

    const std::string output = args.output_path.empty() ? cfg.report_file : args.output_path;
    std::filesystem::path out_path(output);
    if (out_path.has_parent_path()) {
        std::filesystem::create_directories(out_path.parent_path());
    }
    std::ofstream file(out_path);
    if (!file.is_open()) {
        LOG_ERROR("cannot write report to {}", out_path.string());
        return kExitConfigError;
    }
    file << report.toJson().dump(2);
    LOG_INFO("report written to {}", out_path.string());

    printSummary(report);
    return kExitOk;
}

int runTick(const AppConfig& cfg) {
    auto store = std::make_shared<core::PortfolioStateStoreJson>(resolvePath(cfg.state_file));
    engine::AutomationScheduler scheduler(wireContext(cfg), store);
    engine::TickResult result = scheduler.tick(nowMs());

    std::cout << result.cycle.toJson().dump(2) << "\n";
    if (!result.ok) {
        std::cerr << "tick failed: " << result.error << "\n";
        return kExitConfigError;
    }
    return kExitOk;
}

int runLoop(const AppConfig& cfg) {
    auto store = std::make_shared<core::PortfolioStateStoreJson>(resolvePath(cfg.state_file));
    engine::AutomationScheduler scheduler(wireContext(cfg), store);
    scheduler.run();
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args;
    if (!parseArgs(argc, argv, args)) {
        printUsage();
        return kExitUsage;
    }

    g_cancel_token = std::make_shared<engine::CancelToken>();
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    AppConfig cfg;
    try {
        cfg = ConfigLoader::load(args.config_path);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return kExitConfigError;
    }

    try {
        Logger::getInstance().initialize(cfg.log_dir, cfg.log_level);
    } catch (const std::exception& e) {
        std::cerr << "logger init failed: " << e.what() << "\n";
        return kExitConfigError;
    }

    try {
        if (args.command == "backtest") {
            return runBacktest(cfg, args);
        }
        if (args.command == "tick") {
            return runTick(cfg);
        }
        return runLoop(cfg);
    } catch (const ConfigError& e) {
        LOG_ERROR("{}", e.what());
        std::cerr << e.what() << "\n";
        return kExitConfigError;
    } catch (const std::exception& e) {
        LOG_ERROR("fatal: {}", e.what());
        std::cerr << "fatal: " << e.what() << "\n";
        return kExitConfigError;
    }
}
