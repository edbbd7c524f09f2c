#include "backtest/MarketDataSources.h"
#include "common/Errors.h"
#include "core/state/PortfolioStateStoreJson.h"
#include "engine/AutomationScheduler.h"
#include "strategy/StrategyCatalog.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using namespace stocktrade;
using namespace stocktrade::engine;

namespace {
constexpr TimestampMs kMonday = 19730LL * kMillisPerDay;     // 2024-01-08 00:00 UTC
constexpr TimestampMs kSaturday = 19735LL * kMillisPerDay;   // 2024-01-13
constexpr TimestampMs kHour = 3600LL * 1000;

int fail(const std::string& message) {
    std::cerr << "[TEST] " << message << "\n";
    return 1;
}

// Daily bars ending on `last_day`, oscillating so MACD crosses regularly
std::vector<PriceBar> dailyBars(const std::string& symbol, TimestampMs last_day, int n) {
    std::vector<PriceBar> bars;
    double prev = 100.0;
    for (int i = 0; i < n; ++i) {
        const double close = 100.0 + 8.0 * std::sin(i / 5.0) + 0.04 * i;
        const TimestampMs ts = last_day - static_cast<TimestampMs>(n - 1 - i) * kMillisPerDay;
        bars.emplace_back(symbol, ts, prev, std::max(prev, close) + 0.5, std::min(prev, close) - 0.5, close, 1000.0);
        prev = close;
    }
    return bars;
}

RunContext makeContext(std::shared_ptr<core::IMarketDataSource> source) {
    RunContext ctx;
    ctx.symbols = {"AAPL", "MSFT"};
    ctx.initial_capital = 50000.0;
    ctx.strategy_kind = strategy::StrategyKind::MACD;
    ctx.profile = strategy::StrategyCatalog::builtin().profile(strategy::StrategyKind::MACD, "aggressive");
    ctx.data_source = std::move(source);
    ctx.cancel_token = std::make_shared<CancelToken>();
    return ctx;
}

class BrokenSource : public core::IMarketDataSource {
public:
    std::vector<PriceBar> loadBars(const std::string&, TimestampMs, TimestampMs) override {
        throw std::runtime_error("feed handler crashed");
    }
};

class CountingStore : public core::IPortfolioStateStore {
public:
    explicit CountingStore(bool save_ok) : save_ok_(save_ok) {}

    std::optional<core::PortfolioSnapshot> load() override { return std::nullopt; }
    bool save(const core::PortfolioSnapshot&) override {
        ++saves;
        return save_ok_;
    }

    int saves = 0;

private:
    bool save_ok_;
};

// Keeps the last saved snapshot in memory
class MemoryStore : public core::IPortfolioStateStore {
public:
    explicit MemoryStore(std::optional<core::PortfolioSnapshot> initial) : snapshot_(std::move(initial)) {}

    std::optional<core::PortfolioSnapshot> load() override { return snapshot_; }
    bool save(const core::PortfolioSnapshot& snapshot) override {
        snapshot_ = snapshot;
        return true;
    }

private:
    std::optional<core::PortfolioSnapshot> snapshot_;
};

int countTrades(const std::vector<Trade>& trades, const std::string& symbol, ExitReason reason) {
    return static_cast<int>(std::count_if(trades.begin(), trades.end(), [&](const Trade& t) {
        return t.symbol == symbol && t.exit_reason == reason;
    }));
}
}

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "stocktrade_test_automation";
    std::filesystem::remove_all(dir);
    const auto state_path = dir / "portfolio.json";

    auto source = std::make_shared<backtest::InMemoryMarketDataSource>();
    source->setBars("AAPL", dailyBars("AAPL", kMonday + kMillisPerDay, 200));
    source->setBars("MSFT", dailyBars("MSFT", kMonday + kMillisPerDay, 200));

    // ===== Construction =====
    {
        bool threw = false;
        try {
            AutomationScheduler scheduler(makeContext(source), nullptr);
        } catch (const ConfigError&) {
            threw = true;
        }
        if (!threw) {
            return fail("missing state store should be a ConfigError");
        }

        AutomationScheduler scheduler(makeContext(source), std::make_shared<core::PortfolioStateStoreJson>(state_path));
        if (scheduler.nextTickAt(1000) != 301000) {
            return fail("next tick should be one interval later");
        }
    }

    // ===== Market closed: skipped, nothing written =====
    {
        auto store = std::make_shared<core::PortfolioStateStoreJson>(state_path);
        AutomationScheduler scheduler(makeContext(source), store);

        TickResult weekend = scheduler.tick(kSaturday + 15 * kHour);
        TickResult early = scheduler.tick(kMonday + 13 * kHour);
        if (!weekend.ok || !weekend.skipped || !early.ok || !early.skipped) {
            return fail("closed market ticks should be skipped");
        }
        if (weekend.cycle.analysis_count != 0 || std::filesystem::exists(state_path)) {
            return fail("skipped tick must not analyze or persist");
        }
    }

    // ===== Persistence across ticks =====
    core::PortfolioSnapshot after_first;
    {
        auto store = std::make_shared<core::PortfolioStateStoreJson>(state_path);
        AutomationScheduler scheduler(makeContext(source), store);

        TickResult first = scheduler.tick(kMonday + 15 * kHour);
        if (!first.ok || first.skipped || first.cycle.analysis_count != 2) {
            return fail("open market tick should analyze both symbols: " + first.error);
        }
        auto saved = store->load();
        if (!saved || saved->saved_at_ms != first.at || saved->portfolio.equity_curve.size() != 1) {
            return fail("first tick should persist one equity point");
        }
        after_first = *saved;

        // Next day: the book is restored, not rebuilt from initial capital
        TickResult second = scheduler.tick(kMonday + kMillisPerDay + 15 * kHour);
        if (!second.ok || second.skipped) {
            return fail("second tick failed: " + second.error);
        }
        auto resumed = store->load();
        if (!resumed || resumed->portfolio.equity_curve.size() != 2) {
            return fail("second tick should extend the saved equity curve");
        }
        if (resumed->trades.size() != after_first.trades.size() + second.cycle.closed_trades.size()) {
            return fail("trade history should carry over between ticks");
        }
        for (const auto& [symbol, pos] : after_first.portfolio.positions) {
            bool closed = false;
            for (const auto& t : second.cycle.closed_trades) {
                closed = closed || t.symbol == symbol;
            }
            if (!closed && !resumed->portfolio.hasPosition(symbol)) {
                return fail("open position lost between ticks: " + symbol);
            }
        }
        after_first = *resumed;
    }

    // ===== Repeated ticks over an unchanged feed =====
    {
        // Restored book holds AAPL bought on Monday's bar, with a stop above the market
        core::PortfolioSnapshot seeded;
        seeded.portfolio.cash_balance = 40000.0;
        Position pos;
        pos.symbol = "AAPL";
        pos.shares = 10;
        pos.average_entry_price = 100.0;
        pos.opened_at = kMonday;
        pos.stop_loss_price = 1000.0;
        pos.current_price = 100.0;
        pos.highest_price = 100.0;
        pos.strategy_id = "macd";
        pos.profile_id = "aggressive";
        seeded.portfolio.positions["AAPL"] = pos;
        seeded.portfolio.last_bar_at["AAPL"] = kMonday;

        auto store = std::make_shared<MemoryStore>(seeded);
        AutomationScheduler scheduler(makeContext(source), store);

        size_t trades_after_first = 0;
        for (int i = 0; i < 6; ++i) {
            TickResult result = scheduler.tick(kMonday + 15 * kHour + i * 5 * 60 * 1000LL);
            if (!result.ok || result.skipped) {
                return fail("tick on an unchanged feed failed: " + result.error);
            }
            const int expected_analyzed = (i == 0) ? 1 : 0;
            if (result.cycle.analysis_count != expected_analyzed || result.cycle.stale_symbols != 2 - expected_analyzed) {
                return fail("a bar should be analyzed by exactly one tick");
            }
            auto saved = store->load();
            if (!saved || !saved->portfolio.hasPosition("AAPL")) {
                return fail("position should not be stopped out on its entry bar");
            }
            if (i == 0) {
                trades_after_first = saved->trades.size();
            } else if (result.cycle.trades_executed != 0 || saved->trades.size() != trades_after_first) {
                return fail("repeated ticks over the same bar should not trade");
            }
        }

        // Tuesday's bar is new: the stop fires once
        TickResult next_day = scheduler.tick(kMonday + kMillisPerDay + 15 * kHour);
        TickResult again = scheduler.tick(kMonday + kMillisPerDay + 15 * kHour + 5 * 60 * 1000LL);
        auto saved = store->load();
        if (!next_day.ok || !again.ok || !saved || saved->portfolio.hasPosition("AAPL") ||
            countTrades(saved->trades, "AAPL", ExitReason::STOP_LOSS) != 1) {
            return fail("stop should fire exactly once on the next bar");
        }
        if (saved->portfolio.last_bar_at.at("AAPL") != kMonday + kMillisPerDay) {
            return fail("last processed bar should be saved with the portfolio");
        }
    }

    // ===== A crashing feed is confined to its symbols =====
    {
        auto store = std::make_shared<core::PortfolioStateStoreJson>(state_path);
        AutomationScheduler scheduler(makeContext(std::make_shared<BrokenSource>()), store);

        const TimestampMs at = kMonday + kMillisPerDay + 16 * kHour;
        TickResult broken = scheduler.tick(at);
        if (!broken.ok || broken.cycle.errors != 2 || broken.cycle.symbol_errors.size() != 2) {
            return fail("feed exception should be reported per symbol: " + broken.error);
        }
        if (broken.cycle.symbol_errors.front().message.find("feed handler crashed") == std::string::npos) {
            return fail("symbol error should carry the feed's message");
        }
        auto saved = store->load();
        if (!saved || saved->saved_at_ms != at ||
            saved->portfolio.positions.size() != after_first.portfolio.positions.size() ||
            saved->trades.size() != after_first.trades.size()) {
            return fail("cycle without data should keep the book and be saved");
        }
    }

    // Every symbol unavailable is a completed cycle with errors, and is saved
    {
        auto missing = std::make_shared<backtest::InMemoryMarketDataSource>();
        missing->failSymbol("AAPL");
        missing->failSymbol("MSFT");
        auto store = std::make_shared<CountingStore>(true);
        AutomationScheduler scheduler(makeContext(missing), store);

        TickResult result = scheduler.tick(kMonday + 15 * kHour);
        if (!result.ok || result.cycle.errors != 2 || result.cycle.symbol_errors.size() != 2 || store->saves != 1) {
            return fail("unavailable symbols should be reported per symbol");
        }
    }

    // Store refusing to save
    {
        auto store = std::make_shared<CountingStore>(false);
        AutomationScheduler scheduler(makeContext(source), store);
        TickResult result = scheduler.tick(kMonday + 15 * kHour);
        if (result.ok || result.error.empty() || store->saves != 1) {
            return fail("failed save should fail the tick");
        }
    }

    // ===== Tampered and corrupt state =====
    {
        nlohmann::json raw;
        {
            std::ifstream in(state_path);
            in >> raw;
        }
        raw["portfolio"]["cash_balance"] = raw["portfolio"]["cash_balance"].get<double>() + 1000.0;
        {
            std::ofstream out(state_path, std::ios::trunc);
            out << raw.dump(2);
        }

        auto store = std::make_shared<core::PortfolioStateStoreJson>(state_path);
        bool threw = false;
        try {
            store->load();
        } catch (const TradingError&) {
            threw = true;
        }
        if (!threw) {
            return fail("checksum mismatch should be detected");
        }

        AutomationScheduler scheduler(makeContext(source), store);
        TickResult tampered = scheduler.tick(kMonday + kMillisPerDay + 15 * kHour);
        if (tampered.ok || tampered.error.find("checksum") == std::string::npos) {
            return fail("tampered state should fail the tick");
        }

        raw.erase("checksum");
        {
            std::ofstream out(state_path, std::ios::trunc);
            out << raw.dump(2);
        }
        threw = false;
        try {
            store->load();
        } catch (const TradingError& e) {
            threw = std::string(e.what()).find("missing checksum") != std::string::npos;
        }
        if (!threw) {
            return fail("state without a checksum should be rejected");
        }

        {
            std::ofstream out(state_path, std::ios::trunc);
            out << "{ \"portfolio\": ";
        }
        TickResult corrupt = scheduler.tick(kMonday + kMillisPerDay + 15 * kHour);
        if (corrupt.ok || corrupt.error.empty()) {
            return fail("corrupt state should fail the tick");
        }
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] AutomationScheduler PASSED\n";
    return 0;
}
