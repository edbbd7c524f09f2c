#include "engine/Engine.h"
#include "analytics/IndicatorEnricher.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "strategy/StrategyCatalog.h"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace stocktrade {
namespace engine {

namespace {
void validateContext(const RunContext& ctx) {
    if (!ctx.data_source) {
        throw ConfigError("run context has no market data source");
    }
    if (ctx.symbols.empty()) {
        throw ConfigError("run.symbols is empty");
    }
    std::set<std::string> unique(ctx.symbols.begin(), ctx.symbols.end());
    if (unique.size() != ctx.symbols.size()) {
        throw ConfigError("run.symbols contains duplicates");
    }
    if (!(ctx.initial_capital > 0.0)) {
        throw ConfigError("run.initial_capital must be positive");
    }
    if (ctx.end_ms != 0 && ctx.start_ms > ctx.end_ms) {
        throw ConfigError("run.start is after run.end");
    }
    if (ctx.performance.annualization_factor <= 0.0) {
        throw ConfigError("annualization factor must be positive");
    }
    if (ctx.automation.cycle_interval_seconds <= 0) {
        throw ConfigError("automation.cycle_interval_seconds must be positive");
    }
    ctx.risk_limits.validate();
    ctx.broker.validate();
    strategy::StrategyCatalog::validate(ctx.strategy_kind, ctx.profile);
}

struct PendingExit {
    std::string symbol;
    ExitReason reason;
    Price price;
    TimestampMs at;
};

struct PendingEntry {
    strategy::Signal signal;
    const PriceBar* bar;
};
}

Engine::Engine(RunContext context)
    : context_(std::move(context))
    , strategies_(context_.strategy_kind, context_.profile)
    , risk_(context_.risk_limits, context_.broker.costRate())
    , window_size_(0)
{
    validateContext(context_);
    window_size_ = std::max<size_t>(strategies_.minLookback(), 2);
}

void Engine::transitionTo(EngineState next) {
    if (!EngineStateMachine::canTransition(state_, next)) {
        throw std::logic_error(std::string("illegal engine transition ") +
                               toString(state_) + " -> " + toString(next));
    }
    state_ = next;
}

bool Engine::cancelled() const {
    return context_.cancel_token && context_.cancel_token->isCancelled();
}

bool Engine::isMarketOpen(TimestampMs now, const AutomationSettings& settings) {
    if (now < 0) {
        return false;
    }
    const long long days = now / kMillisPerDay;
    // 1970-01-01 was a Thursday; 0 = Sunday
    const int weekday = static_cast<int>((days + 4) % 7);
    if (weekday == 0 || weekday == 6) {
        return false;
    }
    const int minute = static_cast<int>((now % kMillisPerDay) / 60000);
    return minute >= settings.market_open_minute_utc && minute < settings.market_close_minute_utc;
}

std::vector<PriceBar> Engine::loadSymbol(const std::string& symbol, TimestampMs start_ms, TimestampMs end_ms) {
    std::vector<PriceBar> bars;
    try {
        bars = context_.data_source->loadBars(symbol, start_ms, end_ms);
    } catch (const DataUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        // Any feed failure is confined to its symbol
        throw DataUnavailableError("loading " + symbol + " failed: " + e.what());
    }
    if (bars.empty()) {
        throw DataUnavailableError("no bars for " + symbol);
    }
    analytics::IndicatorEnricher::enrich(bars);
    return bars;
}

std::vector<PriceBar> Engine::tail(const std::vector<PriceBar>& bars, size_t end_index) const {
    const size_t end = end_index + 1;
    const size_t begin = (end > window_size_) ? end - window_size_ : 0;
    return std::vector<PriceBar>(bars.begin() + begin, bars.begin() + end);
}

void Engine::resetToIdle() {
    if (state_ == EngineState::COMPLETE) {
        transitionTo(EngineState::IDLE);
    } else if (state_ != EngineState::IDLE) {
        LOG_WARN("[Engine] previous run stopped in {}, resetting to IDLE", toString(state_));
        state_ = EngineState::IDLE;
    }
}

// ===== Backtest =====

RunReport Engine::runBacktest() {
    resetToIdle();
    transitionTo(EngineState::LOADING_DATA);

    RunReport report;
    report.strategy_id = strategies_.strategy().id();
    report.profile_id = strategies_.profile().name;
    report.initial_capital = context_.initial_capital;

    LOG_INFO("[Backtest] {} / {} on {} symbols, capital {:.2f}",
             report.strategy_id, report.profile_id, context_.symbols.size(), context_.initial_capital);

    execution::PositionManager positions(context_.initial_capital, makeBroker());

    // Load every symbol once; a failing symbol is skipped for the whole run.
    std::vector<std::pair<std::string, std::vector<PriceBar>>> series;
    std::set<TimestampMs> timeline;
    for (const auto& symbol : context_.symbols) {
        try {
            auto bars = loadSymbol(symbol, context_.start_ms, context_.end_ms);
            for (const auto& bar : bars) {
                timeline.insert(bar.timestamp);
            }
            series.emplace_back(symbol, std::move(bars));
        } catch (const DataUnavailableError& e) {
            LOG_WARN("[Backtest] skipping {}: {}", symbol, e.what());
            report.symbol_errors.push_back({symbol, context_.start_ms, e.what()});
        }
    }

    std::vector<size_t> cursor(series.size(), 0);
    size_t index = 0;
    for (TimestampMs at : timeline) {
        if (cancelled()) {
            LOG_INFO("[Backtest] cancelled after {} bars", report.bars_processed);
            report.cancelled = true;
            break;
        }
        transitionTo(EngineState::LOADING_DATA);

        std::vector<SymbolWindow> windows;
        for (size_t s = 0; s < series.size(); ++s) {
            const auto& bars = series[s].second;
            while (cursor[s] < bars.size() && bars[cursor[s]].timestamp < at) {
                ++cursor[s];
            }
            if (cursor[s] < bars.size() && bars[cursor[s]].timestamp == at) {
                windows.push_back({series[s].first, tail(bars, cursor[s])});
            }
        }

        const bool final_bar = (++index == timeline.size());
        CycleOptions options;
        options.allow_entries = !final_bar;
        options.liquidate = final_bar;

        CycleResult cycle;
        cycle.at = at;
        processCycle(at, windows, positions, cycle, options);

        report.bars_processed++;
        report.signals_generated += cycle.signals_generated;
        report.rejected_signals.insert(report.rejected_signals.end(),
                                       cycle.rejected_signals.begin(), cycle.rejected_signals.end());
        report.symbol_errors.insert(report.symbol_errors.end(),
                                    cycle.symbol_errors.begin(), cycle.symbol_errors.end());
    }

    transitionTo(EngineState::COMPLETE);

    report.trades = positions.trades();
    report.equity_curve = positions.state().equity_curve;
    report.final_value = positions.totalValue();
    report.performance = analytics::PerformanceAnalyzer::compute(
        report.trades, report.equity_curve, context_.risk_free_rate, context_.performance);

    LOG_INFO("[Backtest] done: {} bars, {} trades, {} rejected, final value {:.2f}",
             report.bars_processed, report.trades.size(), report.rejected_signals.size(), report.final_value);
    return report;
}

// ===== Automation =====

CycleResult Engine::runCycle(TimestampMs now, execution::PositionManager& positions) {
    resetToIdle();

    CycleResult result;
    result.at = now;

    if (context_.automation.market_hours_only && !isMarketOpen(now, context_.automation)) {
        result.skipped = true;
        result.skip_reason = "market closed";
        LOG_INFO("[Cycle] market closed, skipping");
        return result;
    }

    transitionTo(EngineState::LOADING_DATA);

    const TimestampMs start = now - static_cast<long long>(context_.automation.lookback_days) * kMillisPerDay;
    std::vector<SymbolWindow> windows;
    for (const auto& symbol : context_.symbols) {
        try {
            auto bars = loadSymbol(symbol, start, now);
            const auto last = positions.lastBarAt(symbol);
            if (last && bars.back().timestamp <= *last) {
                LOG_DEBUG("[Cycle] {} has no bar newer than {}", symbol, *last);
                result.stale_symbols++;
                continue;
            }
            windows.push_back({symbol, tail(bars, bars.size() - 1)});
        } catch (const DataUnavailableError& e) {
            LOG_WARN("[Cycle] skipping {}: {}", symbol, e.what());
            result.errors++;
            result.symbol_errors.push_back({symbol, now, e.what()});
        }
    }

    processCycle(now, windows, positions, result, CycleOptions());
    transitionTo(EngineState::COMPLETE);

    LOG_INFO("[Cycle] analyzed {}, stale {}, signals {}, trades {}, errors {}",
             result.analysis_count, result.stale_symbols, result.signals_generated,
             result.trades_executed, result.errors);
    return result;
}

// ===== One cycle =====

void Engine::processCycle(
    TimestampMs at,
    const std::vector<SymbolWindow>& windows,
    execution::PositionManager& positions,
    CycleResult& result,
    const CycleOptions& options
) {
    // Mark open positions first so sizing sees current portfolio value
    for (const auto& sw : windows) {
        if (positions.hasPosition(sw.symbol)) {
            positions.markToMarket(sw.symbol, sw.window.back().close);
        }
    }

    transitionTo(EngineState::EVALUATING_STRATEGY);

    std::vector<PendingExit> exits;
    std::vector<PendingEntry> entries;
    for (const auto& sw : windows) {
        const PriceBar& bar = sw.window.back();
        result.analysis_count++;

        if (positions.hasPosition(sw.symbol)) {
            auto protective = risk_.checkExit(positions.position(sw.symbol), bar);
            if (protective) {
                exits.push_back({sw.symbol, protective->reason, protective->price, bar.timestamp});
                continue;
            }
        }

        auto signal = strategies_.evaluate(sw.symbol, sw.window);
        if (!signal) {
            continue;
        }
        result.signals_generated++;

        if (!signal->isEntry()) {
            if (positions.hasPosition(sw.symbol)) {
                exits.push_back({sw.symbol, ExitReason::SIGNAL_EXIT, bar.close, bar.timestamp});
            } else {
                LOG_DEBUG("[Cycle] {} exit signal without position ({})", sw.symbol, signal->reason);
            }
            continue;
        }
        if (options.allow_entries) {
            entries.push_back({*signal, &bar});
        }
    }

    // ===== Exits (free cash before entries) =====
    if (!exits.empty() || options.liquidate) {
        transitionTo(EngineState::EXECUTING);
    }
    for (const auto& exit : exits) {
        try {
            Trade trade = positions.closePosition(exit.symbol, exit.price, exit.at, exit.reason);
            result.closed_trades.push_back(trade);
            result.trades_executed++;
        } catch (const TradingError& e) {
            LOG_ERROR("[Cycle] close {} failed: {}", exit.symbol, e.what());
            result.errors++;
            result.symbol_errors.push_back({exit.symbol, at, e.what()});
        }
    }
    if (options.liquidate) {
        for (const auto& symbol : positions.openSymbols()) {
            const Price last = positions.position(symbol).current_price;
            Trade trade = positions.closePosition(symbol, last, at, ExitReason::END_OF_BACKTEST);
            result.closed_trades.push_back(trade);
            result.trades_executed++;
        }
    }

    // ===== Entries, one at a time against the live cash balance =====
    for (const auto& entry : entries) {
        transitionTo(EngineState::RISK_CHECK);
        const strategy::Signal& signal = entry.signal;
        const PriceBar& bar = *entry.bar;

        const risk::SizingResult sizing = risk_.sizePosition(signal, bar.close, positions.state());
        if (!sizing.accepted) {
            result.rejected_signals.push_back({signal.symbol, bar.timestamp,
                                               risk::toString(sizing.rejection), sizing.reason});
            continue;
        }

        const risk::RiskLevels levels = risk_.computeLevels(bar.close, bar, &strategies_.profile());

        transitionTo(EngineState::EXECUTING);
        try {
            positions.openPosition(signal, sizing.shares, bar.close, bar.timestamp, levels);
            result.trades_executed++;
        } catch (const InsufficientCashError& e) {
            result.rejected_signals.push_back({signal.symbol, bar.timestamp,
                                               risk::toString(risk::RejectionCode::INSUFFICIENT_CASH), e.what()});
        } catch (const TradingError& e) {
            LOG_ERROR("[Cycle] open {} failed: {}", signal.symbol, e.what());
            result.errors++;
            result.symbol_errors.push_back({signal.symbol, at, e.what()});
        }
    }

    // ===== Record =====
    transitionTo(EngineState::RECORDING);
    for (const auto& sw : windows) {
        positions.markBarProcessed(sw.symbol, sw.window.back().timestamp);
    }
    for (const auto& symbol : positions.openSymbols()) {
        auto new_stop = risk_.trailingStop(positions.position(symbol));
        if (new_stop) {
            positions.raiseStopLoss(symbol, *new_stop);
        }
    }
    positions.recordEquity(at);
}

} // namespace engine
} // namespace stocktrade
