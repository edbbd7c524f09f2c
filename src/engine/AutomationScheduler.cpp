#include "engine/AutomationScheduler.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "engine/Engine.h"
#include "execution/PositionManager.h"

#include <algorithm>
#include <chrono>
#include <thread>

namespace stocktrade {
namespace engine {

namespace {
TimestampMs wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
}

AutomationScheduler::AutomationScheduler(RunContext context, std::shared_ptr<core::IPortfolioStateStore> store)
    : context_(std::move(context))
    , store_(std::move(store))
{
    if (!store_) {
        throw ConfigError("automation requires a portfolio state store");
    }
}

TimestampMs AutomationScheduler::nextTickAt(TimestampMs last) const {
    return last + static_cast<TimestampMs>(context_.automation.cycle_interval_seconds) * 1000;
}

TickResult AutomationScheduler::tick(TimestampMs now) {
    TickResult result;
    result.at = now;

    try {
        Engine engine(context_);

        auto snapshot = store_->load();
        std::unique_ptr<execution::PositionManager> positions;
        if (snapshot) {
            LOG_INFO("[Tick] resuming: cash {:.2f}, {} open positions, {} trades",
                     snapshot->portfolio.cash_balance,
                     snapshot->portfolio.positions.size(),
                     snapshot->trades.size());
            positions = std::make_unique<execution::PositionManager>(
                snapshot->portfolio, engine.makeBroker(), snapshot->trades);
        } else {
            LOG_INFO("[Tick] no saved state, starting with {:.2f}", context_.initial_capital);
            positions = std::make_unique<execution::PositionManager>(
                context_.initial_capital, engine.makeBroker());
        }

        result.cycle = engine.runCycle(now, *positions);
        result.skipped = result.cycle.skipped;

        if (!result.skipped) {
            core::PortfolioSnapshot out;
            out.saved_at_ms = now;
            out.portfolio = positions->state();
            out.trades = positions->trades();
            if (!store_->save(out)) {
                result.ok = false;
                result.error = "failed to save portfolio state";
                LOG_ERROR("[Tick] {}", result.error);
                return result;
            }
        }
        result.ok = true;
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = e.what();
        LOG_ERROR("[Tick] cycle failed, state not saved: {}", e.what());
    }
    return result;
}

void AutomationScheduler::run() {
    LOG_INFO("[Automation] loop started, interval {}s", context_.automation.cycle_interval_seconds);

    TimestampMs next = wallClockMs();
    while (!(context_.cancel_token && context_.cancel_token->isCancelled())) {
        const TimestampMs now = wallClockMs();
        if (now >= next) {
            tick(now);
            next = nextTickAt(now);
            continue;
        }
        // Short sleeps so cancellation is picked up promptly
        const TimestampMs wait = std::min<TimestampMs>(next - now, 1000);
        std::this_thread::sleep_for(std::chrono::milliseconds(wait));
    }

    LOG_INFO("[Automation] loop stopped");
}

} // namespace engine
} // namespace stocktrade
