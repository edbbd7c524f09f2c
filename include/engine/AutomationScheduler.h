#pragma once

#include <memory>
#include <string>

#include "core/contracts/IPortfolioStateStore.h"
#include "engine/RunContext.h"
#include "engine/RunReport.h"

namespace stocktrade {
namespace engine {

struct TickResult {
    TimestampMs at = 0;
    bool ok = false;
    bool skipped = false;
    std::string error;
    CycleResult cycle;
};

// Drives Engine::runCycle from an external clock. Every tick restores the
// book from the state store and persists it again only when the cycle
// completed, so a failed tick leaves the last saved state untouched.
class AutomationScheduler {
public:
    AutomationScheduler(RunContext context, std::shared_ptr<core::IPortfolioStateStore> store);

    TickResult tick(TimestampMs now);

    TimestampMs nextTickAt(TimestampMs last) const;

    // Blocking loop until the context's cancel token fires
    void run();

    const RunContext& context() const { return context_; }

private:
    RunContext context_;
    std::shared_ptr<core::IPortfolioStateStore> store_;
};

} // namespace engine
} // namespace stocktrade
