#pragma once

#include <optional>
#include <vector>

#include "common/Types.h"

namespace stocktrade {
namespace core {

struct PortfolioSnapshot {
    int schema_version = 1;
    long long saved_at_ms = 0;
    PortfolioState portfolio;
    std::vector<Trade> trades;
};

class IPortfolioStateStore {
public:
    virtual ~IPortfolioStateStore() = default;

    virtual std::optional<PortfolioSnapshot> load() = 0;
    virtual bool save(const PortfolioSnapshot& snapshot) = 0;
};

} // namespace core
} // namespace stocktrade
