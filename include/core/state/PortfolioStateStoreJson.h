#pragma once

#include <filesystem>
#include <optional>

#include "core/contracts/IPortfolioStateStore.h"

namespace stocktrade {
namespace core {

class PortfolioStateStoreJson : public IPortfolioStateStore {
public:
    explicit PortfolioStateStoreJson(std::filesystem::path file_path);

    // std::nullopt when no snapshot exists yet; throws TradingError on a corrupt
    // file or a checksum mismatch
    std::optional<PortfolioSnapshot> load() override;
    bool save(const PortfolioSnapshot& snapshot) override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace stocktrade
