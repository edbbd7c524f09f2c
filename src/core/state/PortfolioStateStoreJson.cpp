#include "core/state/PortfolioStateStoreJson.h"
#include "common/Errors.h"
#include "common/TypesJson.h"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <openssl/sha.h>

namespace stocktrade {
namespace core {

namespace {
// SHA-256 over the compact dump of {portfolio, trades}
std::string payloadChecksum(const nlohmann::json& portfolio, const nlohmann::json& trades) {
    nlohmann::json payload;
    payload["portfolio"] = portfolio;
    payload["trades"] = trades;
    const std::string text = payload.dump();

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(text.c_str()), text.length(), hash);

    std::ostringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(hash[i]);
    }
    return hex_stream.str();
}
}

PortfolioStateStoreJson::PortfolioStateStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<PortfolioSnapshot> PortfolioStateStoreJson::load() {
    if (!std::filesystem::exists(file_path_)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        throw TradingError("cannot open portfolio state " + file_path_.string());
    }

    try {
        nlohmann::json raw;
        in >> raw;

        const nlohmann::json trades = raw.value("trades", nlohmann::json::array());
        if (!raw.contains("checksum")) {
            throw TradingError("corrupt portfolio state " + file_path_.string() + ": missing checksum");
        }
        const std::string expected = raw.at("checksum").get<std::string>();
        if (expected != payloadChecksum(raw.at("portfolio"), trades)) {
            throw TradingError("portfolio state " + file_path_.string() + " failed checksum verification");
        }

        PortfolioSnapshot snapshot;
        snapshot.schema_version = raw.value("schema_version", 1);
        snapshot.saved_at_ms = raw.value("saved_at_ms", 0LL);
        snapshot.portfolio = raw.at("portfolio").get<PortfolioState>();
        snapshot.trades = trades.get<std::vector<Trade>>();
        return snapshot;
    } catch (const nlohmann::json::exception& e) {
        throw TradingError("corrupt portfolio state " + file_path_.string() + ": " + e.what());
    }
}

bool PortfolioStateStoreJson::save(const PortfolioSnapshot& snapshot) {
    nlohmann::json raw;
    raw["schema_version"] = snapshot.schema_version;
    raw["saved_at_ms"] = snapshot.saved_at_ms;
    raw["portfolio"] = snapshot.portfolio;
    raw["trades"] = snapshot.trades;
    raw["checksum"] = payloadChecksum(raw["portfolio"], raw["trades"]);

    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
        if (!out.good()) {
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // Cross-device rename fails; fall back to copy + remove.
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace stocktrade
