#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <map>
#include "common/Errors.h"
#include "common/Logger.h"

namespace stocktrade {
namespace backtest {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// days since 1970-01-01 for a proleptic Gregorian date
long long daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

const char* const kBaseColumns[] = {"timestamp", "open", "high", "low", "close", "volume"};

bool isBaseColumn(const std::string& name) {
    for (const char* base : kBaseColumns) {
        if (name == base) return true;
    }
    return name == "date" || name == "symbol";
}
}

std::optional<TimestampMs> DataHistory::parseTimestamp(const std::string& value) {
    const std::string s = trim(value);
    if (s.empty()) {
        return std::nullopt;
    }

    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    char sep1 = 0;
    char sep2 = 0;
    std::istringstream date_in(s);
    if (s.size() >= 10 && s[4] == '-' &&
        (date_in >> y >> sep1 >> m >> sep2 >> d) && sep1 == '-' && sep2 == '-' &&
        m >= 1 && m <= 12 && d >= 1 && d <= 31) {
        return daysFromCivil(y, m, d) * kMillisPerDay;
    }

    try {
        size_t consumed = 0;
        long long ms = std::stoll(s, &consumed);
        if (consumed == s.size()) {
            return ms;
        }
    } catch (const std::exception&) {
        // not numeric
    }
    return std::nullopt;
}

std::vector<PriceBar> DataHistory::loadCSV(const std::string& file_path, const std::string& symbol) {
    std::vector<PriceBar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw DataUnavailableError("failed to open CSV file: " + file_path);
    }

    // column name -> index; positional layout until a header is seen
    std::vector<std::string> header = {"timestamp", "open", "high", "low", "close", "volume"};
    bool header_seen = false;

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.empty() || row[0].empty()) continue;

        if (!header_seen && !std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            header.clear();
            for (const auto& name : row) {
                header.push_back(lower(name));
            }
            if (!header.empty() && header[0] == "date") {
                header[0] = "timestamp";
            }
            header_seen = true;
            continue;
        }

        std::map<std::string, std::string> fields;
        for (size_t i = 0; i < row.size() && i < header.size(); ++i) {
            fields[header[i]] = row[i];
        }

        try {
            auto ts = parseTimestamp(fields["timestamp"]);
            if (!ts) {
                LOG_WARN("{}:{} bad timestamp '{}'", file_path, line_no, fields["timestamp"]);
                continue;
            }
            PriceBar bar;
            bar.symbol = symbol;
            bar.timestamp = *ts;
            bar.open = std::stod(fields.at("open"));
            bar.high = std::stod(fields.at("high"));
            bar.low = std::stod(fields.at("low"));
            bar.close = std::stod(fields.at("close"));
            bar.volume = std::stod(fields.at("volume"));

            for (const auto& [name, value] : fields) {
                if (isBaseColumn(name) || value.empty()) continue;
                bar.indicators[name] = std::stod(value);
            }
            bars.push_back(std::move(bar));
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row {}:{} - {}", file_path, line_no, e.what());
        }
    }

    std::stable_sort(bars.begin(), bars.end(), [](const PriceBar& a, const PriceBar& b) {
        return a.timestamp < b.timestamp;
    });

    LOG_DEBUG("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<PriceBar> DataHistory::loadJSON(const std::string& file_path, const std::string& symbol) {
    std::vector<PriceBar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw DataUnavailableError("failed to open JSON file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
        for (const auto& item : j) {
            PriceBar bar;
            bar.symbol = symbol;
            if (item.contains("timestamp") && item["timestamp"].is_number()) {
                bar.timestamp = item["timestamp"].get<long long>();
            } else {
                const std::string raw = item.contains("date") ? item["date"].get<std::string>()
                                                              : item.value("timestamp", "");
                auto ts = parseTimestamp(raw);
                if (!ts) {
                    LOG_WARN("{}: skipping bar with bad timestamp '{}'", file_path, raw);
                    continue;
                }
                bar.timestamp = *ts;
            }
            bar.open = item.at("open").get<double>();
            bar.high = item.at("high").get<double>();
            bar.low = item.at("low").get<double>();
            bar.close = item.at("close").get<double>();
            bar.volume = item.value("volume", 0.0);

            for (auto it = item.begin(); it != item.end(); ++it) {
                if (isBaseColumn(it.key()) || !it.value().is_number()) continue;
                bar.indicators[it.key()] = it.value().get<double>();
            }
            bars.push_back(std::move(bar));
        }
    } catch (const nlohmann::json::exception& e) {
        throw DataUnavailableError("error parsing JSON file " + file_path + ": " + e.what());
    }

    std::stable_sort(bars.begin(), bars.end(), [](const PriceBar& a, const PriceBar& b) {
        return a.timestamp < b.timestamp;
    });

    LOG_DEBUG("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<PriceBar> DataHistory::filterByTime(const std::vector<PriceBar>& bars,
                                                TimestampMs start_ms,
                                                TimestampMs end_ms) {
    std::vector<PriceBar> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) {
        if (start_ms != 0 && bar.timestamp < start_ms) continue;
        if (end_ms != 0 && bar.timestamp > end_ms) continue;
        out.push_back(bar);
    }
    return out;
}

} // namespace backtest
} // namespace stocktrade
