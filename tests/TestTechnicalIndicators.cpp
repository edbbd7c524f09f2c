#include "analytics/IndicatorColumns.h"
#include "analytics/IndicatorEnricher.h"
#include "analytics/TechnicalIndicators.h"

#include <cmath>
#include <iostream>
#include <vector>

using namespace stocktrade;
using analytics::TechnicalIndicators;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

std::vector<PriceBar> makeBars(const std::vector<double>& closes) {
    std::vector<PriceBar> bars;
    for (size_t i = 0; i < closes.size(); ++i) {
        const double c = closes[i];
        bars.emplace_back("TEST", static_cast<TimestampMs>(i) * kMillisPerDay, c, c + 1.0, c - 1.0, c, 1000.0);
    }
    return bars;
}
}

int main() {
    // SMA / EMA warm-up and values
    {
        const std::vector<double> prices = {1, 2, 3, 4, 5};
        auto sma = TechnicalIndicators::smaSeries(prices, 3);
        if (sma[0] || sma[1] || !sma[2] || !near(*sma[2], 2.0) || !near(*sma[4], 4.0)) {
            std::cerr << "[TEST] SMA(3) mismatch\n";
            return 1;
        }

        auto ema = TechnicalIndicators::emaSeries(prices, 3);
        if (ema[1] || !ema[2] || !near(*ema[2], 2.0) || !near(*ema[3], 3.0) || !near(*ema[4], 4.0)) {
            std::cerr << "[TEST] EMA(3) mismatch\n";
            return 1;
        }

        auto too_short = TechnicalIndicators::smaSeries(prices, 10);
        for (const auto& v : too_short) {
            if (v) {
                std::cerr << "[TEST] SMA longer than input should be empty\n";
                return 1;
            }
        }
    }

    // RSI: monotonic rise is 100, short input never warms up
    {
        std::vector<double> rising;
        for (int i = 0; i < 30; ++i) rising.push_back(100.0 + i);
        auto rising_rsi = TechnicalIndicators::rsiSeries(rising, 14);
        if (!rising_rsi.back() || !near(*rising_rsi.back(), 100.0)) {
            std::cerr << "[TEST] RSI of rising series should be 100\n";
            return 1;
        }
        for (const auto& v : TechnicalIndicators::rsiSeries({1.0, 2.0, 3.0}, 14)) {
            if (v) {
                std::cerr << "[TEST] RSI of short series should have no values\n";
                return 1;
            }
        }

        // Alternating +1/-1 keeps average gain equal to average loss
        std::vector<double> zigzag;
        for (int i = 0; i < 41; ++i) zigzag.push_back((i % 2 == 0) ? 100.0 : 101.0);
        auto rsi = TechnicalIndicators::rsiSeries(zigzag, 14);
        if (rsi[13] || !rsi[14]) {
            std::cerr << "[TEST] RSI first value should be at index 14\n";
            return 1;
        }
        if (*rsi.back() < 40.0 || *rsi.back() > 60.0) {
            std::cerr << "[TEST] zigzag RSI should stay near 50, got " << *rsi.back() << "\n";
            return 1;
        }
    }

    // Bollinger bands collapse on a flat series
    {
        std::vector<double> flat(25, 50.0);
        auto bands = TechnicalIndicators::bollingerSeries(flat, 20, 2.0);
        if (bands.upper[18] || !bands.upper[19]) {
            std::cerr << "[TEST] Bollinger warm-up mismatch\n";
            return 1;
        }
        if (!near(*bands.upper[24], 50.0) || !near(*bands.lower[24], 50.0) || !near(*bands.middle[24], 50.0)) {
            std::cerr << "[TEST] flat Bollinger bands should equal the price\n";
            return 1;
        }

        // Population std-dev of {1..20} is sqrt(33.25)
        std::vector<double> ramp;
        for (int i = 1; i <= 20; ++i) ramp.push_back(i);
        auto ramp_bands = TechnicalIndicators::bollingerSeries(ramp, 20, 2.0);
        const double expected_upper = 10.5 + 2.0 * std::sqrt(33.25);
        if (!near(*ramp_bands.upper[19], expected_upper, 1e-9)) {
            std::cerr << "[TEST] Bollinger upper mismatch: " << *ramp_bands.upper[19] << "\n";
            return 1;
        }
    }

    // MACD: line from the slow EMA seed, signal nine values later
    {
        std::vector<double> prices;
        for (int i = 0; i < 60; ++i) prices.push_back(100.0 + std::sin(i / 5.0) * 5.0);
        auto macd = TechnicalIndicators::macdSeries(prices, 12, 26, 9);
        if (macd.line[24] || !macd.line[25]) {
            std::cerr << "[TEST] MACD line should start at index 25\n";
            return 1;
        }
        if (macd.signal[32] || !macd.signal[33]) {
            std::cerr << "[TEST] MACD signal should start at index 33\n";
            return 1;
        }

        std::vector<double> flat(60, 42.0);
        auto flat_macd = TechnicalIndicators::macdSeries(flat, 12, 26, 9);
        if (!near(*flat_macd.line.back(), 0.0) || !near(*flat_macd.signal.back(), 0.0)) {
            std::cerr << "[TEST] MACD of flat series should be zero\n";
            return 1;
        }
    }

    // ATR of constant-range bars equals the range
    {
        auto bars = makeBars(std::vector<double>(20, 10.0));
        auto atr = TechnicalIndicators::atrSeries(bars, 14);
        if (atr[13] || !atr[14] || !near(*atr[14], 2.0) || !near(*atr.back(), 2.0)) {
            std::cerr << "[TEST] ATR mismatch\n";
            return 1;
        }
    }

    // Enricher fills missing columns and keeps feed-supplied values
    {
        std::vector<double> closes;
        for (int i = 0; i < 40; ++i) closes.push_back(100.0 + i * 0.5);
        auto bars = makeBars(closes);
        bars.back().indicators[analytics::columns::kRsi] = 12.5;

        analytics::IndicatorEnricher::enrich(bars);

        const PriceBar& last = bars.back();
        if (!last.indicator(analytics::columns::kRsi) || !near(*last.indicator(analytics::columns::kRsi), 12.5)) {
            std::cerr << "[TEST] enrich must not overwrite feed values\n";
            return 1;
        }
        const char* required[] = {
            analytics::columns::kMacdLine, analytics::columns::kMacdSignal,
            analytics::columns::kEmaShort, analytics::columns::kSmaFast, analytics::columns::kSmaSlow,
            analytics::columns::kAtr, analytics::columns::kBollingerUpper,
            analytics::columns::kBollingerMiddle, analytics::columns::kBollingerLower
        };
        for (const char* column : required) {
            if (!last.indicator(column)) {
                std::cerr << "[TEST] enrich missing column " << column << "\n";
                return 1;
            }
        }
        if (bars.front().indicator(analytics::columns::kSmaSlow)) {
            std::cerr << "[TEST] warm-up bars should not get sma_20\n";
            return 1;
        }
        if (!near(*bars[19].indicator(analytics::columns::kSmaFast), 100.0 + 14.5 * 0.5)) {
            std::cerr << "[TEST] sma_10 value mismatch\n";
            return 1;
        }
    }

    std::cout << "[TEST] TechnicalIndicators PASSED\n";
    return 0;
}
