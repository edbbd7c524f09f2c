#pragma once

namespace stocktrade {
namespace analytics {
namespace columns {

// Column names shared with the market data feed.
constexpr const char* kMacdLine = "macd_line_12_26";
constexpr const char* kMacdSignal = "macd_signal_12_26_9";
constexpr const char* kRsi = "rsi_14";
constexpr const char* kEmaShort = "ema_20";
constexpr const char* kSmaFast = "sma_10";
constexpr const char* kSmaSlow = "sma_20";
constexpr const char* kAtr = "atr_14";
constexpr const char* kBollingerUpper = "bb_upper_20_2.0";
constexpr const char* kBollingerMiddle = "bb_middle_20_2.0";
constexpr const char* kBollingerLower = "bb_lower_20_2.0";

} // namespace columns
} // namespace analytics
} // namespace stocktrade
