#include "analytics/IndicatorEnricher.h"
#include "analytics/IndicatorColumns.h"
#include "analytics/TechnicalIndicators.h"

namespace stocktrade {
namespace analytics {

namespace {
void fillMissing(std::vector<PriceBar>& bars, const char* column, const Series& series) {
    for (size_t i = 0; i < bars.size() && i < series.size(); ++i) {
        if (!series[i]) continue;
        // emplace keeps a value the feed already supplied
        bars[i].indicators.emplace(column, *series[i]);
    }
}
}

void IndicatorEnricher::enrich(std::vector<PriceBar>& bars) {
    if (bars.empty()) {
        return;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(bars);

    auto macd = TechnicalIndicators::macdSeries(closes, 12, 26, 9);
    fillMissing(bars, columns::kMacdLine, macd.line);
    fillMissing(bars, columns::kMacdSignal, macd.signal);

    fillMissing(bars, columns::kRsi, TechnicalIndicators::rsiSeries(closes, 14));
    fillMissing(bars, columns::kEmaShort, TechnicalIndicators::emaSeries(closes, 20));
    fillMissing(bars, columns::kSmaFast, TechnicalIndicators::smaSeries(closes, 10));
    fillMissing(bars, columns::kSmaSlow, TechnicalIndicators::smaSeries(closes, 20));
    fillMissing(bars, columns::kAtr, TechnicalIndicators::atrSeries(bars, 14));

    auto bands = TechnicalIndicators::bollingerSeries(closes, 20, 2.0);
    fillMissing(bars, columns::kBollingerUpper, bands.upper);
    fillMissing(bars, columns::kBollingerMiddle, bands.middle);
    fillMissing(bars, columns::kBollingerLower, bands.lower);
}

} // namespace analytics
} // namespace stocktrade
