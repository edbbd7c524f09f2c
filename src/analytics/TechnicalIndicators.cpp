#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>

namespace stocktrade {
namespace analytics {

// Wilder's smoothing
Series TechnicalIndicators::rsiSeries(const std::vector<double>& prices, int period) {
    Series out(prices.size());
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return out;
    }

    auto toRsi = [](double avg_gain, double avg_loss) {
        if (avg_loss < 0.0000001) return 100.0;
        double rs = avg_gain / avg_loss;
        return 100.0 - (100.0 / (1.0 + rs));
    };

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }
    avg_gain /= period;
    avg_loss /= period;
    out[period] = toRsi(avg_gain, avg_loss);

    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
        out[i] = toRsi(avg_gain, avg_loss);
    }
    return out;
}

Series TechnicalIndicators::emaSeries(const std::vector<double>& prices, int period) {
    Series out(prices.size());
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return out;
    }

    double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += prices[i];
    ema /= period;
    out[period - 1] = ema;

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        out[i] = ema;
    }
    return out;
}

Series TechnicalIndicators::smaSeries(const std::vector<double>& prices, int period) {
    Series out(prices.size());
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return out;
    }

    double sum = 0.0;
    for (size_t i = 0; i < prices.size(); ++i) {
        sum += prices[i];
        if (i >= static_cast<size_t>(period)) {
            sum -= prices[i - period];
        }
        if (i + 1 >= static_cast<size_t>(period)) {
            out[i] = sum / period;
        }
    }
    return out;
}

TechnicalIndicators::MACDSeries TechnicalIndicators::macdSeries(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDSeries result;
    result.line.resize(prices.size());
    result.signal.resize(prices.size());

    auto fast_ema = emaSeries(prices, fast);
    auto slow_ema = emaSeries(prices, slow);

    // MACD line exists wherever both EMAs exist
    std::vector<double> line_values;
    size_t first_line = prices.size();
    for (size_t i = 0; i < prices.size(); ++i) {
        if (fast_ema[i] && slow_ema[i]) {
            result.line[i] = *fast_ema[i] - *slow_ema[i];
            if (first_line == prices.size()) first_line = i;
            line_values.push_back(*result.line[i]);
        }
    }

    // Signal line = EMA of the MACD line
    auto signal = emaSeries(line_values, signal_period);
    for (size_t k = 0; k < signal.size(); ++k) {
        result.signal[first_line + k] = signal[k];
    }
    return result;
}

TechnicalIndicators::BollingerSeries TechnicalIndicators::bollingerSeries(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    BollingerSeries result;
    result.upper.resize(prices.size());
    result.middle.resize(prices.size());
    result.lower.resize(prices.size());

    auto sma = smaSeries(prices, period);
    for (size_t i = 0; i < prices.size(); ++i) {
        if (!sma[i]) continue;
        const double mean = *sma[i];
        double variance = 0.0;
        for (size_t k = i + 1 - period; k <= i; ++k) {
            variance += (prices[k] - mean) * (prices[k] - mean);
        }
        const double std_dev = std::sqrt(variance / period);
        result.middle[i] = mean;
        result.upper[i] = mean + (std_dev * std_dev_mult);
        result.lower[i] = mean - (std_dev * std_dev_mult);
    }
    return result;
}

Series TechnicalIndicators::atrSeries(const std::vector<PriceBar>& bars, int period) {
    Series out(bars.size());
    if (period <= 0 || bars.size() < static_cast<size_t>(period + 1)) {
        return out;
    }

    auto trueRange = [&](size_t i) {
        const double high_low = bars[i].high - bars[i].low;
        const double high_close = std::abs(bars[i].high - bars[i - 1].close);
        const double low_close = std::abs(bars[i].low - bars[i - 1].close);
        return std::max({high_low, high_close, low_close});
    };

    double atr = 0.0;
    for (int i = 1; i <= period; ++i) {
        atr += trueRange(i);
    }
    atr /= period;
    out[period] = atr;

    for (size_t i = period + 1; i < bars.size(); ++i) {
        atr = ((atr * (period - 1)) + trueRange(i)) / period;
        out[i] = atr;
    }
    return out;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<PriceBar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());
    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }
    return prices;
}

} // namespace analytics
} // namespace stocktrade
