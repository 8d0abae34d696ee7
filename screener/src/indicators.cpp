#include "indicators.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

const double kNaN = std::numeric_limits<double>::quiet_NaN();

void require_points(const std::string& name, size_t have, size_t need) {
    if (have < need) {
        throw InsufficientHistory(name, have, need);
    }
}

// Wilder smoothing over values[1..]. The first average is the simple mean of
// values[1..period], placed at index `period`.
std::vector<double> wilder_smooth(const std::vector<double>& values, size_t period) {
    std::vector<double> out(values.size(), kNaN);

    double avg = 0.0;
    for (size_t i = 1; i <= period; i++) {
        avg += values[i];
    }
    avg /= static_cast<double>(period);
    out[period] = avg;

    const double n = static_cast<double>(period);
    for (size_t i = period + 1; i < values.size(); i++) {
        avg = (avg * (n - 1.0) + values[i]) / n;
        out[i] = avg;
    }
    return out;
}

std::optional<double> last_defined(const std::vector<double>& values) {
    if (values.empty() || std::isnan(values.back())) return std::nullopt;
    return values.back();
}

} // namespace

std::vector<double> IndicatorEngine::sma(const std::vector<double>& prices, size_t period) {
    if (period == 0) throw std::invalid_argument("SMA period must be positive");
    require_points("SMA" + std::to_string(period), prices.size(), period);

    std::vector<double> out(prices.size(), kNaN);
    for (size_t t = period - 1; t < prices.size(); t++) {
        double sum = 0.0;
        for (size_t i = t + 1 - period; i <= t; i++) {
            sum += prices[i];
        }
        out[t] = sum / static_cast<double>(period);
    }
    return out;
}

std::vector<double> IndicatorEngine::ema(const std::vector<double>& prices, size_t period) {
    if (period == 0) throw std::invalid_argument("EMA period must be positive");
    require_points("EMA" + std::to_string(period), prices.size(), period);

    std::vector<double> out(prices.size(), kNaN);

    double seed = 0.0;
    for (size_t i = 0; i < period; i++) {
        seed += prices[i];
    }
    double value = seed / static_cast<double>(period);
    out[period - 1] = value;

    const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
    for (size_t t = period; t < prices.size(); t++) {
        value = prices[t] * alpha + value * (1.0 - alpha);
        out[t] = value;
    }
    return out;
}

std::vector<double> IndicatorEngine::rsi(const std::vector<double>& prices, size_t period) {
    if (period == 0) throw std::invalid_argument("RSI period must be positive");
    require_points("RSI", prices.size(), period + 1);

    std::vector<double> gains(prices.size(), 0.0);
    std::vector<double> losses(prices.size(), 0.0);
    for (size_t i = 1; i < prices.size(); i++) {
        double delta = prices[i] - prices[i - 1];
        if (delta > 0) gains[i] = delta;
        else losses[i] = -delta;
    }

    auto avg_gain = wilder_smooth(gains, period);
    auto avg_loss = wilder_smooth(losses, period);

    std::vector<double> out(prices.size(), kNaN);
    for (size_t t = period; t < prices.size(); t++) {
        if (avg_loss[t] == 0.0) {
            out[t] = 100.0;
            continue;
        }
        double rs = avg_gain[t] / avg_loss[t];
        out[t] = std::clamp(100.0 - 100.0 / (1.0 + rs), 0.0, 100.0);
    }
    return out;
}

MacdSeries IndicatorEngine::macd(const std::vector<double>& prices,
                                 size_t fast, size_t slow, size_t signal) {
    if (fast >= slow) throw std::invalid_argument("MACD fast period must be below slow period");
    require_points("MACD", prices.size(), slow);

    auto ema_fast = ema(prices, fast);
    auto ema_slow = ema(prices, slow);

    MacdSeries result;
    result.line.assign(prices.size(), kNaN);
    result.signal.assign(prices.size(), kNaN);
    result.histogram.assign(prices.size(), kNaN);

    const size_t first = slow - 1;
    for (size_t t = first; t < prices.size(); t++) {
        result.line[t] = ema_fast[t] - ema_slow[t];
    }

    // Signal line is an EMA over the defined part of the MACD line only.
    std::vector<double> defined(result.line.begin() + static_cast<std::ptrdiff_t>(first),
                                result.line.end());
    if (defined.size() < signal) {
        return result;
    }

    auto signal_tail = ema(defined, signal);
    for (size_t i = 0; i < signal_tail.size(); i++) {
        size_t t = first + i;
        result.signal[t] = signal_tail[i];
        if (!std::isnan(signal_tail[i])) {
            result.histogram[t] = result.line[t] - result.signal[t];
        }
    }
    return result;
}

BollingerSeries IndicatorEngine::bollinger(const std::vector<double>& prices,
                                           size_t period, double width) {
    if (period < 2) throw std::invalid_argument("Bollinger period must be at least 2");
    require_points("BB", prices.size(), period);

    BollingerSeries bands;
    bands.mid = sma(prices, period);
    bands.upper.assign(prices.size(), kNaN);
    bands.lower.assign(prices.size(), kNaN);

    for (size_t t = period - 1; t < prices.size(); t++) {
        const double mid = bands.mid[t];
        double var = 0.0;
        for (size_t i = t + 1 - period; i <= t; i++) {
            const double d = prices[i] - mid;
            var += d * d;
        }
        const double sd = std::sqrt(var / static_cast<double>(period - 1));
        bands.upper[t] = mid + width * sd;
        bands.lower[t] = mid - width * sd;
    }
    return bands;
}

std::vector<double> IndicatorEngine::atr(const std::vector<double>& highs,
                                         const std::vector<double>& lows,
                                         const std::vector<double>& closes,
                                         size_t period) {
    if (period == 0) throw std::invalid_argument("ATR period must be positive");
    if (highs.size() != closes.size() || lows.size() != closes.size()) {
        throw std::invalid_argument("ATR needs equally sized high, low and close series");
    }
    require_points("ATR", closes.size(), period + 1);

    std::vector<double> true_range(closes.size(), 0.0);
    for (size_t i = 1; i < closes.size(); i++) {
        const double prev_close = closes[i - 1];
        true_range[i] = std::max({highs[i] - lows[i],
                                  std::abs(highs[i] - prev_close),
                                  std::abs(lows[i] - prev_close)});
    }

    return wilder_smooth(true_range, period);
}

double IndicatorEngine::band_position(double price, double upper, double lower) {
    const double band_width = upper - lower;
    if (!(band_width > 0.0)) return 0.5;
    return std::clamp((price - lower) / band_width, 0.0, 1.0);
}

IndicatorSet IndicatorEngine::compute(const PriceSeries& series) {
    IndicatorSet set;
    const auto& closes = series.closes;

    auto degrade = [&set, &series](const InsufficientHistory& e) {
        set.degraded.push_back(e.indicator());
        spdlog::debug("{}: {} degraded ({})", series.symbol, e.indicator(), e.what());
    };

    try {
        set.rsi = last_defined(rsi(closes));
    } catch (const InsufficientHistory& e) {
        degrade(e);
    }

    try {
        auto m = macd(closes);
        if (!std::isnan(m.histogram.back())) {
            set.macd = MacdValue{m.line.back(), m.signal.back(), m.histogram.back()};
        } else {
            set.degraded.push_back("MACD");
            spdlog::debug("{}: MACD signal line not yet defined", series.symbol);
        }
    } catch (const InsufficientHistory& e) {
        degrade(e);
    }

    try {
        set.sma20 = last_defined(sma(closes, kBollingerPeriod));
    } catch (const InsufficientHistory& e) {
        degrade(e);
    }

    try {
        set.ema9 = last_defined(ema(closes, 9));
    } catch (const InsufficientHistory& e) {
        degrade(e);
    }

    try {
        set.ema21 = last_defined(ema(closes, 21));
    } catch (const InsufficientHistory& e) {
        degrade(e);
    }

    try {
        set.atr14 = last_defined(atr(series.highs, series.lows, closes));
    } catch (const InsufficientHistory& e) {
        degrade(e);
    }

    try {
        auto bands = bollinger(closes);
        set.bollinger = BollingerValue{bands.upper.back(), bands.mid.back(), bands.lower.back()};
        set.bb_position = band_position(closes.back(), bands.upper.back(), bands.lower.back());
    } catch (const InsufficientHistory& e) {
        degrade(e);
    }

    return set;
}
