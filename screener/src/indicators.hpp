#pragma once

#include "market_data.hpp"
#include <optional>
#include <string>
#include <vector>

struct MacdSeries {
    std::vector<double> line;
    std::vector<double> signal;
    std::vector<double> histogram;
};

struct BollingerSeries {
    std::vector<double> upper;
    std::vector<double> mid;
    std::vector<double> lower;
};

struct MacdValue {
    double line;
    double signal;
    double histogram;
};

struct BollingerValue {
    double upper;
    double mid;
    double lower;
};

// Latest-bar indicator values for one symbol. An indicator whose lookback is
// not satisfied is left empty and named in `degraded`.
struct IndicatorSet {
    std::optional<double> rsi;
    std::optional<MacdValue> macd;
    std::optional<double> sma20;
    std::optional<double> ema9;
    std::optional<double> ema21;
    std::optional<double> atr14;
    std::optional<BollingerValue> bollinger;
    std::optional<double> bb_position;

    std::vector<std::string> degraded;

    bool all_degraded() const {
        return !rsi && !macd && !sma20 && !ema9 && !ema21 && !atr14 && !bollinger;
    }
};

// Pure indicator math. Series functions return one value per input point, NaN
// until the lookback is satisfied, and throw InsufficientHistory when the input
// is shorter than the minimum window.
class IndicatorEngine {
public:
    static constexpr size_t kRsiPeriod = 14;
    static constexpr size_t kMacdFast = 12;
    static constexpr size_t kMacdSlow = 26;
    static constexpr size_t kMacdSignal = 9;
    static constexpr size_t kBollingerPeriod = 20;
    static constexpr double kBollingerWidth = 2.0;
    static constexpr size_t kAtrPeriod = 14;

    static std::vector<double> sma(const std::vector<double>& prices, size_t period);
    static std::vector<double> ema(const std::vector<double>& prices, size_t period);
    static std::vector<double> rsi(const std::vector<double>& prices, size_t period = kRsiPeriod);

    static MacdSeries macd(const std::vector<double>& prices,
                           size_t fast = kMacdFast,
                           size_t slow = kMacdSlow,
                           size_t signal = kMacdSignal);

    // Sample standard deviation over the same window as the middle band.
    static BollingerSeries bollinger(const std::vector<double>& prices,
                                     size_t period = kBollingerPeriod,
                                     double width = kBollingerWidth);

    static std::vector<double> atr(const std::vector<double>& highs,
                                   const std::vector<double>& lows,
                                   const std::vector<double>& closes,
                                   size_t period = kAtrPeriod);

    // (price - lower) / (upper - lower) clamped to [0, 1]; 0.5 for a flat band.
    static double band_position(double price, double upper, double lower);

    static IndicatorSet compute(const PriceSeries& series);
};
