#pragma once

#include <string>
#include <vector>
#include <cstdint>

// Daily bars for one symbol, oldest first. All vectors have the same length.
struct PriceSeries {
    std::string symbol;
    std::vector<int64_t> timestamps;  // session open, epoch seconds
    std::vector<double> opens;
    std::vector<double> highs;
    std::vector<double> lows;
    std::vector<double> closes;

    size_t size() const { return closes.size(); }
    bool empty() const { return closes.empty(); }

    void append(int64_t ts, double open, double high, double low, double close) {
        timestamps.push_back(ts);
        opens.push_back(open);
        highs.push_back(high);
        lows.push_back(low);
        closes.push_back(close);
    }

    // Keep only the most recent n bars.
    void keep_last(size_t n);
};

inline void PriceSeries::keep_last(size_t n) {
    if (closes.size() <= n) return;
    auto drop = static_cast<std::ptrdiff_t>(closes.size() - n);
    timestamps.erase(timestamps.begin(), timestamps.begin() + drop);
    opens.erase(opens.begin(), opens.begin() + drop);
    highs.erase(highs.begin(), highs.begin() + drop);
    lows.erase(lows.begin(), lows.begin() + drop);
    closes.erase(closes.begin(), closes.begin() + drop);
}

// Source of daily OHLC history. Implementations throw ProviderUnavailable for
// transient failures and ProviderFatal for unknown symbols. Must be safe to
// call from several threads at once.
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    virtual PriceSeries fetch_daily(const std::string& symbol, int days) = 0;
    virtual std::string name() const = 0;
};
