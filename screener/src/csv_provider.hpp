#pragma once

#include "market_data.hpp"
#include <string>

// Reads daily bars from "<dir>/<SYMBOL>.csv" with a header row of
// Date,Open,High,Low,Close[,Volume]. Dates are YYYY-MM-DD, oldest first.
class CsvDirectoryProvider : public MarketDataProvider {
public:
    explicit CsvDirectoryProvider(const std::string& directory);

    PriceSeries fetch_daily(const std::string& symbol, int days) override;
    std::string name() const override { return "csv"; }

    static int64_t parse_date(const std::string& date);

private:
    std::string directory_;
};
