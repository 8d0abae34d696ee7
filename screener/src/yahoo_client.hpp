#pragma once

#include "market_data.hpp"
#include <nlohmann/json.hpp>
#include <string>

struct YahooClientOptions {
    std::string base_url = "https://query1.finance.yahoo.com";
    std::string symbol_suffix = ".NS";  // not applied to index symbols ("^NSEI")
    int timeout_ms = 8000;
    int max_retries = 2;
    int backoff_ms_min = 250;
    int backoff_ms_max = 1500;
};

class YahooFinanceClient : public MarketDataProvider {
public:
    explicit YahooFinanceClient(const YahooClientOptions& options);

    PriceSeries fetch_daily(const std::string& symbol, int days) override;
    std::string name() const override { return "yahoo"; }

    // Ticker as Yahoo knows it, e.g. "RELIANCE" -> "RELIANCE.NS".
    std::string provider_symbol(const std::string& symbol) const;

    // Smallest chart range covering `days` trading sessions.
    static std::string range_for(int days);

    // Turns a v8 chart payload into a series. Bars with any null field are
    // skipped; only the last `days` bars are kept.
    static PriceSeries parse_chart(const std::string& symbol, const nlohmann::json& payload, int days);

private:
    YahooClientOptions options_;

    PriceSeries fetch_once(const std::string& symbol, int days);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
