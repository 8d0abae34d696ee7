#include "yahoo_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <thread>

YahooFinanceClient::YahooFinanceClient(const YahooClientOptions& options)
    : options_(options) {}

size_t YahooFinanceClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

std::string YahooFinanceClient::provider_symbol(const std::string& symbol) const {
    if (!symbol.empty() && symbol[0] == '^') return symbol;
    return symbol + options_.symbol_suffix;
}

std::string YahooFinanceClient::range_for(int days) {
    if (days <= 5) return "5d";
    if (days <= 21) return "1mo";
    if (days <= 63) return "3mo";
    if (days <= 126) return "6mo";
    if (days <= 252) return "1y";
    return "2y";
}

PriceSeries YahooFinanceClient::fetch_daily(const std::string& symbol, int days) {
    for (int attempt = 0;; attempt++) {
        try {
            return fetch_once(symbol, days);
        } catch (const ProviderUnavailable& e) {
            if (attempt >= options_.max_retries) {
                throw;
            }
            int backoff_ms = util::random_jitter(options_.backoff_ms_min, options_.backoff_ms_max) *
                             (attempt + 1);
            spdlog::debug("{}: attempt {} failed ({}), retrying in {}ms",
                          symbol, attempt + 1, e.what(), backoff_ms);
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        }
    }
}

PriceSeries YahooFinanceClient::fetch_once(const std::string& symbol, int days) {
    // One handle per request: fetches run concurrently from the refresh workers.
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw ProviderUnavailable("Failed to initialize CURL");
    }

    std::string ticker = provider_symbol(symbol);
    char* escaped = curl_easy_escape(curl.get(), ticker.c_str(), static_cast<int>(ticker.length()));
    std::string url = options_.base_url + "/v8/finance/chart/" + std::string(escaped) +
                      "?range=" + range_for(days) + "&interval=1d";
    curl_free(escaped);

    std::string response_string;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "Mozilla/5.0 (swingscout)");

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw ProviderUnavailable(ticker + ": " + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

    if (status == 404) {
        throw ProviderFatal(ticker + ": not found (HTTP 404)");
    }
    if (status != 200) {
        throw ProviderUnavailable(ticker + ": HTTP " + std::to_string(status));
    }

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(response_string);
    } catch (const nlohmann::json::exception& e) {
        throw ProviderUnavailable(ticker + ": unparsable response: " + e.what());
    }

    return parse_chart(symbol, payload, days);
}

PriceSeries YahooFinanceClient::parse_chart(const std::string& symbol,
                                            const nlohmann::json& payload, int days) {
    try {
        const auto& chart = payload.at("chart");

        if (chart.contains("error") && !chart["error"].is_null()) {
            const auto& err = chart["error"];
            std::string code = err.value("code", "");
            std::string description = err.value("description", "");
            if (code == "Not Found") {
                throw ProviderFatal(symbol + ": " + description);
            }
            throw ProviderUnavailable(symbol + ": " + code + " " + description);
        }

        const auto& results = chart.at("result");
        if (!results.is_array() || results.empty()) {
            throw ProviderFatal(symbol + ": no chart data");
        }

        const auto& result = results[0];
        if (!result.contains("timestamp") || result["timestamp"].empty()) {
            throw ProviderFatal(symbol + ": no bars returned");
        }

        const auto& timestamps = result["timestamp"];
        const auto& quote = result.at("indicators").at("quote").at(0);
        const auto& opens = quote.at("open");
        const auto& highs = quote.at("high");
        const auto& lows = quote.at("low");
        const auto& closes = quote.at("close");

        PriceSeries series;
        series.symbol = symbol;

        for (size_t i = 0; i < timestamps.size(); i++) {
            if (i >= closes.size() || i >= opens.size() || i >= highs.size() || i >= lows.size()) break;
            if (opens[i].is_null() || highs[i].is_null() || lows[i].is_null() || closes[i].is_null()) {
                continue;
            }
            series.append(timestamps[i].get<int64_t>(),
                          opens[i].get<double>(),
                          highs[i].get<double>(),
                          lows[i].get<double>(),
                          closes[i].get<double>());
        }

        if (series.empty()) {
            throw ProviderFatal(symbol + ": every bar was empty");
        }

        if (days > 0) series.keep_last(static_cast<size_t>(days));
        return series;

    } catch (const nlohmann::json::exception& e) {
        throw ProviderUnavailable(symbol + ": malformed chart payload: " + e.what());
    }
}
