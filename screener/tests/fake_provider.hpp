#pragma once

#include "../src/errors.hpp"
#include "../src/market_data.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Daily series with highs/lows one point either side of the close.
inline PriceSeries make_series(const std::string& symbol, const std::vector<double>& closes) {
    PriceSeries series;
    series.symbol = symbol;
    int64_t ts = 1700000000;
    for (double c : closes) {
        series.append(ts, c, c + 1.0, c - 1.0, c);
        ts += 86400;
    }
    return series;
}

inline std::vector<double> linear_closes(double start, double step, size_t count) {
    std::vector<double> closes;
    for (size_t i = 0; i < count; i++) {
        closes.push_back(start + step * static_cast<double>(i));
    }
    return closes;
}

// In-memory provider. Counts calls, can fail chosen symbols, and can hold
// every fetch until release() is called.
class FakeProvider : public MarketDataProvider {
public:
    void set_series(const std::string& symbol, const std::vector<double>& closes) {
        std::lock_guard<std::mutex> lock(mutex_);
        series_[symbol] = make_series(symbol, closes);
    }

    void fail_unavailable(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        unavailable_.insert(symbol);
    }

    void fail_fatal(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        fatal_.insert(symbol);
    }

    void clear_failures() {
        std::lock_guard<std::mutex> lock(mutex_);
        unavailable_.clear();
        fatal_.clear();
    }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    // Waits until at least one fetch is parked on the gate.
    bool wait_until_blocked(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return blocked_cv_.wait_for(lock, timeout, [this] { return waiting_ > 0; });
    }

    int calls(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_by_symbol_.find(symbol);
        return it == calls_by_symbol_.end() ? 0 : it->second;
    }

    int total_calls() const { return total_calls_; }

    PriceSeries fetch_daily(const std::string& symbol, int days) override {
        total_calls_++;

        std::unique_lock<std::mutex> lock(mutex_);
        calls_by_symbol_[symbol]++;

        if (held_) {
            waiting_++;
            blocked_cv_.notify_all();
            cv_.wait(lock, [this] { return !held_; });
            waiting_--;
        }

        if (fatal_.count(symbol)) {
            throw ProviderFatal(symbol + ": not found");
        }
        if (unavailable_.count(symbol)) {
            throw ProviderUnavailable(symbol + ": timed out");
        }

        auto it = series_.find(symbol);
        if (it == series_.end()) {
            throw ProviderFatal(symbol + ": no such symbol");
        }

        PriceSeries series = it->second;
        if (days > 0) series.keep_last(static_cast<size_t>(days));
        return series;
    }

    std::string name() const override { return "fake"; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable blocked_cv_;
    bool held_ = false;
    int waiting_ = 0;

    std::map<std::string, PriceSeries> series_;
    std::set<std::string> unavailable_;
    std::set<std::string> fatal_;
    std::map<std::string, int> calls_by_symbol_;
    std::atomic<int> total_calls_{0};
};
