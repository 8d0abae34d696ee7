#pragma once

#include "generation_builder.hpp"
#include "strategy.hpp"
#include "yahoo_client.hpp"
#include <string>
#include <cstdlib>

struct Config {
    // HTTP
    std::string listen_addr;
    int listen_port;

    // Cache / refresh
    int cache_ttl_seconds;
    int refresh_interval_seconds;
    int history_days;
    int worker_threads;

    // Market data
    std::string provider;
    std::string yahoo_base_url;
    std::string symbol_suffix;
    std::string index_symbol;
    std::string csv_data_dir;
    std::string universe_file;
    int request_timeout_ms;
    int max_retries;
    int retry_backoff_ms_min;
    int retry_backoff_ms_max;

    // Strategy
    int confidence_threshold;
    double spread_offset_pct;
    double condor_short_pct;
    double condor_wing_pct;
    int top_picks;

    std::string data_source;

    // Optional sinks
    std::string redis_url;
    std::string redis_stream;
    std::string pg_dsn;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

    BuilderOptions builder_options() const;
    YahooClientOptions yahoo_options() const;
    StrategyParams strategy_params() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
