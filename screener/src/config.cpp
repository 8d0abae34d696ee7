#include "config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8000);

    cfg.cache_ttl_seconds = get_env_int("CACHE_TTL_SECONDS", 120);
    cfg.refresh_interval_seconds = get_env_int("REFRESH_INTERVAL_SECONDS", cfg.cache_ttl_seconds);
    cfg.history_days = get_env_int("HISTORY_DAYS", 60);
    cfg.worker_threads = get_env_int("WORKER_THREADS", 8);

    cfg.provider = get_env("PROVIDER", "yahoo");
    cfg.yahoo_base_url = get_env("YAHOO_BASE_URL", "https://query1.finance.yahoo.com");
    cfg.symbol_suffix = get_env("SYMBOL_SUFFIX", ".NS");
    cfg.index_symbol = get_env("INDEX_SYMBOL", "^NSEI");
    cfg.csv_data_dir = get_env("CSV_DATA_DIR", "data");
    cfg.universe_file = get_env("UNIVERSE_FILE");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);
    cfg.max_retries = get_env_int("MAX_RETRIES", 2);
    cfg.retry_backoff_ms_min = get_env_int("RETRY_BACKOFF_MS_MIN", 250);
    cfg.retry_backoff_ms_max = get_env_int("RETRY_BACKOFF_MS_MAX", 1500);

    cfg.confidence_threshold = get_env_int("CONFIDENCE_THRESHOLD", 70);
    cfg.spread_offset_pct = get_env_double("SPREAD_OFFSET_PCT", 3.0);
    cfg.condor_short_pct = get_env_double("CONDOR_SHORT_PCT", 2.5);
    cfg.condor_wing_pct = get_env_double("CONDOR_WING_PCT", 4.0);
    cfg.top_picks = get_env_int("TOP_PICKS", 5);

    cfg.data_source = get_env("DATA_SOURCE", "Yahoo Finance (NSE ~15min delayed)");

    cfg.redis_url = get_env("REDIS_URL");
    cfg.redis_stream = get_env("REDIS_STREAM", "swing.generations");
    cfg.pg_dsn = get_env("PG_DSN");

    cfg.service_name = get_env("SERVICE_NAME", "swingscout");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (provider != "yahoo" && provider != "csv") {
        throw std::runtime_error("PROVIDER must be 'yahoo' or 'csv', got '" + provider + "'");
    }
    if (cache_ttl_seconds <= 0) {
        throw std::runtime_error("CACHE_TTL_SECONDS must be positive");
    }
    if (refresh_interval_seconds <= 0) {
        throw std::runtime_error("REFRESH_INTERVAL_SECONDS must be positive");
    }
    if (history_days < 1) {
        throw std::runtime_error("HISTORY_DAYS must be at least 1");
    }
    if (worker_threads < 1) {
        throw std::runtime_error("WORKER_THREADS must be at least 1");
    }
    if (max_retries < 0) {
        throw std::runtime_error("MAX_RETRIES must not be negative");
    }
    if (retry_backoff_ms_min < 0 || retry_backoff_ms_max < retry_backoff_ms_min) {
        throw std::runtime_error("RETRY_BACKOFF_MS_MIN/MAX must satisfy 0 <= min <= max");
    }
    if (confidence_threshold < 0 || confidence_threshold > 100) {
        throw std::runtime_error("CONFIDENCE_THRESHOLD must be within 0..100");
    }
    if (condor_wing_pct <= condor_short_pct) {
        throw std::runtime_error("CONDOR_WING_PCT must exceed CONDOR_SHORT_PCT");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Provider: {} (history {}d, {} workers)", provider, history_days, worker_threads);
    spdlog::info("  Cache TTL: {}s, refresh every {}s", cache_ttl_seconds, refresh_interval_seconds);
    spdlog::info("  Spread threshold: confidence > {}", confidence_threshold);
}

BuilderOptions Config::builder_options() const {
    BuilderOptions options;
    options.history_days = history_days;
    options.worker_threads = worker_threads;
    options.index_symbol = index_symbol;
    return options;
}

YahooClientOptions Config::yahoo_options() const {
    YahooClientOptions options;
    options.base_url = yahoo_base_url;
    options.symbol_suffix = symbol_suffix;
    options.timeout_ms = request_timeout_ms;
    options.max_retries = max_retries;
    options.backoff_ms_min = retry_backoff_ms_min;
    options.backoff_ms_max = retry_backoff_ms_max;
    return options;
}

StrategyParams Config::strategy_params() const {
    StrategyParams params;
    params.confidence_threshold = confidence_threshold;
    params.spread_offset_pct = spread_offset_pct;
    params.condor_short_pct = condor_short_pct;
    params.condor_wing_pct = condor_wing_pct;
    return params;
}
