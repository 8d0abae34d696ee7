#include "api_server.hpp"
#include "config.hpp"
#include "csv_provider.hpp"
#include "generation_builder.hpp"
#include "pg_store.hpp"
#include "redis_publisher.hpp"
#include "refresh_scheduler.hpp"
#include "universe.hpp"
#include "universe_cache.hpp"
#include "yahoo_client.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("swingscout", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

std::shared_ptr<MarketDataProvider> make_provider(const Config& config) {
    if (config.provider == "csv") {
        spdlog::info("Reading daily bars from {}", config.csv_data_dir);
        return std::make_shared<CsvDirectoryProvider>(config.csv_data_dir);
    }
    spdlog::info("Fetching daily bars from {}", config.yahoo_base_url);
    return std::make_shared<YahooFinanceClient>(config.yahoo_options());
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("Failed to initialize libcurl");
            return 1;
        }

        Universe universe = config.universe_file.empty()
            ? Universe::nifty50()
            : Universe::load_from_file(config.universe_file);
        spdlog::info("Universe: {} symbols", universe.size());

        UniverseCache cache(config.cache_ttl_seconds);
        GenerationBuilder builder(universe,
                                  make_provider(config),
                                  SnapshotBuilder(ScoringWeights(), config.strategy_params(),
                                                  static_cast<size_t>(config.history_days)),
                                  config.builder_options());
        RefreshScheduler scheduler(cache, builder, config.refresh_interval_seconds,
                                   static_cast<size_t>(config.top_picks));

        if (!config.redis_url.empty()) {
            auto redis = std::make_shared<RedisPublisher>(config.redis_url, config.redis_stream);
            if (!redis->ping()) {
                spdlog::error("Failed to connect to Redis");
                return 1;
            }
            scheduler.add_sink(redis);
        }

        if (!config.pg_dsn.empty()) {
            auto store = std::make_shared<PgSignalStore>(config.pg_dsn);
            if (!store->ping()) {
                spdlog::error("Failed to connect to Postgres");
                return 1;
            }
            store->init_schema();
            scheduler.add_sink(store);
        }

        ApiOptions api_options;
        api_options.listen_addr = config.listen_addr;
        api_options.listen_port = config.listen_port;
        api_options.data_source = config.data_source;
        api_options.top_picks = static_cast<size_t>(config.top_picks);
        ApiServer api(api_options, scheduler, cache);

        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        scheduler.start();
        api.start();

        spdlog::info("Entering main loop");
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutting down gracefully");
        api.stop();
        scheduler.stop();
        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
