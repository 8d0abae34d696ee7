#pragma once

#include "refresh_scheduler.hpp"
#include "universe_cache.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

struct ApiOptions {
    std::string listen_addr = "0.0.0.0";
    int listen_port = 8000;
    std::string data_source = "Yahoo Finance (NSE ~15min delayed)";
    size_t top_picks = 5;
};

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

// Read-only HTTP surface over the universe cache. Handlers never wait for a
// refresh; they answer from whatever generation is current.
class ApiServer {
public:
    ApiServer(const ApiOptions& options, RefreshScheduler& scheduler, UniverseCache& cache);

    void start();
    void stop();
    bool is_running() const { return running_; }

    ApiResponse root() const;
    ApiResponse stocks();
    ApiResponse stock(const std::string& symbol);
    ApiResponse health() const;

private:
    ApiOptions options_;
    RefreshScheduler& scheduler_;
    UniverseCache& cache_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;

    void setup_routes();
    static void reply(httplib::Response& res, const ApiResponse& response);
};
