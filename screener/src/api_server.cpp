#include "api_server.hpp"
#include "aggregator.hpp"
#include "json_codec.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

ApiServer::ApiServer(const ApiOptions& options, RefreshScheduler& scheduler, UniverseCache& cache)
    : options_(options)
    , scheduler_(scheduler)
    , cache_(cache)
    , server_(std::make_unique<httplib::Server>())
{}

void ApiServer::start() {
    if (running_) return;

    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{}",
                     options_.listen_addr, options_.listen_port);
        if (!server_->listen(options_.listen_addr.c_str(), options_.listen_port)) {
            spdlog::error("HTTP server failed to listen on {}:{}",
                          options_.listen_addr, options_.listen_port);
        }
    });

    spdlog::info("API server started");
}

void ApiServer::stop() {
    if (!running_) return;

    running_ = false;
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("API server stopped");
}

void ApiServer::reply(httplib::Response& res, const ApiResponse& response) {
    res.status = response.status;
    res.set_content(response.body.dump(), "application/json");
}

void ApiServer::setup_routes() {
    server_->set_default_headers({
        {"Access-Control-Allow-Origin", "*"}
    });

    // Wraps a handler so that any exception becomes a 500 JSON body.
    auto guarded = [](const char* route, auto handler) {
        return [route, handler](const httplib::Request& req, httplib::Response& res) {
            try {
                reply(res, handler(req));
            } catch (const std::exception& e) {
                spdlog::error("{} handler error: {}", route, e.what());
                reply(res, {500, {{"error", "internal error"}}});
            }
        };
    };

    server_->Get("/", guarded("/", [this](const httplib::Request&) {
        return root();
    }));

    server_->Get("/api/stocks", guarded("/api/stocks", [this](const httplib::Request&) {
        return stocks();
    }));

    server_->Get(R"(/api/stock/([^/]+))", guarded("/api/stock", [this](const httplib::Request& req) {
        return stock(req.matches[1].str());
    }));

    server_->Get("/api/health", guarded("/api/health", [this](const httplib::Request&) {
        return health();
    }));

    server_->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Methods", "GET, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        res.status = 204;
    });

    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            res.set_content(nlohmann::json{{"error", "not found"}}.dump(), "application/json");
        }
    });
}

ApiResponse ApiServer::root() const {
    return {200, {
        {"status", "ok"},
        {"message", "Nifty 50 swing signal screener"}
    }};
}

ApiResponse ApiServer::stocks() {
    auto generation = scheduler_.read();
    if (!generation) {
        return {503, {
            {"error", "Data is being fetched, try again shortly"},
            {"fetching", true}
        }};
    }

    auto summary = Aggregator::summarize(*generation, options_.top_picks);
    return {200, json_codec::stocks_response(*generation, summary,
                                             cache_.seconds_until_stale(),
                                             options_.data_source,
                                             cache_.expired())};
}

ApiResponse ApiServer::stock(const std::string& symbol) {
    std::string key = symbol;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto generation = scheduler_.read();
    if (!generation) {
        return {503, {
            {"error", "Data is being fetched, try again shortly"},
            {"fetching", true}
        }};
    }

    auto snap = generation->find(key);
    if (!snap) {
        return {404, {{"error", "Stock " + key + " not found"}}};
    }
    return {200, json_codec::snapshot(*snap)};
}

ApiResponse ApiServer::health() const {
    auto h = cache_.health();
    // Only an empty cache after a failed refresh is unhealthy; stale data is still served.
    int status = (h.sequence == 0 && !h.last_refresh_ok && !h.refreshing) ? 503 : 200;
    return {status, json_codec::health(h)};
}
