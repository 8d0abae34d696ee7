#include "refresh_scheduler.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

RefreshScheduler::RefreshScheduler(UniverseCache& cache, GenerationBuilder& builder,
                                   int interval_seconds, size_t top_picks)
    : cache_(cache)
    , builder_(builder)
    , interval_seconds_(interval_seconds)
    , top_picks_(top_picks)
{
    if (interval_seconds <= 0) {
        throw std::invalid_argument("refresh interval must be positive");
    }
}

RefreshScheduler::~RefreshScheduler() {
    stop();
}

void RefreshScheduler::add_sink(std::shared_ptr<GenerationSink> sink) {
    spdlog::info("Registered generation sink: {}", sink->name());
    sinks_.push_back(std::move(sink));
}

void RefreshScheduler::start(bool refresh_immediately) {
    if (running_) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        if (refresh_immediately) requested_ = true;
    }

    running_ = true;
    thread_ = std::thread(&RefreshScheduler::loop, this);
    spdlog::info("Refresh scheduler started (every {}s)", interval_seconds_);
}

void RefreshScheduler::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
    spdlog::info("Refresh scheduler stopped");
}

bool RefreshScheduler::request_refresh() {
    std::lock_guard<std::mutex> lock(mutex_);
    // A pass may have published since the caller looked at the cache.
    auto state = cache_.state();
    if (requested_ || (state != CacheState::Empty && state != CacheState::Stale)) {
        return false;
    }
    requested_ = true;
    cv_.notify_one();
    return true;
}

GenerationPtr RefreshScheduler::read() {
    auto state = cache_.state();
    if (state == CacheState::Empty || state == CacheState::Stale) {
        if (request_refresh()) {
            spdlog::debug("Read found cache {}, refresh requested", to_string(state));
        }
    }
    return cache_.current();
}

bool RefreshScheduler::run_once() {
    if (!cache_.begin_refresh()) {
        return false;
    }
    return execute_pass();
}

void RefreshScheduler::loop() {
    while (true) {
        bool started = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::seconds(interval_seconds_),
                         [this] { return requested_ || stopping_; });
            if (stopping_) break;

            // Claim the pass before clearing the request so that readers
            // arriving in between see Refreshing and do not queue another.
            started = cache_.begin_refresh();
            requested_ = false;
        }

        if (started) {
            execute_pass();
        }
    }
}

bool RefreshScheduler::execute_pass() {
    passes_++;

    auto previous = cache_.current();
    uint64_t sequence = previous ? previous->sequence + 1 : 1;

    GenerationPtr generation;
    try {
        generation = builder_.build(previous, sequence);
    } catch (const RefreshFailed& e) {
        spdlog::error("Refresh failed, keeping generation #{}: {}",
                      previous ? previous->sequence : 0, e.what());
        cache_.fail_refresh(e.what());
        return false;
    } catch (const std::exception& e) {
        spdlog::error("Refresh aborted: {}", e.what());
        cache_.fail_refresh(e.what());
        return false;
    }

    cache_.publish(generation);
    notify_sinks(*generation);
    return true;
}

void RefreshScheduler::notify_sinks(const Generation& generation) {
    if (sinks_.empty()) return;

    auto summary = Aggregator::summarize(generation, top_picks_);
    for (const auto& sink : sinks_) {
        try {
            sink->on_generation(generation, summary);
        } catch (const std::exception& e) {
            spdlog::error("Sink {} failed for generation #{}: {}",
                          sink->name(), generation.sequence, e.what());
        }
    }
}
