#pragma once

#include "generation_builder.hpp"
#include "generation_sink.hpp"
#include "universe_cache.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// Owns refresh execution. A single thread runs passes on a fixed interval or
// when asked; requests made while one is pending or in flight are folded into it.
class RefreshScheduler {
public:
    RefreshScheduler(UniverseCache& cache, GenerationBuilder& builder,
                     int interval_seconds, size_t top_picks = 5);
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    void add_sink(std::shared_ptr<GenerationSink> sink);

    void start(bool refresh_immediately = true);
    void stop();
    bool is_running() const { return running_; }

    // Returns false when the cache is fresh or the request was coalesced into a
    // pending/in-flight pass.
    bool request_refresh();

    // Current generation; asks for a refresh if the cache is empty or stale.
    GenerationPtr read();

    // One synchronous pass. False if another pass was in flight or the pass failed.
    bool run_once();

    uint64_t passes() const { return passes_; }

private:
    UniverseCache& cache_;
    GenerationBuilder& builder_;
    int interval_seconds_;
    size_t top_picks_;
    std::vector<std::shared_ptr<GenerationSink>> sinks_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool requested_ = false;
    bool stopping_ = false;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> passes_{0};
    std::thread thread_;

    void loop();
    bool execute_pass();
    void notify_sinks(const Generation& generation);
};
