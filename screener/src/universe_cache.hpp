#pragma once

#include "generation.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

enum class CacheState {
    Empty,
    Fresh,
    Stale,
    Refreshing
};

std::string to_string(CacheState state);

struct CacheHealth {
    CacheState state = CacheState::Empty;
    bool refreshing = false;
    bool last_refresh_ok = true;
    std::optional<double> age_seconds;
    size_t symbol_count = 0;
    uint64_t sequence = 0;
    uint64_t refreshes = 0;
    uint64_t failures = 0;
    std::string last_error;
    std::optional<TimePoint> last_error_at;
    std::optional<TimePoint> built_at;
};

// Holds the current generation. Readers copy the pointer and never wait for a
// refresh; a refresh goes through begin_refresh() so that at most one is in
// flight, and ends with either publish() or fail_refresh().
class UniverseCache {
public:
    explicit UniverseCache(int ttl_seconds);

    GenerationPtr current() const;
    CacheState state() const;

    // True when the current generation is older than the TTL (or absent).
    bool expired() const;

    // Seconds until the current generation turns stale; 0 if already stale.
    int seconds_until_stale() const;

    // Single-flight gate. Returns false if a refresh is already in flight.
    bool begin_refresh();
    void publish(GenerationPtr generation);
    void fail_refresh(const std::string& error);

    CacheHealth health() const;

private:
    using SteadyClock = std::chrono::steady_clock;

    int ttl_seconds_;

    mutable std::mutex mutex_;
    GenerationPtr current_;
    SteadyClock::time_point published_at_;
    bool refreshing_ = false;
    bool last_refresh_ok_ = true;
    uint64_t refreshes_ = 0;
    uint64_t failures_ = 0;
    std::string last_error_;
    std::optional<TimePoint> last_error_at_;

    double age_seconds_locked() const;
    bool expired_locked() const;
    CacheState state_locked() const;
};
