#include "universe_cache.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

std::string to_string(CacheState state) {
    switch (state) {
        case CacheState::Empty: return "empty";
        case CacheState::Fresh: return "fresh";
        case CacheState::Stale: return "stale";
        case CacheState::Refreshing: return "refreshing";
    }
    return "empty";
}

UniverseCache::UniverseCache(int ttl_seconds) : ttl_seconds_(ttl_seconds) {
    if (ttl_seconds < 0) {
        throw std::invalid_argument("cache TTL must not be negative");
    }
}

double UniverseCache::age_seconds_locked() const {
    return std::chrono::duration<double>(SteadyClock::now() - published_at_).count();
}

bool UniverseCache::expired_locked() const {
    if (!current_) return true;
    return age_seconds_locked() >= static_cast<double>(ttl_seconds_);
}

CacheState UniverseCache::state_locked() const {
    if (refreshing_) return CacheState::Refreshing;
    if (!current_) return CacheState::Empty;
    return expired_locked() ? CacheState::Stale : CacheState::Fresh;
}

GenerationPtr UniverseCache::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

CacheState UniverseCache::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_locked();
}

bool UniverseCache::expired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return expired_locked();
}

int UniverseCache::seconds_until_stale() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_) return 0;
    double remaining = static_cast<double>(ttl_seconds_) - age_seconds_locked();
    return remaining > 0 ? static_cast<int>(std::ceil(remaining)) : 0;
}

bool UniverseCache::begin_refresh() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (refreshing_) {
        spdlog::debug("Refresh already in flight, coalescing");
        return false;
    }
    refreshing_ = true;
    return true;
}

void UniverseCache::publish(GenerationPtr generation) {
    if (!generation) {
        throw std::invalid_argument("cannot publish an empty generation");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(generation);
    published_at_ = SteadyClock::now();
    refreshing_ = false;
    last_refresh_ok_ = true;
    refreshes_++;
}

void UniverseCache::fail_refresh(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshing_ = false;
    last_refresh_ok_ = false;
    failures_++;
    last_error_ = error;
    last_error_at_ = std::chrono::system_clock::now();
}

CacheHealth UniverseCache::health() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheHealth h;
    h.state = state_locked();
    h.refreshing = refreshing_;
    h.last_refresh_ok = last_refresh_ok_;
    h.refreshes = refreshes_;
    h.failures = failures_;
    h.last_error = last_error_;
    h.last_error_at = last_error_at_;

    if (current_) {
        h.age_seconds = age_seconds_locked();
        h.symbol_count = current_->snapshots.size();
        h.sequence = current_->sequence;
        h.built_at = current_->built_at;
    }
    return h;
}
