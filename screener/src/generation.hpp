#pragma once

#include "snapshot.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Everything published by one refresh pass. Immutable once published; all
// snapshots share `built_at` as their `as_of`.
struct Generation {
    uint64_t sequence = 0;
    TimePoint built_at;

    std::vector<SnapshotPtr> snapshots;  // universe order
    std::unordered_map<std::string, SnapshotPtr> by_symbol;
    std::optional<IndexSnapshot> index;

    size_t fresh_count = 0;
    size_t stale_count = 0;
    size_t omitted_count = 0;

    // symbol -> reason for symbols that are stale or omitted
    std::map<std::string, std::string> errors;

    SnapshotPtr find(const std::string& symbol) const {
        auto it = by_symbol.find(symbol);
        return it == by_symbol.end() ? nullptr : it->second;
    }
};

using GenerationPtr = std::shared_ptr<const Generation>;
