#pragma once

#include "generation.hpp"
#include <map>
#include <string>
#include <vector>

struct SectorBreadth {
    int longs = 0;
    int shorts = 0;
    int neutrals = 0;
};

struct UniverseSummary {
    int longs = 0;
    int shorts = 0;
    int neutrals = 0;
    int stale = 0;
    int total = 0;

    // Shares of `total`, in percent.
    double long_pct = 0.0;
    double short_pct = 0.0;
    double neutral_pct = 0.0;

    std::vector<SnapshotPtr> top_longs;
    std::vector<SnapshotPtr> top_shorts;
    std::map<std::string, SectorBreadth> sectors;
};

class Aggregator {
public:
    // Top picks are ordered by confidence, then |score|, then symbol.
    static UniverseSummary summarize(const Generation& generation, size_t top_n = 5);
};
