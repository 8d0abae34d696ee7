#include "aggregator.hpp"
#include <algorithm>
#include <cmath>

namespace {

bool ranks_higher(const SnapshotPtr& a, const SnapshotPtr& b) {
    if (a->signal.confidence != b->signal.confidence) {
        return a->signal.confidence > b->signal.confidence;
    }
    double abs_a = std::abs(a->signal.score);
    double abs_b = std::abs(b->signal.score);
    if (abs_a != abs_b) return abs_a > abs_b;
    return a->symbol < b->symbol;
}

void keep_top(std::vector<SnapshotPtr>& picks, size_t top_n) {
    std::sort(picks.begin(), picks.end(), ranks_higher);
    if (picks.size() > top_n) picks.resize(top_n);
}

} // namespace

UniverseSummary Aggregator::summarize(const Generation& generation, size_t top_n) {
    UniverseSummary summary;

    for (const auto& snap : generation.snapshots) {
        auto& sector = summary.sectors[snap->sector];
        switch (snap->signal.direction) {
            case Direction::Long:
                summary.longs++;
                sector.longs++;
                summary.top_longs.push_back(snap);
                break;
            case Direction::Short:
                summary.shorts++;
                sector.shorts++;
                summary.top_shorts.push_back(snap);
                break;
            case Direction::Neutral:
                summary.neutrals++;
                sector.neutrals++;
                break;
        }
        if (snap->stale) summary.stale++;
    }

    summary.total = static_cast<int>(generation.snapshots.size());
    if (summary.total > 0) {
        const double total = static_cast<double>(summary.total);
        summary.long_pct = summary.longs * 100.0 / total;
        summary.short_pct = summary.shorts * 100.0 / total;
        summary.neutral_pct = summary.neutrals * 100.0 / total;
    }

    keep_top(summary.top_longs, top_n);
    keep_top(summary.top_shorts, top_n);

    return summary;
}
