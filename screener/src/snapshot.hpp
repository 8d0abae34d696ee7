#pragma once

#include "indicators.hpp"
#include "scoring.hpp"
#include "strategy.hpp"
#include "universe.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using TimePoint = std::chrono::system_clock::time_point;

// One symbol's view for one generation. Never modified after construction;
// a refresh produces new snapshots.
struct Snapshot {
    std::string symbol;
    std::string sector;
    double price = 0.0;
    double change_1d_pct = 0.0;
    double change_5d_pct = 0.0;
    std::vector<double> price_history;

    IndicatorSet indicators;
    Signal signal;
    StrategyRecommendation strategy;

    TimePoint as_of;       // generation stamp
    TimePoint data_as_of;  // when the underlying bars were fetched
    bool stale = false;    // carried over from an earlier generation
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

struct IndexSnapshot {
    std::string symbol;
    double price = 0.0;
    double change = 0.0;
    double change_pct = 0.0;
    TimePoint as_of;
    TimePoint data_as_of;
    bool stale = false;
};

class SnapshotBuilder {
public:
    SnapshotBuilder(const ScoringWeights& weights = ScoringWeights(),
                    const StrategyParams& strategy_params = StrategyParams(),
                    size_t history_points = 60);

    // Throws InsufficientHistory when the series has no closes at all.
    SnapshotPtr build(const UniverseMember& member, const PriceSeries& series,
                      TimePoint as_of) const;

    // Copy of `previous` re-stamped into a new generation and flagged stale.
    static SnapshotPtr restamp_stale(const Snapshot& previous, TimePoint as_of);

    static IndexSnapshot build_index(const std::string& symbol, const PriceSeries& series,
                                     TimePoint as_of);

    const StrategySelector& selector() const { return selector_; }

private:
    SignalScorer scorer_;
    StrategySelector selector_;
    size_t history_points_;
};
