#include "snapshot.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

double pct_change(double now, double then) {
    if (then == 0.0) return 0.0;
    return (now - then) / then * 100.0;
}

} // namespace

SnapshotBuilder::SnapshotBuilder(const ScoringWeights& weights,
                                 const StrategyParams& strategy_params,
                                 size_t history_points)
    : scorer_(weights)
    , selector_(strategy_params)
    , history_points_(history_points)
{}

SnapshotPtr SnapshotBuilder::build(const UniverseMember& member, const PriceSeries& series,
                                   TimePoint as_of) const {
    if (series.empty()) {
        throw InsufficientHistory("price series for " + member.symbol, 0, 1);
    }

    const auto& closes = series.closes;
    const size_t n = closes.size();

    auto snap = std::make_shared<Snapshot>();
    snap->symbol = member.symbol;
    snap->sector = member.sector;
    snap->price = closes.back();
    snap->change_1d_pct = n > 1 ? pct_change(closes[n - 1], closes[n - 2]) : 0.0;
    snap->change_5d_pct = n > 5 ? pct_change(closes[n - 1], closes[n - 6]) : 0.0;

    const size_t keep = std::min(n, history_points_);
    snap->price_history.assign(closes.end() - static_cast<std::ptrdiff_t>(keep), closes.end());

    snap->indicators = IndicatorEngine::compute(series);
    snap->signal = scorer_.score(snap->indicators, snap->price);

    PricingContext ctx;
    ctx.symbol = member.symbol;
    ctx.price = snap->price;
    ctx.atr = snap->indicators.atr14.value_or(0.0);
    ctx.expiry = util::next_weekly_expiry(as_of);
    snap->strategy = selector_.recommend(snap->signal.direction, snap->signal.confidence, ctx);

    snap->as_of = as_of;
    snap->data_as_of = as_of;
    snap->stale = false;

    if (!snap->indicators.degraded.empty()) {
        spdlog::debug("{} built with {} degraded indicators", member.symbol,
                      snap->indicators.degraded.size());
    }

    return snap;
}

SnapshotPtr SnapshotBuilder::restamp_stale(const Snapshot& previous, TimePoint as_of) {
    auto snap = std::make_shared<Snapshot>(previous);
    snap->as_of = as_of;
    snap->stale = true;
    return snap;
}

IndexSnapshot SnapshotBuilder::build_index(const std::string& symbol, const PriceSeries& series,
                                           TimePoint as_of) {
    if (series.empty()) {
        throw InsufficientHistory("index series for " + symbol, 0, 1);
    }

    const auto& closes = series.closes;
    const double price = closes.back();
    const double prev = closes.size() > 1 ? closes[closes.size() - 2] : price;

    IndexSnapshot index;
    index.symbol = symbol;
    index.price = price;
    index.change = price - prev;
    index.change_pct = pct_change(price, prev);
    index.as_of = as_of;
    index.data_as_of = as_of;
    index.stale = false;
    return index;
}
