#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/snapshot.hpp"
#include "../src/errors.hpp"
#include "../src/util.hpp"
#include "fake_provider.hpp"
#include <algorithm>

using Catch::Approx;

namespace {

// Thursday 2026-10-15 10:00 UTC
const TimePoint kThursday = std::chrono::system_clock::from_time_t(1792058400);

bool has_reason(const Signal& signal, const std::string& reason) {
    return std::find(signal.reasons.begin(), signal.reasons.end(), reason) != signal.reasons.end();
}

} // namespace

TEST_CASE("Weekly expiry", "[snapshot]") {
    REQUIRE(util::next_weekly_expiry(kThursday) == "22 Oct '26");
    REQUIRE(util::next_weekly_expiry(kThursday - std::chrono::hours(72)) == "15 Oct '26");
    REQUIRE(util::next_weekly_expiry(kThursday + std::chrono::hours(24)) == "22 Oct '26");
}

TEST_CASE("Snapshot building", "[snapshot]") {
    SnapshotBuilder builder;
    UniverseMember member{"TCS", "IT"};

    SECTION("Price fields come from the last closes") {
        auto snap = builder.build(member, make_series("TCS", linear_closes(100, 1, 60)), kThursday);
        REQUIRE(snap->symbol == "TCS");
        REQUIRE(snap->sector == "IT");
        REQUIRE(snap->price == 159.0);
        REQUIRE(snap->change_1d_pct == Approx(100.0 / 158.0));
        REQUIRE(snap->change_5d_pct == Approx(500.0 / 154.0));
        REQUIRE(snap->price_history.size() == 60);
        REQUIRE(snap->price_history.back() == 159.0);
        REQUIRE(snap->as_of == kThursday);
        REQUIRE(snap->data_as_of == kThursday);
        REQUIRE_FALSE(snap->stale);
        REQUIRE(snap->indicators.degraded.empty());
    }

    SECTION("Price history is capped") {
        SnapshotBuilder short_history(ScoringWeights(), StrategyParams(), 30);
        auto snap = short_history.build(member, make_series("TCS", linear_closes(100, 1, 60)), kThursday);
        REQUIRE(snap->price_history.size() == 30);
        REQUIRE(snap->price_history.front() == 130.0);
    }

    SECTION("Strategy follows the signal and expires next Thursday") {
        auto snap = builder.build(member, make_series("TCS", linear_closes(100, 1, 60)), kThursday);
        auto expected = builder.selector().select(snap->signal.direction, snap->signal.confidence);
        REQUIRE(snap->strategy.kind == expected);
        auto expiry = std::visit([](const auto& s) { return s.expiry; }, snap->strategy.legs);
        REQUIRE(expiry == "22 Oct '26");
    }

    SECTION("Single bar still builds, with everything degraded") {
        auto snap = builder.build(member, make_series("TCS", {250.0}), kThursday);
        REQUIRE(snap->price == 250.0);
        REQUIRE(snap->change_1d_pct == 0.0);
        REQUIRE(snap->indicators.all_degraded());
        REQUIRE(snap->signal.direction == Direction::Neutral);
        REQUIRE(snap->strategy.kind == StrategyKind::IronCondor);
    }

    SECTION("Empty series is rejected") {
        PriceSeries empty;
        REQUIRE_THROWS_AS(builder.build(member, empty, kThursday), InsufficientHistory);
    }
}

TEST_CASE("Thirty-day uptrend end to end", "[snapshot]") {
    SnapshotBuilder builder;
    auto series = make_series("INFY", linear_closes(100, 1, 30));
    auto snap = builder.build(UniverseMember{"INFY", "IT"}, series, kThursday);

    REQUIRE(snap->indicators.rsi.has_value());
    REQUIRE(*snap->indicators.rsi > 65.0);
    REQUIRE(*snap->indicators.ema9 > *snap->indicators.ema21);
    REQUIRE(has_reason(snap->signal, "9EMA above 21EMA"));
    REQUIRE(snap->signal.direction != Direction::Neutral);
    REQUIRE(snap->signal.confidence > 0);

    // 30 bars define the MACD line but not its signal line
    REQUIRE_FALSE(snap->indicators.macd.has_value());
    REQUIRE(snap->indicators.degraded == std::vector<std::string>{"MACD"});
}

TEST_CASE("Carrying a snapshot into a later generation", "[snapshot]") {
    SnapshotBuilder builder;
    auto original = builder.build(UniverseMember{"ITC", "FMCG"},
                                  make_series("ITC", linear_closes(400, -0.5, 60)), kThursday);

    auto later = kThursday + std::chrono::minutes(2);
    auto carried = SnapshotBuilder::restamp_stale(*original, later);

    REQUIRE(carried->stale);
    REQUIRE(carried->as_of == later);
    REQUIRE(carried->data_as_of == kThursday);
    REQUIRE(carried->price == original->price);
    REQUIRE(carried->signal.score == original->signal.score);
    REQUIRE_FALSE(original->stale);
    REQUIRE(original->as_of == kThursday);
}

TEST_CASE("Index snapshot", "[snapshot]") {
    auto index = SnapshotBuilder::build_index("^NSEI", make_series("^NSEI", {24000.0, 24240.0}), kThursday);
    REQUIRE(index.symbol == "^NSEI");
    REQUIRE(index.price == 24240.0);
    REQUIRE(index.change == Approx(240.0));
    REQUIRE(index.change_pct == Approx(1.0));
    REQUIRE_FALSE(index.stale);
}
