#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/aggregator.hpp"

using Catch::Approx;

namespace {

SnapshotPtr snap(const std::string& symbol, const std::string& sector,
                 Direction direction, int confidence, double score, bool stale = false) {
    auto s = std::make_shared<Snapshot>();
    s->symbol = symbol;
    s->sector = sector;
    s->signal.direction = direction;
    s->signal.confidence = confidence;
    s->signal.score = score;
    s->stale = stale;
    return s;
}

Generation seven_symbols() {
    Generation gen;
    gen.sequence = 4;
    gen.snapshots = {
        snap("TCS", "IT", Direction::Long, 50, 3.5),
        snap("INFY", "IT", Direction::Long, 50, 3.5),
        snap("WIPRO", "IT", Direction::Long, 71, 5.0, true),
        snap("SBIN", "Banking", Direction::Short, 29, -2.0),
        snap("HDFCBANK", "Banking", Direction::Short, 93, -6.5),
        snap("ITC", "FMCG", Direction::Neutral, 0, 0.0),
        snap("NTPC", "Power", Direction::Neutral, 7, 0.5),
    };
    for (const auto& s : gen.snapshots) gen.by_symbol[s->symbol] = s;
    return gen;
}

} // namespace

TEST_CASE("Universe summary", "[aggregator]") {
    auto gen = seven_symbols();

    SECTION("Counts and percentages use the actual total") {
        auto summary = Aggregator::summarize(gen);
        REQUIRE(summary.total == 7);
        REQUIRE(summary.longs == 3);
        REQUIRE(summary.shorts == 2);
        REQUIRE(summary.neutrals == 2);
        REQUIRE(summary.stale == 1);
        REQUIRE(summary.long_pct == Approx(300.0 / 7.0));
        REQUIRE(summary.short_pct == Approx(200.0 / 7.0));
        REQUIRE(summary.neutral_pct == Approx(200.0 / 7.0));
    }

    SECTION("Top picks rank by confidence, then score, then symbol") {
        auto summary = Aggregator::summarize(gen, 2);
        REQUIRE(summary.top_longs.size() == 2);
        REQUIRE(summary.top_longs[0]->symbol == "WIPRO");
        REQUIRE(summary.top_longs[1]->symbol == "INFY");

        REQUIRE(summary.top_shorts.size() == 2);
        REQUIRE(summary.top_shorts[0]->symbol == "HDFCBANK");
        REQUIRE(summary.top_shorts[1]->symbol == "SBIN");
    }

    SECTION("Sector breadth") {
        auto summary = Aggregator::summarize(gen);
        REQUIRE(summary.sectors.size() == 4);
        REQUIRE(summary.sectors["IT"].longs == 3);
        REQUIRE(summary.sectors["Banking"].shorts == 2);
        REQUIRE(summary.sectors["FMCG"].neutrals == 1);
        REQUIRE(summary.sectors["Power"].longs == 0);
    }

    SECTION("Empty generation") {
        Generation empty;
        auto summary = Aggregator::summarize(empty);
        REQUIRE(summary.total == 0);
        REQUIRE(summary.long_pct == 0.0);
        REQUIRE(summary.top_longs.empty());
        REQUIRE(summary.sectors.empty());
    }
}
