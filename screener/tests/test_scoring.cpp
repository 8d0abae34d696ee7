#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/scoring.hpp"

using Catch::Approx;

namespace {

IndicatorSet bullish_set() {
    IndicatorSet set;
    set.rsi = 30.0;
    set.macd = MacdValue{1.2, 0.7, 0.5};
    set.ema9 = 105.0;
    set.ema21 = 101.0;
    set.sma20 = 100.0;
    set.bollinger = BollingerValue{110.0, 100.0, 90.0};
    set.bb_position = 0.1;
    set.atr14 = 2.0;
    return set;
}

IndicatorSet bearish_set() {
    IndicatorSet set;
    set.rsi = 72.0;
    set.macd = MacdValue{-1.2, -0.7, -0.5};
    set.ema9 = 96.0;
    set.ema21 = 99.0;
    set.sma20 = 100.0;
    set.bollinger = BollingerValue{110.0, 100.0, 90.0};
    set.bb_position = 0.9;
    set.atr14 = 2.0;
    return set;
}

} // namespace

TEST_CASE("Direction thresholds", "[scoring]") {
    REQUIRE(SignalScorer::direction_for(1.0) == Direction::Long);
    REQUIRE(SignalScorer::direction_for(0.999) == Direction::Neutral);
    REQUIRE(SignalScorer::direction_for(0.0) == Direction::Neutral);
    REQUIRE(SignalScorer::direction_for(-0.999) == Direction::Neutral);
    REQUIRE(SignalScorer::direction_for(-1.0) == Direction::Short);
    REQUIRE(SignalScorer::direction_for(6.5) == Direction::Long);

    REQUIRE(to_string(Direction::Long) == "LONG");
    REQUIRE(to_string(Direction::Short) == "SHORT");
    REQUIRE(to_string(Direction::Neutral) == "NEUTRAL");
}

TEST_CASE("Confidence scaling", "[scoring]") {
    SignalScorer scorer;

    REQUIRE(scorer.confidence_for(0.0) == 0);
    REQUIRE(scorer.confidence_for(3.5) == 50);
    REQUIRE(scorer.confidence_for(-3.5) == 50);
    REQUIRE(scorer.confidence_for(7.0) == 100);
    REQUIRE(scorer.confidence_for(2.0) == 29);

    SECTION("Capped at 100 with a smaller divisor") {
        ScoringWeights weights;
        weights.max_score = 5.0;
        SignalScorer tight(weights);
        REQUIRE(tight.confidence_for(7.0) == 100);
        REQUIRE(tight.confidence_for(2.5) == 50);
    }
}

TEST_CASE("Signal scoring", "[scoring]") {
    SignalScorer scorer;

    SECTION("Every bullish rule fires") {
        auto signal = scorer.score(bullish_set(), 103.0);
        REQUIRE(signal.score == Approx(6.5));
        REQUIRE(signal.direction == Direction::Long);
        REQUIRE(signal.confidence == 93);
        REQUIRE(signal.reasons == std::vector<std::string>{
            "RSI oversold (30.0)",
            "MACD bullish (hist 0.50)",
            "9EMA above 21EMA",
            "Price near BB lower band (0.10)",
            "Price >2% above SMA20"
        });
    }

    SECTION("Every bearish rule fires") {
        auto signal = scorer.score(bearish_set(), 97.0);
        REQUIRE(signal.score == Approx(-6.5));
        REQUIRE(signal.direction == Direction::Short);
        REQUIRE(signal.confidence == 93);
        REQUIRE(signal.reasons == std::vector<std::string>{
            "RSI overbought (72.0)",
            "MACD bearish (hist -0.50)",
            "9EMA below 21EMA",
            "Price near BB upper band (0.90)",
            "Price >2% below SMA20"
        });
    }

    SECTION("Values inside every band score zero") {
        IndicatorSet set = bullish_set();
        set.rsi = 50.0;
        set.macd = MacdValue{0.0, 0.0, 0.0};
        set.ema9 = 100.0;
        set.ema21 = 100.0;
        set.bb_position = 0.5;
        auto signal = scorer.score(set, 101.0);
        REQUIRE(signal.score == 0.0);
        REQUIRE(signal.direction == Direction::Neutral);
        REQUIRE(signal.confidence == 0);
        REQUIRE(signal.reasons.empty());
    }

    SECTION("A lone EMA cross reaches the long threshold") {
        IndicatorSet set;
        set.ema9 = 101.0;
        set.ema21 = 100.0;
        auto signal = scorer.score(set, 100.0);
        REQUIRE(signal.score == Approx(1.0));
        REQUIRE(signal.direction == Direction::Long);
        REQUIRE(signal.confidence == 14);
    }

    SECTION("Missing indicators contribute nothing") {
        IndicatorSet set = bearish_set();
        set.macd.reset();
        set.degraded.push_back("MACD");
        auto signal = scorer.score(set, 97.0);
        REQUIRE(signal.score == Approx(-5.0));
        REQUIRE(signal.direction == Direction::Short);
    }

    SECTION("Nothing computable gives a neutral zero-confidence signal") {
        IndicatorSet empty;
        auto signal = scorer.score(empty, 100.0);
        REQUIRE(signal.direction == Direction::Neutral);
        REQUIRE(signal.confidence == 0);
        REQUIRE(signal.score == 0.0);
        REQUIRE(signal.reasons == std::vector<std::string>{"Insufficient history"});
    }
}
