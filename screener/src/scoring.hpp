#pragma once

#include "indicators.hpp"
#include <string>
#include <vector>

enum class Direction {
    Long,
    Short,
    Neutral
};

std::string to_string(Direction direction);

// Contribution weights and thresholds for the composite score.
struct ScoringWeights {
    double w_rsi = 2.0;        // RSI < 35 / > 65
    double w_macd = 1.5;       // histogram sign
    double w_ema_cross = 1.0;  // EMA9 vs EMA21
    double w_bb = 1.5;         // band position < 0.25 / > 0.75
    double w_sma = 0.5;        // price vs SMA20 +-2%

    double rsi_oversold = 35.0;
    double rsi_overbought = 65.0;
    double bb_low = 0.25;
    double bb_high = 0.75;
    double sma_band = 0.02;

    // Largest attainable |score|; confidence is |score| / max_score * 100.
    double max_score = 7.0;
};

struct Signal {
    double score = 0.0;
    Direction direction = Direction::Neutral;
    int confidence = 0;
    std::vector<std::string> reasons;
};

class SignalScorer {
public:
    explicit SignalScorer(const ScoringWeights& weights = ScoringWeights());

    Signal score(const IndicatorSet& indicators, double price) const;

    static Direction direction_for(double score);
    int confidence_for(double score) const;

private:
    ScoringWeights weights_;
};
