#include "scoring.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

std::string to_string(Direction direction) {
    switch (direction) {
        case Direction::Long: return "LONG";
        case Direction::Short: return "SHORT";
        case Direction::Neutral: return "NEUTRAL";
    }
    return "NEUTRAL";
}

SignalScorer::SignalScorer(const ScoringWeights& weights)
    : weights_(weights) {}

Direction SignalScorer::direction_for(double score) {
    if (score >= 1.0) return Direction::Long;
    if (score <= -1.0) return Direction::Short;
    return Direction::Neutral;
}

int SignalScorer::confidence_for(double score) const {
    if (weights_.max_score <= 0.0) return 0;
    long scaled = std::lround(std::abs(score) / weights_.max_score * 100.0);
    return static_cast<int>(std::min(100L, scaled));
}

Signal SignalScorer::score(const IndicatorSet& ind, double price) const {
    Signal signal;

    if (ind.all_degraded()) {
        signal.reasons.push_back("Insufficient history");
        return signal;
    }

    double score = 0.0;
    auto& reasons = signal.reasons;

    if (ind.rsi) {
        if (*ind.rsi < weights_.rsi_oversold) {
            score += weights_.w_rsi;
            reasons.push_back(fmt::format("RSI oversold ({:.1f})", *ind.rsi));
        }
        if (*ind.rsi > weights_.rsi_overbought) {
            score -= weights_.w_rsi;
            reasons.push_back(fmt::format("RSI overbought ({:.1f})", *ind.rsi));
        }
    }

    if (ind.macd) {
        if (ind.macd->histogram > 0) {
            score += weights_.w_macd;
            reasons.push_back(fmt::format("MACD bullish (hist {:.2f})", ind.macd->histogram));
        }
        if (ind.macd->histogram < 0) {
            score -= weights_.w_macd;
            reasons.push_back(fmt::format("MACD bearish (hist {:.2f})", ind.macd->histogram));
        }
    }

    if (ind.ema9 && ind.ema21) {
        if (*ind.ema9 > *ind.ema21) {
            score += weights_.w_ema_cross;
            reasons.push_back("9EMA above 21EMA");
        }
        if (*ind.ema9 < *ind.ema21) {
            score -= weights_.w_ema_cross;
            reasons.push_back("9EMA below 21EMA");
        }
    }

    if (ind.bb_position) {
        if (*ind.bb_position < weights_.bb_low) {
            score += weights_.w_bb;
            reasons.push_back(fmt::format("Price near BB lower band ({:.2f})", *ind.bb_position));
        }
        if (*ind.bb_position > weights_.bb_high) {
            score -= weights_.w_bb;
            reasons.push_back(fmt::format("Price near BB upper band ({:.2f})", *ind.bb_position));
        }
    }

    if (ind.sma20) {
        if (price > *ind.sma20 * (1.0 + weights_.sma_band)) {
            score += weights_.w_sma;
            reasons.push_back("Price >2% above SMA20");
        }
        if (price < *ind.sma20 * (1.0 - weights_.sma_band)) {
            score -= weights_.w_sma;
            reasons.push_back("Price >2% below SMA20");
        }
    }

    signal.score = score;
    signal.direction = direction_for(score);
    signal.confidence = confidence_for(score);
    return signal;
}
