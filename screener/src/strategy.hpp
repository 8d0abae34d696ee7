#pragma once

#include "scoring.hpp"
#include <string>
#include <variant>
#include <vector>

enum class StrategyKind {
    BullCallSpread,
    AtmCallBuy,
    BearPutSpread,
    AtmPutBuy,
    IronCondor
};

std::string to_string(StrategyKind kind);

enum class OptionType {
    Call,
    Put
};

struct OptionLeg {
    std::string underlying;
    double strike = 0.0;
    OptionType type = OptionType::Call;

    // "RELIANCE 2900 CE"
    std::string describe() const;
};

struct BullCallSpread {
    OptionLeg buy;
    OptionLeg sell;
    std::string expiry;
    double max_profit = 0.0;
    double max_loss = 0.0;
    double premium = 0.0;
};

struct BearPutSpread {
    OptionLeg buy;
    OptionLeg sell;
    std::string expiry;
    double max_profit = 0.0;
    double max_loss = 0.0;
    double premium = 0.0;
};

struct AtmCallBuy {
    OptionLeg buy;
    std::string expiry;
    double target = 0.0;
    double stop_loss = 0.0;
    double premium = 0.0;
};

struct AtmPutBuy {
    OptionLeg buy;
    std::string expiry;
    double target = 0.0;
    double stop_loss = 0.0;
    double premium = 0.0;
};

struct IronCondor {
    OptionLeg sell_call;
    OptionLeg buy_call;
    OptionLeg sell_put;
    OptionLeg buy_put;
    std::string expiry;
    double premium = 0.0;
};

using StrategyLegs = std::variant<BullCallSpread, AtmCallBuy, BearPutSpread, AtmPutBuy, IronCondor>;

struct StrategyRecommendation {
    StrategyKind kind = StrategyKind::IronCondor;
    StrategyLegs legs;

    std::string name() const { return to_string(kind); }
};

// Strikes above `min_price` are quoted in multiples of `step`.
struct StrikeTier {
    double min_price;
    double step;
};

struct StrategyParams {
    int confidence_threshold = 70;      // spreads need confidence strictly above this
    double spread_offset_pct = 3.0;     // OTM leg distance for bull/bear spreads
    double condor_short_pct = 2.5;      // short strikes of the condor
    double condor_wing_pct = 4.0;       // long wings of the condor
    double target_pct = 4.0;            // single-leg target move
    double stop_loss_pct = 1.5;         // single-leg stop distance

    // ATR multiples for premium / payoff estimates
    double spread_max_profit_atr = 3.0;
    double spread_max_loss_atr = 1.5;
    double spread_premium_atr = 1.2;
    double single_premium_atr = 0.8;
    double condor_premium_atr = 0.6;

    // Checked in order; first tier whose min_price is below the price wins.
    std::vector<StrikeTier> strike_tiers = {
        {5000.0, 100.0},
        {1000.0, 50.0},
        {500.0, 20.0},
        {0.0, 10.0},
    };
};

struct PricingContext {
    std::string symbol;
    double price = 0.0;
    double atr = 0.0;
    std::string expiry;
};

class StrategySelector {
public:
    explicit StrategySelector(const StrategyParams& params = StrategyParams());

    // Pure table lookup on (direction, confidence).
    StrategyKind select(Direction direction, int confidence) const;

    StrategyRecommendation recommend(Direction direction, int confidence,
                                     const PricingContext& ctx) const;

    // Strike spacing for an underlying trading at `price`.
    double strike_step(double price) const;
    double round_to_strike(double price) const;

    const StrategyParams& params() const { return params_; }

private:
    StrategyParams params_;

    OptionLeg leg(const PricingContext& ctx, double price, OptionType type) const;
};
