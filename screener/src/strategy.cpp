#include "strategy.hpp"
#include "util.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

std::string to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::BullCallSpread: return "Bull Call Spread";
        case StrategyKind::AtmCallBuy: return "ATM Call Buy";
        case StrategyKind::BearPutSpread: return "Bear Put Spread";
        case StrategyKind::AtmPutBuy: return "ATM Put Buy";
        case StrategyKind::IronCondor: return "Iron Condor";
    }
    return "Iron Condor";
}

std::string OptionLeg::describe() const {
    return fmt::format("{} {:.0f} {}", underlying, strike, type == OptionType::Call ? "CE" : "PE");
}

StrategySelector::StrategySelector(const StrategyParams& params)
    : params_(params) {}

StrategyKind StrategySelector::select(Direction direction, int confidence) const {
    const bool high_conviction = confidence > params_.confidence_threshold;

    switch (direction) {
        case Direction::Long:
            return high_conviction ? StrategyKind::BullCallSpread : StrategyKind::AtmCallBuy;
        case Direction::Short:
            return high_conviction ? StrategyKind::BearPutSpread : StrategyKind::AtmPutBuy;
        case Direction::Neutral:
            return StrategyKind::IronCondor;
    }
    return StrategyKind::IronCondor;
}

double StrategySelector::strike_step(double price) const {
    for (const auto& tier : params_.strike_tiers) {
        if (price > tier.min_price && tier.step > 0) {
            return tier.step;
        }
    }
    return 1.0;
}

double StrategySelector::round_to_strike(double price) const {
    const double step = strike_step(price);
    return std::round(price / step) * step;
}

OptionLeg StrategySelector::leg(const PricingContext& ctx, double price, OptionType type) const {
    OptionLeg leg;
    leg.underlying = ctx.symbol;
    leg.strike = round_to_strike(price);
    leg.type = type;
    return leg;
}

StrategyRecommendation StrategySelector::recommend(Direction direction, int confidence,
                                                   const PricingContext& ctx) const {
    StrategyRecommendation rec;
    rec.kind = select(direction, confidence);

    const double p = ctx.price;
    const double atr = ctx.atr;
    const double spread = params_.spread_offset_pct / 100.0;
    // Protective legs sit at least one strike away from the leg they cover.
    const double step = strike_step(p);

    switch (rec.kind) {
        case StrategyKind::BullCallSpread: {
            BullCallSpread s;
            s.buy = leg(ctx, p, OptionType::Call);
            s.sell = leg(ctx, p * (1.0 + spread), OptionType::Call);
            s.sell.strike = std::max(s.sell.strike, s.buy.strike + step);
            s.expiry = ctx.expiry;
            s.max_profit = std::round(atr * params_.spread_max_profit_atr);
            s.max_loss = std::round(atr * params_.spread_max_loss_atr);
            s.premium = std::round(atr * params_.spread_premium_atr);
            rec.legs = s;
            break;
        }
        case StrategyKind::BearPutSpread: {
            BearPutSpread s;
            s.buy = leg(ctx, p, OptionType::Put);
            s.sell = leg(ctx, p * (1.0 - spread), OptionType::Put);
            s.sell.strike = std::min(s.sell.strike, s.buy.strike - step);
            s.expiry = ctx.expiry;
            s.max_profit = std::round(atr * params_.spread_max_profit_atr);
            s.max_loss = std::round(atr * params_.spread_max_loss_atr);
            s.premium = std::round(atr * params_.spread_premium_atr);
            rec.legs = s;
            break;
        }
        case StrategyKind::AtmCallBuy: {
            AtmCallBuy s;
            s.buy = leg(ctx, p, OptionType::Call);
            s.expiry = ctx.expiry;
            s.target = util::round2(p * (1.0 + params_.target_pct / 100.0));
            s.stop_loss = util::round2(p * (1.0 - params_.stop_loss_pct / 100.0));
            s.premium = std::round(atr * params_.single_premium_atr);
            rec.legs = s;
            break;
        }
        case StrategyKind::AtmPutBuy: {
            AtmPutBuy s;
            s.buy = leg(ctx, p, OptionType::Put);
            s.expiry = ctx.expiry;
            s.target = util::round2(p * (1.0 - params_.target_pct / 100.0));
            s.stop_loss = util::round2(p * (1.0 + params_.stop_loss_pct / 100.0));
            s.premium = std::round(atr * params_.single_premium_atr);
            rec.legs = s;
            break;
        }
        case StrategyKind::IronCondor: {
            IronCondor s;
            const double short_off = params_.condor_short_pct / 100.0;
            const double wing_off = params_.condor_wing_pct / 100.0;
            s.sell_call = leg(ctx, p * (1.0 + short_off), OptionType::Call);
            s.buy_call = leg(ctx, p * (1.0 + wing_off), OptionType::Call);
            s.sell_put = leg(ctx, p * (1.0 - short_off), OptionType::Put);
            s.buy_put = leg(ctx, p * (1.0 - wing_off), OptionType::Put);
            s.buy_call.strike = std::max(s.buy_call.strike, s.sell_call.strike + step);
            s.buy_put.strike = std::min(s.buy_put.strike, s.sell_put.strike - step);
            s.expiry = ctx.expiry;
            s.premium = std::round(atr * params_.condor_premium_atr);
            rec.legs = s;
            break;
        }
    }

    return rec;
}
