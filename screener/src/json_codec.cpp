#include "json_codec.hpp"
#include "util.hpp"
#include <spdlog/fmt/fmt.h>
#include <type_traits>
#include <variant>

namespace json_codec {

namespace {

nlohmann::json rounded(const std::optional<double>& value) {
    if (!value) return nullptr;
    return util::round2(*value);
}

std::string rupees(double amount) {
    return fmt::format("₹{:.0f}", amount);
}

std::string rupees2(double amount) {
    return fmt::format("₹{:.2f}", amount);
}

nlohmann::json pick(const Snapshot& snap) {
    return {
        {"sym", snap.symbol},
        {"sector", snap.sector},
        {"price", util::round2(snap.price)},
        {"score", util::round2(snap.signal.score)},
        {"direction", to_string(snap.signal.direction)},
        {"confidence", snap.signal.confidence},
        {"optionStrategy", snap.strategy.name()}
    };
}

} // namespace

nlohmann::json option_details(const StrategyLegs& legs) {
    return std::visit([](const auto& s) -> nlohmann::json {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, BullCallSpread> || std::is_same_v<T, BearPutSpread>) {
            return {
                {"buy", s.buy.describe()},
                {"sell", s.sell.describe()},
                {"expiry", s.expiry},
                {"maxProfit", rupees(s.max_profit)},
                {"maxLoss", rupees(s.max_loss)},
                {"premium", rupees(s.premium)}
            };
        } else if constexpr (std::is_same_v<T, AtmCallBuy> || std::is_same_v<T, AtmPutBuy>) {
            return {
                {"buy", s.buy.describe()},
                {"expiry", s.expiry},
                {"target", rupees2(s.target)},
                {"stopLoss", rupees2(s.stop_loss)},
                {"premium", rupees(s.premium)}
            };
        } else {
            return {
                {"sellCall", s.sell_call.describe()},
                {"buyCall", s.buy_call.describe()},
                {"sellPut", s.sell_put.describe()},
                {"buyPut", s.buy_put.describe()},
                {"expiry", s.expiry},
                {"premium", rupees(s.premium)}
            };
        }
    }, legs);
}

nlohmann::json snapshot(const Snapshot& snap) {
    const auto& ind = snap.indicators;

    nlohmann::json history = nlohmann::json::array();
    for (double p : snap.price_history) {
        history.push_back(util::round2(p));
    }

    nlohmann::json macd = nullptr;
    if (ind.macd) {
        macd = {
            {"macd", util::round2(ind.macd->line)},
            {"signal", util::round2(ind.macd->signal)},
            {"hist", util::round2(ind.macd->histogram)}
        };
    }

    nlohmann::json bb = nullptr;
    if (ind.bollinger) {
        bb = {
            {"upper", util::round2(ind.bollinger->upper)},
            {"mid", util::round2(ind.bollinger->mid)},
            {"lower", util::round2(ind.bollinger->lower)}
        };
    }

    return {
        {"sym", snap.symbol},
        {"sector", snap.sector},
        {"price", util::round2(snap.price)},
        {"change", util::round2(snap.change_1d_pct)},
        {"change5d", util::round2(snap.change_5d_pct)},
        {"priceHistory", history},
        {"rsi", rounded(ind.rsi)},
        {"macd", macd},
        {"sma20", rounded(ind.sma20)},
        {"ema9", rounded(ind.ema9)},
        {"ema21", rounded(ind.ema21)},
        {"atr", rounded(ind.atr14)},
        {"bb", bb},
        {"bbPos", rounded(ind.bb_position)},
        {"score", util::round2(snap.signal.score)},
        {"direction", to_string(snap.signal.direction)},
        {"confidence", snap.signal.confidence},
        {"optionStrategy", snap.strategy.name()},
        {"optionDetails", option_details(snap.strategy.legs)},
        {"reasons", snap.signal.reasons},
        {"degraded", ind.degraded},
        {"stale", snap.stale},
        {"asOf", util::to_iso8601(snap.as_of)},
        {"dataAsOf", util::to_iso8601(snap.data_as_of)}
    };
}

nlohmann::json index(const IndexSnapshot& index) {
    return {
        {"symbol", index.symbol},
        {"price", util::round2(index.price)},
        {"change", util::round2(index.change)},
        {"changePct", util::round2(index.change_pct)},
        {"stale", index.stale},
        {"asOf", util::to_iso8601(index.as_of)}
    };
}

nlohmann::json summary(const UniverseSummary& summary) {
    nlohmann::json top_longs = nlohmann::json::array();
    for (const auto& snap : summary.top_longs) top_longs.push_back(pick(*snap));

    nlohmann::json top_shorts = nlohmann::json::array();
    for (const auto& snap : summary.top_shorts) top_shorts.push_back(pick(*snap));

    nlohmann::json sectors = nlohmann::json::object();
    for (const auto& [name, breadth] : summary.sectors) {
        sectors[name] = {
            {"longs", breadth.longs},
            {"shorts", breadth.shorts},
            {"neutrals", breadth.neutrals}
        };
    }

    return {
        {"longs", summary.longs},
        {"shorts", summary.shorts},
        {"neutrals", summary.neutrals},
        {"stale", summary.stale},
        {"total", summary.total},
        {"longPct", util::round2(summary.long_pct)},
        {"shortPct", util::round2(summary.short_pct)},
        {"neutralPct", util::round2(summary.neutral_pct)},
        {"topLongs", top_longs},
        {"topShorts", top_shorts},
        {"sectors", sectors}
    };
}

nlohmann::json stocks_response(const Generation& generation,
                               const UniverseSummary& sum,
                               int next_refresh_seconds,
                               const std::string& data_source,
                               bool stale) {
    nlohmann::json stocks = nlohmann::json::array();
    for (const auto& snap : generation.snapshots) {
        stocks.push_back(snapshot(*snap));
    }

    return {
        {"stocks", stocks},
        {"nifty", generation.index ? index(*generation.index) : nlohmann::json(nullptr)},
        {"summary", summary(sum)},
        {"fetchedAt", util::to_iso8601(generation.built_at)},
        {"nextRefresh", next_refresh_seconds},
        {"dataSource", data_source},
        {"generation", generation.sequence},
        {"stale", stale}
    };
}

nlohmann::json health(const CacheHealth& h) {
    std::string status = "healthy";
    if (h.sequence == 0) {
        status = h.last_refresh_ok ? "warming_up" : "unavailable";
    } else if (!h.last_refresh_ok) {
        status = "degraded";
    }

    nlohmann::json age = nullptr;
    if (h.age_seconds) age = static_cast<int64_t>(*h.age_seconds);

    return {
        {"status", status},
        {"state", to_string(h.state)},
        {"cacheAge", age},
        {"stocksCached", h.symbol_count},
        {"generation", h.sequence},
        {"refreshing", h.refreshing},
        {"refreshes", h.refreshes},
        {"failures", h.failures},
        {"lastError", h.last_error.empty() ? nlohmann::json(nullptr) : nlohmann::json(h.last_error)},
        {"lastErrorAt", h.last_error_at ? nlohmann::json(util::to_iso8601(*h.last_error_at))
                                        : nlohmann::json(nullptr)},
        {"builtAt", h.built_at ? nlohmann::json(util::to_iso8601(*h.built_at))
                               : nlohmann::json(nullptr)}
    };
}

nlohmann::json generation_digest(const Generation& generation, const UniverseSummary& sum) {
    nlohmann::json signals = nlohmann::json::array();
    for (const auto& snap : generation.snapshots) {
        signals.push_back({
            {"sym", snap->symbol},
            {"direction", to_string(snap->signal.direction)},
            {"score", util::round2(snap->signal.score)},
            {"confidence", snap->signal.confidence},
            {"strategy", snap->strategy.name()},
            {"stale", snap->stale}
        });
    }

    return {
        {"generation", generation.sequence},
        {"builtAt", util::to_iso8601(generation.built_at)},
        {"summary", {
            {"longs", sum.longs},
            {"shorts", sum.shorts},
            {"neutrals", sum.neutrals},
            {"stale", sum.stale},
            {"total", sum.total}
        }},
        {"signals", signals}
    };
}

} // namespace json_codec
