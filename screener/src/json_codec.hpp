#pragma once

#include "aggregator.hpp"
#include "generation.hpp"
#include "universe_cache.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace json_codec {
    nlohmann::json snapshot(const Snapshot& snap);
    nlohmann::json option_details(const StrategyLegs& legs);
    nlohmann::json index(const IndexSnapshot& index);
    nlohmann::json summary(const UniverseSummary& summary);

    // Body of GET /api/stocks.
    nlohmann::json stocks_response(const Generation& generation,
                                   const UniverseSummary& summary,
                                   int next_refresh_seconds,
                                   const std::string& data_source,
                                   bool stale);

    nlohmann::json health(const CacheHealth& health);

    // Compact per-generation record for downstream consumers.
    nlohmann::json generation_digest(const Generation& generation,
                                     const UniverseSummary& summary);
}
