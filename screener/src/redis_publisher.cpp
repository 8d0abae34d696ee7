#include "redis_publisher.hpp"
#include "json_codec.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

RedisPublisher::RedisPublisher(const std::string& redis_url, const std::string& stream)
    : stream_(stream) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Connected to Redis: {}", redis_url);
}

void RedisPublisher::on_generation(const Generation& generation, const UniverseSummary& summary) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["generation"] = std::to_string(generation.sequence);
        fields["data"] = json_codec::generation_digest(generation, summary).dump();
        redis_->xadd(stream_, "*", fields.begin(), fields.end());
        spdlog::debug("Published generation {} to {}", generation.sequence, stream_);
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to publish generation {}: {}", generation.sequence, e.what());
    }
}

bool RedisPublisher::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::warn("Redis ping failed: {}", e.what());
        return false;
    }
}
