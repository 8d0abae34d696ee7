#pragma once

#include "generation_sink.hpp"
#include <memory>
#include <string>
#include <sw/redis++/redis++.h>

// Appends a digest of every published generation to a Redis stream.
class RedisPublisher : public GenerationSink {
public:
    RedisPublisher(const std::string& redis_url, const std::string& stream);

    void on_generation(const Generation& generation, const UniverseSummary& summary) override;
    std::string name() const override { return "redis"; }

    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string stream_;
};
