#pragma once

#include "aggregator.hpp"
#include "generation.hpp"
#include <string>

// Receives every generation after it has been published to the cache.
class GenerationSink {
public:
    virtual ~GenerationSink() = default;

    virtual void on_generation(const Generation& generation, const UniverseSummary& summary) = 0;
    virtual std::string name() const = 0;
};
