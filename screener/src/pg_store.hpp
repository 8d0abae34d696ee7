#pragma once

#include "generation_sink.hpp"
#include <string>
#include <pqxx/pqxx>

// Keeps a history of every signal in the signal_history table, one row per
// symbol per generation.
class PgSignalStore : public GenerationSink {
public:
    explicit PgSignalStore(const std::string& dsn);

    void init_schema();
    void on_generation(const Generation& generation, const UniverseSummary& summary) override;
    std::string name() const override { return "postgres"; }

    bool ping();

private:
    std::string dsn_;
    pqxx::connection make_connection();
};
