#include "pg_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PgSignalStore::PgSignalStore(const std::string& dsn) : dsn_(dsn) {}

pqxx::connection PgSignalStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PgSignalStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS signal_history (
                id BIGSERIAL PRIMARY KEY,
                generation BIGINT NOT NULL,
                symbol TEXT NOT NULL,
                sector TEXT NOT NULL,
                price DOUBLE PRECISION NOT NULL,
                score DOUBLE PRECISION NOT NULL,
                direction TEXT NOT NULL,
                confidence INTEGER NOT NULL,
                strategy TEXT NOT NULL,
                stale BOOLEAN NOT NULL DEFAULT FALSE,
                as_of TIMESTAMPTZ NOT NULL,
                data_as_of TIMESTAMPTZ NOT NULL
            )
        )");
        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS idx_signal_history_symbol
            ON signal_history (symbol, as_of DESC)
        )");
        txn.commit();

        spdlog::info("signal_history schema ready");
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

void PgSignalStore::on_generation(const Generation& generation, const UniverseSummary&) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        for (const auto& snap : generation.snapshots) {
            txn.exec_params(
                "INSERT INTO signal_history (generation, symbol, sector, price, score, direction, "
                "confidence, strategy, stale, as_of, data_as_of) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11)",
                static_cast<int64_t>(generation.sequence),
                snap->symbol,
                snap->sector,
                snap->price,
                snap->signal.score,
                to_string(snap->signal.direction),
                snap->signal.confidence,
                snap->strategy.name(),
                snap->stale,
                util::to_iso8601(snap->as_of),
                util::to_iso8601(snap->data_as_of));
        }

        txn.commit();
        spdlog::debug("Stored {} signals for generation {}",
                      generation.snapshots.size(), generation.sequence);
    } catch (const std::exception& e) {
        spdlog::error("Failed to store generation {}: {}", generation.sequence, e.what());
    }
}

bool PgSignalStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Postgres ping failed: {}", e.what());
        return false;
    }
}
