#pragma once

#include "generation.hpp"
#include "market_data.hpp"
#include "snapshot.hpp"
#include "universe.hpp"
#include <memory>
#include <mutex>
#include <set>
#include <string>

struct BuilderOptions {
    int history_days = 60;
    int worker_threads = 8;
    std::string index_symbol = "^NSEI";
};

// Runs one refresh pass over the universe: fetch, compute and assemble a new
// generation. Symbols are processed in parallel; a transient failure carries
// the previous snapshot over, a fatal one drops the symbol.
class GenerationBuilder {
public:
    GenerationBuilder(Universe universe,
                      std::shared_ptr<MarketDataProvider> provider,
                      SnapshotBuilder snapshot_builder,
                      const BuilderOptions& options = BuilderOptions());

    // Throws RefreshFailed when no symbol produced fresh data.
    GenerationPtr build(const GenerationPtr& previous, uint64_t sequence);

private:
    enum class Outcome {
        Fresh,
        Carried,
        Omitted
    };

    struct SymbolResult {
        Outcome outcome = Outcome::Omitted;
        SnapshotPtr snapshot;
        std::string error;
        bool fatal = false;
    };

    Universe universe_;
    std::shared_ptr<MarketDataProvider> provider_;
    SnapshotBuilder snapshot_builder_;
    BuilderOptions options_;

    std::mutex fatal_mutex_;
    std::set<std::string> fatal_logged_;

    SymbolResult process_symbol(const UniverseMember& member, const GenerationPtr& previous,
                                TimePoint built_at);
    std::optional<IndexSnapshot> process_index(const GenerationPtr& previous, TimePoint built_at);
    SymbolResult carry_over(const UniverseMember& member, const GenerationPtr& previous,
                            TimePoint built_at, const std::string& error);
    void log_fatal_once(const std::string& symbol, const std::string& error);
};
