#include "generation_builder.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

GenerationBuilder::GenerationBuilder(Universe universe,
                                     std::shared_ptr<MarketDataProvider> provider,
                                     SnapshotBuilder snapshot_builder,
                                     const BuilderOptions& options)
    : universe_(std::move(universe))
    , provider_(std::move(provider))
    , snapshot_builder_(std::move(snapshot_builder))
    , options_(options)
{
    if (!provider_) {
        throw std::invalid_argument("GenerationBuilder requires a market data provider");
    }
}

void GenerationBuilder::log_fatal_once(const std::string& symbol, const std::string& error) {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    if (fatal_logged_.insert(symbol).second) {
        spdlog::warn("Dropping {} from universe: {}", symbol, error);
    }
}

GenerationBuilder::SymbolResult GenerationBuilder::carry_over(const UniverseMember& member,
                                                              const GenerationPtr& previous,
                                                              TimePoint built_at,
                                                              const std::string& error) {
    SymbolResult result;
    result.error = error;

    SnapshotPtr last = previous ? previous->find(member.symbol) : nullptr;
    if (last) {
        result.outcome = Outcome::Carried;
        result.snapshot = SnapshotBuilder::restamp_stale(*last, built_at);
        spdlog::warn("{}: keeping previous snapshot ({})", member.symbol, error);
    } else {
        result.outcome = Outcome::Omitted;
        spdlog::warn("{}: no data this pass and nothing to carry over ({})", member.symbol, error);
    }
    return result;
}

GenerationBuilder::SymbolResult GenerationBuilder::process_symbol(const UniverseMember& member,
                                                                  const GenerationPtr& previous,
                                                                  TimePoint built_at) {
    try {
        auto series = provider_->fetch_daily(member.symbol, options_.history_days);
        SymbolResult result;
        result.outcome = Outcome::Fresh;
        result.snapshot = snapshot_builder_.build(member, series, built_at);
        return result;
    } catch (const ProviderFatal& e) {
        log_fatal_once(member.symbol, e.what());
        SymbolResult result;
        result.outcome = Outcome::Omitted;
        result.error = e.what();
        result.fatal = true;
        return result;
    } catch (const ProviderUnavailable& e) {
        return carry_over(member, previous, built_at, e.what());
    } catch (const InsufficientHistory& e) {
        return carry_over(member, previous, built_at, e.what());
    } catch (const std::exception& e) {
        spdlog::error("{}: unexpected failure: {}", member.symbol, e.what());
        return carry_over(member, previous, built_at, e.what());
    }
}

std::optional<IndexSnapshot> GenerationBuilder::process_index(const GenerationPtr& previous,
                                                              TimePoint built_at) {
    if (options_.index_symbol.empty()) return std::nullopt;

    try {
        auto series = provider_->fetch_daily(options_.index_symbol, 5);
        return SnapshotBuilder::build_index(options_.index_symbol, series, built_at);
    } catch (const std::exception& e) {
        spdlog::warn("Index {} unavailable: {}", options_.index_symbol, e.what());
    }

    if (previous && previous->index) {
        IndexSnapshot carried = *previous->index;
        carried.as_of = built_at;
        carried.stale = true;
        return carried;
    }
    return std::nullopt;
}

GenerationPtr GenerationBuilder::build(const GenerationPtr& previous, uint64_t sequence) {
    const auto& members = universe_.members();
    const TimePoint built_at = std::chrono::system_clock::now();
    auto started = std::chrono::steady_clock::now();

    spdlog::info("Refresh pass #{} starting: {} symbols via {}",
                 sequence, members.size(), provider_->name());

    std::vector<SymbolResult> results(members.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < members.size(); i = next.fetch_add(1)) {
            results[i] = process_symbol(members[i], previous, built_at);
        }
    };

    size_t thread_count = std::min<size_t>(std::max(1, options_.worker_threads), members.size());
    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (size_t t = 0; t < thread_count; t++) {
        workers.emplace_back(worker);
    }
    for (auto& w : workers) {
        w.join();
    }

    auto generation = std::make_shared<Generation>();
    generation->sequence = sequence;
    generation->built_at = built_at;

    size_t fatal_count = 0;
    for (size_t i = 0; i < members.size(); i++) {
        auto& r = results[i];
        switch (r.outcome) {
            case Outcome::Fresh:
                generation->fresh_count++;
                break;
            case Outcome::Carried:
                generation->stale_count++;
                generation->errors[members[i].symbol] = r.error;
                break;
            case Outcome::Omitted:
                generation->omitted_count++;
                generation->errors[members[i].symbol] = r.error;
                if (r.fatal) fatal_count++;
                break;
        }
        if (r.snapshot) {
            generation->snapshots.push_back(r.snapshot);
            generation->by_symbol[r.snapshot->symbol] = r.snapshot;
        }
    }

    if (generation->fresh_count == 0) {
        throw RefreshFailed("no fresh data for any of " + std::to_string(members.size()) +
                            " symbols (" + std::to_string(fatal_count) + " unknown, " +
                            std::to_string(members.size() - fatal_count) + " unavailable)");
    }

    generation->index = process_index(previous, built_at);

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    spdlog::info("Refresh pass #{} done in {}ms: {} fresh, {} carried over, {} omitted",
                 sequence, elapsed_ms, generation->fresh_count,
                 generation->stale_count, generation->omitted_count);

    return generation;
}
