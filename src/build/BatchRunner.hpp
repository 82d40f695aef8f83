#pragma once

#include <chrono>
#include <cstdio>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "CheckpointStore.hpp"
#include "cards/HandCode.hpp"
#include "parallel/ParallelMap.hpp"

namespace isoholdem::build {

// Configuration for a checkpointed batch build
struct BatchConfig {
    std::size_t batch_size = 1000000;  // Units per checkpoint
    int num_threads = 0;               // 0 = hardware concurrency
    int max_batches = -1;              // New batches to compute this run, -1 = all
    bool verbose = false;              // Print one line per batch
};

// Statistics for a single batch
struct BatchStats {
    std::size_t batch_index = 0;
    std::size_t units = 0;
    bool skipped = false;          // Already on disk from an earlier run
    double wall_time_ms = 0.0;
    std::size_t units_done = 0;    // Units covered so far, this batch included
    int num_threads = 1;

    nlohmann::json to_json() const {
        return {
            {"batch_index", batch_index},
            {"units", units},
            {"skipped", skipped},
            {"wall_time_ms", wall_time_ms},
            {"units_done", units_done},
            {"num_threads", num_threads}
        };
    }
};

// Outcome of one build invocation
struct BuildSummary {
    std::size_t batches = 0;       // Batches seen in the unit stream
    std::size_t computed = 0;
    std::size_t skipped = 0;
    std::size_t units = 0;
    bool complete = false;         // Every batch is on disk
    double wall_time_ms = 0.0;

    nlohmann::json to_json() const {
        return {
            {"batches", batches},
            {"computed", computed},
            {"skipped", skipped},
            {"units", units},
            {"complete", complete},
            {"wall_time_ms", wall_time_ms}
        };
    }
};

// Receives stats after every batch (for progress reporting)
using ProgressCallback = std::function<void(const BatchStats&)>;

// Produces the build's units in a fixed order, one call per unit
using UnitSource = std::function<void(const std::function<void(cards::HandCode)>&)>;

// Runs compute over every unit of source, batch by batch, persisting each
// batch as { "<hand>": encode(result) } before starting the next. Batches
// already on disk are skipped, so an interrupted build resumes where it
// stopped. After max_batches new batches the remaining ones are only counted.
template<typename Result, typename Compute, typename Encode>
BuildSummary run_checkpointed(const std::string& kind,
                              const UnitSource& source,
                              const CheckpointStore& store,
                              const BatchConfig& config,
                              Compute&& compute,
                              Encode&& encode,
                              const std::optional<ProgressCallback>& callback = std::nullopt) {
    auto start = std::chrono::high_resolution_clock::now();

    Manifest manifest = store.prepare(kind, config.batch_size);

    BuildSummary summary;
    if (manifest.complete) {
        summary.batches = manifest.batches;
        summary.skipped = manifest.batches;
        summary.units = manifest.units;
        summary.complete = true;
        return summary;
    }

    std::vector<cards::HandCode> pending;
    pending.reserve(config.batch_size);
    bool all_present = true;

    auto flush = [&]() {
        if (pending.empty()) return;

        BatchStats stats;
        stats.batch_index = summary.batches;
        stats.units = pending.size();
        summary.units += pending.size();
        stats.units_done = summary.units;

        const bool budget_left = config.max_batches < 0 ||
            summary.computed < static_cast<std::size_t>(config.max_batches);

        if (store.has_batch(summary.batches)) {
            stats.skipped = true;
            ++summary.skipped;
        } else if (budget_left) {
            parallel::MapMetrics metrics;
            std::vector<Result> results = parallel::parallel_map<Result>(
                pending.size(),
                [&](std::size_t i) { return compute(pending[i]); },
                config.num_threads, &metrics);

            nlohmann::json batch = nlohmann::json::object();
            for (std::size_t i = 0; i < pending.size(); ++i) {
                batch[cards::code_to_string(pending[i])] = encode(results[i]);
            }
            store.write_batch(summary.batches, batch);

            stats.wall_time_ms = metrics.wall_time_ms;
            stats.num_threads = metrics.num_threads;
            ++summary.computed;
        } else {
            all_present = false;
            ++summary.batches;
            pending.clear();
            return;
        }

        if (config.verbose) {
            std::printf("  [%s] batch %zu: %zu units%s (%.1f ms), %zu done\n",
                        kind.c_str(), stats.batch_index, stats.units,
                        stats.skipped ? " skipped" : "", stats.wall_time_ms,
                        stats.units_done);
        }
        if (callback) (*callback)(stats);

        ++summary.batches;
        pending.clear();
    };

    source([&](cards::HandCode code) {
        pending.push_back(code);
        if (pending.size() == config.batch_size) flush();
    });
    flush();

    summary.complete = all_present;

    auto end = std::chrono::high_resolution_clock::now();
    summary.wall_time_ms =
        std::chrono::duration_cast<std::chrono::microseconds>(end - start).count() / 1000.0;

    manifest.batches = summary.batches;
    manifest.units = summary.units;
    manifest.complete = summary.complete;
    manifest.extra["build"] = summary.to_json();
    store.write_manifest(manifest);

    return summary;
}

} // namespace isoholdem::build
