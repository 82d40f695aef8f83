#include "TableSet.hpp"
#include "build/CheckpointStore.hpp"
#include "core/Errors.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace isoholdem::abstraction {

using cards::Street;

build::BatchConfig equity_batch_config(const Config& config) {
    build::BatchConfig batch;
    batch.batch_size = config.equity_batch_size;
    batch.num_threads = config.num_threads;
    batch.max_batches = config.max_batches;
    batch.verbose = config.verbose;
    return batch;
}

AbstractionBuildConfig abstraction_build_config(const Config& config, Street street) {
    AbstractionBuildConfig out;
    out.batch.batch_size = config.distribution_batch_size;
    out.batch.num_threads = config.num_threads;
    out.batch.max_batches = config.max_batches;
    out.batch.verbose = config.verbose;

    out.cluster.method = config.cluster_method;
    out.cluster.k = (street == Street::Flop) ? config.flop_buckets : config.turn_buckets;
    out.cluster.max_iters = config.kmeans_max_iters;
    out.cluster.seed = config.seed;
    out.cluster.metric = metric_from_string(config.distance_metric);
    out.cluster.num_threads = config.num_threads;

    out.max_train_samples = config.max_train_samples;
    return out;
}

std::shared_ptr<const tables::StrengthTable> load_strengths(const Config& config) {
    return std::make_shared<const tables::StrengthTable>(
        tables::StrengthTable::load(config.strength_path));
}

std::shared_ptr<const tables::EquityTable> load_equities(
    const Config& config,
    std::shared_ptr<const tables::StrengthTable> strengths,
    const std::optional<build::ProgressCallback>& callback) {

    build::CheckpointStore store(config.equity_dir);
    if (!store.is_complete()) {
        if (!config.build_missing) {
            throw DatasetMissingError("River equity dataset at " + config.equity_dir +
                                      " is missing or incomplete");
        }
        std::cout << "Building river equities in " << config.equity_dir << std::endl;

        tables::EquityTableBuilder builder(std::move(strengths), equity_batch_config(config));
        if (callback) builder.set_callback(*callback);
        build::BuildSummary summary = builder.build(config.equity_dir);
        if (!summary.complete) {
            throw DatasetMissingError("River equity build stopped after " +
                                      std::to_string(summary.computed) +
                                      " new batches; rerun to resume");
        }
    }
    return std::make_shared<const tables::EquityTable>(
        tables::EquityTable::load(config.equity_dir));
}

std::shared_ptr<const AbstractionTable> load_abstraction(
    const Config& config,
    Street street,
    std::shared_ptr<const tables::StrengthTable> strengths,
    const std::optional<build::ProgressCallback>& callback) {

    const std::string& abs_dir = (street == Street::Flop)
        ? config.flop_abstraction_dir : config.turn_abstraction_dir;
    const std::string& dist_dir = (street == Street::Flop)
        ? config.flop_distribution_dir : config.turn_distribution_dir;

    build::CheckpointStore store(abs_dir);
    if (store.is_complete()) {
        return std::make_shared<const AbstractionTable>(AbstractionTable::load(abs_dir, street));
    }
    if (!config.build_missing) {
        throw DatasetMissingError(cards::street_to_string(street) + " abstraction at " +
                                  abs_dir + " is missing or incomplete");
    }
    std::cout << "Building " << cards::street_to_string(street)
              << " abstraction in " << abs_dir << std::endl;

    AbstractionBuilder builder(std::move(strengths), abstraction_build_config(config, street));
    if (callback) builder.set_callback(*callback);
    return std::make_shared<const AbstractionTable>(builder.build(street, dist_dir, abs_dir));
}

TableNeeds tables_needed(const std::vector<cards::Hand>& hands, bool with_equity) {
    TableNeeds needs;
    for (const cards::Hand& hand : hands) {
        const std::size_t n = hand.size();
        if (n != 2 && n != 5 && n != 6 && n != 7) {
            throw std::invalid_argument("Abstraction queries take 2, 5, 6 or 7 cards, got " +
                                        std::to_string(n));
        }
        needs.strengths |= n >= 5;
        needs.equities |= n == 7 || (with_equity && n >= 5);
        needs.flop |= n == 5;
        needs.turn |= n == 6;
    }
    return needs;
}

TableSet load_tables(const Config& config,
                     const TableNeeds& needs,
                     const std::optional<build::ProgressCallback>& callback) {
    TableSet tables;
    // Every other table is built from strengths
    if (needs.strengths || needs.equities || needs.flop || needs.turn) {
        tables.strengths = load_strengths(config);
    }
    if (needs.equities) {
        tables.equities = load_equities(config, tables.strengths, callback);
    }
    if (needs.flop) {
        tables.flop = load_abstraction(config, Street::Flop, tables.strengths, callback);
    }
    if (needs.turn) {
        tables.turn = load_abstraction(config, Street::Turn, tables.strengths, callback);
    }
    return tables;
}

} // namespace isoholdem::abstraction
