#include "AbstractionBuilder.hpp"
#include "EquityDistribution.hpp"
#include "build/CheckpointStore.hpp"
#include "cards/Canonical.hpp"
#include "cards/Enumeration.hpp"
#include "core/Errors.hpp"
#include "parallel/ParallelMap.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <random>
#include <stdexcept>
#include <utility>

namespace isoholdem::abstraction {

using cards::Hand;
using cards::HandCode;
using cards::Street;
using cards::StreetMode;

namespace {

void check_street(Street street) {
    if (street != Street::Flop && street != Street::Turn) {
        throw std::invalid_argument("Abstractions are built for flop and turn only, not " +
                                    cards::street_to_string(street));
    }
}

} // namespace

std::string distribution_kind(Street street) {
    return cards::street_to_string(street) + "_distributions";
}

AbstractionBuilder::AbstractionBuilder(std::shared_ptr<const tables::StrengthTable> strengths,
                                       AbstractionBuildConfig config)
    : strengths_(std::move(strengths))
    , config_(std::move(config)) {
    if (!strengths_ || strengths_->empty()) {
        throw std::invalid_argument("Abstraction builder needs a loaded strength table");
    }
    if (config_.max_train_samples == 0) {
        throw std::invalid_argument("max_train_samples must be positive");
    }
}

void AbstractionBuilder::set_callback(build::ProgressCallback callback) {
    callback_ = std::move(callback);
}

// ============================================================================
// Distribution phase
// ============================================================================

build::BuildSummary AbstractionBuilder::build_distributions(
    Street street, const std::string& dist_dir) const {
    check_street(street);
    const int length = cards::cards_for_street(street);
    return run_distributions(street, [length](const std::function<void(HandCode)>& emit) {
        cards::for_each_canonical(length, StreetMode::StreetAware, [&emit](const Hand& h) {
            emit(cards::pack_hand(h));
        });
    }, dist_dir);
}

build::BuildSummary AbstractionBuilder::build_distributions(
    Street street, const std::vector<Hand>& hands, const std::string& dist_dir) const {
    check_street(street);
    std::vector<HandCode> codes;
    codes.reserve(hands.size());
    for (const Hand& h : hands) {
        if (static_cast<int>(h.size()) != cards::cards_for_street(street)) {
            throw std::invalid_argument(cards::street_to_string(street) + " units have " +
                                        std::to_string(cards::cards_for_street(street)) +
                                        " cards: " + cards::hand_to_string(h));
        }
        codes.push_back(cards::pack_hand(cards::canonicalize(h, StreetMode::StreetAware)));
    }
    return run_distributions(street, [&codes](const std::function<void(HandCode)>& emit) {
        for (HandCode c : codes) emit(c);
    }, dist_dir);
}

build::BuildSummary AbstractionBuilder::run_distributions(
    Street street, const build::UnitSource& source, const std::string& dist_dir) const {
    build::CheckpointStore store(dist_dir);
    const tables::StrengthTable& strengths = *strengths_;

    return build::run_checkpointed<EquityDistribution>(
        distribution_kind(street), source, store, config_.batch,
        [&strengths](HandCode code) {
            return equity_distribution(cards::unpack_hand(code), strengths);
        },
        [](const EquityDistribution& d) { return d.to_json(); },
        callback_);
}

// ============================================================================
// Clustering phase
// ============================================================================

AbstractionTable AbstractionBuilder::cluster(Street street,
                                             const std::string& dist_dir,
                                             const std::string& abstraction_dir) const {
    check_street(street);

    build::CheckpointStore abs_store(abstraction_dir);
    if (abs_store.is_complete()) {
        return AbstractionTable::load(abstraction_dir, street);
    }

    build::CheckpointStore dist_store(dist_dir);
    if (!dist_store.is_complete()) {
        throw DatasetMissingError("Equity distributions at " + dist_dir +
                                  " are incomplete; build them first");
    }
    const build::Manifest dist_manifest = dist_store.read_manifest();
    if (dist_manifest.kind != distribution_kind(street)) {
        throw ParseError("Dataset at " + dist_dir + " holds '" + dist_manifest.kind +
                         "', expected '" + distribution_kind(street) + "'");
    }

    auto start = std::chrono::high_resolution_clock::now();

    // Seeded reservoir sample of the histograms to fit on
    const std::size_t sample_size = std::min(config_.max_train_samples, dist_manifest.units);
    std::vector<EquityDistribution> sample;
    sample.reserve(sample_size);
    std::mt19937_64 rng(config_.cluster.seed);
    std::size_t seen = 0;

    dist_store.for_each_batch([&](std::size_t, const nlohmann::json& batch) {
        for (auto it = batch.begin(); it != batch.end(); ++it, ++seen) {
            if (sample.size() < sample_size) {
                sample.push_back(EquityDistribution::from_json(it.value()));
                continue;
            }
            std::uniform_int_distribution<std::size_t> U(0, seen);
            std::size_t j = U(rng);
            if (j < sample_size) {
                sample[j] = EquityDistribution::from_json(it.value());
            }
        }
    });

    if (sample.empty()) {
        throw DatasetMissingError("No equity distributions at " + dist_dir);
    }

    Eigen::MatrixXd data(static_cast<Eigen::Index>(sample.size()), EQUITY_BINS);
    for (std::size_t i = 0; i < sample.size(); ++i) {
        data.row(static_cast<Eigen::Index>(i)) = sample[i].normalized().transpose();
    }

    ClusterConfig cluster_config = config_.cluster;
    cluster_config.k = std::min<int>(cluster_config.k, static_cast<int>(sample.size()));
    cluster_config.num_threads = config_.batch.num_threads;
    std::unique_ptr<Clusterer> clusterer = create_clusterer(cluster_config);
    clusterer->fit(data);

    if (config_.batch.verbose) {
        std::printf("  [%s] fit %s with k=%d on %zu of %zu hands\n",
                    abstraction_kind(street).c_str(), clusterer->name().c_str(),
                    clusterer->num_clusters(), sample.size(), dist_manifest.units);
    }

    // Assign every hand, one abstraction shard per distribution shard
    build::Manifest manifest = abs_store.prepare(abstraction_kind(street),
                                                 dist_manifest.batch_size);
    std::size_t units_done = 0;

    dist_store.for_each_batch([&](std::size_t index, const nlohmann::json& batch) {
        build::BatchStats stats;
        stats.batch_index = index;
        stats.units = batch.size();
        units_done += batch.size();
        stats.units_done = units_done;

        if (abs_store.has_batch(index)) {
            stats.skipped = true;
        } else {
            std::vector<std::string> keys;
            std::vector<Eigen::VectorXd> points;
            keys.reserve(batch.size());
            points.reserve(batch.size());
            for (auto it = batch.begin(); it != batch.end(); ++it) {
                keys.push_back(it.key());
                points.push_back(EquityDistribution::from_json(it.value()).normalized());
            }

            parallel::MapMetrics metrics;
            const Clusterer& fitted = *clusterer;
            std::vector<int> buckets = parallel::parallel_map<int>(
                points.size(),
                [&](std::size_t i) { return fitted.assign(points[i]); },
                config_.batch.num_threads, &metrics);

            nlohmann::json out = nlohmann::json::object();
            for (std::size_t i = 0; i < keys.size(); ++i) {
                out[keys[i]] = buckets[i];
            }
            abs_store.write_batch(index, out);
            stats.wall_time_ms = metrics.wall_time_ms;
            stats.num_threads = metrics.num_threads;
        }

        if (config_.batch.verbose) {
            std::printf("  [%s] batch %zu: %zu hands%s (%.1f ms)\n",
                        abstraction_kind(street).c_str(), index, stats.units,
                        stats.skipped ? " skipped" : "", stats.wall_time_ms);
        }
        if (callback_) (*callback_)(stats);
    });

    auto end = std::chrono::high_resolution_clock::now();

    manifest.batches = dist_manifest.batches;
    manifest.units = dist_manifest.units;
    manifest.complete = true;
    manifest.extra["street"] = cards::street_to_string(street);
    manifest.extra["num_buckets"] = clusterer->num_clusters();
    manifest.extra["train_samples"] = sample.size();
    manifest.extra["clusterer"] = clusterer->to_json();
    manifest.extra["wall_time_ms"] =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    abs_store.write_manifest(manifest);

    return AbstractionTable::load(abstraction_dir, street);
}

AbstractionTable AbstractionBuilder::build(Street street,
                                           const std::string& dist_dir,
                                           const std::string& abstraction_dir) const {
    build::BuildSummary summary = build_distributions(street, dist_dir);
    if (!summary.complete) {
        throw DatasetMissingError(
            "Equity distributions at " + dist_dir + " stopped after " +
            std::to_string(summary.computed) + " new batches; rerun to resume");
    }
    return cluster(street, dist_dir, abstraction_dir);
}

} // namespace isoholdem::abstraction
