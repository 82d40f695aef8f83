#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "AbstractionTable.hpp"
#include "Clustering.hpp"
#include "build/BatchRunner.hpp"
#include "cards/Card.hpp"
#include "cards/Street.hpp"
#include "tables/StrengthTable.hpp"

namespace isoholdem::abstraction {

// Dataset kind of a street's distribution shards, e.g. "turn_distributions"
std::string distribution_kind(cards::Street street);

// Configuration for an abstraction build
struct AbstractionBuildConfig {
    build::BatchConfig batch;              // Distribution checkpoints
    ClusterConfig cluster;                 // k is the street's bucket count
    std::size_t max_train_samples = 200000;  // Histograms the clusterer is fit on
};

// Offline pipeline for one street: equity distributions for every canonical
// hand (checkpointed), then a clusterer fit on a seeded sample of them, then
// every hand assigned and persisted as that street's abstraction table
class AbstractionBuilder {
public:
    AbstractionBuilder(std::shared_ptr<const tables::StrengthTable> strengths,
                       AbstractionBuildConfig config);

    // Set callback to receive per-batch progress of both phases
    void set_callback(build::ProgressCallback callback);

    // Distributions of every canonical street-aware hand of the street
    build::BuildSummary build_distributions(cards::Street street,
                                            const std::string& dist_dir) const;

    // Distributions of the given hands only (canonicalized first)
    build::BuildSummary build_distributions(cards::Street street,
                                            const std::vector<cards::Hand>& hands,
                                            const std::string& dist_dir) const;

    // Fits the clusterer and writes the abstraction dataset.
    // Throws DatasetMissingError if the distributions are incomplete.
    AbstractionTable cluster(cards::Street street,
                             const std::string& dist_dir,
                             const std::string& abstraction_dir) const;

    // Both phases. Throws DatasetMissingError if max_batches stopped the
    // distribution phase early; rerunning resumes it.
    AbstractionTable build(cards::Street street,
                           const std::string& dist_dir,
                           const std::string& abstraction_dir) const;

    const AbstractionBuildConfig& config() const { return config_; }

private:
    build::BuildSummary run_distributions(cards::Street street,
                                          const build::UnitSource& source,
                                          const std::string& dist_dir) const;

    std::shared_ptr<const tables::StrengthTable> strengths_;
    AbstractionBuildConfig config_;
    std::optional<build::ProgressCallback> callback_;
};

} // namespace isoholdem::abstraction
