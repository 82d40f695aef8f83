#pragma once

#include <string>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace isoholdem {

// Runtime configuration shared by the builders, the facade and the driver.
// Every field has a default; a JSON config file only overrides what it names.
struct Config {
    // Dataset locations
    std::string products_dir = "products";
    std::string strength_path = "products/strengths.json";
    std::string equity_dir = "products/river_equity";
    std::string flop_distribution_dir = "products/flop_distributions";
    std::string turn_distribution_dir = "products/turn_distributions";
    std::string flop_abstraction_dir = "products/flop_abstraction";
    std::string turn_abstraction_dir = "products/turn_abstraction";

    // Batch builds
    std::size_t equity_batch_size = 1000000;      // River hands per checkpoint
    std::size_t distribution_batch_size = 10000;  // Flop/turn hands per checkpoint
    int num_threads = 0;                          // 0 = hardware concurrency
    int max_batches = -1;                         // New batches per run, -1 = all

    // Abstraction
    int flop_buckets = 200;
    int turn_buckets = 200;
    int river_buckets = 50;
    std::string cluster_method = "kmeans";        // kmeans | percentile
    std::string distance_metric = "emd";          // emd | euclidean
    int kmeans_max_iters = 100;
    uint32_t seed = 123;
    std::size_t max_train_samples = 200000;       // Clustering sample cap

    bool build_missing = true;                    // Build absent datasets on load
    bool verbose = false;

    // Re-root every dataset path under a new products directory
    void set_products_dir(const std::string& dir);

    // Throws std::invalid_argument on out-of-range values
    void validate() const;

    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);

    // Throws std::runtime_error if the file cannot be opened,
    // ParseError if it is not valid JSON
    static Config load(const std::string& path);
};

} // namespace isoholdem
