#include "Config.hpp"
#include "Errors.hpp"
#include <fstream>
#include <stdexcept>

namespace isoholdem {

void Config::set_products_dir(const std::string& dir) {
    products_dir = dir;
    strength_path = dir + "/strengths.json";
    equity_dir = dir + "/river_equity";
    flop_distribution_dir = dir + "/flop_distributions";
    turn_distribution_dir = dir + "/turn_distributions";
    flop_abstraction_dir = dir + "/flop_abstraction";
    turn_abstraction_dir = dir + "/turn_abstraction";
}

void Config::validate() const {
    if (equity_batch_size == 0 || distribution_batch_size == 0) {
        throw std::invalid_argument("Batch sizes must be positive");
    }
    if (flop_buckets <= 0 || turn_buckets <= 0 || river_buckets <= 0) {
        throw std::invalid_argument("Bucket counts must be positive");
    }
    if (cluster_method != "kmeans" && cluster_method != "percentile") {
        throw std::invalid_argument("Unknown cluster method: " + cluster_method);
    }
    if (distance_metric != "emd" && distance_metric != "euclidean") {
        throw std::invalid_argument("Unknown distance metric: " + distance_metric);
    }
    if (kmeans_max_iters <= 0) {
        throw std::invalid_argument("kmeans_max_iters must be positive");
    }
    if (max_train_samples == 0) {
        throw std::invalid_argument("max_train_samples must be positive");
    }
}

nlohmann::json Config::to_json() const {
    return {
        {"products_dir", products_dir},
        {"strength_path", strength_path},
        {"equity_dir", equity_dir},
        {"flop_distribution_dir", flop_distribution_dir},
        {"turn_distribution_dir", turn_distribution_dir},
        {"flop_abstraction_dir", flop_abstraction_dir},
        {"turn_abstraction_dir", turn_abstraction_dir},
        {"equity_batch_size", equity_batch_size},
        {"distribution_batch_size", distribution_batch_size},
        {"num_threads", num_threads},
        {"max_batches", max_batches},
        {"flop_buckets", flop_buckets},
        {"turn_buckets", turn_buckets},
        {"river_buckets", river_buckets},
        {"cluster_method", cluster_method},
        {"distance_metric", distance_metric},
        {"kmeans_max_iters", kmeans_max_iters},
        {"seed", seed},
        {"max_train_samples", max_train_samples},
        {"build_missing", build_missing},
        {"verbose", verbose}
    };
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    // A products_dir re-roots the defaults; explicit paths still win below
    if (j.contains("products_dir")) {
        c.set_products_dir(j.at("products_dir").get<std::string>());
    }

    c.strength_path = j.value("strength_path", c.strength_path);
    c.equity_dir = j.value("equity_dir", c.equity_dir);
    c.flop_distribution_dir = j.value("flop_distribution_dir", c.flop_distribution_dir);
    c.turn_distribution_dir = j.value("turn_distribution_dir", c.turn_distribution_dir);
    c.flop_abstraction_dir = j.value("flop_abstraction_dir", c.flop_abstraction_dir);
    c.turn_abstraction_dir = j.value("turn_abstraction_dir", c.turn_abstraction_dir);
    c.equity_batch_size = j.value("equity_batch_size", c.equity_batch_size);
    c.distribution_batch_size = j.value("distribution_batch_size", c.distribution_batch_size);
    c.num_threads = j.value("num_threads", c.num_threads);
    c.max_batches = j.value("max_batches", c.max_batches);
    c.flop_buckets = j.value("flop_buckets", c.flop_buckets);
    c.turn_buckets = j.value("turn_buckets", c.turn_buckets);
    c.river_buckets = j.value("river_buckets", c.river_buckets);
    c.cluster_method = j.value("cluster_method", c.cluster_method);
    c.distance_metric = j.value("distance_metric", c.distance_metric);
    c.kmeans_max_iters = j.value("kmeans_max_iters", c.kmeans_max_iters);
    c.seed = j.value("seed", c.seed);
    c.max_train_samples = j.value("max_train_samples", c.max_train_samples);
    c.build_missing = j.value("build_missing", c.build_missing);
    c.verbose = j.value("verbose", c.verbose);

    c.validate();
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        f >> j;
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw ParseError("Invalid config file " + path + ": " + e.what());
    }
}

} // namespace isoholdem
