#include "Clustering.hpp"
#include "parallel/ParallelMap.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <stdexcept>

namespace isoholdem::abstraction {

std::string metric_to_string(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::EarthMovers: return "emd";
        case DistanceMetric::Euclidean: return "euclidean";
    }
    return "unknown";
}

DistanceMetric metric_from_string(const std::string& name) {
    if (name == "emd") return DistanceMetric::EarthMovers;
    if (name == "euclidean") return DistanceMetric::Euclidean;
    throw std::invalid_argument("Unknown distance metric: " + name);
}

double earth_movers_distance(const Eigen::VectorXd& a, const Eigen::VectorXd& b) {
    double carried = 0.0;
    double total = 0.0;
    for (Eigen::Index i = 0; i < a.size(); ++i) {
        carried += a(i) - b(i);
        total += std::abs(carried);
    }
    return total;
}

double distance(const Eigen::VectorXd& a, const Eigen::VectorXd& b, DistanceMetric metric) {
    if (metric == DistanceMetric::EarthMovers) {
        return earth_movers_distance(a, b);
    }
    return (a - b).norm();
}

double histogram_mean(const Eigen::VectorXd& h) {
    const double bins = static_cast<double>(h.size());
    double sum = 0.0;
    double mass = 0.0;
    for (Eigen::Index i = 0; i < h.size(); ++i) {
        sum += h(i) * (i + 0.5) / bins;
        mass += h(i);
    }
    return mass > 0.0 ? sum / mass : 0.0;
}

namespace {

void check_fit_input(const Eigen::MatrixXd& data, int k) {
    if (data.rows() == 0) {
        throw std::invalid_argument("Clustering: data is empty");
    }
    if (k <= 0) {
        throw std::invalid_argument("Clustering: k must be positive");
    }
    if (k > data.rows()) {
        throw std::invalid_argument("Clustering: k cannot exceed number of points");
    }
}

int nearest(const Eigen::MatrixXd& centroids, const Eigen::VectorXd& point,
            DistanceMetric metric) {
    double best_dist = std::numeric_limits<double>::max();
    int best_idx = 0;
    for (Eigen::Index j = 0; j < centroids.rows(); ++j) {
        double d = distance(point, centroids.row(j).transpose(), metric);
        if (d < best_dist) {
            best_dist = d;
            best_idx = static_cast<int>(j);
        }
    }
    return best_idx;
}

} // namespace

// ============================================================================
// KMeansClusterer
// ============================================================================

KMeansClusterer::KMeansClusterer(ClusterConfig config)
    : config_(std::move(config)) {}

std::vector<int> KMeansClusterer::fit(const Eigen::MatrixXd& data) {
    const int k = config_.k;
    check_fit_input(data, k);

    const std::size_t n = static_cast<std::size_t>(data.rows());
    std::mt19937 rng(config_.seed);
    std::uniform_int_distribution<std::size_t> U(0, n - 1);

    // k-means++ seeding: next centroid drawn with probability ~ D(x)^2
    centroids_.resize(k, data.cols());
    centroids_.row(0) = data.row(U(rng));
    std::vector<double> min_dist(n, std::numeric_limits<double>::max());

    for (int c = 1; c < k; ++c) {
        const Eigen::VectorXd last = centroids_.row(c - 1).transpose();
        auto dists = parallel::parallel_map<double>(n, [&](std::size_t i) {
            return distance(data.row(i).transpose(), last, config_.metric);
        }, config_.num_threads);

        double total = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            min_dist[i] = std::min(min_dist[i], dists[i]);
            total += min_dist[i] * min_dist[i];
        }

        std::size_t pick = U(rng);
        if (total > 0.0) {
            std::uniform_real_distribution<double> R(0.0, total);
            double target = R(rng);
            for (std::size_t i = 0; i < n; ++i) {
                target -= min_dist[i] * min_dist[i];
                if (target <= 0.0 && min_dist[i] > 0.0) {
                    pick = i;
                    break;
                }
            }
        }
        centroids_.row(c) = data.row(pick);
    }

    std::vector<int> assignments(n, -1);
    iterations_ = 0;

    for (int it = 0; it < config_.max_iters; ++it) {
        iterations_ = it + 1;

        auto next = parallel::parallel_map<int>(n, [&](std::size_t i) {
            return nearest(centroids_, data.row(i).transpose(), config_.metric);
        }, config_.num_threads);

        const bool changed = (next != assignments);
        assignments = std::move(next);
        if (!changed) break;

        // accumulation for centroid update
        Eigen::MatrixXd sum = Eigen::MatrixXd::Zero(k, data.cols());
        std::vector<int> count(k, 0);
        for (std::size_t i = 0; i < n; ++i) {
            sum.row(assignments[i]) += data.row(i);
            count[assignments[i]]++;
        }

        // update centroids; empty clusters restart from a random point
        double moved = 0.0;
        for (int j = 0; j < k; ++j) {
            Eigen::RowVectorXd updated = count[j] > 0
                ? Eigen::RowVectorXd(sum.row(j) / count[j])
                : Eigen::RowVectorXd(data.row(U(rng)));
            moved = std::max(moved, (updated - centroids_.row(j)).norm());
            centroids_.row(j) = updated;
        }
        if (moved < config_.tol) break;
    }

    // Relabel so bucket order follows mean equity
    std::vector<int> order(k);
    std::iota(order.begin(), order.end(), 0);
    std::vector<double> means(k);
    for (int j = 0; j < k; ++j) {
        means[j] = histogram_mean(centroids_.row(j).transpose());
    }
    std::stable_sort(order.begin(), order.end(), [&means](int a, int b) {
        return means[a] < means[b];
    });

    Eigen::MatrixXd sorted(k, data.cols());
    for (int j = 0; j < k; ++j) {
        sorted.row(j) = centroids_.row(order[j]);
    }
    centroids_ = std::move(sorted);

    // Final assignment against the final centroids
    return parallel::parallel_map<int>(n, [&](std::size_t i) {
        return nearest(centroids_, data.row(i).transpose(), config_.metric);
    }, config_.num_threads);
}

int KMeansClusterer::assign(const Eigen::VectorXd& point) const {
    if (centroids_.rows() == 0) {
        throw std::logic_error("KMeansClusterer::assign called before fit");
    }
    if (point.size() != centroids_.cols()) {
        throw std::invalid_argument("Point has " + std::to_string(point.size()) +
                                    " bins, centroids have " +
                                    std::to_string(centroids_.cols()));
    }
    return nearest(centroids_, point, config_.metric);
}

nlohmann::json KMeansClusterer::to_json() const {
    nlohmann::json j;
    j["method"] = name();
    j["k"] = num_clusters();
    j["metric"] = metric_to_string(config_.metric);
    j["seed"] = config_.seed;
    j["iterations"] = iterations_;
    j["centroids"] = nlohmann::json::array();
    for (Eigen::Index r = 0; r < centroids_.rows(); ++r) {
        std::vector<double> row(static_cast<std::size_t>(centroids_.cols()));
        for (Eigen::Index c = 0; c < centroids_.cols(); ++c) {
            row[static_cast<std::size_t>(c)] = centroids_(r, c);
        }
        j["centroids"].push_back(row);
    }
    return j;
}

// ============================================================================
// PercentileClusterer
// ============================================================================

PercentileClusterer::PercentileClusterer(ClusterConfig config)
    : config_(std::move(config)) {}

std::vector<int> PercentileClusterer::fit(const Eigen::MatrixXd& data) {
    const int k = config_.k;
    check_fit_input(data, k);

    const std::size_t n = static_cast<std::size_t>(data.rows());
    std::vector<double> means(n);
    for (std::size_t i = 0; i < n; ++i) {
        means[i] = histogram_mean(data.row(i).transpose());
    }

    std::vector<double> sorted = means;
    std::sort(sorted.begin(), sorted.end());

    upper_bounds_.resize(k);
    for (int b = 0; b < k; ++b) {
        std::size_t last = (static_cast<std::size_t>(b) + 1) * n / k - 1;
        upper_bounds_[b] = sorted[last];
    }

    std::vector<int> assignments(n);
    for (std::size_t i = 0; i < n; ++i) {
        assignments[i] = assign(data.row(i).transpose());
    }
    return assignments;
}

int PercentileClusterer::assign(const Eigen::VectorXd& point) const {
    if (upper_bounds_.empty()) {
        throw std::logic_error("PercentileClusterer::assign called before fit");
    }
    const double m = histogram_mean(point);
    auto it = std::lower_bound(upper_bounds_.begin(), upper_bounds_.end(), m);
    if (it == upper_bounds_.end()) {
        return static_cast<int>(upper_bounds_.size()) - 1;
    }
    return static_cast<int>(it - upper_bounds_.begin());
}

nlohmann::json PercentileClusterer::to_json() const {
    return {
        {"method", name()},
        {"k", num_clusters()},
        {"upper_bounds", upper_bounds_}
    };
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<Clusterer> create_clusterer(const ClusterConfig& config) {
    if (config.method == "kmeans") {
        return std::make_unique<KMeansClusterer>(config);
    }
    if (config.method == "percentile") {
        return std::make_unique<PercentileClusterer>(config);
    }
    throw std::invalid_argument("Unknown cluster method: " + config.method);
}

} // namespace isoholdem::abstraction
