#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>

namespace isoholdem::abstraction {

enum class DistanceMetric {
    EarthMovers,  // 1-D earth mover's distance: L1 between cumulative sums
    Euclidean
};

std::string metric_to_string(DistanceMetric metric);
DistanceMetric metric_from_string(const std::string& name);

double earth_movers_distance(const Eigen::VectorXd& a, const Eigen::VectorXd& b);
double distance(const Eigen::VectorXd& a, const Eigen::VectorXd& b, DistanceMetric metric);

// Mean equity of a normalized histogram over [0, 1], bins taken at their centres
double histogram_mean(const Eigen::VectorXd& h);

// Configuration for clustering
struct ClusterConfig {
    std::string method = "kmeans";    // kmeans | percentile
    int k = 200;                      // Number of buckets
    int max_iters = 100;              // Lloyd iterations
    uint32_t seed = 123;              // k-means++ and reseeding
    DistanceMetric metric = DistanceMetric::EarthMovers;
    double tol = 1e-9;                // Stop when no centroid moves more
    int num_threads = 0;              // 0 = hardware concurrency
};

// Groups equity histograms (one per row) into buckets. Bucket 0 is the
// weakest by mean equity, bucket k-1 the strongest.
class Clusterer {
public:
    virtual ~Clusterer() = default;

    // Fits on the rows of data and returns each row's bucket.
    // Throws std::invalid_argument on empty data or k outside [1, rows].
    virtual std::vector<int> fit(const Eigen::MatrixXd& data) = 0;

    // Bucket of a new histogram; std::logic_error before fit
    virtual int assign(const Eigen::VectorXd& point) const = 0;

    virtual int num_clusters() const = 0;

    virtual std::string name() const = 0;

    // Fitted model, recorded with the dataset
    virtual nlohmann::json to_json() const = 0;
};

// Seeded k-means with k-means++ initialization
class KMeansClusterer : public Clusterer {
public:
    explicit KMeansClusterer(ClusterConfig config = {});

    std::vector<int> fit(const Eigen::MatrixXd& data) override;
    int assign(const Eigen::VectorXd& point) const override;
    int num_clusters() const override { return static_cast<int>(centroids_.rows()); }
    std::string name() const override { return "kmeans"; }
    nlohmann::json to_json() const override;

    const Eigen::MatrixXd& centroids() const { return centroids_; }
    int iterations() const { return iterations_; }

private:
    ClusterConfig config_;
    Eigen::MatrixXd centroids_;   // One row per bucket
    int iterations_ = 0;
};

// Equal-frequency buckets over mean equity
class PercentileClusterer : public Clusterer {
public:
    explicit PercentileClusterer(ClusterConfig config = {});

    std::vector<int> fit(const Eigen::MatrixXd& data) override;
    int assign(const Eigen::VectorXd& point) const override;
    int num_clusters() const override { return static_cast<int>(upper_bounds_.size()); }
    std::string name() const override { return "percentile"; }
    nlohmann::json to_json() const override;

private:
    ClusterConfig config_;
    std::vector<double> upper_bounds_;  // Highest mean equity in each bucket
};

// Factory function to create clusterers by config.method
std::unique_ptr<Clusterer> create_clusterer(const ClusterConfig& config);

} // namespace isoholdem::abstraction
