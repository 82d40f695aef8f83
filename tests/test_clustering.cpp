// Tests for histogram distances and bucket clustering

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "abstraction/Clustering.hpp"
#include "abstraction/EquityDistribution.hpp"

using namespace isoholdem::abstraction;
using Catch::Matchers::WithinAbs;

namespace {

Eigen::VectorXd point_mass(int bin) {
    Eigen::VectorXd v = Eigen::VectorXd::Zero(EQUITY_BINS);
    v(bin) = 1.0;
    return v;
}

// Three tight groups of histograms around bins 5, 25 and 45, interleaved
Eigen::MatrixXd three_groups() {
    const int centres[3] = {45, 5, 25};
    Eigen::MatrixXd data = Eigen::MatrixXd::Zero(30, EQUITY_BINS);
    for (int i = 0; i < 30; ++i) {
        int c = centres[i % 3];
        int spread = (i / 3) % 3 - 1;
        data(i, c) += 0.5;
        data(i, c + spread) += 0.5;
    }
    return data;
}

} // namespace

TEST_CASE("Earth mover's distance on histograms", "[clustering]") {
    REQUIRE_THAT(earth_movers_distance(point_mass(3), point_mass(3)), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(earth_movers_distance(point_mass(3), point_mass(4)), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(earth_movers_distance(point_mass(0), point_mass(49)), WithinAbs(49.0, 1e-12));
    REQUIRE_THAT(earth_movers_distance(point_mass(49), point_mass(0)), WithinAbs(49.0, 1e-12));

    // Euclidean cannot tell near from far shifts
    REQUIRE_THAT(distance(point_mass(0), point_mass(1), DistanceMetric::Euclidean),
                 WithinAbs(distance(point_mass(0), point_mass(49), DistanceMetric::Euclidean),
                           1e-12));

    REQUIRE_THAT(histogram_mean(point_mass(49)), WithinAbs(0.99, 1e-12));
}

TEST_CASE("Distance metric names", "[clustering]") {
    REQUIRE(metric_from_string("emd") == DistanceMetric::EarthMovers);
    REQUIRE(metric_from_string("euclidean") == DistanceMetric::Euclidean);
    REQUIRE(metric_to_string(DistanceMetric::EarthMovers) == "emd");
    REQUIRE_THROWS_AS(metric_from_string("cosine"), std::invalid_argument);
}

TEST_CASE("K-means separates groups and orders buckets by equity", "[clustering]") {
    ClusterConfig config;
    config.k = 3;
    config.seed = 42;
    KMeansClusterer km(config);

    Eigen::MatrixXd data = three_groups();
    std::vector<int> labels = km.fit(data);

    REQUIRE(labels.size() == 30);
    REQUIRE(km.num_clusters() == 3);
    for (int i = 0; i < 30; ++i) {
        // Rows cycle through the groups at bins 45, 5, 25
        const int expected[3] = {2, 0, 1};
        REQUIRE(labels[i] == expected[i % 3]);
        REQUIRE(km.assign(data.row(i).transpose()) == labels[i]);
    }

    REQUIRE(km.assign(point_mass(0)) == 0);
    REQUIRE(km.assign(point_mass(49)) == 2);

    nlohmann::json j = km.to_json();
    REQUIRE(j["method"] == "kmeans");
    REQUIRE(j["centroids"].size() == 3);
}

TEST_CASE("K-means is deterministic for a seed", "[clustering]") {
    ClusterConfig config;
    config.k = 4;
    config.seed = 7;

    KMeansClusterer a(config);
    KMeansClusterer b(config);
    Eigen::MatrixXd data = three_groups();

    REQUIRE(a.fit(data) == b.fit(data));
    REQUIRE(a.centroids().isApprox(b.centroids()));
}

TEST_CASE("Clustering rejects bad input", "[clustering]") {
    ClusterConfig config;
    config.k = 5;
    KMeansClusterer km(config);

    REQUIRE_THROWS_AS(km.assign(point_mass(0)), std::logic_error);
    REQUIRE_THROWS_AS(km.fit(Eigen::MatrixXd::Zero(3, EQUITY_BINS)), std::invalid_argument);
    REQUIRE_THROWS_AS(km.fit(Eigen::MatrixXd(0, EQUITY_BINS)), std::invalid_argument);

    config.k = 0;
    KMeansClusterer zero(config);
    REQUIRE_THROWS_AS(zero.fit(three_groups()), std::invalid_argument);

    config.method = "spectral";
    REQUIRE_THROWS_AS(create_clusterer(config), std::invalid_argument);
}

TEST_CASE("Percentile buckets split by mean equity", "[clustering]") {
    ClusterConfig config;
    config.method = "percentile";
    config.k = 5;
    auto clusterer = create_clusterer(config);
    REQUIRE(clusterer->name() == "percentile");

    Eigen::MatrixXd data = Eigen::MatrixXd::Zero(10, EQUITY_BINS);
    for (int i = 0; i < 10; ++i) {
        data(9 - i, i * 5) = 1.0;
    }

    std::vector<int> labels = clusterer->fit(data);
    for (int i = 0; i < 10; ++i) {
        REQUIRE(labels[9 - i] == i / 2);
    }
    REQUIRE(clusterer->assign(point_mass(49)) == 4);
    REQUIRE(clusterer->assign(point_mass(0)) == 0);
}
