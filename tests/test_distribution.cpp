// Tests for equity histograms of flop and turn hands

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "TestSupport.hpp"
#include "abstraction/EquityDistribution.hpp"
#include "core/Errors.hpp"

using namespace isoholdem;
using namespace isoholdem::abstraction;
using Catch::Matchers::WithinAbs;
using isoholdem::testing::make_hand;
using isoholdem::testing::shared_strengths;

TEST_CASE("Equity bins cover [0, 1]", "[distribution]") {
    REQUIRE(equity_bin(0.0) == 0);
    REQUIRE(equity_bin(0.03) == 1);
    REQUIRE(equity_bin(0.5) == 25);
    REQUIRE(equity_bin(0.999) == 49);
    REQUIRE(equity_bin(1.0) == EQUITY_BINS - 1);
    REQUIRE(equity_bin(-0.1) == 0);
}

TEST_CASE("Histogram statistics", "[distribution]") {
    EquityDistribution d;
    REQUIRE(d.total() == 0);
    REQUIRE(d.mean_equity() == 0.0);
    REQUIRE(d.normalized().sum() == 0.0);

    d.add(0.0);
    d.add(1.0);
    d.add(1.0);
    d.add(0.5);
    REQUIRE(d.total() == 4);
    REQUIRE(d.counts[49] == 2);
    REQUIRE_THAT(d.normalized().sum(), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(d.normalized()(49), WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(d.mean_equity(), WithinAbs((0.01 + 0.99 + 0.99 + 0.51) / 4.0, 1e-12));
}

TEST_CASE("Histograms serialize as 50 counts", "[distribution]") {
    EquityDistribution d;
    d.add(0.25);
    d.add(0.75);

    nlohmann::json j = d.to_json();
    REQUIRE(j.is_array());
    REQUIRE(j.size() == EQUITY_BINS);
    REQUIRE(EquityDistribution::from_json(j).counts == d.counts);

    REQUIRE_THROWS_AS(EquityDistribution::from_json(nlohmann::json::array({1, 2})), ParseError);
    j[3] = -1;
    REQUIRE_THROWS_AS(EquityDistribution::from_json(j), ParseError);
    j[3] = "many";
    REQUIRE_THROWS_AS(EquityDistribution::from_json(j), ParseError);
    REQUIRE_THROWS_AS(EquityDistribution::from_json(nlohmann::json::object()), ParseError);
}

TEST_CASE("Turn distribution covers all 1035 opponents", "[distribution]") {
    auto strengths = shared_strengths();

    // Royal flush already made: every opponent loses on every river
    EquityDistribution nuts = equity_distribution(make_hand("AsKsQsJsTs2c"), *strengths);
    REQUIRE(nuts.total() == 1035);
    REQUIRE(nuts.counts[EQUITY_BINS - 1] == 1035);

    EquityDistribution weak = equity_distribution(make_hand("7c2dAhKsQd9h"), *strengths);
    REQUIRE(weak.total() == 1035);
    REQUIRE(weak.mean_equity() < 0.5);

    EquityDistribution strong = equity_distribution(make_hand("AhAdAcKsQd9h"), *strengths);
    REQUIRE(strong.mean_equity() > weak.mean_equity());
}

TEST_CASE("Distributions are suit-invariant", "[distribution]") {
    auto strengths = shared_strengths();
    EquityDistribution a = equity_distribution(make_hand("Th9h8c7d2s3s"), *strengths);
    EquityDistribution b = equity_distribution(make_hand("Ts9s8d7c2h3h"), *strengths);
    REQUIRE(a.counts == b.counts);
}

TEST_CASE("Flop distribution covers all 1081 opponents", "[distribution]") {
    auto strengths = shared_strengths();
    EquityDistribution nuts = equity_distribution(make_hand("AsKsQsJsTs"), *strengths);
    REQUIRE(nuts.total() == 1081);
    REQUIRE(nuts.counts[EQUITY_BINS - 1] == 1081);
}

TEST_CASE("Distributions reject other hand sizes", "[distribution]") {
    auto strengths = shared_strengths();
    REQUIRE_THROWS_AS(equity_distribution(make_hand("AsKs"), *strengths),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(equity_distribution(make_hand("AsKsQsJsTs2c3d"), *strengths),
                      std::invalid_argument);
}
