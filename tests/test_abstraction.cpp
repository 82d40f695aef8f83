// Tests for abstraction tables, the offline builder and the bucket facade

#include <catch2/catch_test_macros.hpp>

#include <set>

#include "TestSupport.hpp"
#include "abstraction/AbstractionBuilder.hpp"
#include "abstraction/AbstractionTable.hpp"
#include "abstraction/CardAbstraction.hpp"
#include "abstraction/TableSet.hpp"
#include "build/CheckpointStore.hpp"
#include "core/Errors.hpp"

using namespace isoholdem;
using namespace isoholdem::abstraction;
using cards::Street;
using isoholdem::testing::TempDir;
using isoholdem::testing::make_hand;
using isoholdem::testing::shared_strengths;

namespace {

const std::vector<std::string>& turn_hands() {
    static const std::vector<std::string> hands = {
        "AsKsQsJsTs2c",   // royal flush
        "AhAdAcKsQd9h",
        "KhKdKc7s2d9h",
        "QhQd8c7s2d4h",
        "JhTh9h8d2c3s",
        "9c8dAhKsQd2h",
        "7c2dAhKsQd9h",
        "3c2dAhKsQd9h",
        "4c3dKhJsTd8h",
        "6c5dAhKsJd9h",
        "TcTdAhKs5d2h",
        "AcQdAh7s5d2h"
    };
    return hands;
}

} // namespace

TEST_CASE("Preflop bins cover the 169 hand classes", "[abstraction]") {
    REQUIRE(CardAbstraction::preflop_bin(make_hand("AhAd")) ==
            CardAbstraction::preflop_bin(make_hand("AcAs")));
    REQUIRE(CardAbstraction::preflop_bin(make_hand("AhAd")) !=
            CardAbstraction::preflop_bin(make_hand("AhKh")));
    REQUIRE(CardAbstraction::preflop_bin(make_hand("KhAh")) ==
            CardAbstraction::preflop_bin(make_hand("AsKs")));

    REQUIRE(CardAbstraction::preflop_bin(make_hand("2c2d")) == 0);
    REQUIRE(CardAbstraction::preflop_bin(make_hand("AcAd")) == 12);
    REQUIRE(CardAbstraction::preflop_bin(make_hand("3c2c")) == 13);
    REQUIRE(CardAbstraction::preflop_bin(make_hand("AhKh")) == 90);
    REQUIRE(CardAbstraction::preflop_bin(make_hand("3c2d")) == 91);
    REQUIRE(CardAbstraction::preflop_bin(make_hand("AhKd")) == 168);

    std::set<int> ids;
    const auto& d = cards::deck();
    for (int a = 0; a < cards::DECK_SIZE; ++a) {
        for (int b = a + 1; b < cards::DECK_SIZE; ++b) {
            int id = CardAbstraction::preflop_bin({d[a], d[b]});
            REQUIRE(id >= 0);
            REQUIRE(id < 169);
            ids.insert(id);
        }
    }
    REQUIRE(ids.size() == 169);
    REQUIRE(count_canonical_preflop_hands() == 169);

    REQUIRE_THROWS_AS(CardAbstraction::preflop_bin(make_hand("AhKhQh")), std::invalid_argument);
}

TEST_CASE("Abstraction tables key on the canonical hand", "[abstraction]") {
    AbstractionTable flop(Street::Flop, 10);
    flop.insert(make_hand("AsKsQsJs2c"), 3);

    REQUIRE(flop.lookup(make_hand("AhKhQhJh2d")) == 3);
    REQUIRE(flop.lookup(make_hand("KdAdJdQd2s")) == 3);
    REQUIRE(flop.lookup(make_hand("AcKcQcJc2h")) == 3);
    REQUIRE(flop.size() == 1);

    REQUIRE_THROWS_AS(flop.lookup(make_hand("AsKsQsJs3c")), DatasetLookupMiss);
    REQUIRE_THROWS_AS(flop.lookup(make_hand("AsKsQsJs2c3c")), std::invalid_argument);
    REQUIRE_THROWS_AS(flop.insert(make_hand("AsKsQsJs3c"), 10), std::invalid_argument);
    REQUIRE_THROWS_AS(flop.insert(make_hand("AsKsQsJs3c"), -1), std::invalid_argument);

    REQUIRE_THROWS_AS(AbstractionTable(Street::River, 10), std::invalid_argument);
    REQUIRE_THROWS_AS(AbstractionTable(Street::Turn, 0), std::invalid_argument);
    REQUIRE(abstraction_kind(Street::Turn) == "turn_abstraction");
}

TEST_CASE("Facade routes each street to its table", "[abstraction]") {
    auto flop = std::make_shared<AbstractionTable>(Street::Flop, 5);
    flop->insert(make_hand("AsKsQsJs2c"), 4);
    auto turn = std::make_shared<AbstractionTable>(Street::Turn, 7);
    turn->insert(make_hand("AsKsQsJs2c3d"), 6);
    auto equities = std::make_shared<tables::EquityTable>();
    equities->insert(cards::pack_hand(cards::canonicalize(
        make_hand("AsKsQsJsTs2c3d"), cards::StreetMode::StreetAware)), 1.0f);
    equities->insert(cards::pack_hand(cards::canonicalize(
        make_hand("7c2dAhKsQd9h4c"), cards::StreetMode::StreetAware)), 0.25f);

    TableSet tables;
    tables.strengths = shared_strengths();
    tables.flop = flop;
    tables.turn = turn;
    tables.equities = equities;
    CardAbstraction facade(tables, 50);

    REQUIRE(facade.abstract_id(make_hand("AhAd")) == 12);
    REQUIRE(facade.abstract_id(make_hand("AhKhQhJh2d")) == 4);
    REQUIRE(facade.abstract_id(make_hand("AhKhQhJh2d3c")) == 6);
    REQUIRE(facade.abstract_id(make_hand("AhKhQhJhTh2d3c")) == 49);
    REQUIRE(facade.abstract_id(make_hand("7d2cAhKsQc9h4d")) == 12);

    REQUIRE(facade.num_buckets(Street::Preflop) == 169);
    REQUIRE(facade.num_buckets(Street::Flop) == 5);
    REQUIRE(facade.num_buckets(Street::Turn) == 7);
    REQUIRE(facade.num_buckets(Street::River) == 50);

    REQUIRE(facade.hand_strength(make_hand("AsKsQsJsTs")) == tables::NUM_STRENGTH_CLASSES);
    REQUIRE(facade.equity(make_hand("AsKsQsJsTs2c3d")) == 1.0);

    REQUIRE_THROWS_AS(facade.abstract_id(make_hand("AhKhQh")), std::invalid_argument);
    REQUIRE_THROWS_AS(facade.abstract_id(make_hand("AsKsQsJs3c")), DatasetLookupMiss);
    REQUIRE_THROWS_AS(CardAbstraction(tables, 0), std::invalid_argument);
}

TEST_CASE("Facade reports tables that are not loaded", "[abstraction]") {
    CardAbstraction facade(TableSet{}, 50);

    REQUIRE(facade.abstract_id(make_hand("7c2d")) == 101);
    REQUIRE_THROWS_AS(facade.abstract_id(make_hand("AsKsQsJs2c")), DatasetMissingError);
    REQUIRE_THROWS_AS(facade.abstract_id(make_hand("AsKsQsJs2c3d")), DatasetMissingError);
    REQUIRE_THROWS_AS(facade.abstract_id(make_hand("AsKsQsJsTs2c3d")), DatasetMissingError);
    REQUIRE_THROWS_AS(facade.hand_strength(make_hand("AsKsQsJsTs")), DatasetMissingError);
    REQUIRE(facade.num_buckets(Street::Flop) == 0);
}

TEST_CASE("Turn abstraction builds end to end and resumes", "[abstraction]") {
    TempDir dir("turn_abs");
    std::string dist_dir = dir.sub("turn_distributions");
    std::string abs_dir = dir.sub("turn_abstraction");

    std::vector<cards::Hand> hands;
    for (const std::string& text : turn_hands()) {
        hands.push_back(make_hand(text));
    }

    AbstractionBuildConfig config;
    config.batch.batch_size = 5;
    config.batch.max_batches = 1;
    config.cluster.k = 3;
    config.cluster.seed = 11;
    AbstractionBuilder builder(shared_strengths(), config);

    build::BuildSummary partial = builder.build_distributions(Street::Turn, hands, dist_dir);
    REQUIRE(partial.batches == 3);
    REQUIRE(partial.computed == 1);
    REQUIRE_FALSE(partial.complete);
    REQUIRE_THROWS_AS(builder.cluster(Street::Turn, dist_dir, abs_dir), DatasetMissingError);

    config.batch.max_batches = -1;
    AbstractionBuilder resumed(shared_strengths(), config);
    build::BuildSummary full = resumed.build_distributions(Street::Turn, hands, dist_dir);
    REQUIRE(full.skipped == 1);
    REQUIRE(full.complete);

    AbstractionTable table = resumed.cluster(Street::Turn, dist_dir, abs_dir);
    REQUIRE(table.size() == hands.size());
    REQUIRE(table.num_buckets() == 3);

    for (const cards::Hand& h : hands) {
        int bucket = table.lookup(h);
        REQUIRE(bucket >= 0);
        REQUIRE(bucket < 3);
    }

    // The made royal flush sits in the strongest bucket
    REQUIRE(table.lookup(make_hand("AhKhQhJhTh2c")) == 2);

    build::Manifest manifest = build::CheckpointStore(abs_dir).read_manifest();
    REQUIRE(manifest.kind == "turn_abstraction");
    REQUIRE(manifest.extra["num_buckets"] == 3);
    REQUIRE(manifest.extra["clusterer"]["method"] == "kmeans");

    // A finished abstraction is reloaded, not refit
    AbstractionTable again = resumed.cluster(Street::Turn, dist_dir, abs_dir);
    for (const cards::Hand& h : hands) {
        REQUIRE(again.lookup(h) == table.lookup(h));
    }
    AbstractionTable loaded = AbstractionTable::load(abs_dir, Street::Turn);
    REQUIRE(loaded.size() == hands.size());
    REQUIRE_THROWS_AS(AbstractionTable::load(abs_dir, Street::Flop), ParseError);
}

TEST_CASE("Builder rejects bad streets and units", "[abstraction]") {
    TempDir dir("abs_bad");
    AbstractionBuilder builder(shared_strengths(), AbstractionBuildConfig{});

    REQUIRE_THROWS_AS(builder.build_distributions(Street::River, dir.sub("x")),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(builder.build_distributions(Street::Flop, {make_hand("AsKs")},
                                                  dir.sub("x")),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(AbstractionBuilder(nullptr, AbstractionBuildConfig{}),
                      std::invalid_argument);
    REQUIRE(distribution_kind(Street::Flop) == "flop_distributions");
}

TEST_CASE("Table loading without building reports missing datasets", "[abstraction]") {
    TempDir dir("tableset");
    Config config;
    config.set_products_dir(dir.path());
    config.build_missing = false;

    REQUIRE_THROWS_AS(load_tables(config, TableNeeds::all()), DatasetMissingError);

    // Preflop-only queries read no dataset at all
    TableSet none = load_tables(config, tables_needed({make_hand("AsKd")}, true));
    REQUIRE(none.strengths == nullptr);
    REQUIRE(none.equities == nullptr);

    shared_strengths()->save(config.strength_path);
    auto strengths = load_strengths(config);
    REQUIRE(strengths->size() == 134459);

    REQUIRE_THROWS_AS(load_equities(config, strengths), DatasetMissingError);
    REQUIRE_THROWS_AS(load_abstraction(config, Street::Flop, strengths), DatasetMissingError);
}

TEST_CASE("Queries load only the tables they read", "[abstraction]") {
    TableNeeds preflop = tables_needed({make_hand("AsKd"), make_hand("7c2d")}, false);
    REQUIRE_FALSE(preflop.strengths);
    REQUIRE_FALSE(preflop.equities);
    REQUIRE_FALSE(preflop.flop);
    REQUIRE_FALSE(preflop.turn);

    // A flop id does not pull in the river equity table
    TableNeeds flop = tables_needed({make_hand("AsKsQsJs2c")}, false);
    REQUIRE(flop.strengths);
    REQUIRE(flop.flop);
    REQUIRE_FALSE(flop.equities);
    REQUIRE_FALSE(flop.turn);

    REQUIRE(tables_needed({make_hand("AsKsQsJs2c")}, true).equities);

    TableNeeds turn = tables_needed({make_hand("AsKsQsJs2c3d")}, false);
    REQUIRE(turn.turn);
    REQUIRE_FALSE(turn.equities);

    TableNeeds river = tables_needed({make_hand("AsKsQsJs2c3d4h")}, false);
    REQUIRE(river.equities);
    REQUIRE_FALSE(river.flop);
    REQUIRE_FALSE(river.turn);

    REQUIRE_THROWS_AS(tables_needed({make_hand("AsKsQs")}, false), std::invalid_argument);
}

TEST_CASE("Config maps onto build settings", "[abstraction]") {
    Config config;
    config.flop_buckets = 30;
    config.turn_buckets = 40;
    config.distribution_batch_size = 77;
    config.distance_metric = "euclidean";

    AbstractionBuildConfig flop = abstraction_build_config(config, Street::Flop);
    REQUIRE(flop.cluster.k == 30);
    REQUIRE(flop.batch.batch_size == 77);
    REQUIRE(flop.cluster.metric == DistanceMetric::Euclidean);
    REQUIRE(abstraction_build_config(config, Street::Turn).cluster.k == 40);
    REQUIRE(equity_batch_config(config).batch_size == config.equity_batch_size);
}
