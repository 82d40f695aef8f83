// Tests for the 5-card strength table

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <fstream>
#include <random>

#include "TestSupport.hpp"
#include "cards/Canonical.hpp"
#include "core/Errors.hpp"
#include "eval/HandEvaluator.hpp"

using namespace isoholdem;
using namespace isoholdem::tables;
using isoholdem::testing::TempDir;
using isoholdem::testing::make_hand;
using isoholdem::testing::shared_strengths;

TEST_CASE("Generated table covers every 5-card class", "[strength]") {
    auto table = shared_strengths();
    REQUIRE(table->size() == 134459);

    REQUIRE(table->strength(make_hand("AsKsQsJsTs")) == NUM_STRENGTH_CLASSES);
    REQUIRE(table->strength(make_hand("7c5d4h3s2c")) == 1);
    REQUIRE(table->strength(make_hand("AsKsQsJsTs")) >
            table->strength(make_hand("2c3c4c5c7d")));
}

TEST_CASE("Strength is the best five of up to seven cards", "[strength]") {
    auto table = shared_strengths();
    REQUIRE(table->strength(make_hand("AsKsQsJsTs2c3d")) == NUM_STRENGTH_CLASSES);
    REQUIRE(table->strength(make_hand("AhAcAdKhKc2c3d")) ==
            table->strength(make_hand("AhAcAdKhKc")));
    REQUIRE(table->strength(make_hand("9c9d2h3s4hKcQd")) ==
            table->strength(make_hand("9c9dKcQd4h")));
}

TEST_CASE("Strength ordering agrees with the evaluator", "[strength]") {
    auto table = shared_strengths();
    std::mt19937 rng(2024);
    std::vector<cards::Card> d = cards::deck();

    for (int trial = 0; trial < 300; ++trial) {
        std::shuffle(d.begin(), d.end(), rng);
        cards::Hand a(d.begin(), d.begin() + 7);
        cards::Hand b(d.begin() + 7, d.begin() + 14);

        auto va = eval::HandEvaluator::evaluate(a);
        auto vb = eval::HandEvaluator::evaluate(b);
        int sa = table->strength(a);
        int sb = table->strength(b);

        REQUIRE((va < vb) == (sa < sb));
        REQUIRE((va == vb) == (sa == sb));
    }
}

TEST_CASE("Strength ignores suit labels and card order", "[strength]") {
    auto table = shared_strengths();
    int s = table->strength(make_hand("Ah9h7h3d2c"));
    REQUIRE(table->strength(make_hand("As9s7s3c2d")) == s);
    REQUIRE(table->strength(make_hand("2c3dAh7h9h")) == s);

    auto code = cards::pack_hand(
        cards::canonicalize(make_hand("Ah9h7h3d2c"), cards::StreetMode::StreetAgnostic));
    REQUIRE(table->lookup(code) == s);
}

TEST_CASE("Strength rejects bad input", "[strength]") {
    auto table = shared_strengths();
    REQUIRE_THROWS_AS(table->strength(make_hand("AsKsQs")), std::invalid_argument);
    REQUIRE_THROWS_AS(table->strength(make_hand("AsKsQsJsTs9s8s7s")),
                      std::invalid_argument);

    cards::Hand dup = make_hand("AsKsQsJsTs");
    dup.push_back(cards::parse_card("As"));
    REQUIRE_THROWS_AS(table->strength(dup), std::invalid_argument);
}

TEST_CASE("Partial tables report misses", "[strength]") {
    StrengthTable table;
    REQUIRE(table.empty());
    REQUIRE_THROWS_AS(table.strength(make_hand("AsKsQsJsTs")), DatasetLookupMiss);

    table.insert(cards::code_from_string("TcJcQcKcAc"), NUM_STRENGTH_CLASSES);
    REQUIRE(table.strength(make_hand("AhKhQhJhTh")) == NUM_STRENGTH_CLASSES);
    REQUIRE_THROWS_AS(table.strength(make_hand("AhKhQhJh9h")), DatasetLookupMiss);
    REQUIRE_THROWS_AS(table.lookup(cards::code_from_string("9cJcQcKcAc")),
                      DatasetLookupMiss);

    REQUIRE_THROWS_AS(table.insert(cards::code_from_string("AcKc"), 5),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(table.insert(cards::code_from_string("9cJcQcKcAc"), 0),
                      std::invalid_argument);
}

TEST_CASE("Strength table saves and loads", "[strength]") {
    TempDir dir("strength");
    auto table = shared_strengths();
    std::string path = dir.sub("strengths.json");

    table->save(path);
    StrengthTable loaded = StrengthTable::load(path);

    REQUIRE(loaded.size() == table->size());
    REQUIRE(loaded.strength(make_hand("AsKsQsJsTs2c3d")) == NUM_STRENGTH_CLASSES);
    REQUIRE(loaded.strength(make_hand("Kd8c8h5s2d")) ==
            table->strength(make_hand("Kd8c8h5s2d")));
}

TEST_CASE("Loading a missing or malformed strength file", "[strength]") {
    TempDir dir("strength_bad");

    REQUIRE_THROWS_AS(StrengthTable::load(dir.sub("absent.json")), DatasetMissingError);

    {
        std::ofstream out(dir.sub("garbage.json"));
        out << "{ not json";
    }
    REQUIRE_THROWS_AS(StrengthTable::load(dir.sub("garbage.json")), ParseError);

    {
        std::ofstream out(dir.sub("noncanonical.json"));
        out << "{\"AsKsQsJsTs\": 7462}";
    }
    REQUIRE_THROWS_AS(StrengthTable::load(dir.sub("noncanonical.json")), ParseError);

    {
        std::ofstream out(dir.sub("badvalue.json"));
        out << "{\"TcJcQcKcAc\": \"high\"}";
    }
    REQUIRE_THROWS_AS(StrengthTable::load(dir.sub("badvalue.json")), ParseError);

    // Values outside the strength range and keys of the wrong length
    const char* bad_entries[] = {
        "{\"TcJcQcKcAc\": 0}",
        "{\"TcJcQcKcAc\": 70000}",
        "{\"TcJcQcKcAc\": 4294967297}",
        "{\"2c3c4c5c\": 12}",
        "{\"2c3c4c5c6c7c8c9cTc\": 12}",
        "{\"2c3x4c5c6c\": 12}"
    };
    for (const char* entry : bad_entries) {
        {
            std::ofstream out(dir.sub("entry.json"));
            out << entry;
        }
        INFO(entry);
        REQUIRE_THROWS_AS(StrengthTable::load(dir.sub("entry.json")), ParseError);
    }
}
