// Tests for the packed 64-bit hand code

#include <catch2/catch_test_macros.hpp>

#include "cards/HandCode.hpp"
#include "core/Errors.hpp"

using namespace isoholdem;
using namespace isoholdem::cards;

TEST_CASE("Card bytes use suit * 15 + rank", "[hand_code]") {
    REQUIRE(card_byte(parse_card("2c")) == 2);
    REQUIRE(card_byte(parse_card("Ac")) == 14);
    REQUIRE(card_byte(parse_card("2d")) == 17);
    REQUIRE(card_byte(parse_card("As")) == 59);

    // Card i occupies byte i
    REQUIRE(pack_hand(parse_hand("2cAs")) == (HandCode{2} | (HandCode{59} << 8)));
    REQUIRE(pack_hand(Hand{}) == 0);
}

TEST_CASE("Packing round-trips hands of 0 to 8 cards", "[hand_code]") {
    const Hand full = parse_hand("As2c9dTh3sKcQd4h");

    for (size_t n = 0; n <= full.size(); ++n) {
        Hand h(full.begin(), full.begin() + n);
        HandCode code = pack_hand(h);
        REQUIRE(code_length(code) == static_cast<int>(n));
        REQUIRE(unpack_hand(code) == h);
    }
}

TEST_CASE("A ninth card is rejected", "[hand_code]") {
    Hand nine = parse_hand("As2c9dTh3sKcQd4h5c");
    REQUIRE(nine.size() == 9);
    REQUIRE_THROWS_AS(pack_hand(nine), std::length_error);
}

TEST_CASE("Malformed codes are rejected", "[hand_code]") {
    // Rank 1 is not a card
    REQUIRE_THROWS_AS(unpack_hand(1), ParseError);
    // Suit 4
    REQUIRE_THROWS_AS(unpack_hand(62), ParseError);
    // Rank 0 of suit 4
    REQUIRE_THROWS_AS(unpack_hand(60), ParseError);
    // Card after an empty slot
    REQUIRE_THROWS_AS(unpack_hand(HandCode{2} << 8), ParseError);
}

TEST_CASE("Codes convert to and from text keys", "[hand_code]") {
    HandCode code = code_from_string("AsKsQsJsTs");
    REQUIRE(code_length(code) == 5);
    REQUIRE(code_to_string(code) == "AsKsQsJsTs");
    REQUIRE_THROWS_AS(code_from_string("AsK"), ParseError);
}
