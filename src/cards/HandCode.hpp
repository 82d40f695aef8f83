#pragma once

#include <cstdint>
#include <string>
#include "Card.hpp"

namespace isoholdem::cards {

// Compact hand code: one byte per card, card i in byte i (low to high).
// Card byte = suit * 15 + rank, never zero; unused high bytes are zero,
// so the length is the index of the first zero byte.
using HandCode = uint64_t;

constexpr int MAX_CODE_CARDS = 8;
constexpr int SUIT_MULTIPLIER = 15;

inline uint8_t card_byte(const Card& card) {
    return static_cast<uint8_t>(card.suit * SUIT_MULTIPLIER + card.rank);
}

// Throws std::length_error for more than 8 cards
HandCode pack_hand(const Hand& hand);

// Throws ParseError on a byte that is not a card or a card after an empty slot
Hand unpack_hand(HandCode code);

int code_length(HandCode code);

// Text form of the packed cards, e.g. "AsKd7c"; used as dataset keys
std::string code_to_string(HandCode code);
HandCode code_from_string(const std::string& text);

} // namespace isoholdem::cards
