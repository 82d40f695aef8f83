#pragma once

#include <array>
#include <cstdint>
#include "Card.hpp"

namespace isoholdem::cards {

// Street-aware: the first two cards are the hole, the rest the board, and
// the two parts are never mixed. Street-agnostic: the hand is one set.
enum class StreetMode {
    StreetAware,
    StreetAgnostic
};

constexpr int HOLE_CARDS = 2;

// Everything a suit contributes to a hand, independent of its label.
// Street-aware keys are hole ranks, a 0 marker, then board ranks.
struct SuitKey {
    int count = 0;                    // Cards of this suit
    int length = 0;                   // Used entries of ranks
    std::array<uint8_t, 16> ranks{};  // Ascending within each part
};

// True if a must take a lower suit label than b:
// more cards first, then the lexicographically smaller rank list
bool key_before(const SuitKey& a, const SuitKey& b);

bool keys_equal(const SuitKey& a, const SuitKey& b);

// Keys of all four suits of a hand (sorted or not)
std::array<SuitKey, NUM_SUITS> suit_keys(const Hand& hand, StreetMode mode);

// Sorts by (suit, rank): the hole and the board separately when street-aware
void sort_for_mode(Hand& hand, StreetMode mode);

// No repeated cards, sorted for the mode, and suit keys in label order
bool is_canonical(const Hand& hand, StreetMode mode);

// Canonical representative of the hand's suit-permutation class.
// Throws std::invalid_argument on repeated cards and
// CanonicalizationInvariantViolation if the result fails is_canonical.
Hand canonicalize(const Hand& hand, StreetMode mode);

} // namespace isoholdem::cards
