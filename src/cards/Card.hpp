#pragma once

#include <array>
#include <vector>
#include <cstdint>
#include <string>

namespace isoholdem::cards {

// Card representation
// Rank: 2..14 (T=10, J=11, Q=12, K=13, A=14)
// Suit: 0=clubs, 1=diamonds, 2=hearts, 3=spades
// Deck index = suit * 13 + (rank - 2), so the deck is ordered by (suit, rank)

constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;
constexpr int DECK_SIZE = 52;
constexpr int MIN_RANK = 2;
constexpr int MAX_RANK = 14;

struct Card {
    uint8_t rank = MIN_RANK;
    uint8_t suit = 0;

    Card() = default;

    // Throws std::invalid_argument on an out-of-range rank or suit
    Card(int r, int s);

    // Card at a deck index 0..51
    static Card from_index(int index);

    int index() const { return suit * NUM_RANKS + (rank - MIN_RANK); }

    // Total order by (rank, suit)
    bool operator<(const Card& other) const {
        return rank != other.rank ? rank < other.rank : suit < other.suit;
    }
    bool operator==(const Card& other) const {
        return rank == other.rank && suit == other.suit;
    }
    bool operator!=(const Card& other) const { return !(*this == other); }
};

// Ordering used inside a hand: by (suit, rank), i.e. by deck index
inline bool suit_first_less(const Card& a, const Card& b) {
    return a.index() < b.index();
}

using Hand = std::vector<Card>;

// Suit relabelling: perm[old_suit] = new_suit
using SuitPermutation = std::array<int, NUM_SUITS>;

char rank_char(int rank);
char suit_char(int suit);

// "As", "Td", "2c"; throws ParseError on anything else (case-sensitive)
Card parse_card(const std::string& token);
std::string card_to_string(const Card& card);

// Concatenated tokens, e.g. "AsKd7c". Throws ParseError on odd length,
// a bad token, or a repeated card.
Hand parse_hand(const std::string& text);
std::string hand_to_string(const Hand& hand);

// The 52 cards in deck-index order
const std::vector<Card>& deck();

// Bit i set for every card with deck index i
uint64_t card_mask(const Hand& hand);

bool has_duplicates(const Hand& hand);

// Relabels every card's suit; the order of cards is unchanged
Hand apply_suit_permutation(const Hand& hand, const SuitPermutation& perm);

} // namespace isoholdem::cards
