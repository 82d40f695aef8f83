#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include "cards/Card.hpp"

namespace isoholdem::eval {

// Hand ranking categories (higher = better)
enum class HandRank : uint8_t {
    HighCard = 0,
    Pair = 1,
    TwoPair = 2,
    ThreeOfAKind = 3,
    Straight = 4,
    Flush = 5,
    FullHouse = 6,
    FourOfAKind = 7,
    StraightFlush = 8
};

inline std::string hand_rank_to_string(HandRank rank) {
    switch (rank) {
        case HandRank::HighCard: return "High Card";
        case HandRank::Pair: return "Pair";
        case HandRank::TwoPair: return "Two Pair";
        case HandRank::ThreeOfAKind: return "Three of a Kind";
        case HandRank::Straight: return "Straight";
        case HandRank::Flush: return "Flush";
        case HandRank::FullHouse: return "Full House";
        case HandRank::FourOfAKind: return "Four of a Kind";
        case HandRank::StraightFlush: return "Straight Flush";
    }
    return "Unknown";
}

// Hand evaluation result
// Higher value = better hand
// Format: RRRR_KKKK_KKKK_KKKK_KKKK_KKKK where R = rank category, K = kickers
struct HandValue {
    uint32_t value = 0;

    HandValue() = default;
    explicit HandValue(uint32_t v) : value(v) {}

    HandRank rank() const {
        return static_cast<HandRank>(value >> 20);
    }

    bool operator<(const HandValue& other) const { return value < other.value; }
    bool operator>(const HandValue& other) const { return value > other.value; }
    bool operator==(const HandValue& other) const { return value == other.value; }
    bool operator!=(const HandValue& other) const { return value != other.value; }
    bool operator<=(const HandValue& other) const { return value <= other.value; }
    bool operator>=(const HandValue& other) const { return value >= other.value; }
};

// Direct poker-rules evaluator. Slow compared to the strength table; it is
// the ranking source the strength dataset is generated from.
class HandEvaluator {
public:
    // Evaluate 5-7 cards (finds best 5-card combination)
    // Throws std::invalid_argument outside that range
    static HandValue evaluate(const cards::Hand& cards);

private:
    // Count occurrences of each rank (index = rank - 2)
    static void count_ranks(const cards::Hand& cards, int* rank_counts);

    // Check for flush (5+ cards of same suit)
    static int find_flush_suit(const cards::Hand& cards);

    // Find straight high card index (returns -1 if no straight)
    static int find_straight_high(uint16_t rank_mask);

    // Build hand value from rank and kickers
    static HandValue make_value(HandRank rank, int k1 = 0, int k2 = 0,
                                int k3 = 0, int k4 = 0, int k5 = 0);
};

inline void HandEvaluator::count_ranks(const cards::Hand& cards, int* rank_counts) {
    std::fill(rank_counts, rank_counts + cards::NUM_RANKS, 0);
    for (const cards::Card& c : cards) {
        rank_counts[c.rank - cards::MIN_RANK]++;
    }
}

inline int HandEvaluator::find_flush_suit(const cards::Hand& cards) {
    int suit_counts[cards::NUM_SUITS] = {0, 0, 0, 0};
    for (const cards::Card& c : cards) {
        suit_counts[c.suit]++;
    }
    for (int s = 0; s < cards::NUM_SUITS; ++s) {
        if (suit_counts[s] >= 5) return s;
    }
    return -1;
}

inline int HandEvaluator::find_straight_high(uint16_t rank_mask) {
    for (int high = 12; high >= 4; --high) {
        uint16_t straight_mask = static_cast<uint16_t>(0x1F << (high - 4));
        if ((rank_mask & straight_mask) == straight_mask) {
            return high;
        }
    }

    // Wheel (A-2-3-4-5) only when nothing higher
    if ((rank_mask & 0x100F) == 0x100F) {
        return 3;  // 5-high straight
    }
    return -1;
}

inline HandValue HandEvaluator::make_value(HandRank rank, int k1, int k2,
                                           int k3, int k4, int k5) {
    uint32_t v = static_cast<uint32_t>(rank) << 20;
    v |= (k1 & 0xF) << 16;
    v |= (k2 & 0xF) << 12;
    v |= (k3 & 0xF) << 8;
    v |= (k4 & 0xF) << 4;
    v |= (k5 & 0xF);
    return HandValue(v);
}

} // namespace isoholdem::eval
