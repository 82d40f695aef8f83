#pragma once

#include <cstdint>
#include <vector>
#include "cards/Card.hpp"
#include "StrengthTable.hpp"

namespace isoholdem::tables {

// Outcome counts of one holding against a set of opponent holdings
struct RolloutTally {
    int wins = 0;
    int ties = 0;
    int losses = 0;

    int total() const { return wins + ties + losses; }

    // (wins + 0.5 * ties) / total; 0 when empty
    double equity() const {
        const int n = total();
        return n > 0 ? (wins + 0.5 * ties) / n : 0.0;
    }
};

// Deck indices not in the mask, ascending
std::vector<int> remaining_deck(uint64_t used_mask);

// Sorted deck indices of a hand
std::vector<int> sorted_indices(const cards::Hand& hand);

// Hole (first two cards) + 5-card board against every one of the
// C(45,2) = 990 opponent holdings, compared by strength.
// Throws std::invalid_argument unless the hand has 7 distinct cards.
RolloutTally river_tally(const cards::Hand& seven, const StrengthTable& strengths);

inline double river_equity(const cards::Hand& seven, const StrengthTable& strengths) {
    return river_tally(seven, strengths).equity();
}

} // namespace isoholdem::tables
