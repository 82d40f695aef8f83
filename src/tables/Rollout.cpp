#include "Rollout.hpp"
#include "cards/Canonical.hpp"
#include <algorithm>
#include <stdexcept>

namespace isoholdem::tables {

using cards::Hand;

std::vector<int> remaining_deck(uint64_t used_mask) {
    std::vector<int> rest;
    rest.reserve(cards::DECK_SIZE);
    for (int i = 0; i < cards::DECK_SIZE; ++i) {
        if (!(used_mask & (uint64_t{1} << i))) rest.push_back(i);
    }
    return rest;
}

std::vector<int> sorted_indices(const Hand& hand) {
    std::vector<int> idx;
    idx.reserve(hand.size());
    for (const cards::Card& c : hand) {
        idx.push_back(c.index());
    }
    std::sort(idx.begin(), idx.end());
    return idx;
}

RolloutTally river_tally(const Hand& seven, const StrengthTable& strengths) {
    if (seven.size() != 7 || cards::has_duplicates(seven)) {
        throw std::invalid_argument("River rollout needs 7 distinct cards: " +
                                    cards::hand_to_string(seven));
    }

    const int hero = strengths.strength(seven);

    const Hand board(seven.begin() + cards::HOLE_CARDS, seven.end());
    const std::vector<int> rest = remaining_deck(cards::card_mask(seven));
    const std::vector<int> board_idx = sorted_indices(board);

    RolloutTally tally;
    int opp[7];
    for (size_t a = 0; a < rest.size(); ++a) {
        for (size_t b = a + 1; b < rest.size(); ++b) {
            std::copy(board_idx.begin(), board_idx.end(), opp);
            opp[5] = rest[a];
            opp[6] = rest[b];
            std::sort(opp, opp + 7);

            const int villain = strengths.strength_of_indices(opp, 7);
            if (hero > villain) ++tally.wins;
            else if (hero < villain) ++tally.losses;
            else ++tally.ties;
        }
    }
    return tally;
}

} // namespace isoholdem::tables
