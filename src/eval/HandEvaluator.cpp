#include "HandEvaluator.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <vector>

namespace isoholdem::eval {

using cards::Card;
using cards::Hand;
using cards::NUM_RANKS;
using cards::MIN_RANK;

HandValue HandEvaluator::evaluate(const Hand& cards) {
    if (cards.size() < 5 || cards.size() > 7) {
        throw std::invalid_argument("Need 5 to 7 cards to evaluate, got " +
                                    std::to_string(cards.size()));
    }

    int rank_counts[NUM_RANKS];
    count_ranks(cards, rank_counts);

    // Build rank bitmask
    uint16_t rank_mask = 0;
    for (int r = 0; r < NUM_RANKS; ++r) {
        if (rank_counts[r] > 0) {
            rank_mask |= (1 << r);
        }
    }

    // Check for flush
    int flush_suit = find_flush_suit(cards);

    if (flush_suit >= 0) {
        uint16_t flush_mask = 0;
        std::vector<int> flush_ranks;
        for (const Card& c : cards) {
            if (c.suit == flush_suit) {
                flush_mask |= (1 << (c.rank - MIN_RANK));
                flush_ranks.push_back(c.rank - MIN_RANK);
            }
        }

        // Check for straight flush
        int sf_high = find_straight_high(flush_mask);
        if (sf_high >= 0) {
            return make_value(HandRank::StraightFlush, sf_high);
        }

        // Regular flush - top 5 flush cards
        std::sort(flush_ranks.begin(), flush_ranks.end(), std::greater<int>());
        return make_value(HandRank::Flush,
                          flush_ranks[0], flush_ranks[1], flush_ranks[2],
                          flush_ranks[3], flush_ranks[4]);
    }

    // Find quads, trips, pairs
    std::vector<int> quads, trips, pairs, singles;
    for (int r = NUM_RANKS - 1; r >= 0; --r) {
        switch (rank_counts[r]) {
            case 4: quads.push_back(r); break;
            case 3: trips.push_back(r); break;
            case 2: pairs.push_back(r); break;
            case 1: singles.push_back(r); break;
        }
    }

    // Four of a kind
    if (!quads.empty()) {
        int kicker = 0;
        for (int r = NUM_RANKS - 1; r >= 0; --r) {
            if (r != quads[0] && rank_counts[r] > 0) {
                kicker = r;
                break;
            }
        }
        return make_value(HandRank::FourOfAKind, quads[0], kicker);
    }

    // Full house (trips + pair, or two trips)
    if (!trips.empty()) {
        if (trips.size() >= 2) {
            return make_value(HandRank::FullHouse, trips[0], trips[1]);
        }
        if (!pairs.empty()) {
            return make_value(HandRank::FullHouse, trips[0], pairs[0]);
        }
    }

    // Check for straight
    int straight_high = find_straight_high(rank_mask);
    if (straight_high >= 0) {
        return make_value(HandRank::Straight, straight_high);
    }

    // Three of a kind
    if (!trips.empty()) {
        return make_value(HandRank::ThreeOfAKind, trips[0],
                          singles.size() > 0 ? singles[0] : 0,
                          singles.size() > 1 ? singles[1] : 0);
    }

    // Two pair
    if (pairs.size() >= 2) {
        // Best kicker from a third pair or the singles
        int kicker = 0;
        if (pairs.size() > 2) kicker = pairs[2];
        if (!singles.empty()) kicker = std::max(kicker, singles[0]);

        return make_value(HandRank::TwoPair, pairs[0], pairs[1], kicker);
    }

    // One pair
    if (pairs.size() == 1) {
        return make_value(HandRank::Pair, pairs[0],
                          singles.size() > 0 ? singles[0] : 0,
                          singles.size() > 1 ? singles[1] : 0,
                          singles.size() > 2 ? singles[2] : 0);
    }

    // High card
    return make_value(HandRank::HighCard,
                      singles[0], singles[1], singles[2],
                      singles[3], singles[4]);
}

} // namespace isoholdem::eval
