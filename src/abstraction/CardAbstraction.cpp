#include "CardAbstraction.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace isoholdem::abstraction {

using cards::Hand;
using cards::Street;

CardAbstraction::CardAbstraction(TableSet tables, int river_buckets)
    : tables_(std::move(tables))
    , river_buckets_(river_buckets) {
    if (river_buckets <= 0) {
        throw std::invalid_argument("River bucket count must be positive");
    }
}

int CardAbstraction::preflop_bin(const Hand& hole) {
    if (hole.size() != 2) {
        throw std::invalid_argument("Preflop hands have 2 cards, got " +
                                    std::to_string(hole.size()));
    }
    if (hole[0] == hole[1]) {
        throw std::invalid_argument("Hand has repeated cards: " + cards::hand_to_string(hole));
    }

    int r1 = hole[0].rank - cards::MIN_RANK;
    int r2 = hole[1].rank - cards::MIN_RANK;
    int hi = std::max(r1, r2);
    int lo = std::min(r1, r2);
    if (hi == lo) return hi;

    int idx = hi * (hi - 1) / 2 + lo;
    return (hole[0].suit == hole[1].suit) ? (13 + idx) : (91 + idx);
}

int CardAbstraction::abstract_id(const Hand& hand) const {
    switch (hand.size()) {
        case 2:
            return preflop_bin(hand);

        case 5:
            if (!tables_.flop) {
                throw DatasetMissingError("Flop abstraction table is not loaded");
            }
            return tables_.flop->lookup(hand);

        case 6:
            if (!tables_.turn) {
                throw DatasetMissingError("Turn abstraction table is not loaded");
            }
            return tables_.turn->lookup(hand);

        case 7: {
            if (!tables_.equities) {
                throw DatasetMissingError("River equity table is not loaded");
            }
            double eq = tables_.equities->lookup(hand);
            int bucket = static_cast<int>(std::floor(eq * river_buckets_));
            return std::clamp(bucket, 0, river_buckets_ - 1);
        }
    }
    throw std::invalid_argument("Abstraction ids exist for 2, 5, 6 or 7 cards, got " +
                                std::to_string(hand.size()));
}

int CardAbstraction::hand_strength(const Hand& hand) const {
    if (!tables_.strengths) {
        throw DatasetMissingError("Strength table is not loaded");
    }
    return tables_.strengths->strength(hand);
}

double CardAbstraction::equity(const Hand& hand) const {
    if (!tables_.equities) {
        throw DatasetMissingError("River equity table is not loaded");
    }
    return tables_.equities->equity(hand);
}

int CardAbstraction::num_buckets(Street street) const {
    switch (street) {
        case Street::Preflop: return count_canonical_preflop_hands();
        case Street::Flop: return tables_.flop ? tables_.flop->num_buckets() : 0;
        case Street::Turn: return tables_.turn ? tables_.turn->num_buckets() : 0;
        case Street::River: return river_buckets_;
    }
    return 0;
}

int count_canonical_preflop_hands() {
    // 13 pairs + 78 suited + 78 offsuit
    return 13 + 78 + 78;
}

} // namespace isoholdem::abstraction
