#pragma once

#include "TableSet.hpp"
#include "cards/Card.hpp"
#include "cards/Street.hpp"

namespace isoholdem::abstraction {

// Card abstraction maps hands to buckets to reduce state space.
// Preflop buckets are exact (169 hand classes); flop and turn buckets come
// from the clustered tables; river buckets are equity quantiles.
class CardAbstraction {
public:
    // Throws std::invalid_argument if river_buckets is not positive
    explicit CardAbstraction(TableSet tables, int river_buckets = 50);

    // Bucket id of a 2, 5, 6 or 7 card hand (hole cards first).
    // Throws std::invalid_argument for other sizes or repeated cards,
    // DatasetMissingError if the street's table is not loaded and
    // DatasetLookupMiss if the hand is absent from it.
    int abstract_id(const cards::Hand& hand) const;

    // Best 5-card strength of a 5-7 card hand (1..7462)
    int hand_strength(const cards::Hand& hand) const;

    // Equity against a random holding; 5 and 6 cards average over run-outs
    double equity(const cards::Hand& hand) const;

    int num_buckets(cards::Street street) const;

    // Dense preflop class: pairs 0..12, suited 13..90, offsuit 91..168
    static int preflop_bin(const cards::Hand& hole);

    const TableSet& tables() const { return tables_; }

private:
    TableSet tables_;
    int river_buckets_;
};

// Utility: count canonical preflop hands (169 for Hold'em)
int count_canonical_preflop_hands();

} // namespace isoholdem::abstraction
