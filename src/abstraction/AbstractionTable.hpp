#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include "cards/Card.hpp"
#include "cards/HandCode.hpp"
#include "cards/Street.hpp"

namespace isoholdem::abstraction {

// Dataset kind of a street's abstraction shards, e.g. "flop_abstraction"
std::string abstraction_kind(cards::Street street);

// Canonical street-aware flop (5-card) or turn (6-card) hand -> bucket id
// in [0, num_buckets). Immutable once loaded.
class AbstractionTable {
public:
    // Throws std::invalid_argument unless street is flop or turn
    // and num_buckets is positive
    AbstractionTable(cards::Street street, int num_buckets);

    // Reads a complete dataset directory; bucket count comes from its manifest.
    // Throws DatasetMissingError if absent or incomplete, ParseError if malformed.
    static AbstractionTable load(const std::string& dir, cards::Street street);

    // Canonicalizes the hand first; throws std::invalid_argument on a wrong
    // hand size or a bucket outside [0, num_buckets)
    void insert(const cards::Hand& hand, int bucket);

    // Canonicalizes (street-aware) and retrieves; DatasetLookupMiss if absent
    int lookup(const cards::Hand& hand) const;

    cards::Street street() const { return street_; }
    int num_buckets() const { return num_buckets_; }
    std::size_t size() const { return buckets_.size(); }

private:
    cards::HandCode key(const cards::Hand& hand) const;

    cards::Street street_;
    int num_buckets_;
    std::unordered_map<cards::HandCode, int> buckets_;
};

} // namespace isoholdem::abstraction
