#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "cards/Card.hpp"
#include "cards/HandCode.hpp"

namespace isoholdem::tables {

// Number of distinct 5-card hand values under standard poker ranking
constexpr int NUM_STRENGTH_CLASSES = 7462;

// C(52, 5)
constexpr std::size_t NUM_FIVE_CARD_HANDS = 2598960;

// Canonical street-agnostic 5-card hand -> dense strength
// (1 = worst high card, 7462 = royal flush). Immutable once loaded.
//
// Every insert also fills a dense index over all C(52,5) raw 5-card hands
// (the 24 suit relabellings of the canonical hand), so evaluating 5-7 cards
// is a handful of array reads instead of a canonicalization per subset.
class StrengthTable {
public:
    StrengthTable() = default;

    // Reads { "<10-char hand>": int }.
    // Throws DatasetMissingError if the file is absent, ParseError if malformed.
    static StrengthTable load(const std::string& path);

    // Generates the dataset from the direct evaluator by visiting every
    // canonical street-agnostic 5-card hand
    static StrengthTable build_from_evaluator();

    // Atomic write in the format load() reads
    void save(const std::string& path) const;

    // Key must be a canonical street-agnostic 5-card hand;
    // strength must be in [1, 65535]
    void insert(cards::HandCode canonical_five, int strength);

    // Best strength over all 5-card subsets of a 5-7 card hand.
    // Throws std::invalid_argument for other sizes and DatasetLookupMiss
    // if a subset is not in the table.
    int strength(const cards::Hand& hand) const;

    // Same, for sorted deck indices (no validation; hot path of rollouts)
    int strength_of_indices(const int* sorted_indices, int n) const;

    // Exact lookup of a canonical 5-card code; DatasetLookupMiss if absent
    int lookup(cards::HandCode canonical_five) const;

    std::size_t size() const { return strengths_.size(); }
    bool empty() const { return strengths_.empty(); }

private:
    std::unordered_map<cards::HandCode, int> strengths_;
    std::vector<uint16_t> dense_;  // Colex index of 5 deck indices -> strength, 0 = absent

    std::string describe(const int* five) const;
};

} // namespace isoholdem::tables
