#include "Canonical.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace isoholdem::cards {

bool key_before(const SuitKey& a, const SuitKey& b) {
    if (a.count != b.count) return a.count > b.count;
    return std::lexicographical_compare(a.ranks.begin(), a.ranks.begin() + a.length,
                                        b.ranks.begin(), b.ranks.begin() + b.length);
}

bool keys_equal(const SuitKey& a, const SuitKey& b) {
    return a.count == b.count && a.length == b.length &&
           std::equal(a.ranks.begin(), a.ranks.begin() + a.length, b.ranks.begin());
}

std::array<SuitKey, NUM_SUITS> suit_keys(const Hand& hand, StreetMode mode) {
    // Ascending ranks per suit and part
    std::array<uint16_t, NUM_SUITS> hole_masks{};
    std::array<uint16_t, NUM_SUITS> board_masks{};

    const size_t hole_end = (mode == StreetMode::StreetAware)
        ? std::min<size_t>(HOLE_CARDS, hand.size()) : hand.size();

    for (size_t i = 0; i < hand.size(); ++i) {
        const Card& c = hand[i];
        uint16_t bit = static_cast<uint16_t>(1u << (c.rank - MIN_RANK));
        if (i < hole_end) hole_masks[c.suit] |= bit;
        else board_masks[c.suit] |= bit;
    }

    std::array<SuitKey, NUM_SUITS> keys;
    for (int s = 0; s < NUM_SUITS; ++s) {
        SuitKey& k = keys[s];
        for (int r = 0; r < NUM_RANKS; ++r) {
            if (hole_masks[s] & (1u << r)) {
                k.ranks[k.length++] = static_cast<uint8_t>(r + MIN_RANK);
                ++k.count;
            }
        }
        if (mode == StreetMode::StreetAware) {
            k.ranks[k.length++] = 0;
            for (int r = 0; r < NUM_RANKS; ++r) {
                if (board_masks[s] & (1u << r)) {
                    k.ranks[k.length++] = static_cast<uint8_t>(r + MIN_RANK);
                    ++k.count;
                }
            }
        }
    }
    return keys;
}

void sort_for_mode(Hand& hand, StreetMode mode) {
    if (mode == StreetMode::StreetAgnostic || hand.size() <= HOLE_CARDS) {
        std::sort(hand.begin(), hand.end(), suit_first_less);
        return;
    }
    std::sort(hand.begin(), hand.begin() + HOLE_CARDS, suit_first_less);
    std::sort(hand.begin() + HOLE_CARDS, hand.end(), suit_first_less);
}

namespace {

bool is_sorted_for_mode(const Hand& hand, StreetMode mode) {
    for (size_t i = 1; i < hand.size(); ++i) {
        if (mode == StreetMode::StreetAware && i == HOLE_CARDS) continue;
        if (!suit_first_less(hand[i - 1], hand[i])) return false;
    }
    return true;
}

} // namespace

bool is_canonical(const Hand& hand, StreetMode mode) {
    if (has_duplicates(hand) || !is_sorted_for_mode(hand, mode)) {
        return false;
    }
    auto keys = suit_keys(hand, mode);
    for (int s = 0; s + 1 < NUM_SUITS; ++s) {
        if (key_before(keys[s + 1], keys[s])) return false;
    }
    return true;
}

Hand canonicalize(const Hand& hand, StreetMode mode) {
    if (has_duplicates(hand)) {
        throw std::invalid_argument("Cannot canonicalize hand with repeated cards: " +
                                    hand_to_string(hand));
    }

    auto keys = suit_keys(hand, mode);

    // New label order; suits with equal keys keep their relative order
    std::array<int, NUM_SUITS> order = {0, 1, 2, 3};
    std::stable_sort(order.begin(), order.end(), [&keys](int a, int b) {
        return key_before(keys[a], keys[b]);
    });

    SuitPermutation perm;
    for (int label = 0; label < NUM_SUITS; ++label) {
        perm[order[label]] = label;
    }

    Hand out = apply_suit_permutation(hand, perm);
    sort_for_mode(out, mode);

    if (!is_canonical(out, mode)) {
        throw CanonicalizationInvariantViolation(
            "Canonical form " + hand_to_string(out) + " of " + hand_to_string(hand) +
            " is not canonical");
    }
    return out;
}

} // namespace isoholdem::cards
