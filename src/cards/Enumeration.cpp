#include "Enumeration.hpp"
#include <stdexcept>

namespace isoholdem::cards {

namespace {

bool parts_sorted(const Hand& hand) {
    for (size_t i = 1; i < hand.size(); ++i) {
        if (i == HOLE_CARDS) continue;
        if (!suit_first_less(hand[i - 1], hand[i])) return false;
    }
    return true;
}

// First deck index worth trying for the next card
int next_start(const Hand& cur, StreetMode mode) {
    if (cur.empty()) return 0;
    if (mode == StreetMode::StreetAware && cur.size() == HOLE_CARDS) return 0;
    return cur.back().index() + 1;
}

void extend(Hand& cur, uint64_t used, int length, StreetMode mode,
            const HandVisitor& visit) {
    if (static_cast<int>(cur.size()) == length) {
        visit(cur);
        return;
    }
    for (int idx = next_start(cur, mode); idx < DECK_SIZE; ++idx) {
        uint64_t bit = uint64_t{1} << idx;
        if (used & bit) continue;
        cur.push_back(deck()[idx]);
        if (is_canonical_prefix(cur, length, mode)) {
            extend(cur, used | bit, length, mode, visit);
        }
        cur.pop_back();
    }
}

} // namespace

bool is_canonical_prefix(const Hand& partial, int length, StreetMode mode) {
    const int m = static_cast<int>(partial.size());
    if (m > length) return false;

    // Street-agnostic canonical hands are closed under dropping the last card
    if (m == length || mode == StreetMode::StreetAgnostic) {
        return is_canonical(partial, mode);
    }

    if (has_duplicates(partial) || !parts_sorted(partial)) {
        return false;
    }

    auto keys = suit_keys(partial, mode);

    // Board cards arrive in deck order, so suits below the last board card's
    // suit can gain no more cards and their keys are final
    const int last = (m > HOLE_CARDS) ? partial.back().suit : 0;

    for (int s = 0; s + 1 < last; ++s) {
        if (key_before(keys[s + 1], keys[s])) return false;
    }
    if (last >= 1) {
        if (keys[last].count > keys[last - 1].count) return false;
        if (keys[last].count == keys[last - 1].count &&
            key_before(keys[last], keys[last - 1])) {
            return false;
        }
    }

    // Fewest extra cards that make the counts non-increasing
    int needed = 0;
    int floor_count = keys[NUM_SUITS - 1].count;
    for (int s = NUM_SUITS - 2; s >= 0; --s) {
        if (keys[s].count < floor_count) {
            if (s < last) return false;
            needed += floor_count - keys[s].count;
        } else {
            floor_count = keys[s].count;
        }
    }
    return needed <= length - m;
}

void for_each_canonical(int length, StreetMode mode, const HandVisitor& visit) {
    if (length < 0 || length > DECK_SIZE) {
        throw std::invalid_argument("Invalid hand length: " + std::to_string(length));
    }
    Hand cur;
    cur.reserve(length);
    extend(cur, 0, length, mode, visit);
}

std::vector<Hand> deal_canonical(int length, StreetMode mode) {
    std::vector<Hand> hands;
    for_each_canonical(length, mode, [&hands](const Hand& h) {
        hands.push_back(h);
    });
    return hands;
}

size_t count_canonical(int length, StreetMode mode) {
    size_t n = 0;
    for_each_canonical(length, mode, [&n](const Hand&) { ++n; });
    return n;
}

} // namespace isoholdem::cards
