#include "StrengthTable.hpp"
#include "build/CheckpointStore.hpp"
#include "cards/Canonical.hpp"
#include "cards/Enumeration.hpp"
#include "core/Errors.hpp"
#include "eval/HandEvaluator.hpp"
#include <algorithm>
#include <array>
#include <bitset>
#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>

namespace isoholdem::tables {

using cards::Hand;
using cards::HandCode;
using cards::StreetMode;

namespace {

// binomial(n, k) for n <= 52, k <= 5
struct BinomialTable {
    std::array<std::array<uint32_t, 6>, cards::DECK_SIZE + 1> c{};

    BinomialTable() {
        for (int n = 0; n <= cards::DECK_SIZE; ++n) {
            c[n][0] = 1;
            for (int k = 1; k <= 5; ++k) {
                c[n][k] = (n == 0) ? 0 : c[n - 1][k - 1] + c[n - 1][k];
            }
        }
    }
};

const BinomialTable& binomials() {
    static const BinomialTable table;
    return table;
}

// Colex rank of five ascending deck indices, in [0, C(52,5))
inline std::size_t colex_index(const int* five) {
    const auto& c = binomials().c;
    return c[five[0]][1] + c[five[1]][2] + c[five[2]][3] + c[five[3]][4] + c[five[4]][5];
}

} // namespace

StrengthTable StrengthTable::load(const std::string& path) {
    nlohmann::json j = build::read_json_file(path);
    if (!j.is_object()) {
        throw ParseError("Strength dataset " + path + " is not a JSON object");
    }

    StrengthTable table;
    table.strengths_.reserve(j.size());
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number_integer()) {
            throw ParseError("Strength for " + it.key() + " is not an integer");
        }
        HandCode code = 0;
        try {
            code = cards::code_from_string(it.key());
        } catch (const std::logic_error& e) {
            throw ParseError("Bad strength key " + it.key() + ": " + e.what());
        }
        if (!cards::is_canonical(cards::unpack_hand(code), StreetMode::StreetAgnostic)) {
            throw ParseError("Strength key " + it.key() + " is not canonical");
        }
        const long long value = it.value().get<long long>();
        if (value < 1 || value > 0xFFFF) {
            throw ParseError("Strength for " + it.key() + " out of range: " +
                             std::to_string(value));
        }
        try {
            table.insert(code, static_cast<int>(value));
        } catch (const std::invalid_argument& e) {
            throw ParseError("Bad strength entry " + it.key() + ": " + e.what());
        }
    }
    return table;
}

StrengthTable StrengthTable::build_from_evaluator() {
    std::vector<std::pair<uint32_t, HandCode>> valued;
    valued.reserve(134459);

    cards::for_each_canonical(5, StreetMode::StreetAgnostic, [&valued](const Hand& h) {
        valued.emplace_back(eval::HandEvaluator::evaluate(h).value, cards::pack_hand(h));
    });

    std::sort(valued.begin(), valued.end());

    // Dense ranks: equal evaluator values share a strength
    StrengthTable table;
    table.strengths_.reserve(valued.size());
    int strength = 0;
    for (size_t i = 0; i < valued.size(); ++i) {
        if (i == 0 || valued[i].first != valued[i - 1].first) {
            ++strength;
        }
        table.insert(valued[i].second, strength);
    }
    return table;
}

void StrengthTable::save(const std::string& path) const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [code, strength] : strengths_) {
        j[cards::code_to_string(code)] = strength;
    }
    build::write_json_atomic(path, j);
}

void StrengthTable::insert(HandCode canonical_five, int strength) {
    if (cards::code_length(canonical_five) != 5) {
        throw std::invalid_argument("Strength keys are 5-card hands: " +
                                    cards::code_to_string(canonical_five));
    }
    if (strength < 1 || strength > 0xFFFF) {
        throw std::invalid_argument("Strength out of range: " + std::to_string(strength));
    }
    strengths_[canonical_five] = strength;

    if (dense_.empty()) {
        dense_.assign(NUM_FIVE_CARD_HANDS, 0);
    }

    // Every suit relabelling of the hand shares its strength
    const Hand hand = cards::unpack_hand(canonical_five);
    cards::SuitPermutation perm = {0, 1, 2, 3};
    do {
        int idx[5];
        for (int i = 0; i < 5; ++i) {
            idx[i] = cards::Card(hand[i].rank, perm[hand[i].suit]).index();
        }
        std::sort(idx, idx + 5);
        dense_[colex_index(idx)] = static_cast<uint16_t>(strength);
    } while (std::next_permutation(perm.begin(), perm.end()));
}

int StrengthTable::lookup(HandCode canonical_five) const {
    auto it = strengths_.find(canonical_five);
    if (it == strengths_.end()) {
        throw DatasetLookupMiss("No strength for " + cards::code_to_string(canonical_five));
    }
    return it->second;
}

std::string StrengthTable::describe(const int* five) const {
    Hand h;
    for (int i = 0; i < 5; ++i) {
        h.push_back(cards::Card::from_index(five[i]));
    }
    return cards::hand_to_string(cards::canonicalize(h, StreetMode::StreetAgnostic));
}

int StrengthTable::strength_of_indices(const int* sorted_indices, int n) const {
    if (dense_.empty()) {
        throw DatasetLookupMiss("Strength table is empty");
    }

    int best = 0;
    int five[5];

    // Each 5-card subset is a 5-bit mask over the n positions
    for (unsigned mask = 0; mask < (1u << n); ++mask) {
        if (std::bitset<8>(mask).count() != 5) continue;
        int k = 0;
        for (int i = 0; i < n; ++i) {
            if (mask & (1u << i)) five[k++] = sorted_indices[i];
        }
        int s = dense_[colex_index(five)];
        if (s == 0) {
            throw DatasetLookupMiss("No strength for " + describe(five));
        }
        best = std::max(best, s);
    }
    return best;
}

int StrengthTable::strength(const Hand& hand) const {
    const int n = static_cast<int>(hand.size());
    if (n < 5 || n > 7) {
        throw std::invalid_argument("Strength needs 5 to 7 cards, got " + std::to_string(n));
    }
    if (cards::has_duplicates(hand)) {
        throw std::invalid_argument("Hand has repeated cards: " + cards::hand_to_string(hand));
    }

    int idx[7];
    for (int i = 0; i < n; ++i) {
        idx[i] = hand[i].index();
    }
    std::sort(idx, idx + n);
    return strength_of_indices(idx, n);
}

} // namespace isoholdem::tables
