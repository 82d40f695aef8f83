#include "EquityDistribution.hpp"
#include "cards/Canonical.hpp"
#include "core/Errors.hpp"
#include "tables/Rollout.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace isoholdem::abstraction {

using cards::Hand;

int equity_bin(double equity) {
    int bin = static_cast<int>(std::floor(equity * EQUITY_BINS));
    return std::clamp(bin, 0, EQUITY_BINS - 1);
}

void EquityDistribution::add(double equity) {
    counts[equity_bin(equity)]++;
}

int EquityDistribution::total() const {
    int t = 0;
    for (int c : counts) t += c;
    return t;
}

Eigen::VectorXd EquityDistribution::normalized() const {
    Eigen::VectorXd v(EQUITY_BINS);
    const int t = total();
    for (int i = 0; i < EQUITY_BINS; ++i) {
        v(i) = t > 0 ? static_cast<double>(counts[i]) / t : 0.0;
    }
    return v;
}

double EquityDistribution::mean_equity() const {
    const int t = total();
    if (t == 0) return 0.0;
    double sum = 0.0;
    for (int i = 0; i < EQUITY_BINS; ++i) {
        sum += counts[i] * (i + 0.5) / EQUITY_BINS;
    }
    return sum / t;
}

nlohmann::json EquityDistribution::to_json() const {
    return nlohmann::json(counts);
}

EquityDistribution EquityDistribution::from_json(const nlohmann::json& j) {
    if (!j.is_array() || j.size() != EQUITY_BINS) {
        throw ParseError("Equity distribution must be an array of 50 counts");
    }
    EquityDistribution d;
    for (int i = 0; i < EQUITY_BINS; ++i) {
        if (!j[i].is_number_integer() || j[i].get<int>() < 0) {
            throw ParseError("Equity distribution count is not a non-negative integer");
        }
        d.counts[i] = j[i].get<int>();
    }
    return d;
}

// ============================================================================
// Distribution builder
// ============================================================================

namespace {

// Strength of the given cards plus up to two extra deck indices
inline int strength_with(const tables::StrengthTable& strengths,
                         const std::vector<int>& base, int x, int y) {
    int idx[7];
    int n = 0;
    for (int c : base) idx[n++] = c;
    idx[n++] = x;
    if (y >= 0) idx[n++] = y;
    std::sort(idx, idx + n);
    return strengths.strength_of_indices(idx, n);
}

} // namespace

EquityDistribution equity_distribution(const Hand& hand,
                                       const tables::StrengthTable& strengths) {
    const size_t n = hand.size();
    if (n != 5 && n != 6) {
        throw std::invalid_argument("Equity distribution needs 5 or 6 cards, got " +
                                    std::to_string(n));
    }
    if (cards::has_duplicates(hand)) {
        throw std::invalid_argument("Hand has repeated cards: " + cards::hand_to_string(hand));
    }

    const std::vector<int> hero_cards = tables::sorted_indices(hand);
    const std::vector<int> board(tables::sorted_indices(
        Hand(hand.begin() + cards::HOLE_CARDS, hand.end())));
    const std::vector<int> rest = tables::remaining_deck(cards::card_mask(hand));
    const bool turn = (n == 6);

    // Hero strength for every run-out, computed once and shared by all opponents
    std::vector<int> hero(cards::DECK_SIZE * cards::DECK_SIZE, 0);
    for (size_t t = 0; t < rest.size(); ++t) {
        if (turn) {
            hero[rest[t]] = strength_with(strengths, hero_cards, rest[t], -1);
            continue;
        }
        for (size_t r = t + 1; r < rest.size(); ++r) {
            hero[rest[t] * cards::DECK_SIZE + rest[r]] =
                strength_with(strengths, hero_cards, rest[t], rest[r]);
        }
    }

    EquityDistribution dist;
    std::vector<int> villain(board);
    villain.resize(board.size() + 2);

    for (size_t a = 0; a < rest.size(); ++a) {
        for (size_t b = a + 1; b < rest.size(); ++b) {
            villain[board.size()] = rest[a];
            villain[board.size() + 1] = rest[b];

            tables::RolloutTally tally;
            auto score = [&](int hero_strength, int villain_strength) {
                if (hero_strength > villain_strength) ++tally.wins;
                else if (hero_strength < villain_strength) ++tally.losses;
                else ++tally.ties;
            };

            for (size_t t = 0; t < rest.size(); ++t) {
                if (t == a || t == b) continue;
                if (turn) {
                    score(hero[rest[t]], strength_with(strengths, villain, rest[t], -1));
                    continue;
                }
                for (size_t r = t + 1; r < rest.size(); ++r) {
                    if (r == a || r == b) continue;
                    score(hero[rest[t] * cards::DECK_SIZE + rest[r]],
                          strength_with(strengths, villain, rest[t], rest[r]));
                }
            }
            dist.add(tally.equity());
        }
    }
    return dist;
}

} // namespace isoholdem::abstraction
