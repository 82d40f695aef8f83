#pragma once

#include <array>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include "cards/Card.hpp"
#include "tables/StrengthTable.hpp"

namespace isoholdem::abstraction {

constexpr int EQUITY_BINS = 50;

// Histogram of a hand's equity against each possible opponent holding,
// each equity taken over every completion of the board
struct EquityDistribution {
    std::array<int, EQUITY_BINS> counts{};

    // Bin min(floor(equity * 50), 49)
    void add(double equity);

    int total() const;

    // Bin frequencies summing to 1 (all zero when empty)
    Eigen::VectorXd normalized() const;

    // Mean equity, taking each bin at its centre
    double mean_equity() const;

    nlohmann::json to_json() const;

    // Throws ParseError unless j is an array of 50 non-negative integers
    static EquityDistribution from_json(const nlohmann::json& j);
};

int equity_bin(double equity);

// Flop (5 cards: 1081 opponents x 990 run-outs) or turn
// (6 cards: 1035 opponents x 44 rivers). Throws std::invalid_argument
// for other sizes or repeated cards.
EquityDistribution equity_distribution(const cards::Hand& hand,
                                       const tables::StrengthTable& strengths);

} // namespace isoholdem::abstraction
