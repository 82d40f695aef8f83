#pragma once

#include <string>
#include <stdexcept>

namespace isoholdem::cards {

// Betting rounds, named by how many board cards are visible
enum class Street {
    Preflop,   // No community cards
    Flop,      // 3 community cards
    Turn,      // 4 community cards
    River      // 5 community cards
};

inline std::string street_to_string(Street street) {
    switch (street) {
        case Street::Preflop: return "preflop";
        case Street::Flop: return "flop";
        case Street::Turn: return "turn";
        case Street::River: return "river";
    }
    return "unknown";
}

inline Street street_from_string(const std::string& name) {
    if (name == "preflop") return Street::Preflop;
    if (name == "flop") return Street::Flop;
    if (name == "turn") return Street::Turn;
    if (name == "river") return Street::River;
    throw std::invalid_argument("Unknown street: " + name);
}

// Total cards (hole + board) seen on a street
inline int cards_for_street(Street street) {
    switch (street) {
        case Street::Preflop: return 2;
        case Street::Flop: return 5;
        case Street::Turn: return 6;
        case Street::River: return 7;
    }
    return 0;
}

inline Street street_for_length(size_t num_cards) {
    switch (num_cards) {
        case 2: return Street::Preflop;
        case 5: return Street::Flop;
        case 6: return Street::Turn;
        case 7: return Street::River;
    }
    throw std::invalid_argument("No street has " + std::to_string(num_cards) + " cards");
}

} // namespace isoholdem::cards
