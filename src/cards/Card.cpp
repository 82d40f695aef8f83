#include "Card.hpp"
#include "core/Errors.hpp"
#include <stdexcept>

namespace isoholdem::cards {

namespace {

constexpr char RANK_CHARS[] = "23456789TJQKA";
constexpr char SUIT_CHARS[] = "cdhs";

int rank_from_char(char c) {
    for (int i = 0; i < NUM_RANKS; ++i) {
        if (RANK_CHARS[i] == c) return MIN_RANK + i;
    }
    return -1;
}

int suit_from_char(char c) {
    for (int i = 0; i < NUM_SUITS; ++i) {
        if (SUIT_CHARS[i] == c) return i;
    }
    return -1;
}

} // namespace

Card::Card(int r, int s) {
    if (r < MIN_RANK || r > MAX_RANK) {
        throw std::invalid_argument("Card rank out of range: " + std::to_string(r));
    }
    if (s < 0 || s >= NUM_SUITS) {
        throw std::invalid_argument("Card suit out of range: " + std::to_string(s));
    }
    rank = static_cast<uint8_t>(r);
    suit = static_cast<uint8_t>(s);
}

Card Card::from_index(int index) {
    if (index < 0 || index >= DECK_SIZE) {
        throw std::invalid_argument("Deck index out of range: " + std::to_string(index));
    }
    return Card(index % NUM_RANKS + MIN_RANK, index / NUM_RANKS);
}

char rank_char(int rank) {
    return RANK_CHARS[rank - MIN_RANK];
}

char suit_char(int suit) {
    return SUIT_CHARS[suit];
}

Card parse_card(const std::string& token) {
    if (token.size() != 2) {
        throw ParseError("Card token must be two characters: '" + token + "'");
    }
    int r = rank_from_char(token[0]);
    if (r < 0) {
        throw ParseError("Unknown rank in card '" + token + "'");
    }
    int s = suit_from_char(token[1]);
    if (s < 0) {
        throw ParseError("Unknown suit in card '" + token + "'");
    }
    return Card(r, s);
}

std::string card_to_string(const Card& card) {
    return std::string(1, rank_char(card.rank)) + std::string(1, suit_char(card.suit));
}

Hand parse_hand(const std::string& text) {
    if (text.size() % 2 != 0) {
        throw ParseError("Hand text has odd length: '" + text + "'");
    }

    Hand hand;
    hand.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        hand.push_back(parse_card(text.substr(i, 2)));
    }

    if (has_duplicates(hand)) {
        throw ParseError("Hand contains a repeated card: '" + text + "'");
    }
    return hand;
}

std::string hand_to_string(const Hand& hand) {
    std::string s;
    s.reserve(hand.size() * 2);
    for (const Card& c : hand) {
        s += card_to_string(c);
    }
    return s;
}

const std::vector<Card>& deck() {
    static const std::vector<Card> cards = [] {
        std::vector<Card> d;
        d.reserve(DECK_SIZE);
        for (int i = 0; i < DECK_SIZE; ++i) {
            d.push_back(Card::from_index(i));
        }
        return d;
    }();
    return cards;
}

uint64_t card_mask(const Hand& hand) {
    uint64_t mask = 0;
    for (const Card& c : hand) {
        mask |= uint64_t{1} << c.index();
    }
    return mask;
}

bool has_duplicates(const Hand& hand) {
    uint64_t mask = 0;
    for (const Card& c : hand) {
        uint64_t bit = uint64_t{1} << c.index();
        if (mask & bit) return true;
        mask |= bit;
    }
    return false;
}

Hand apply_suit_permutation(const Hand& hand, const SuitPermutation& perm) {
    Hand out;
    out.reserve(hand.size());
    for (const Card& c : hand) {
        out.push_back(Card(c.rank, perm[c.suit]));
    }
    return out;
}

} // namespace isoholdem::cards
