#include "HandCode.hpp"
#include "core/Errors.hpp"
#include <stdexcept>

namespace isoholdem::cards {

HandCode pack_hand(const Hand& hand) {
    if (hand.size() > MAX_CODE_CARDS) {
        throw std::length_error("Hand code holds at most 8 cards, got " +
                                std::to_string(hand.size()));
    }
    HandCode code = 0;
    for (size_t i = 0; i < hand.size(); ++i) {
        code |= static_cast<HandCode>(card_byte(hand[i])) << (8 * i);
    }
    return code;
}

Hand unpack_hand(HandCode code) {
    Hand hand;
    bool ended = false;
    for (int i = 0; i < MAX_CODE_CARDS; ++i) {
        int b = static_cast<int>((code >> (8 * i)) & 0xFF);
        if (b == 0) {
            ended = true;
            continue;
        }
        if (ended) {
            throw ParseError("Hand code has a card after an empty slot");
        }
        int rank = b % SUIT_MULTIPLIER;
        int suit = b / SUIT_MULTIPLIER;
        if (rank < MIN_RANK || suit >= NUM_SUITS) {
            throw ParseError("Hand code byte " + std::to_string(b) + " is not a card");
        }
        hand.push_back(Card(rank, suit));
    }
    return hand;
}

int code_length(HandCode code) {
    int n = 0;
    while (n < MAX_CODE_CARDS && ((code >> (8 * n)) & 0xFF) != 0) {
        ++n;
    }
    return n;
}

std::string code_to_string(HandCode code) {
    return hand_to_string(unpack_hand(code));
}

HandCode code_from_string(const std::string& text) {
    return pack_hand(parse_hand(text));
}

} // namespace isoholdem::cards
