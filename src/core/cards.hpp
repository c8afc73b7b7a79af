#ifndef POKER_TABLE_CARDS_HPP
#define POKER_TABLE_CARDS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept> // Pour std::invalid_argument

namespace poker_table {

// Une carte = index 0-51 (suit * 13 + rank), valeur immuable
using Card = uint8_t;

constexpr int  NUM_CARDS    = 52;
constexpr Card INVALID_CARD = 52; // Index hors paquet

enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };
enum class Rank : uint8_t {
    TWO = 0, THREE = 1, FOUR = 2, FIVE = 3, SIX = 4, SEVEN = 5, EIGHT = 6,
    NINE = 7, TEN = 8, JACK = 9, QUEEN = 10, KING = 11, ACE = 12
};

constexpr Card make_card(Rank r, Suit s) {
    return static_cast<uint8_t>(s) * 13 + static_cast<uint8_t>(r);
}

constexpr Rank get_rank(Card c) {
    if (c >= INVALID_CARD) return static_cast<Rank>(13);
    return static_cast<Rank>(c % 13);
}

constexpr Suit get_suit(Card c) {
    if (c >= INVALID_CARD) return static_cast<Suit>(4);
    return static_cast<Suit>(c / 13);
}

// Valeur numérique du rang: 2..14 (As = 14)
constexpr int rank_value(Card c) {
    return static_cast<int>(get_rank(c)) + 2;
}

constexpr bool is_valid_card(Card c) {
    return c < INVALID_CARD;
}

// Conversions string <-> Card/Rank/Suit
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(Card c);

Card card_from_string(const std::string& s);
Rank rank_from_char(char r);
Suit suit_from_char(char s);

// "As Kd 7h" -> {As, Kd, 7h}; lève std::invalid_argument si un jeton est invalide
std::vector<Card> cards_from_string(const std::string& s);

// Nom anglais du rang ("Ace", "Ten") et son pluriel ("Aces", "Sixes")
std::string rank_name(int value);
std::string rank_name_plural(int value);

} // namespace poker_table

#endif // POKER_TABLE_CARDS_HPP
