#ifndef POKER_TABLE_CORE_DECK_HPP
#define POKER_TABLE_CORE_DECK_HPP

#include "core/cards.hpp"
#include <vector>
#include <random>
#include <optional>
#include <cstdint>

namespace poker_table {

// Paquet de 52 cartes: pile de tirage + pile distribuée.
// Invariant: tirage ∪ distribuées = les 52 cartes, sans doublon.
class Deck {
public:
    Deck();
    explicit Deck(uint64_t seed); // Mélanges reproductibles (tests, démo)
    ~Deck() = default;

    void reset();
    void shuffle();

    std::optional<Card> deal();
    std::vector<Card>   deal_multiple(int n);
    void                burn();

    std::size_t remaining() const { return draw_pile_.size(); }
    bool        has_cards() const { return !draw_pile_.empty(); }
    const std::vector<Card>& dealt() const { return dealt_pile_; }

    // Installe un ordre précis (52 cartes uniques): order[0] sort en premier
    void set_cards_for_testing(const std::vector<Card>& order);

private:
    std::vector<Card> draw_pile_;  // Le dessus du paquet est en fin de vecteur
    std::vector<Card> dealt_pile_;
    std::mt19937_64   rng_;
};

} // namespace poker_table

#endif // POKER_TABLE_CORE_DECK_HPP
