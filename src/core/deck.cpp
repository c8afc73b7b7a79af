#include "core/deck.hpp"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <algorithm>
#include <chrono>
#include <array>

namespace poker_table {

namespace {

// Graine forte si random_device fournit de l'entropie, sinon repli pseudo-aléatoire sur l'horloge
uint64_t make_seed() {
    try {
        std::random_device rd;
        if (rd.entropy() > 0.0) {
            return (static_cast<uint64_t>(rd()) << 32) ^ rd();
        }
    } catch (const std::exception& e) {
        spdlog::warn("random_device indisponible ({}), repli sur l'horloge", e.what());
    }
    return static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
}

} // namespace

Deck::Deck() : Deck(make_seed()) {}

Deck::Deck(uint64_t seed) : rng_(seed) {
    reset();
}

void Deck::reset() {
    draw_pile_.clear();
    dealt_pile_.clear();
    draw_pile_.reserve(NUM_CARDS);
    dealt_pile_.reserve(NUM_CARDS);
    for (int s = 0; s < 4; ++s) {
        for (int r = 0; r < 13; ++r) {
            draw_pile_.push_back(make_card(static_cast<Rank>(r), static_cast<Suit>(s)));
        }
    }
}

// Fisher–Yates en place sur la pile de tirage
void Deck::shuffle() {
    for (std::size_t i = draw_pile_.size(); i > 1; --i) {
        std::uniform_int_distribution<std::size_t> pick(0, i - 1);
        std::swap(draw_pile_[i - 1], draw_pile_[pick(rng_)]);
    }
}

std::optional<Card> Deck::deal() {
    if (draw_pile_.empty()) {
        spdlog::warn("Deck vide, aucune carte distribuée");
        return std::nullopt;
    }
    Card c = draw_pile_.back();
    draw_pile_.pop_back();
    dealt_pile_.push_back(c);
    return c;
}

std::vector<Card> Deck::deal_multiple(int n) {
    std::vector<Card> out;
    for (int i = 0; i < n; ++i) {
        auto c = deal();
        if (!c) break;
        out.push_back(*c);
    }
    return out;
}

void Deck::burn() {
    // Carte morte: distribuée puis ignorée
    (void)deal();
}

void Deck::set_cards_for_testing(const std::vector<Card>& order) {
    if (order.size() != NUM_CARDS) {
        throw std::invalid_argument("Specific deck for testing must contain exactly " + std::to_string(NUM_CARDS) + " cards.");
    }
    std::array<bool, NUM_CARDS> seen{};
    for (Card c : order) {
        if (!is_valid_card(c) || seen[c]) {
            throw std::invalid_argument("Deck order must be a permutation of the 52 cards (bad card: " + to_string(c) + ")");
        }
        seen[c] = true;
    }
    draw_pile_.assign(order.rbegin(), order.rend());
    dealt_pile_.clear();
}

} // namespace poker_table
