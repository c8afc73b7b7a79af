#ifndef POKER_TABLE_HAND_EVALUATOR_HPP
#define POKER_TABLE_HAND_EVALUATOR_HPP

#include <vector>
#include <cstdint>
#include <string>
#include <array>
#include <optional>

#include "core/cards.hpp"
#include "poker_table/errors.h"

namespace poker_table {

// Catégories par ordre croissant; la valeur numérique (1..10) sert à la comparaison
enum class HandCategory : uint8_t {
    HIGH_CARD = 1,
    PAIR,
    TWO_PAIR,
    THREE_OF_A_KIND,
    STRAIGHT,
    FLUSH,
    FULL_HOUSE,
    FOUR_OF_A_KIND,
    STRAIGHT_FLUSH,
    ROYAL_FLUSH
};

struct EvaluatedHand {
    HandCategory         category = HandCategory::HIGH_CARD;
    int                  value    = 1;     // 1..10
    std::vector<int>     kickers;          // Valeurs de rang 2..14, ordre de significativité
    std::string          description;
    std::array<Card, 5>  cards{};          // Les 5 cartes retenues
};

// Main basse Omaha Hi/Lo (8-or-better): valeur plus petite = meilleure
struct LowHand {
    int                  value = 0;
    std::vector<int>     ranks;            // Décroissant, As = 1
    std::string          description;      // "5-4-3-2-1 Low"
    std::array<Card, 5>  cards{};
};

struct ContenderHand {
    std::string   id;
    EvaluatedHand hand;
};

// --- Interface de l'évaluateur ---

/**
 * @brief Évalue exactement 5 cartes.
 * @throws InvalidInputError si une carte est invalide.
 */
EvaluatedHand evaluate_five_card_hand(const std::array<Card, 5>& cards);

/**
 * @brief Meilleure main de 5 cartes parmi toutes les combinaisons (Hold'em: 2 privées + board).
 * @throws InvalidInputError si moins de 5 cartes sont fournies.
 */
EvaluatedHand evaluate_hand(const std::vector<Card>& cards);

/**
 * @brief Omaha high: exactement 2 cartes privées + 3 cartes du board.
 * @throws InvalidInputError si moins de 2 cartes privées ou moins de 3 cartes de board.
 */
EvaluatedHand evaluate_omaha_hand(const std::vector<Card>& hole, const std::vector<Card>& board);

/**
 * @brief Omaha low 8-or-better (2 privées + 3 board, 5 rangs distincts <= 8, As = 1).
 * @return std::nullopt si aucune combinaison ne qualifie ou si les cartes manquent.
 */
std::optional<LowHand> evaluate_omaha_low_hand(const std::vector<Card>& hole, const std::vector<Card>& board);

// > 0 si a bat b, < 0 si b bat a, 0 en cas d'égalité exacte
int compare_hands(const EvaluatedHand& a, const EvaluatedHand& b);

// > 0 si la basse a bat b (a plus basse)
int compare_low_hands(const LowHand& a, const LowHand& b);

// Tous les joueurs à égalité avec la meilleure main (ordre d'entrée conservé)
std::vector<ContenderHand> determine_winners(const std::vector<ContenderHand>& contenders);

std::string hand_category_to_string(HandCategory category);

} // namespace poker_table

#endif // POKER_TABLE_HAND_EVALUATOR_HPP
