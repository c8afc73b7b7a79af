#ifndef POKER_TABLE_HAND_STRENGTH_HPP
#define POKER_TABLE_HAND_STRENGTH_HPP

#include <string>
#include <vector>

#include "core/cards.hpp"
#include "eval/hand_evaluator.hpp"
#include "poker_table/common_types.h"

namespace poker_table {

// Estimation "live" pour l'affichage: jamais utilisée pour régler un pot

struct PotentialHand {
    HandCategory category = HandCategory::HIGH_CARD;
    std::string  name;
    int          outs = 0;
    double       probability = 0.0; // 0..0.99
};

struct DrawAnalysis {
    bool is_flush_draw    = false;
    bool is_straight_draw = false;
    bool is_open_ended    = false;
    bool is_gutshot       = false;
    int  flush_outs       = 0;
    int  straight_outs    = 0;
    int  total_outs       = 0;
};

struct HandStrength {
    HandCategory               category = HandCategory::HIGH_CARD;
    std::string                name;
    std::string                description;
    int                        strength = 0; // 0..100
    int                        outs = 0;
    std::vector<PotentialHand> potential_hands;
};

DrawAnalysis analyze_draws(const std::vector<Card>& hole, const std::vector<Card>& board);

/**
 * @brief Force relative (0-100), tirages et mains potentielles.
 * @throws std::invalid_argument si aucune carte privée n'est fournie.
 */
HandStrength analyze_hand_strength(const std::vector<Card>& hole, const std::vector<Card>& board);

// Règle du 2 et du 4: FLOP x4, TURN x2, sinon 0; plafonnée à 99
int estimate_equity(int outs, Street street);

// max(5, force - 8 par adversaire supplémentaire)
int estimate_hand_vs_range(const HandStrength& hand, int opponent_count);

/**
 * @brief Équité exacte heads-up (Hold'em) par énumération des runouts restants.
 * @return Part du pot attendue pour hero (victoires + égalités / 2), dans [0, 1].
 * @throws std::invalid_argument si le board a moins de 3 cartes ou si des cartes se recouvrent.
 */
double calculate_showdown_equity(const std::vector<Card>& hero,
                                 const std::vector<Card>& villain,
                                 const std::vector<Card>& board);

} // namespace poker_table

#endif // POKER_TABLE_HAND_STRENGTH_HPP
