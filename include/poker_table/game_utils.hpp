#ifndef POKER_TABLE_GAME_UTILS_HPP
#define POKER_TABLE_GAME_UTILS_HPP

#include <string>
#include <vector>

#include "core/cards.hpp" // Pour Card et to_string(Card)
#include "poker_table/common_types.h"
#include "poker_table/table_state.h"

namespace poker_table {

// Conversions enum -> texte (logs, historique, relais)
std::string street_to_string(Street s);
std::string action_type_to_string(ActionType a);
std::string player_status_to_string(PlayerStatus s);
std::string betting_structure_to_string(BettingStructure b);
std::string game_variant_to_string(GameVariant v);
std::string history_type_to_string(HistoryType t);

// "NLH", "PLO", "PLO5", "PLO6", "PLO8" (insensible à la casse); std::invalid_argument sinon
GameVariant variant_from_string(const std::string& s);

// "[As Kd --]"
std::string vec_to_string(const std::vector<Card>& cards);

// Action + montant ("RAISE 120")
std::string action_to_string(ActionType type, int amount);

} // namespace poker_table

#endif // POKER_TABLE_GAME_UTILS_HPP
