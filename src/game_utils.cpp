#include "poker_table/game_utils.hpp"
#include "poker_table/table_events.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace poker_table {

std::string street_to_string(Street s) {
    switch (s) {
        case Street::WAITING:  return "Waiting";
        case Street::PREFLOP:  return "Preflop";
        case Street::FLOP:     return "Flop";
        case Street::TURN:     return "Turn";
        case Street::RIVER:    return "River";
        case Street::SHOWDOWN: return "Showdown";
    }
    return "UnknownStreet";
}

std::string action_type_to_string(ActionType a) {
    switch (a) {
        case ActionType::FOLD:   return "FOLD";
        case ActionType::CHECK:  return "CHECK";
        case ActionType::CALL:   return "CALL";
        case ActionType::BET:    return "BET";
        case ActionType::RAISE:  return "RAISE";
        case ActionType::ALL_IN: return "ALL_IN";
    }
    return "UNKNOWN_ACTION_TYPE";
}

std::string player_status_to_string(PlayerStatus s) {
    switch (s) {
        case PlayerStatus::WAITING:      return "WAITING";
        case PlayerStatus::ACTIVE:       return "ACTIVE";
        case PlayerStatus::FOLDED:       return "FOLDED";
        case PlayerStatus::ALL_IN:       return "ALL_IN";
        case PlayerStatus::SITTING_OUT:  return "SITTING_OUT";
        case PlayerStatus::DISCONNECTED: return "DISCONNECTED";
    }
    return "UNKNOWN_STATUS";
}

std::string betting_structure_to_string(BettingStructure b) {
    switch (b) {
        case BettingStructure::NO_LIMIT:    return "No Limit";
        case BettingStructure::POT_LIMIT:   return "Pot Limit";
        case BettingStructure::FIXED_LIMIT: return "Fixed Limit";
    }
    return "Unknown";
}

std::string game_variant_to_string(GameVariant v) {
    switch (v) {
        case GameVariant::NLH:  return "NLH";
        case GameVariant::PLO:  return "PLO";
        case GameVariant::PLO5: return "PLO5";
        case GameVariant::PLO6: return "PLO6";
        case GameVariant::PLO8: return "PLO8";
    }
    return "Unknown";
}

std::string history_type_to_string(HistoryType t) {
    switch (t) {
        case HistoryType::ACTION:        return "action";
        case HistoryType::CARD_DEALT:    return "card_dealt";
        case HistoryType::STREET_CHANGE: return "street_change";
        case HistoryType::WINNER:        return "winner";
        case HistoryType::SYSTEM:        return "system";
    }
    return "unknown";
}

GameVariant variant_from_string(const std::string& s) {
    std::string upper(s);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "NLH")  return GameVariant::NLH;
    if (upper == "PLO")  return GameVariant::PLO;
    if (upper == "PLO5") return GameVariant::PLO5;
    if (upper == "PLO6") return GameVariant::PLO6;
    if (upper == "PLO8") return GameVariant::PLO8;
    throw std::invalid_argument("Variante inconnue: " + s);
}

std::string vec_to_string(const std::vector<Card>& cards) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards.size(); ++i) {
        ss << (cards[i] == INVALID_CARD ? "--" : poker_table::to_string(cards[i]));
        if (i < cards.size() - 1) {
            ss << " ";
        }
    }
    ss << "]";
    return ss.str();
}

std::string action_to_string(ActionType type, int amount) {
    // FOLD et CHECK n'ont pas de montant
    if (type == ActionType::FOLD || type == ActionType::CHECK) {
        return action_type_to_string(type);
    }
    return action_type_to_string(type) + " " + std::to_string(amount);
}

// -----------------------------------------------------------------------------
//  Noms d'événements
// -----------------------------------------------------------------------------
const char* event_name(const TableEventPayload& payload) {
    return std::visit([](const auto& ev) -> const char* {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, PlayerJoined>)   return "PLAYER_JOINED";
        else if constexpr (std::is_same_v<T, PlayerLeft>)     return "PLAYER_LEFT";
        else if constexpr (std::is_same_v<T, HandStarted>)    return "HAND_STARTED";
        else if constexpr (std::is_same_v<T, CardsDealt>)     return "CARDS_DEALT";
        else if constexpr (std::is_same_v<T, PlayerActed>)    return "PLAYER_ACTED";
        else if constexpr (std::is_same_v<T, PlayerTurn>)     return "PLAYER_TURN";
        else if constexpr (std::is_same_v<T, StreetChanged>)  return "STREET_CHANGED";
        else if constexpr (std::is_same_v<T, PotUpdated>)     return "POT_UPDATED";
        else if constexpr (std::is_same_v<T, HandComplete>)   return "HAND_COMPLETE";
        else if constexpr (std::is_same_v<T, PlayerTimedOut>) return "PLAYER_TIMED_OUT";
        else if constexpr (std::is_same_v<T, TablePaused>)    return "TABLE_PAUSED";
        else return "TABLE_RESUMED";
    }, payload);
}

} // namespace poker_table
