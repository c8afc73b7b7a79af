#ifndef POKER_TABLE_TABLE_EVENTS_H
#define POKER_TABLE_TABLE_EVENTS_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "poker_table/table_state.h"

namespace poker_table {

// ─────────────────────────────────────────────────────────────────────────────
//  Événements typés, un enregistrement par type (ensemble fermé)
// ─────────────────────────────────────────────────────────────────────────────

struct PlayerJoined {
    int         seat_number = 0;
    std::string player_id;
    std::string username;
    int         chip_stack = 0;
};

struct PlayerLeft {
    int         seat_number = 0;
    std::string player_id;
    int         chip_stack = 0;
};

struct HandStarted {
    int dealer_seat = 0;
    int small_blind_seat = 0;
    int big_blind_seat = 0;
    std::vector<int> seats_in_hand;
};

// Cartes privées distribuées (le contenu n'est jamais dans l'événement)
struct CardsDealt {
    std::vector<int> seats;
    int              cards_per_player = 0;
};

struct PlayerActed {
    int         seat_number = 0;
    std::string player_id;
    ActionType  action = ActionType::FOLD;
    int         amount = 0; // Jetons ajoutés par l'action
    int         stack_after = 0;
};

struct PlayerTurn {
    int                       seat_number = 0;
    std::string               player_id;
    int                       to_call = 0;
    std::chrono::milliseconds time_limit{0};
    std::vector<ValidAction>  valid_actions;
};

struct StreetChanged {
    Street            street = Street::WAITING;
    std::vector<Card> community_cards;
};

struct PotUpdated {
    std::vector<Pot> pots;
    int              total = 0;
};

struct HandComplete {
    std::vector<PotAward> awards;
    int                   total_awarded = 0;
    bool                  uncontested = false;
};

// Émis par l'orchestration (DealerService), pas par le moteur
struct PlayerTimedOut {
    int         seat_number = 0;
    std::string player_id;
    ActionType  auto_action = ActionType::FOLD;
};

struct TablePaused {};
struct TableResumed {};

using TableEventPayload = std::variant<PlayerJoined, PlayerLeft, HandStarted, CardsDealt, PlayerActed,
                                       PlayerTurn, StreetChanged, PotUpdated, HandComplete,
                                       PlayerTimedOut, TablePaused, TableResumed>;

struct TableEvent {
    std::string       table_id;
    int               hand_number = 0;
    Clock::time_point timestamp;
    TableEventPayload payload;
};

using EventHandler   = std::function<void(const TableEvent&)>;
using SubscriptionId = uint64_t;

// Nom stable ("PLAYER_JOINED", ...) pour logs et relais
const char* event_name(const TableEventPayload& payload);

} // namespace poker_table

#endif // POKER_TABLE_TABLE_EVENTS_H
