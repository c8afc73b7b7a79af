#ifndef POKER_TABLE_TABLE_STATE_H
#define POKER_TABLE_TABLE_STATE_H

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/cards.hpp"
#include "poker_table/common_types.h"

namespace poker_table {

using Clock = std::chrono::system_clock;

// Ce que le demandeur fournit pour s'asseoir (stack = buy-in)
struct PlayerProfile {
    std::string id;
    std::string username;
    int         chip_stack = 0;
};

struct Player {
    std::string                      id;
    std::string                      username;
    int                              seat_number = 0;        // 1-based
    int                              chip_stack = 0;
    int                              current_bet = 0;        // Engagé sur la street
    int                              total_bet_this_hand = 0;
    std::optional<std::vector<Card>> hole_cards;             // nullopt = aucune / masquée
    PlayerStatus                     status = PlayerStatus::WAITING;
    bool                             is_dealer = false;
    bool                             is_turn = false;
    int                              time_bank = 30;         // Secondes
    std::optional<ActionType>        last_action;            // Street courante
};

// Siège vide explicite de l'arène
struct EmptySeat {
    int seat_number = 0;
};

using Seat = std::variant<EmptySeat, Player>;

struct Pot {
    int                      amount = 0;
    std::vector<std::string> eligible_players;
    bool                     is_main_pot = false;
    bool                     is_closed = false;
};

enum class HistoryType {
    ACTION,
    CARD_DEALT,
    STREET_CHANGE,
    WINNER,
    SYSTEM
};

struct HandHistoryEntry {
    std::string               hand_id; // "<table>-<hand number>"
    Clock::time_point         timestamp;
    HistoryType               type = HistoryType::SYSTEM;
    std::optional<std::string> player_id;
    std::optional<ActionType> action;
    std::optional<int>        amount;
    std::vector<Card>         cards;
    std::string               message;
};

struct TableState {
    TableConfig                   config;
    std::vector<Seat>             seats;        // Taille fixe = config.table_size
    Street                        street = Street::WAITING;
    std::vector<Card>             community_cards;
    std::vector<Pot>              pots;
    int                           current_bet = 0;
    int                           min_raise = 0;
    std::optional<int>            active_player_seat;
    int                           dealer_seat = 0;
    int                           small_blind_seat = 0;
    int                           big_blind_seat = 0;
    std::optional<int>            last_aggressor_seat;
    int                           hand_number = 0;
    std::vector<HandHistoryEntry> hand_history;
};

// Attribution d'un pot (ou d'une moitié de pot en Hi/Lo)
struct PotAward {
    int                      pot_index = 0;
    int                      pot_amount = 0;
    std::vector<std::string> eligible_players;
    std::string              player_id;
    int                      seat_number = 0;
    int                      amount = 0;
    std::string              hand_description; // Vide si gagné sans abattage
    bool                     is_low = false;
};

struct CompletedHandPlayer {
    std::string                      id;
    std::string                      username;
    int                              seat = 0;
    int                              starting_stack = 0;
    int                              ending_stack = 0;
    std::optional<std::vector<Card>> hole_cards; // Montrées à l'abattage seulement
    int                              profit = 0;
};

struct CompletedPot {
    int                      amount = 0;
    std::vector<std::string> winners;
};

struct CompletedHand {
    std::string                      hand_id;
    std::string                      table_id;
    int                              hand_number = 0;
    Clock::time_point                started_at;
    Clock::time_point                ended_at;
    std::vector<CompletedHandPlayer> players;
    std::vector<Card>                community_cards;
    std::vector<CompletedPot>        pots;
    std::vector<HandHistoryEntry>    history;
};

// --- Accès à l'arène ---

inline Player* player_at(Seat& seat) { return std::get_if<Player>(&seat); }
inline const Player* player_at(const Seat& seat) { return std::get_if<Player>(&seat); }

// Joueur encore en lice (non couché) pendant une main
inline bool is_live(const Player& p) {
    return p.status == PlayerStatus::ACTIVE || p.status == PlayerStatus::ALL_IN;
}

} // namespace poker_table

#endif // POKER_TABLE_TABLE_STATE_H
