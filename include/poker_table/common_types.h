#ifndef POKER_TABLE_COMMON_TYPES_H
#define POKER_TABLE_COMMON_TYPES_H

#include <chrono>
#include <optional>
#include <string>

namespace poker_table {

// Tours de jeu (cycle par main: WAITING -> ... -> SHOWDOWN -> WAITING)
enum class Street {
    WAITING,
    PREFLOP,
    FLOP,
    TURN,
    RIVER,
    SHOWDOWN
};

// Types d'action possibles
enum class ActionType {
    FOLD,
    CHECK,
    CALL,
    BET,
    RAISE,
    ALL_IN
};

enum class PlayerStatus {
    WAITING,
    ACTIVE,
    FOLDED,
    ALL_IN,
    SITTING_OUT,
    DISCONNECTED
};

enum class BettingStructure {
    NO_LIMIT,
    POT_LIMIT,
    FIXED_LIMIT
};

enum class GameVariant {
    NLH,  // Texas Hold'em
    PLO,  // Omaha 4 cartes
    PLO5,
    PLO6,
    PLO8  // Omaha Hi/Lo 8-or-better
};

constexpr int MIN_TABLE_SIZE = 2;
constexpr int MAX_TABLE_SIZE = 10;

// Configuration immuable d'une table
struct TableConfig {
    std::string               id                 = "table-1";
    std::string               name               = "Table 1";
    int                       table_size         = 6;
    int                       small_blind        = 5;
    int                       big_blind          = 10;
    int                       ante               = 0;
    int                       min_buy_in         = 200;
    int                       max_buy_in         = 2000;
    std::chrono::milliseconds time_limit         = std::chrono::seconds(30);
    BettingStructure          betting_structure  = BettingStructure::NO_LIMIT;
    GameVariant               variant            = GameVariant::NLH;
};

// Lève std::invalid_argument sur la première contrainte violée
void validate_config(const TableConfig& config);

inline int hole_card_count(GameVariant v) {
    switch (v) {
        case GameVariant::NLH:  return 2;
        case GameVariant::PLO:  return 4;
        case GameVariant::PLO5: return 5;
        case GameVariant::PLO6: return 6;
        case GameVariant::PLO8: return 4;
    }
    return 2;
}

inline bool is_omaha(GameVariant v) {
    return v != GameVariant::NLH;
}

// Action légale proposée à un siège (montants en mise totale pour RAISE)
struct ValidAction {
    ActionType         type = ActionType::FOLD;
    std::optional<int> min_amount;
    std::optional<int> max_amount;

    bool operator==(const ValidAction& other) const {
        return type == other.type && min_amount == other.min_amount && max_amount == other.max_amount;
    }
};

} // namespace poker_table

#endif // POKER_TABLE_COMMON_TYPES_H
