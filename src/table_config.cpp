#include "poker_table/common_types.h"
#include "core/cards.hpp"
#include <stdexcept>
#include <string>

namespace poker_table {

namespace {

// Brûlées (3) + board (5)
constexpr int BOARD_AND_BURNS = 8;

} // namespace

void validate_config(const TableConfig& config) {
    if (config.table_size < MIN_TABLE_SIZE || config.table_size > MAX_TABLE_SIZE)
        throw std::invalid_argument("Taille de table hors [2, 10]: " + std::to_string(config.table_size));
    if (config.small_blind <= 0)
        throw std::invalid_argument("Small blind doit être > 0");
    if (config.big_blind < config.small_blind)
        throw std::invalid_argument("Big blind doit être >= small blind");
    if (config.ante < 0)
        throw std::invalid_argument("Ante doit être >= 0");
    if (config.min_buy_in <= 0)
        throw std::invalid_argument("Buy-in minimum doit être > 0");
    if (config.max_buy_in < config.min_buy_in)
        throw std::invalid_argument("Buy-in maximum < buy-in minimum");
    if (config.time_limit.count() <= 0)
        throw std::invalid_argument("Temps de réflexion doit être > 0");

    const int needed = config.table_size * hole_card_count(config.variant) + BOARD_AND_BURNS;
    if (needed > NUM_CARDS)
        throw std::invalid_argument("Paquet insuffisant pour " + std::to_string(config.table_size) +
                                    " joueurs dans cette variante");
}

} // namespace poker_table
