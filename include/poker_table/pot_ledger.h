#ifndef POKER_TABLE_POT_LEDGER_H
#define POKER_TABLE_POT_LEDGER_H

#include <string>
#include <vector>

#include "poker_table/table_state.h"

namespace poker_table {

// Mise d'un joueur sur la street qui se termine
struct StreetContribution {
    std::string player_id;
    int         amount = 0;
    bool        all_in = false;
};

/**
 * Consolide les mises d'une street dans les pots, par paliers croissants.
 * Chaque palier défini par un joueur all-in ferme le pot courant (éligibles =
 * contributeurs à ce palier ou au-dessus) et ouvre un nouveau pot pour l'excédent.
 * Un pot fermé n'est plus jamais modifié.
 */
void collect_bets(std::vector<Pot>& pots, std::vector<StreetContribution> contributions);

int pot_total(const std::vector<Pot>& pots);

} // namespace poker_table

#endif // POKER_TABLE_POT_LEDGER_H
