#include "poker_table/pot_ledger.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <numeric>

namespace poker_table {

namespace {

std::vector<std::string> ids_of(std::vector<StreetContribution>::const_iterator first,
                                std::vector<StreetContribution>::const_iterator last) {
    std::vector<std::string> ids;
    for (auto it = first; it != last; ++it) ids.push_back(it->player_id);
    return ids;
}

} // namespace

void collect_bets(std::vector<Pot>& pots, std::vector<StreetContribution> contributions) {
    contributions.erase(std::remove_if(contributions.begin(), contributions.end(),
                                       [](const StreetContribution& c) { return c.amount <= 0; }),
                        contributions.end());
    if (contributions.empty()) return;

    // Croissant; à montant égal l'all-in passe en tête pour fermer son palier
    std::stable_sort(contributions.begin(), contributions.end(),
                     [](const StreetContribution& a, const StreetContribution& b) {
                         if (a.amount != b.amount) return a.amount < b.amount;
                         return a.all_in && !b.all_in;
                     });

    int previous_level = 0;
    for (auto it = contributions.begin(); it != contributions.end(); ++it) {
        const int level = it->amount - previous_level;
        if (level <= 0) continue;

        // Trié: ce joueur et tous les suivants ont misé au moins ce palier
        const auto participants = static_cast<int>(std::distance(it, contributions.end()));

        if (pots.empty() || pots.back().is_closed) {
            Pot fresh;
            fresh.eligible_players = ids_of(it, contributions.end());
            fresh.is_main_pot      = pots.empty();
            pots.push_back(std::move(fresh));
        }
        Pot& active = pots.back();
        active.amount += level * participants;
        spdlog::debug("Palier {}: +{} x {} -> pot #{} = {}", it->amount, level, participants,
                      pots.size() - 1, active.amount);

        if (it->all_in) {
            active.is_closed        = true;
            active.eligible_players = ids_of(it, contributions.end());

            auto above = std::find_if(it, contributions.end(),
                                      [&](const StreetContribution& c) { return c.amount > it->amount; });
            if (above != contributions.end()) {
                Pot side;
                side.eligible_players = ids_of(above, contributions.end());
                pots.push_back(std::move(side));
            }
        }
        previous_level = it->amount;
    }
}

int pot_total(const std::vector<Pot>& pots) {
    return std::accumulate(pots.begin(), pots.end(), 0,
                           [](int acc, const Pot& p) { return acc + p.amount; });
}

} // namespace poker_table
