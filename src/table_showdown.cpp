#include "poker_table/table_engine.h"     // Interface
#include "poker_table/game_utils.hpp"     // Pour vec_to_string
#include "poker_table/pot_ledger.h"       // Pour pot_total
#include "eval/hand_evaluator.hpp"        // Évaluation high / low
#include "spdlog/spdlog.h"                // Logging
#include <algorithm>
#include <set>
#include <string>
#include <vector>

namespace poker_table {

namespace {

// Main d'un joueur encore en lice à l'abattage
struct Contender {
    Player*                player = nullptr;
    EvaluatedHand          high;
    std::optional<LowHand> low;
};

std::string pot_label(int pot_index) {
    return pot_index == 0 ? "main pot" : "side pot #" + std::to_string(pot_index);
}

bool is_eligible(const Pot& pot, const std::string& id) {
    return std::find(pot.eligible_players.begin(), pot.eligible_players.end(), id) != pot.eligible_players.end();
}

// Gagnants high dans l'ordre des contenders (sens horaire depuis le bouton)
std::vector<std::pair<Player*, std::string>> high_winners(const std::vector<const Contender*>& contenders) {
    std::vector<ContenderHand> hands;
    for (const auto* c : contenders) hands.push_back({c->player->id, c->high});
    const auto best = determine_winners(hands);

    std::vector<std::pair<Player*, std::string>> winners;
    for (const auto* c : contenders) {
        const bool wins = std::any_of(best.begin(), best.end(),
                                      [&](const ContenderHand& h) { return h.id == c->player->id; });
        if (wins) winners.emplace_back(c->player, c->high.description);
    }
    return winners;
}

std::vector<std::pair<Player*, std::string>> low_winners(const std::vector<const Contender*>& contenders) {
    const LowHand* best = nullptr;
    for (const auto* c : contenders) {
        if (!c->low) continue;
        if (!best || compare_low_hands(*c->low, *best) > 0) best = &*c->low;
    }
    std::vector<std::pair<Player*, std::string>> winners;
    if (!best) return winners;
    for (const auto* c : contenders) {
        if (c->low && compare_low_hands(*c->low, *best) == 0) winners.emplace_back(c->player, c->low->description);
    }
    return winners;
}

} // namespace

// -----------------------------------------------------------------------------
//  Abattage
// -----------------------------------------------------------------------------
void TableEngine::go_to_showdown() {
    state_.street = Street::SHOWDOWN;
    state_.active_player_seat.reset();
    for (auto& seat : state_.seats) {
        if (Player* p = player_at(seat)) p->is_turn = false;
    }
    log_history(HistoryType::STREET_CHANGE, std::nullopt, std::nullopt, std::nullopt, state_.community_cards,
                "Showdown");
    spdlog::info("--- Showdown {} ---", vec_to_string(state_.community_cards));
    emit(StreetChanged{state_.street, state_.community_cards});

    const GameVariant variant = state_.config.variant;
    std::vector<Contender> contenders;
    int seat = state_.dealer_seat;
    for (int i = 0; i < state_.config.table_size; ++i) {
        seat = next_seat(seat);
        Player* p = mutable_player(seat);
        if (!p || !is_live(*p) || !p->hole_cards) continue;

        Contender c;
        c.player = p;
        if (is_omaha(variant)) {
            c.high = evaluate_omaha_hand(*p->hole_cards, state_.community_cards);
        } else {
            std::vector<Card> all(*p->hole_cards);
            all.insert(all.end(), state_.community_cards.begin(), state_.community_cards.end());
            c.high = evaluate_hand(all);
        }
        if (variant == GameVariant::PLO8) {
            c.low = evaluate_omaha_low_hand(*p->hole_cards, state_.community_cards);
        }
        spdlog::info("Siège {} ({}) montre {} -> {}{}", seat, p->username, vec_to_string(*p->hole_cards),
                     c.high.description, c.low ? " / " + c.low->description : std::string());
        contenders.push_back(std::move(c));
    }

    std::vector<PotAward> awards;
    for (int idx = 0; idx < static_cast<int>(state_.pots.size()); ++idx) {
        const Pot& pot = state_.pots[idx];
        if (pot.amount <= 0) continue;

        std::vector<const Contender*> eligible;
        for (const auto& c : contenders) {
            if (is_eligible(pot, c.player->id)) eligible.push_back(&c);
        }
        if (eligible.empty()) {
            spdlog::warn("Pot #{} ({}) sans éligible en lice: attribué aux meilleurs restants", idx, pot.amount);
            for (const auto& c : contenders) eligible.push_back(&c);
        }

        int high_share = pot.amount;
        if (variant == GameVariant::PLO8) {
            const auto lows = low_winners(eligible);
            if (!lows.empty()) {
                const int low_share = pot.amount / 2;
                high_share = pot.amount - low_share; // Le jeton impair va au high
                distribute_share(idx, pot, low_share, lows, true, awards);
            }
        }
        distribute_share(idx, pot, high_share, high_winners(eligible), false, awards);
    }

    // Les pots sont maintenant dans les stacks
    state_.pots.clear();
    end_hand(std::move(awards), false);
}

int TableEngine::distribute_share(int pot_index, const Pot& pot, int share,
                                  const std::vector<std::pair<Player*, std::string>>& winners, bool is_low,
                                  std::vector<PotAward>& awards) {
    if (winners.empty() || share <= 0) return 0;
    const int count     = static_cast<int>(winners.size());
    const int each      = share / count;
    const int remainder = share % count;

    int distributed = 0;
    for (int i = 0; i < count; ++i) {
        Player* p = winners[i].first;
        // Jeton impair: premier gagnant à gauche du bouton
        const int prize = each + (i == 0 ? remainder : 0);
        p->chip_stack += prize;
        distributed   += prize;

        PotAward award;
        award.pot_index        = pot_index;
        award.pot_amount       = pot.amount;
        award.eligible_players = pot.eligible_players;
        award.player_id        = p->id;
        award.seat_number      = p->seat_number;
        award.amount           = prize;
        award.hand_description = winners[i].second;
        award.is_low           = is_low;
        awards.push_back(award);

        const std::string message = p->username + " wins " + std::to_string(prize) + " from " + pot_label(pot_index) +
                                    (is_low ? " (low)" : "") + " with " + winners[i].second;
        log_history(HistoryType::WINNER, p->id, std::nullopt, prize, {}, message);
        spdlog::info("{}", message);
    }
    return distributed;
}

void TableEngine::award_uncontested(Player& winner) {
    std::vector<PotAward> awards;
    int total = 0;
    for (int idx = 0; idx < static_cast<int>(state_.pots.size()); ++idx) {
        const Pot& pot = state_.pots[idx];
        if (pot.amount <= 0) continue;
        PotAward award;
        award.pot_index        = idx;
        award.pot_amount       = pot.amount;
        award.eligible_players = pot.eligible_players;
        award.player_id        = winner.id;
        award.seat_number      = winner.seat_number;
        award.amount           = pot.amount;
        awards.push_back(award);
        total += pot.amount;
    }
    winner.chip_stack += total;
    state_.pots.clear();

    const std::string message = winner.username + " wins " + std::to_string(total) + " (others folded)";
    log_history(HistoryType::WINNER, winner.id, std::nullopt, total, {}, message);
    spdlog::info("{}", message);
    end_hand(std::move(awards), true);
}

// -----------------------------------------------------------------------------
//  Fin de main
// -----------------------------------------------------------------------------
void TableEngine::end_hand(std::vector<PotAward> awards, bool uncontested) {
    log_history(HistoryType::SYSTEM, std::nullopt, std::nullopt, std::nullopt, {},
                "Hand #" + std::to_string(state_.hand_number) + " complete");

    CompletedHand record;
    record.hand_id         = state_.config.id + "-" + std::to_string(state_.hand_number);
    record.table_id        = state_.config.id;
    record.hand_number     = state_.hand_number;
    record.started_at      = hand_started_at_;
    record.ended_at        = Clock::now();
    record.community_cards = state_.community_cards;
    record.history         = state_.hand_history;

    for (const auto& seat : state_.seats) {
        const Player* p = player_at(seat);
        if (!p) continue;
        const auto start = starting_stacks_.find(p->id);
        if (start == starting_stacks_.end()) continue;

        CompletedHandPlayer entry;
        entry.id             = p->id;
        entry.username       = p->username;
        entry.seat           = p->seat_number;
        entry.starting_stack = start->second;
        entry.ending_stack   = p->chip_stack;
        entry.profit         = p->chip_stack - start->second;
        if (!uncontested && is_live(*p)) entry.hole_cards = p->hole_cards;
        record.players.push_back(std::move(entry));
    }

    // Regroupe les attributions par pot (moitiés high/low comprises)
    int total_awarded = 0;
    std::vector<int> seen_pots;
    for (const auto& award : awards) {
        total_awarded += award.amount;
        auto pos = std::find(seen_pots.begin(), seen_pots.end(), award.pot_index);
        if (pos == seen_pots.end()) {
            seen_pots.push_back(award.pot_index);
            record.pots.push_back({award.pot_amount, {}});
            pos = seen_pots.end() - 1;
        }
        auto& winners = record.pots[static_cast<size_t>(pos - seen_pots.begin())].winners;
        if (std::find(winners.begin(), winners.end(), award.player_id) == winners.end()) {
            winners.push_back(award.player_id);
        }
    }
    last_completed_hand_ = std::move(record);

    // Émis avant la remise à zéro: les cartes montrées restent visibles
    emit(HandComplete{std::move(awards), total_awarded, uncontested});

    for (auto& seat : state_.seats) {
        Player* p = player_at(seat);
        if (!p) continue;
        p->hole_cards.reset();
        p->current_bet         = 0;
        p->total_bet_this_hand = 0;
        p->last_action.reset();
        p->is_turn             = false;
        if (p->status != PlayerStatus::SITTING_OUT && p->status != PlayerStatus::DISCONNECTED) {
            p->status = PlayerStatus::WAITING;
        }
    }
    state_.street      = Street::WAITING;
    state_.pots.clear();
    state_.community_cards.clear();
    state_.current_bet = 0;
    state_.min_raise   = state_.config.big_blind;
    state_.active_player_seat.reset();
    state_.last_aggressor_seat.reset();
    starting_stacks_.clear();

    spdlog::info("Main #{} terminée: {} distribués", state_.hand_number, total_awarded);
}

} // namespace poker_table
