#ifndef POKER_TABLE_TABLE_ENGINE_H
#define POKER_TABLE_TABLE_ENGINE_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/cards.hpp"
#include "core/deck.hpp"
#include "poker_table/common_types.h"
#include "poker_table/errors.h"
#include "poker_table/table_events.h"
#include "poker_table/table_state.h"

namespace poker_table {

// Machine à états d'une table: sièges, blinds, tours d'enchères, pots, abattage.
// Un seul écrivain: aucune synchronisation interne (voir DealerService).
class TableEngine {
public:
    explicit TableEngine(TableConfig config);
    TableEngine(TableConfig config, uint64_t deck_seed);

    // Vues
    const TableState& get_state() const;
    TableState get_player_state(const std::string& viewer_id) const;
    TableState get_public_state() const;
    const TableConfig& get_config() const;

    // Sièges
    EngineResult seat_player(const PlayerProfile& profile, int seat_number);
    EngineResult seat_player_anywhere(const PlayerProfile& profile);
    EngineResult can_remove_player(int seat_number) const;
    std::optional<Player> remove_player(int seat_number);
    EngineResult set_player_presence(int seat_number, PlayerStatus presence);
    EngineResult add_chips(int seat_number, int amount);

    const Player* get_player(int seat_number) const;
    std::vector<const Player*> get_seated_players() const;
    std::vector<const Player*> get_active_players() const;

    // Cycle d'une main
    bool can_start_hand() const;
    EngineResult start_new_hand();
    std::vector<ValidAction> get_valid_actions(int seat_number) const;
    EngineResult process_action(int seat_number, ActionType action, std::optional<int> amount = std::nullopt);
    int get_amount_to_call(int seat_number) const;

    // Σ stacks + Σ pots + Σ mises de la street
    int total_chips() const;
    const std::optional<CompletedHand>& get_last_completed_hand() const;

    // Événements: livrés de façon synchrone, dans l'ordre d'émission
    SubscriptionId subscribe(EventHandler handler);
    void unsubscribe(SubscriptionId id);

    // La prochaine main utilisera cet ordre au lieu d'un mélange
    void set_next_deck_for_testing(std::vector<Card> order);

    std::string to_string() const;
    void print_state() const;

private:
    TableState                                           state_;
    Deck                                                 deck_;
    std::optional<std::vector<Card>>                     next_deck_order_;
    std::vector<std::pair<SubscriptionId, EventHandler>> handlers_;
    SubscriptionId                                       next_subscription_ = 1;
    std::optional<CompletedHand>                         last_completed_hand_;
    std::map<std::string, int>                           starting_stacks_; // id -> stack au début de la main
    Clock::time_point                                    hand_started_at_;

    // Arène
    bool is_valid_seat(int seat_number) const;
    Player* mutable_player(int seat_number);
    Player* find_player(const std::string& id);
    int next_seat(int from) const;
    int next_live_seat(int from) const;
    int next_seat_to_act(int from) const;
    bool is_in_current_hand(const Player& p) const;

    // Début de main
    void advance_dealer();
    void set_blind_positions();
    void post_antes();
    void post_blinds();
    void deal_hole_cards();

    // Enchères
    int bet_increment() const;
    int max_total_allowed(const Player& p) const;
    void place_bet(Player& p, int amount);
    void set_turn(int seat_number);
    bool is_betting_round_complete() const;
    void collect_street_bets();
    void advance_street();
    void deal_board(Street next);

    // Fin de main (table_showdown.cpp)
    void go_to_showdown();
    void award_uncontested(Player& winner);
    void end_hand(std::vector<PotAward> awards, bool uncontested);
    int distribute_share(int pot_index, const Pot& pot, int share, const std::vector<std::pair<Player*, std::string>>& winners,
                         bool is_low, std::vector<PotAward>& awards);

    void log_history(HistoryType type, std::optional<std::string> player_id, std::optional<ActionType> action,
                     std::optional<int> amount, std::vector<Card> cards, std::string message);
    void emit(TableEventPayload payload);
};

} // namespace poker_table

#endif // POKER_TABLE_TABLE_ENGINE_H
