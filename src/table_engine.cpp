#include "poker_table/table_engine.h"     // Interface
#include "poker_table/game_utils.hpp"     // Pour street_to_string, vec_to_string
#include "poker_table/pot_ledger.h"       // Pour collect_bets, pot_total
#include "spdlog/spdlog.h"                // Logging
#include "fmt/format.h"                  // Pour fmt::join
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace poker_table {

namespace {

TableState make_initial_state(TableConfig config) {
    validate_config(config);
    TableState state;
    state.config = std::move(config);
    state.seats.reserve(state.config.table_size);
    for (int seat = 1; seat <= state.config.table_size; ++seat) {
        state.seats.emplace_back(EmptySeat{seat});
    }
    state.min_raise = state.config.big_blind;
    return state;
}

std::string hand_id_of(const TableState& state) {
    return state.config.id + "-" + std::to_string(state.hand_number);
}

} // namespace

// -----------------------------------------------------------------------------
//  Constructeurs
// -----------------------------------------------------------------------------
TableEngine::TableEngine(TableConfig config)
    : state_(make_initial_state(std::move(config))),
      deck_()
{
    spdlog::debug("Table {} créée: {} sièges, blinds {}/{}", state_.config.id, state_.config.table_size,
                  state_.config.small_blind, state_.config.big_blind);
}

TableEngine::TableEngine(TableConfig config, uint64_t deck_seed)
    : state_(make_initial_state(std::move(config))),
      deck_(deck_seed)
{
    spdlog::debug("Table {} créée (seed {}): {} sièges, blinds {}/{}", state_.config.id, deck_seed,
                  state_.config.table_size, state_.config.small_blind, state_.config.big_blind);
}

// -----------------------------------------------------------------------------
//  Vues
// -----------------------------------------------------------------------------
const TableState& TableEngine::get_state() const { return state_; }
const TableConfig& TableEngine::get_config() const { return state_.config; }

TableState TableEngine::get_player_state(const std::string& viewer_id) const {
    TableState view = state_;
    if (view.street == Street::SHOWDOWN) return view;
    for (auto& seat : view.seats) {
        Player* p = player_at(seat);
        if (p && p->id != viewer_id) p->hole_cards.reset();
    }
    return view;
}

TableState TableEngine::get_public_state() const {
    TableState view = state_;
    if (view.street == Street::SHOWDOWN) return view;
    for (auto& seat : view.seats) {
        if (Player* p = player_at(seat)) p->hole_cards.reset();
    }
    return view;
}

// -----------------------------------------------------------------------------
//  Arène des sièges
// -----------------------------------------------------------------------------
bool TableEngine::is_valid_seat(int seat_number) const {
    return seat_number >= 1 && seat_number <= state_.config.table_size;
}

Player* TableEngine::mutable_player(int seat_number) {
    if (!is_valid_seat(seat_number)) return nullptr;
    return player_at(state_.seats[seat_number - 1]);
}

const Player* TableEngine::get_player(int seat_number) const {
    if (!is_valid_seat(seat_number)) return nullptr;
    return player_at(state_.seats[seat_number - 1]);
}

Player* TableEngine::find_player(const std::string& id) {
    for (auto& seat : state_.seats) {
        Player* p = player_at(seat);
        if (p && p->id == id) return p;
    }
    return nullptr;
}

std::vector<const Player*> TableEngine::get_seated_players() const {
    std::vector<const Player*> players;
    for (const auto& seat : state_.seats) {
        if (const Player* p = player_at(seat)) players.push_back(p);
    }
    return players;
}

std::vector<const Player*> TableEngine::get_active_players() const {
    std::vector<const Player*> players;
    for (const auto& seat : state_.seats) {
        const Player* p = player_at(seat);
        if (p && is_live(*p)) players.push_back(p);
    }
    return players;
}

// Sens horaire, 1-based, avec retour au siège 1
int TableEngine::next_seat(int from) const {
    return (from % state_.config.table_size) + 1;
}

int TableEngine::next_live_seat(int from) const {
    int seat = from;
    for (int i = 0; i < state_.config.table_size; ++i) {
        seat = next_seat(seat);
        const Player* p = get_player(seat);
        if (p && is_live(*p)) return seat;
    }
    return 0;
}

// Premier ACTIVE après `from` qui n'a pas encore parlé ou n'a pas égalisé
int TableEngine::next_seat_to_act(int from) const {
    int seat = from;
    for (int i = 0; i < state_.config.table_size; ++i) {
        seat = next_seat(seat);
        const Player* p = get_player(seat);
        if (!p || p->status != PlayerStatus::ACTIVE) continue;
        if (!p->last_action || p->current_bet < state_.current_bet) return seat;
    }
    return 0;
}

bool TableEngine::is_in_current_hand(const Player& p) const {
    if (state_.street == Street::WAITING) return false;
    return p.status == PlayerStatus::ACTIVE || p.status == PlayerStatus::ALL_IN ||
           p.status == PlayerStatus::FOLDED;
}

EngineResult TableEngine::seat_player(const PlayerProfile& profile, int seat_number) {
    if (!is_valid_seat(seat_number))
        return EngineResult::reject(RejectReason::INVALID_SEAT).with_seat(seat_number);
    if (get_player(seat_number))
        return EngineResult::reject(RejectReason::SEAT_OCCUPIED).with_seat(seat_number);
    if (find_player(profile.id))
        return EngineResult::reject(RejectReason::DUPLICATE_PLAYER).with_seat(seat_number);
    if (profile.chip_stack < state_.config.min_buy_in)
        return EngineResult::reject(RejectReason::BUY_IN_TOO_SMALL).with_seat(seat_number).with_amount(profile.chip_stack);
    if (profile.chip_stack > state_.config.max_buy_in)
        return EngineResult::reject(RejectReason::BUY_IN_TOO_LARGE).with_seat(seat_number).with_amount(profile.chip_stack);

    Player player;
    player.id          = profile.id;
    player.username    = profile.username;
    player.seat_number = seat_number;
    player.chip_stack  = profile.chip_stack;
    player.status      = PlayerStatus::WAITING;
    state_.seats[seat_number - 1] = std::move(player);

    spdlog::info("Siège {}: {} s'assoit avec {} jetons", seat_number, profile.username, profile.chip_stack);
    emit(PlayerJoined{seat_number, profile.id, profile.username, profile.chip_stack});
    return EngineResult::success().with_seat(seat_number).with_amount(profile.chip_stack);
}

EngineResult TableEngine::seat_player_anywhere(const PlayerProfile& profile) {
    for (int seat = 1; seat <= state_.config.table_size; ++seat) {
        if (!get_player(seat)) return seat_player(profile, seat);
    }
    return EngineResult::reject(RejectReason::TABLE_FULL);
}

EngineResult TableEngine::can_remove_player(int seat_number) const {
    if (!is_valid_seat(seat_number))
        return EngineResult::reject(RejectReason::INVALID_SEAT).with_seat(seat_number);
    const Player* p = get_player(seat_number);
    if (!p)
        return EngineResult::reject(RejectReason::SEAT_EMPTY).with_seat(seat_number);
    if (is_in_current_hand(*p))
        return EngineResult::reject(RejectReason::PLAYER_IN_HAND).with_seat(seat_number);
    return EngineResult::success().with_seat(seat_number);
}

std::optional<Player> TableEngine::remove_player(int seat_number) {
    const EngineResult check = can_remove_player(seat_number);
    if (!check) {
        spdlog::warn("Retrait refusé: {}", describe(check));
        return std::nullopt;
    }
    Player removed = std::move(*mutable_player(seat_number));
    state_.seats[seat_number - 1] = EmptySeat{seat_number};

    spdlog::info("Siège {}: {} quitte la table avec {} jetons", seat_number, removed.username, removed.chip_stack);
    emit(PlayerLeft{seat_number, removed.id, removed.chip_stack});
    return removed;
}

EngineResult TableEngine::set_player_presence(int seat_number, PlayerStatus presence) {
    if (!is_valid_seat(seat_number))
        return EngineResult::reject(RejectReason::INVALID_SEAT).with_seat(seat_number);
    Player* p = mutable_player(seat_number);
    if (!p)
        return EngineResult::reject(RejectReason::SEAT_EMPTY).with_seat(seat_number);
    if (presence != PlayerStatus::WAITING && presence != PlayerStatus::SITTING_OUT &&
        presence != PlayerStatus::DISCONNECTED)
        return EngineResult::reject(RejectReason::ILLEGAL_ACTION).with_seat(seat_number);
    if (is_in_current_hand(*p))
        return EngineResult::reject(RejectReason::PLAYER_IN_HAND).with_seat(seat_number);

    p->status = presence;
    spdlog::info("Siège {}: {} -> {}", seat_number, p->username, player_status_to_string(presence));
    return EngineResult::success().with_seat(seat_number);
}

EngineResult TableEngine::add_chips(int seat_number, int amount) {
    if (!is_valid_seat(seat_number))
        return EngineResult::reject(RejectReason::INVALID_SEAT).with_seat(seat_number);
    Player* p = mutable_player(seat_number);
    if (!p)
        return EngineResult::reject(RejectReason::SEAT_EMPTY).with_seat(seat_number);
    if (amount <= 0)
        return EngineResult::reject(RejectReason::INVALID_AMOUNT).with_seat(seat_number).with_amount(amount);
    if (is_in_current_hand(*p))
        return EngineResult::reject(RejectReason::PLAYER_IN_HAND).with_seat(seat_number);
    if (p->chip_stack + amount > state_.config.max_buy_in)
        return EngineResult::reject(RejectReason::BUY_IN_TOO_LARGE).with_seat(seat_number).with_amount(amount);

    p->chip_stack += amount;
    spdlog::info("Siège {}: recave de {} -> {}", seat_number, amount, p->chip_stack);
    return EngineResult::success().with_seat(seat_number).with_amount(amount);
}

// -----------------------------------------------------------------------------
//  Début de main
// -----------------------------------------------------------------------------
bool TableEngine::can_start_hand() const {
    if (state_.street != Street::WAITING) return false;
    int ready = 0;
    for (const auto& seat : state_.seats) {
        const Player* p = player_at(seat);
        if (p && p->status == PlayerStatus::WAITING && p->chip_stack > 0) ++ready;
    }
    return ready >= 2;
}

EngineResult TableEngine::start_new_hand() {
    if (state_.street != Street::WAITING)
        return EngineResult::reject(RejectReason::HAND_IN_PROGRESS);
    if (!can_start_hand())
        return EngineResult::reject(RejectReason::NOT_ENOUGH_PLAYERS);

    state_.hand_number++;
    state_.community_cards.clear();
    state_.pots.clear();
    state_.hand_history.clear();
    state_.current_bet = 0;
    state_.min_raise   = state_.config.big_blind;
    state_.active_player_seat.reset();
    state_.last_aggressor_seat.reset();
    starting_stacks_.clear();
    hand_started_at_ = Clock::now();

    std::vector<std::string> dealt_in;
    std::vector<int>         dealt_seats;
    for (auto& seat : state_.seats) {
        Player* p = player_at(seat);
        if (!p || p->status != PlayerStatus::WAITING || p->chip_stack <= 0) continue;
        p->status              = PlayerStatus::ACTIVE;
        p->current_bet         = 0;
        p->total_bet_this_hand = 0;
        p->hole_cards.reset();
        p->last_action.reset();
        p->is_turn             = false;
        dealt_in.push_back(p->id);
        dealt_seats.push_back(p->seat_number);
        starting_stacks_[p->id] = p->chip_stack;
    }

    Pot main_pot;
    main_pot.eligible_players = dealt_in;
    main_pot.is_main_pot      = true;
    state_.pots.push_back(std::move(main_pot));

    deck_.reset();
    if (next_deck_order_) {
        deck_.set_cards_for_testing(*next_deck_order_);
        next_deck_order_.reset();
    } else {
        deck_.shuffle();
    }

    advance_dealer();
    set_blind_positions();
    state_.street = Street::PREFLOP;

    log_history(HistoryType::SYSTEM, std::nullopt, std::nullopt, std::nullopt, {},
                "Hand #" + std::to_string(state_.hand_number) + " started");
    spdlog::info("Main #{} - bouton {}, SB {}, BB {}, joueurs: {}", state_.hand_number, state_.dealer_seat,
                 state_.small_blind_seat, state_.big_blind_seat, fmt::join(dealt_seats, ","));
    emit(HandStarted{state_.dealer_seat, state_.small_blind_seat, state_.big_blind_seat, dealt_seats});

    post_antes();
    post_blinds();
    deal_hole_cards();

    if (is_betting_round_complete()) {
        advance_street();
    } else {
        set_turn(next_seat_to_act(state_.big_blind_seat));
    }
    return EngineResult::success();
}

void TableEngine::advance_dealer() {
    for (auto& seat : state_.seats) {
        if (Player* p = player_at(seat)) p->is_dealer = false;
    }
    int seat = state_.dealer_seat;
    for (int i = 0; i < state_.config.table_size; ++i) {
        seat = next_seat(seat);
        Player* p = mutable_player(seat);
        if (p && p->status == PlayerStatus::ACTIVE) {
            p->is_dealer       = true;
            state_.dealer_seat = seat;
            return;
        }
    }
    throw std::logic_error("Aucun joueur actif pour le bouton");
}

void TableEngine::set_blind_positions() {
    const auto live = get_active_players().size();
    if (live == 2) {
        // Heads-up: le bouton poste la small blind
        state_.small_blind_seat = state_.dealer_seat;
        state_.big_blind_seat   = next_live_seat(state_.dealer_seat);
    } else {
        state_.small_blind_seat = next_live_seat(state_.dealer_seat);
        state_.big_blind_seat   = next_live_seat(state_.small_blind_seat);
    }
}

void TableEngine::post_antes() {
    if (state_.config.ante <= 0) return;

    std::vector<StreetContribution> contributions;
    for (auto& seat : state_.seats) {
        Player* p = player_at(seat);
        if (!p || p->status != PlayerStatus::ACTIVE) continue;
        const int ante = std::min(state_.config.ante, p->chip_stack);
        p->chip_stack          -= ante;
        p->total_bet_this_hand += ante;
        if (p->chip_stack == 0) p->status = PlayerStatus::ALL_IN;
        contributions.push_back({p->id, ante, p->chip_stack == 0});
        log_history(HistoryType::ACTION, p->id, std::nullopt, ante, {}, "posts ante");
    }
    collect_bets(state_.pots, contributions);
    spdlog::debug("Antes collectées: pot {}", pot_total(state_.pots));
    emit(PotUpdated{state_.pots, pot_total(state_.pots)});
}

void TableEngine::post_blinds() {
    auto post = [this](int seat, int blind, const std::string& label) {
        Player* p = mutable_player(seat);
        if (!p || p->status != PlayerStatus::ACTIVE) return 0;
        const int amount = std::min(p->chip_stack, blind);
        place_bet(*p, amount);
        log_history(HistoryType::ACTION, p->id, ActionType::BET, amount, {}, label);
        spdlog::debug("Siège {} ({}) {} {}", seat, p->username, label, amount);
        return amount;
    };

    const int sb = post(state_.small_blind_seat, state_.config.small_blind, "posts small blind");
    const int bb = post(state_.big_blind_seat, state_.config.big_blind, "posts big blind");
    // Une blind courte n'abaisse pas la relance minimale
    state_.current_bet = std::max(sb, bb);
    state_.min_raise   = state_.config.big_blind;
}

void TableEngine::deal_hole_cards() {
    const int per_player = hole_card_count(state_.config.variant);

    // Distribution une carte à la fois, en commençant à gauche du bouton
    std::vector<int> order;
    int seat = state_.dealer_seat;
    for (int i = 0; i < state_.config.table_size; ++i) {
        seat = next_seat(seat);
        const Player* p = get_player(seat);
        if (p && is_live(*p)) order.push_back(seat);
    }

    for (int round = 0; round < per_player; ++round) {
        for (int s : order) {
            Player* p = mutable_player(s);
            auto card = deck_.deal();
            if (!card) throw std::logic_error("Paquet épuisé pendant la distribution");
            if (!p->hole_cards) p->hole_cards.emplace();
            p->hole_cards->push_back(*card);
        }
    }

    for (int s : order) {
        const Player* p = get_player(s);
        spdlog::trace("Siège {} reçoit {}", s, vec_to_string(*p->hole_cards));
    }
    log_history(HistoryType::CARD_DEALT, std::nullopt, std::nullopt, std::nullopt, {},
                "Dealt " + std::to_string(per_player) + " hole cards");
    emit(CardsDealt{order, per_player});
}

// -----------------------------------------------------------------------------
//  Enchères
// -----------------------------------------------------------------------------
int TableEngine::bet_increment() const {
    if (state_.config.betting_structure == BettingStructure::FIXED_LIMIT &&
        (state_.street == Street::TURN || state_.street == Street::RIVER)) {
        return 2 * state_.config.big_blind;
    }
    return state_.config.big_blind;
}

// Mise totale maximale autorisée sur la street (hors limite du stack)
int TableEngine::max_total_allowed(const Player& p) const {
    switch (state_.config.betting_structure) {
        case BettingStructure::NO_LIMIT:
            return p.current_bet + p.chip_stack;
        case BettingStructure::POT_LIMIT: {
            const int to_call = std::max(0, state_.current_bet - p.current_bet);
            int street_bets = 0;
            for (const auto& seat : state_.seats) {
                if (const Player* other = player_at(seat)) street_bets += other->current_bet;
            }
            return state_.current_bet + pot_total(state_.pots) + street_bets + to_call;
        }
        case BettingStructure::FIXED_LIMIT:
            return state_.current_bet + bet_increment();
    }
    return p.current_bet + p.chip_stack;
}

void TableEngine::place_bet(Player& p, int amount) {
    if (amount < 0 || amount > p.chip_stack)
        throw std::logic_error("Mise invalide pour " + p.id + ": " + std::to_string(amount));
    p.chip_stack          -= amount;
    p.current_bet         += amount;
    p.total_bet_this_hand += amount;
    if (p.chip_stack == 0 && p.status == PlayerStatus::ACTIVE) {
        p.status = PlayerStatus::ALL_IN;
    }
}

int TableEngine::get_amount_to_call(int seat_number) const {
    const Player* p = get_player(seat_number);
    if (!p) return 0;
    return std::min(p->chip_stack, std::max(0, state_.current_bet - p->current_bet));
}

std::vector<ValidAction> TableEngine::get_valid_actions(int seat_number) const {
    std::vector<ValidAction> actions;
    const Player* p = get_player(seat_number);
    if (!p || !p->is_turn || p->status != PlayerStatus::ACTIVE) return actions;

    const int to_call      = std::max(0, state_.current_bet - p->current_bet);
    const int stack        = p->chip_stack;
    const int all_in_total = p->current_bet + stack;
    const int cap          = max_total_allowed(*p);

    if (to_call > 0) actions.push_back({ActionType::FOLD, std::nullopt, std::nullopt});
    if (to_call == 0) actions.push_back({ActionType::CHECK, std::nullopt, std::nullopt});
    if (to_call > 0 && to_call < stack) actions.push_back({ActionType::CALL, to_call, to_call});

    if (state_.current_bet == 0 && stack > 0) {
        const int min_bet = std::min(bet_increment(), stack);
        const int max_bet = std::min(stack, cap - p->current_bet);
        if (min_bet <= max_bet) actions.push_back({ActionType::BET, min_bet, max_bet});
    }

    // RAISE seulement si une relance complète tient dans le stack
    if (state_.current_bet > 0 && stack > to_call) {
        const int min_total = state_.current_bet + state_.min_raise;
        const int max_total = std::min(all_in_total, cap);
        if (min_total <= max_total) actions.push_back({ActionType::RAISE, min_total, max_total});
    }

    if (stack > 0 && all_in_total <= cap) actions.push_back({ActionType::ALL_IN, stack, stack});
    return actions;
}

EngineResult TableEngine::process_action(int seat_number, ActionType action, std::optional<int> amount) {
    if (!is_valid_seat(seat_number))
        return EngineResult::reject(RejectReason::INVALID_SEAT).with_seat(seat_number).with_action(action);
    Player* p = mutable_player(seat_number);
    if (!p)
        return EngineResult::reject(RejectReason::SEAT_EMPTY).with_seat(seat_number).with_action(action);
    if (!p->is_turn || state_.street == Street::WAITING || state_.street == Street::SHOWDOWN)
        return EngineResult::reject(RejectReason::NOT_YOUR_TURN).with_seat(seat_number).with_action(action);

    const auto valid = get_valid_actions(seat_number);
    const auto it = std::find_if(valid.begin(), valid.end(), [&](const ValidAction& v) { return v.type == action; });
    if (it == valid.end()) {
        spdlog::warn("Siège {}: action {} illégale", seat_number, action_type_to_string(action));
        return EngineResult::reject(RejectReason::ILLEGAL_ACTION).with_seat(seat_number).with_action(action);
    }

    auto out_of_range = [&](int value) {
        return value < *it->min_amount || value > *it->max_amount;
    };

    int added = 0;          // Jetons ajoutés par l'action
    int history_amount = 0; // Taille de mise, total de relance ou montant payé
    switch (action) {
        case ActionType::FOLD:
            p->status = PlayerStatus::FOLDED;
            break;
        case ActionType::CHECK:
            break;
        case ActionType::CALL:
            added = *it->min_amount;
            place_bet(*p, added);
            history_amount = added;
            break;
        case ActionType::BET: {
            const int size = amount.value_or(*it->min_amount);
            if (out_of_range(size))
                return EngineResult::reject(RejectReason::AMOUNT_OUT_OF_RANGE).with_seat(seat_number)
                    .with_action(action).with_amount(size);
            place_bet(*p, size);
            added = size;
            state_.current_bet = p->current_bet;
            state_.min_raise   = std::max(state_.min_raise, size);
            state_.last_aggressor_seat = seat_number;
            history_amount = size;
            break;
        }
        case ActionType::RAISE: {
            const int total = amount.value_or(*it->min_amount);
            if (out_of_range(total))
                return EngineResult::reject(RejectReason::AMOUNT_OUT_OF_RANGE).with_seat(seat_number)
                    .with_action(action).with_amount(total);
            added = total - p->current_bet;
            state_.min_raise   = std::max(state_.min_raise, total - state_.current_bet);
            state_.current_bet = total;
            state_.last_aggressor_seat = seat_number;
            place_bet(*p, added);
            history_amount = total;
            break;
        }
        case ActionType::ALL_IN: {
            added = p->chip_stack;
            const int new_total = p->current_bet + added;
            if (new_total > state_.current_bet) {
                // Un all-in incomplet ne rouvre pas la relance minimale
                const int increment = new_total - state_.current_bet;
                if (increment >= state_.min_raise) state_.min_raise = increment;
                state_.current_bet = new_total;
                state_.last_aggressor_seat = seat_number;
            }
            place_bet(*p, added);
            history_amount = added;
            break;
        }
    }

    if (p->chip_stack == 0 && p->status == PlayerStatus::ACTIVE) p->status = PlayerStatus::ALL_IN;
    p->last_action = action;
    p->is_turn     = false;
    state_.active_player_seat.reset();

    std::optional<int> logged_amount;
    if (action != ActionType::FOLD && action != ActionType::CHECK) logged_amount = history_amount;
    log_history(HistoryType::ACTION, p->id, action, logged_amount, {},
                p->username + " " + action_to_string(action, history_amount));
    spdlog::info("Siège {} ({}): {} | stack {}", seat_number, p->username, action_to_string(action, history_amount),
                 p->chip_stack);
    emit(PlayerActed{seat_number, p->id, action, added, p->chip_stack});

    if (is_betting_round_complete()) {
        advance_street();
    } else {
        set_turn(next_seat_to_act(seat_number));
    }

    EngineResult result = EngineResult::success().with_seat(seat_number).with_action(action);
    if (logged_amount) result.with_amount(*logged_amount);
    return result;
}

void TableEngine::set_turn(int seat_number) {
    for (auto& seat : state_.seats) {
        if (Player* p = player_at(seat)) p->is_turn = false;
    }
    Player* p = mutable_player(seat_number);
    if (!p) {
        state_.active_player_seat.reset();
        throw std::logic_error("Aucun siège à qui donner la parole");
    }
    p->is_turn = true;
    state_.active_player_seat = seat_number;

    PlayerTurn turn;
    turn.seat_number   = seat_number;
    turn.player_id     = p->id;
    turn.to_call       = get_amount_to_call(seat_number);
    turn.time_limit    = state_.config.time_limit;
    turn.valid_actions = get_valid_actions(seat_number);
    spdlog::debug("Parole au siège {} ({}), à payer {}", seat_number, p->username, turn.to_call);
    emit(std::move(turn));
}

bool TableEngine::is_betting_round_complete() const {
    int live = 0;
    int active = 0;
    bool all_settled = true;  // Tous les ACTIVE ont égalisé
    bool all_acted = true;
    for (const auto& seat : state_.seats) {
        const Player* p = player_at(seat);
        if (!p || !is_live(*p)) continue;
        ++live;
        if (p->status != PlayerStatus::ACTIVE) continue;
        ++active;
        if (p->current_bet < state_.current_bet) all_settled = false;
        if (!p->last_action) all_acted = false;
    }
    if (live <= 1) return true;
    // Un seul joueur peut encore miser et ne doit rien: personne à qui parler
    if (active <= 1) return all_settled;
    return all_settled && all_acted;
}

void TableEngine::collect_street_bets() {
    std::vector<StreetContribution> contributions;
    for (auto& seat : state_.seats) {
        Player* p = player_at(seat);
        if (!p || p->current_bet <= 0) continue;
        contributions.push_back({p->id, p->current_bet, p->status == PlayerStatus::ALL_IN});
        p->current_bet = 0;
    }
    state_.current_bet = 0;
    if (contributions.empty()) return;

    collect_bets(state_.pots, contributions);
    spdlog::debug("Mises ramassées: {} pot(s), total {}", state_.pots.size(), pot_total(state_.pots));
    emit(PotUpdated{state_.pots, pot_total(state_.pots)});
}

void TableEngine::advance_street() {
    while (true) {
        collect_street_bets();

        std::vector<Player*> live;
        int can_act = 0;
        for (auto& seat : state_.seats) {
            Player* p = player_at(seat);
            if (!p || !is_live(*p)) continue;
            live.push_back(p);
            if (p->status == PlayerStatus::ACTIVE) ++can_act;
        }
        if (live.empty()) throw std::logic_error("Plus aucun joueur en lice");
        if (live.size() == 1) {
            award_uncontested(*live.front());
            return;
        }
        // Moins de deux joueurs capables de miser: les cartes restantes sont déroulées
        const bool run_out = can_act < 2;

        for (auto& seat : state_.seats) {
            if (Player* p = player_at(seat)) {
                p->last_action.reset();
                p->is_turn = false;
            }
        }
        state_.active_player_seat.reset();
        state_.last_aggressor_seat.reset();

        switch (state_.street) {
            case Street::PREFLOP: deal_board(Street::FLOP); break;
            case Street::FLOP:    deal_board(Street::TURN); break;
            case Street::TURN:    deal_board(Street::RIVER); break;
            case Street::RIVER:   go_to_showdown(); return;
            default:
                throw std::logic_error("advance_street hors d'une main: " + street_to_string(state_.street));
        }
        state_.min_raise = bet_increment();

        log_history(HistoryType::STREET_CHANGE, std::nullopt, std::nullopt, std::nullopt, state_.community_cards,
                    street_to_string(state_.street) + " " + vec_to_string(state_.community_cards));
        spdlog::info("--- {} {} ---", street_to_string(state_.street), vec_to_string(state_.community_cards));
        emit(StreetChanged{state_.street, state_.community_cards});

        if (!run_out) {
            set_turn(next_seat_to_act(state_.dealer_seat));
            return;
        }
    }
}

void TableEngine::deal_board(Street next) {
    deck_.burn();
    const int count = next == Street::FLOP ? 3 : 1;
    const auto cards = deck_.deal_multiple(count);
    if (static_cast<int>(cards.size()) != count) throw std::logic_error("Paquet épuisé pour le board");
    state_.community_cards.insert(state_.community_cards.end(), cards.begin(), cards.end());
    state_.street = next;
}

// -----------------------------------------------------------------------------
//  Divers
// -----------------------------------------------------------------------------
int TableEngine::total_chips() const {
    int total = pot_total(state_.pots);
    for (const auto& seat : state_.seats) {
        if (const Player* p = player_at(seat)) total += p->chip_stack + p->current_bet;
    }
    return total;
}

const std::optional<CompletedHand>& TableEngine::get_last_completed_hand() const {
    return last_completed_hand_;
}

SubscriptionId TableEngine::subscribe(EventHandler handler) {
    const SubscriptionId id = next_subscription_++;
    handlers_.emplace_back(id, std::move(handler));
    return id;
}

void TableEngine::unsubscribe(SubscriptionId id) {
    handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(),
                                   [id](const auto& entry) { return entry.first == id; }),
                    handlers_.end());
}

void TableEngine::set_next_deck_for_testing(std::vector<Card> order) {
    Deck probe;
    probe.set_cards_for_testing(order); // Lève std::invalid_argument si l'ordre est invalide
    next_deck_order_ = std::move(order);
}

void TableEngine::log_history(HistoryType type, std::optional<std::string> player_id, std::optional<ActionType> action,
                              std::optional<int> amount, std::vector<Card> cards, std::string message) {
    HandHistoryEntry entry;
    entry.hand_id   = hand_id_of(state_);
    entry.timestamp = Clock::now();
    entry.type      = type;
    entry.player_id = std::move(player_id);
    entry.action    = action;
    entry.amount    = amount;
    entry.cards     = std::move(cards);
    entry.message   = std::move(message);
    state_.hand_history.push_back(std::move(entry));
}

void TableEngine::emit(TableEventPayload payload) {
    TableEvent event{state_.config.id, state_.hand_number, Clock::now(), std::move(payload)};
    spdlog::trace("Événement {}", event_name(event.payload));
    // Copie: un handler peut se désabonner pendant la livraison
    const auto handlers = handlers_;
    for (const auto& [id, handler] : handlers) {
        handler(event);
    }
}

std::string TableEngine::to_string() const {
    std::stringstream ss;
    ss << "Table " << state_.config.id << " | Main #" << state_.hand_number << " | Street: "
       << street_to_string(state_.street) << " | Pot: " << pot_total(state_.pots)
       << " | Board: " << vec_to_string(state_.community_cards) << " | Mise: " << state_.current_bet
       << " | MinRaise: " << state_.min_raise << "\n";
    for (const auto& seat : state_.seats) {
        const Player* p = player_at(seat);
        if (!p) continue;
        ss << "  S" << p->seat_number << (p->is_dealer ? "(BTN)" : "") << (p->is_turn ? "*" : "") << " "
           << p->username << ": Stack=" << p->chip_stack << ", Bet=" << p->current_bet
           << ", Hand=" << (p->hole_cards ? vec_to_string(*p->hole_cards) : "[]") << " ("
           << player_status_to_string(p->status) << ")\n";
    }
    return ss.str();
}

void TableEngine::print_state() const {
    spdlog::info("\n{}", to_string());
}

} // namespace poker_table
