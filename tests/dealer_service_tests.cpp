// tests/dealer_service_tests.cpp
#include "poker_table/dealer_service.h"
#include "poker_table/game_utils.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace poker_table;
using namespace std::chrono_literals;

namespace {

// Canal qui garde tout ce qu'il reçoit (appelé depuis plusieurs threads)
class RecordingChannel : public StateChannel {
public:
    void publish_state(const TableState& state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        states_.push_back(state);
    }
    void publish_event(const TableEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<TableState> states() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_;
    }
    std::vector<TableEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }
    int count(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count_if(events_.begin(), events_.end(), [&](const TableEvent& e) {
            return name == event_name(e.payload);
        }));
    }

private:
    mutable std::mutex      mutex_;
    std::vector<TableState> states_;
    std::vector<TableEvent> events_;
};

class RecordingSink : public SnapshotSink {
public:
    void persist(const TableSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshots_.push_back(snapshot);
    }
    std::vector<TableSnapshot> snapshots() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_;
    }

private:
    mutable std::mutex         mutex_;
    std::vector<TableSnapshot> snapshots_;
};

// Relais en panne: le service doit continuer
class BrokenChannel : public StateChannel {
public:
    void publish_state(const TableState&) override { throw std::runtime_error("socket fermée"); }
    void publish_event(const TableEvent&) override { throw std::runtime_error("socket fermée"); }
};

class BrokenSink : public SnapshotSink {
public:
    void persist(const TableSnapshot&) override { throw std::runtime_error("disque plein"); }
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

TableConfig make_config(std::chrono::milliseconds time_limit) {
    TableConfig c;
    c.id         = "dealer";
    c.table_size = 4;
    c.min_buy_in = 1;
    c.max_buy_in = 5000;
    c.time_limit = time_limit;
    return c;
}

DealerOptions quiet_options() {
    // Délais longs: aucun démarrage automatique pendant le test
    DealerOptions o;
    o.settle_delay     = 60s;
    o.seat_start_delay = 60s;
    return o;
}

void seat_heads_up(DealerService& dealer) {
    REQUIRE(dealer.handle_seat_request({{"p1", "alice", 1000}, 1}).ok());
    REQUIRE(dealer.handle_seat_request({{"p2", "bob", 1000}, 2}).ok());
}

int hand_number(DealerService& dealer) {
    return dealer.with_engine([](TableEngine& e) { return e.get_state().hand_number; });
}

std::vector<PlayerTimedOut> timeouts(const RecordingChannel& channel) {
    std::vector<PlayerTimedOut> out;
    for (const auto& e : channel.events()) {
        if (const auto* t = std::get_if<PlayerTimedOut>(&e.payload)) out.push_back(*t);
    }
    return out;
}

bool has_hole_cards(const TableState& state) {
    return std::any_of(state.seats.begin(), state.seats.end(), [](const Seat& seat) {
        const Player* p = player_at(seat);
        return p && p->hole_cards.has_value();
    });
}

} // namespace

// -----------------------------------------------------------------------------
//  Relais
// -----------------------------------------------------------------------------
TEST_CASE("Broadcast state hides hole cards until showdown", "[dealer][privacy]") {
    TableState state;
    Player p;
    p.id = "p1";
    p.seat_number = 1;
    p.hole_cards = cards_from_string("As Kd");
    state.seats = {p, EmptySeat{2}};

    state.street = Street::RIVER;
    const auto hidden = sanitize_for_broadcast(state);
    REQUIRE_FALSE(has_hole_cards(hidden));
    REQUIRE(has_hole_cards(state));

    state.street = Street::SHOWDOWN;
    REQUIRE(has_hole_cards(sanitize_for_broadcast(state)));
}

TEST_CASE("Snapshot copies the persisted fields", "[dealer][snapshot]") {
    TableState state;
    state.config.id         = "t9";
    state.hand_number       = 4;
    state.street            = Street::TURN;
    state.current_bet       = 40;
    state.min_raise         = 20;
    state.community_cards   = cards_from_string("2c 3d 4h 5s");
    state.dealer_seat       = 3;
    state.active_player_seat = 1;
    state.pots = {Pot{120, {"a", "b"}, true, true}, Pot{60, {"b"}, false, false}};

    const auto snapshot = make_snapshot(state);
    REQUIRE(snapshot.table_id == "t9");
    REQUIRE(snapshot.hand_number == 4);
    REQUIRE(snapshot.street == Street::TURN);
    REQUIRE(snapshot.current_bet == 40);
    REQUIRE(snapshot.min_raise == 20);
    REQUIRE(snapshot.pot_total == 180);
    REQUIRE(snapshot.community_cards.size() == 4);
    REQUIRE(snapshot.dealer_seat == 3);
    REQUIRE(snapshot.active_player_seat == 1);
}

TEST_CASE("Relayed states never leak private cards", "[dealer][privacy]") {
    auto channel = std::make_shared<RecordingChannel>();
    auto sink    = std::make_shared<RecordingSink>();
    DealerService dealer(make_config(60s), quiet_options(), channel, sink, 7);
    seat_heads_up(dealer);

    REQUIRE(dealer.start_hand_if_ready().ok());
    REQUIRE(dealer.handle_remote_action({"p1", 1, ActionType::CALL, std::nullopt}).ok());
    REQUIRE(dealer.handle_remote_action({"p2", 2, ActionType::CHECK, std::nullopt}).ok());
    for (int street = 0; street < 3; ++street) {
        REQUIRE(dealer.handle_remote_action({"p2", 2, ActionType::CHECK, std::nullopt}).ok());
        REQUIRE(dealer.handle_remote_action({"p1", 1, ActionType::CHECK, std::nullopt}).ok());
    }

    const auto states = channel->states();
    REQUIRE_FALSE(states.empty());
    bool saw_showdown = false;
    for (const auto& s : states) {
        if (s.street == Street::SHOWDOWN) {
            saw_showdown = true;
            REQUIRE(has_hole_cards(s));
        } else {
            REQUIRE_FALSE(has_hole_cards(s));
        }
    }
    REQUIRE(saw_showdown);

    // Les vues du service suivent la même règle
    const auto mine = dealer.get_player_state("p1");
    REQUIRE(mine.street == Street::WAITING);
    REQUIRE_FALSE(has_hole_cards(dealer.get_public_state()));

    // Un instantané par état relayé
    REQUIRE(sink->snapshots().size() == states.size());
    REQUIRE(channel->count("HAND_COMPLETE") == 1);
}

TEST_CASE("Snapshots follow the hand", "[dealer][snapshot]") {
    auto sink = std::make_shared<RecordingSink>();
    DealerService dealer(make_config(60s), quiet_options(), nullptr, sink, 3);
    seat_heads_up(dealer);

    auto snapshots = sink->snapshots();
    REQUIRE(snapshots.size() == 2);
    REQUIRE(snapshots.back().table_id == "dealer");
    REQUIRE(snapshots.back().hand_number == 0);
    REQUIRE(snapshots.back().street == Street::WAITING);

    REQUIRE(dealer.start_hand_if_ready().ok());
    snapshots = sink->snapshots();
    REQUIRE(snapshots.back().hand_number == 1);
    REQUIRE(snapshots.back().street == Street::PREFLOP);
    REQUIRE(snapshots.back().current_bet == 10);
    REQUIRE(snapshots.back().dealer_seat == 1);

    REQUIRE(dealer.handle_remote_action({"p1", 1, ActionType::CALL, std::nullopt}).ok());
    REQUIRE(dealer.handle_remote_action({"p2", 2, ActionType::CHECK, std::nullopt}).ok());

    snapshots = sink->snapshots();
    const auto& flop = snapshots.back();
    REQUIRE(flop.street == Street::FLOP);
    REQUIRE(flop.pot_total == 20);
    REQUIRE(flop.current_bet == 0);
    REQUIRE(flop.community_cards.size() == 3);
    REQUIRE(flop.dealer_seat == 1);
}

TEST_CASE("Failing collaborators do not stop the table", "[dealer][errors]") {
    DealerService dealer(make_config(60s), quiet_options(), std::make_shared<BrokenChannel>(),
                         std::make_shared<BrokenSink>(), 5);
    seat_heads_up(dealer);
    REQUIRE(dealer.start_hand_if_ready().ok());
    REQUIRE(dealer.handle_remote_action({"p1", 1, ActionType::FOLD, std::nullopt}).ok());
    REQUIRE(dealer.with_engine([](TableEngine& e) { return e.get_player(2)->chip_stack; }) == 1005);
}

// -----------------------------------------------------------------------------
//  Requêtes
// -----------------------------------------------------------------------------
TEST_CASE("Remote actions are checked against the seat owner", "[dealer][requests]") {
    auto channel = std::make_shared<RecordingChannel>();
    DealerService dealer(make_config(60s), quiet_options(), channel);
    seat_heads_up(dealer);

    const auto taken = dealer.handle_seat_request({{"p3", "carol", 1000}, 1});
    REQUIRE(taken.reason == RejectReason::SEAT_OCCUPIED);
    const auto anywhere = dealer.handle_seat_request({{"p3", "carol", 1000}, 0});
    REQUIRE(anywhere.ok());
    REQUIRE(anywhere.seat == 3);

    REQUIRE(dealer.start_hand_if_ready().ok());
    REQUIRE(dealer.start_hand_if_ready().reason == RejectReason::HAND_IN_PROGRESS);

    const int to_act = *dealer.get_public_state().active_player_seat;
    const auto mismatch = dealer.handle_remote_action({"intruder", to_act, ActionType::FOLD, std::nullopt});
    REQUIRE(mismatch.reason == RejectReason::PLAYER_MISMATCH);
    REQUIRE(mismatch.seat == to_act);
    REQUIRE(dealer.get_public_state().active_player_seat == to_act);

    // Le propriétaire du siège peut jouer
    const std::string owner = dealer.with_engine([to_act](TableEngine& e) { return e.get_player(to_act)->id; });
    REQUIRE(dealer.handle_remote_action({owner, to_act, ActionType::FOLD, std::nullopt}).ok());

    // Pas de départ en pleine main
    REQUIRE_FALSE(dealer.handle_leave_request(to_act).has_value());
}

TEST_CASE("Leaving between hands frees the seat", "[dealer][requests]") {
    auto channel = std::make_shared<RecordingChannel>();
    DealerService dealer(make_config(60s), quiet_options(), channel);
    seat_heads_up(dealer);

    const auto left = dealer.handle_leave_request(2);
    REQUIRE(left.has_value());
    REQUIRE(left->id == "p2");
    REQUIRE(left->chip_stack == 1000);
    REQUIRE(channel->count("PLAYER_LEFT") == 1);
    REQUIRE(dealer.start_hand_if_ready().reason == RejectReason::NOT_ENOUGH_PLAYERS);
}

// -----------------------------------------------------------------------------
//  Timer
// -----------------------------------------------------------------------------
TEST_CASE("Seating the second player starts a hand", "[dealer][timer]") {
    DealerOptions options = quiet_options();
    options.seat_start_delay = 10ms;
    auto channel = std::make_shared<RecordingChannel>();
    DealerService dealer(make_config(60s), options, channel);
    dealer.start();
    REQUIRE(dealer.is_running());

    REQUIRE(dealer.handle_seat_request({{"p1", "alice", 1000}, 0}).ok());
    REQUIRE_FALSE(dealer.has_pending_timer());
    REQUIRE(dealer.handle_seat_request({{"p2", "bob", 1000}, 0}).ok());

    REQUIRE(eventually([&] { return hand_number(dealer) == 1; }));
    REQUIRE(eventually([&] { return channel->count("HAND_STARTED") == 1; }));
    REQUIRE(dealer.pending_turn_seat() == 1);

    dealer.stop();
    REQUIRE_FALSE(dealer.is_running());
    REQUIRE_FALSE(dealer.has_pending_timer());
}

TEST_CASE("Timeout folds when chips are owed", "[dealer][timer]") {
    auto channel = std::make_shared<RecordingChannel>();
    DealerService dealer(make_config(50ms), quiet_options(), channel);
    seat_heads_up(dealer);
    dealer.start();

    REQUIRE(dealer.start_hand_if_ready().ok());
    REQUIRE(eventually([&] { return channel->count("HAND_COMPLETE") == 1; }));

    const auto timed_out = timeouts(*channel);
    REQUIRE(timed_out.size() == 1);
    REQUIRE(timed_out[0].seat_number == 1);
    REQUIRE(timed_out[0].player_id == "p1");
    REQUIRE(timed_out[0].auto_action == ActionType::FOLD);

    // Relais dans l'ordre: l'expiration précède l'action automatique
    const auto names = [&] {
        std::vector<std::string> out;
        for (const auto& e : channel->events()) out.emplace_back(event_name(e.payload));
        return out;
    }();
    const auto timeout_at = std::find(names.begin(), names.end(), "PLAYER_TIMED_OUT");
    REQUIRE(timeout_at != names.end());
    REQUIRE(std::find(timeout_at, names.end(), "PLAYER_ACTED") != names.end());

    REQUIRE(dealer.with_engine([](TableEngine& e) { return e.get_player(1)->chip_stack; }) == 995);
    REQUIRE(dealer.with_engine([](TableEngine& e) { return e.get_player(2)->chip_stack; }) == 1005);
    dealer.stop();
}

TEST_CASE("Timeout checks when nothing is owed", "[dealer][timer]") {
    auto channel = std::make_shared<RecordingChannel>();
    DealerService dealer(make_config(200ms), quiet_options(), channel);
    seat_heads_up(dealer);
    dealer.start();

    REQUIRE(dealer.start_hand_if_ready().ok());
    REQUIRE(dealer.handle_remote_action({"p1", 1, ActionType::CALL, std::nullopt}).ok());
    REQUIRE(eventually([&] { return channel->count("HAND_COMPLETE") == 1; }, 10000ms));

    // BB préflop puis les deux joueurs sur flop, turn et river
    const auto timed_out = timeouts(*channel);
    REQUIRE(timed_out.size() == 7);
    REQUIRE(timed_out.front().seat_number == 2);
    for (const auto& t : timed_out) REQUIRE(t.auto_action == ActionType::CHECK);

    const auto last = dealer.with_engine([](TableEngine& e) { return e.get_last_completed_hand(); });
    REQUIRE(last.has_value());
    REQUIRE(last->community_cards.size() == 5);
    REQUIRE(last->players[0].ending_stack + last->players[1].ending_stack == 2000);
    dealer.stop();
}

TEST_CASE("A human action replaces the pending timeout", "[dealer][timer]") {
    auto channel = std::make_shared<RecordingChannel>();
    DealerService dealer(make_config(60s), quiet_options(), channel);
    seat_heads_up(dealer);
    dealer.start();

    REQUIRE(dealer.start_hand_if_ready().ok());
    REQUIRE(dealer.pending_turn_seat() == 1);

    REQUIRE(dealer.handle_remote_action({"p1", 1, ActionType::CALL, std::nullopt}).ok());
    REQUIRE(dealer.pending_turn_seat() == 2);

    // Action refusée: le timer du siège courant reste armé
    REQUIRE(dealer.handle_remote_action({"p1", 1, ActionType::CHECK, std::nullopt}).reason ==
            RejectReason::NOT_YOUR_TURN);
    REQUIRE(dealer.pending_turn_seat() == 2);

    REQUIRE(dealer.handle_remote_action({"p2", 2, ActionType::CHECK, std::nullopt}).ok());
    REQUIRE(dealer.pending_turn_seat() == 2); // Flop: le BB parle en premier
    REQUIRE(dealer.get_public_state().street == Street::FLOP);

    REQUIRE(dealer.handle_remote_action({"p2", 2, ActionType::BET, 10}).ok());
    REQUIRE(dealer.handle_remote_action({"p1", 1, ActionType::FOLD, std::nullopt}).ok());

    // Main finie: seul le redémarrage différé reste en attente
    REQUIRE(dealer.has_pending_timer());
    REQUIRE_FALSE(dealer.pending_turn_seat().has_value());
    REQUIRE(timeouts(*channel).empty());
    dealer.stop();
}

TEST_CASE("Next hand starts after the settle delay", "[dealer][timer]") {
    DealerOptions options = quiet_options();
    options.settle_delay = 30ms;
    DealerService dealer(make_config(60s), options);
    seat_heads_up(dealer);
    dealer.start();

    REQUIRE(dealer.start_hand_if_ready().ok());
    REQUIRE(dealer.handle_remote_action({"p1", 1, ActionType::FOLD, std::nullopt}).ok());
    REQUIRE(eventually([&] { return hand_number(dealer) == 2; }));

    // Le bouton a tourné
    REQUIRE(dealer.with_engine([](TableEngine& e) { return e.get_state().dealer_seat; }) == 2);
    dealer.stop();
}

TEST_CASE("Topping up a bust player restarts an idle table", "[dealer][timer]") {
    DealerOptions options = quiet_options();
    options.settle_delay     = 30ms;
    options.seat_start_delay = 10ms;
    DealerService dealer(make_config(60s), options, nullptr, nullptr, 11);
    seat_heads_up(dealer);
    dealer.start();

    const auto stack = [&](int seat) {
        return dealer.with_engine([seat](TableEngine& e) { return e.get_player(seat)->chip_stack; });
    };
    const auto shove = [&] {
        const auto seat = dealer.get_public_state().active_player_seat;
        REQUIRE(seat.has_value());
        const std::string owner = *seat == 1 ? "p1" : "p2";
        REQUIRE(dealer.handle_remote_action({owner, *seat, ActionType::ALL_IN, std::nullopt}).ok());
    };

    // Tapis des deux côtés jusqu'à ce qu'un joueur n'ait plus rien (partage = main suivante)
    int loser = 0;
    int hands = 0;
    while (loser == 0) {
        REQUIRE(++hands < 50);
        REQUIRE(eventually([&] {
            return hand_number(dealer) == hands && dealer.get_public_state().active_player_seat.has_value();
        }));
        shove();
        shove();
        REQUIRE(dealer.get_public_state().street == Street::WAITING);
        if (stack(1) == 0) loser = 1;
        if (stack(2) == 0) loser = 2;
    }

    // Le redémarrage différé échoue faute de joueurs: plus aucun timer
    REQUIRE(eventually([&] { return !dealer.has_pending_timer(); }));
    std::this_thread::sleep_for(50ms);
    REQUIRE(hand_number(dealer) == hands);
    REQUIRE(dealer.get_public_state().street == Street::WAITING);

    REQUIRE(dealer.handle_top_up(loser, 0).reason == RejectReason::INVALID_AMOUNT);
    REQUIRE_FALSE(dealer.has_pending_timer());
    REQUIRE(dealer.handle_top_up(loser, 500).ok());
    REQUIRE(stack(loser) == 500);
    REQUIRE(eventually([&] { return hand_number(dealer) == hands + 1; }));
    dealer.stop();
}

TEST_CASE("A player returning to the table restarts an idle table", "[dealer][timer]") {
    DealerOptions options = quiet_options();
    options.seat_start_delay = 10ms;
    DealerService dealer(make_config(60s), options);
    REQUIRE(dealer.handle_seat_request({{"p1", "alice", 1000}, 1}).ok());
    REQUIRE(dealer.handle_presence(1, PlayerStatus::SITTING_OUT).ok());
    REQUIRE(dealer.handle_seat_request({{"p2", "bob", 1000}, 2}).ok());
    dealer.start();
    REQUIRE_FALSE(dealer.has_pending_timer());

    REQUIRE(dealer.handle_presence(1, PlayerStatus::ACTIVE).reason == RejectReason::ILLEGAL_ACTION);
    REQUIRE(dealer.handle_presence(1, PlayerStatus::WAITING).ok());
    REQUIRE(eventually([&] { return hand_number(dealer) == 1; }));
    dealer.stop();
}

TEST_CASE("Engine changes made through with_engine restart an idle table", "[dealer][timer]") {
    DealerOptions options = quiet_options();
    options.seat_start_delay = 10ms;
    DealerService dealer(make_config(60s), options);
    REQUIRE(dealer.handle_seat_request({{"p1", "alice", 1000}, 1}).ok());
    REQUIRE(dealer.handle_seat_request({{"p2", "bob", 1000}, 2}).ok());
    dealer.with_engine([](TableEngine& e) { REQUIRE(e.set_player_presence(2, PlayerStatus::SITTING_OUT).ok()); });
    dealer.start();
    REQUIRE_FALSE(dealer.has_pending_timer());

    dealer.with_engine([](TableEngine& e) { REQUIRE(e.set_player_presence(2, PlayerStatus::WAITING).ok()); });
    REQUIRE(eventually([&] { return hand_number(dealer) == 1; }));
    dealer.stop();
}

TEST_CASE("Paused tables arm no timers", "[dealer][timer]") {
    auto channel = std::make_shared<RecordingChannel>();
    DealerService dealer(make_config(60s), quiet_options(), channel);
    seat_heads_up(dealer);
    dealer.start();

    REQUIRE(dealer.start_hand_if_ready().ok());
    REQUIRE(dealer.has_pending_timer());

    dealer.pause();
    REQUIRE(dealer.is_paused());
    REQUIRE_FALSE(dealer.has_pending_timer());
    REQUIRE(channel->count("TABLE_PAUSED") == 1);

    const auto refused = dealer.handle_remote_action({"p1", 1, ActionType::CALL, std::nullopt});
    REQUIRE(refused.reason == RejectReason::TABLE_PAUSED);
    REQUIRE(dealer.get_public_state().active_player_seat == 1);

    dealer.resume();
    REQUIRE_FALSE(dealer.is_paused());
    REQUIRE(channel->count("TABLE_RESUMED") == 1);
    REQUIRE(dealer.pending_turn_seat() == 1);
    REQUIRE(dealer.handle_remote_action({"p1", 1, ActionType::CALL, std::nullopt}).ok());
    dealer.stop();
}
