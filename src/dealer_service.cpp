#include "poker_table/dealer_service.h"   // Interface
#include "poker_table/game_utils.hpp"     // Pour action_type_to_string
#include "poker_table/pot_ledger.h"       // Pour pot_total
#include "spdlog/spdlog.h"                // Logging
#include <exception>

namespace poker_table {

// -----------------------------------------------------------------------------
//  Relais
// -----------------------------------------------------------------------------
TableState sanitize_for_broadcast(TableState state) {
    if (state.street == Street::SHOWDOWN) return state;
    for (auto& seat : state.seats) {
        if (Player* p = player_at(seat)) p->hole_cards.reset();
    }
    return state;
}

TableSnapshot make_snapshot(const TableState& state) {
    TableSnapshot snapshot;
    snapshot.table_id           = state.config.id;
    snapshot.hand_number        = state.hand_number;
    snapshot.street             = state.street;
    snapshot.current_bet        = state.current_bet;
    snapshot.min_raise          = state.min_raise;
    snapshot.pot_total          = pot_total(state.pots);
    snapshot.community_cards    = state.community_cards;
    snapshot.dealer_seat        = state.dealer_seat;
    snapshot.active_player_seat = state.active_player_seat;
    snapshot.taken_at           = Clock::now();
    return snapshot;
}

// -----------------------------------------------------------------------------
//  Constructeur / Destructeur
// -----------------------------------------------------------------------------
DealerService::DealerService(TableConfig config, DealerOptions options, std::shared_ptr<StateChannel> channel,
                             std::shared_ptr<SnapshotSink> sink, std::optional<uint64_t> deck_seed)
    : engine_ (deck_seed ? TableEngine(std::move(config), *deck_seed) : TableEngine(std::move(config))),
      options_(options),
      channel_(std::move(channel)),
      sink_   (std::move(sink))
{
    // Le moteur n'est appelé que sous mutex_: le handler l'est donc aussi
    engine_.subscribe([this](const TableEvent& event) { on_engine_event(event); });
}

DealerService::~DealerService() {
    stop();
}

// -----------------------------------------------------------------------------
//  Cycle de vie
// -----------------------------------------------------------------------------
void DealerService::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return;
        running_  = true;
        stopping_ = false;
        worker_   = std::thread(&DealerService::timer_loop, this);
        spdlog::info("Dealer {} démarré", engine_.get_config().id);
        if (!paused_ && engine_.can_start_hand()) {
            arm_timer_locked(TimerKind::START_HAND, 0, options_.seat_start_delay);
        }
    }
    flush_outbox();
}

void DealerService::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stopping_ = true;
        pending_.reset();
        ++generation_;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    spdlog::info("Dealer {} arrêté", engine_.get_config().id);
    flush_outbox();
}

bool DealerService::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

// -----------------------------------------------------------------------------
//  Requêtes entrantes
// -----------------------------------------------------------------------------
EngineResult DealerService::handle_seat_request(const SeatRequest& request) {
    EngineResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = request.seat_number == 0 ? engine_.seat_player_anywhere(request.profile)
                                          : engine_.seat_player(request.profile, request.seat_number);
        if (!result) {
            spdlog::warn("Demande de siège de {} refusée: {}", request.profile.id, describe(result));
        } else {
            queue_state_locked();
            arm_start_if_idle_locked();
        }
    }
    flush_outbox();
    return result;
}

EngineResult DealerService::handle_top_up(int seat_number, int amount) {
    EngineResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = engine_.add_chips(seat_number, amount);
        if (!result) {
            spdlog::warn("Recave du siège {} refusée: {}", seat_number, describe(result));
        } else {
            queue_state_locked();
            arm_start_if_idle_locked();
        }
    }
    flush_outbox();
    return result;
}

EngineResult DealerService::handle_presence(int seat_number, PlayerStatus presence) {
    EngineResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = engine_.set_player_presence(seat_number, presence);
        if (!result) {
            spdlog::warn("Présence du siège {} refusée: {}", seat_number, describe(result));
        } else {
            queue_state_locked();
            arm_start_if_idle_locked();
        }
    }
    flush_outbox();
    return result;
}

EngineResult DealerService::handle_remote_action(const RemoteAction& request) {
    EngineResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const Player* p = engine_.get_player(request.seat_number);
        if (paused_) {
            result = EngineResult::reject(RejectReason::TABLE_PAUSED).with_seat(request.seat_number)
                         .with_action(request.action);
        } else if (p && p->id != request.user_id) {
            result = EngineResult::reject(RejectReason::PLAYER_MISMATCH).with_seat(request.seat_number)
                         .with_action(request.action);
        } else {
            result = engine_.process_action(request.seat_number, request.action, request.amount);
        }
        if (!result) spdlog::warn("Action de {} refusée: {}", request.user_id, describe(result));
    }
    flush_outbox();
    return result;
}

std::optional<Player> DealerService::handle_leave_request(int seat_number) {
    std::optional<Player> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = engine_.remove_player(seat_number);
        if (removed) queue_state_locked();
    }
    flush_outbox();
    return removed;
}

EngineResult DealerService::start_hand_if_ready() {
    EngineResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = start_hand_locked();
    }
    flush_outbox();
    return result;
}

EngineResult DealerService::start_hand_locked() {
    if (paused_) return EngineResult::reject(RejectReason::TABLE_PAUSED);
    const EngineResult result = engine_.start_new_hand();
    if (!result) spdlog::debug("Pas de nouvelle main: {}", describe(result));
    return result;
}

void DealerService::pause() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (paused_) return;
        paused_ = true;
        cancel_timer_locked();
        queue_event_locked(TablePaused{});
        spdlog::info("Table {} en pause", engine_.get_config().id);
    }
    flush_outbox();
}

void DealerService::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!paused_) return;
        paused_ = false;
        queue_event_locked(TableResumed{});
        const auto& state = engine_.get_state();
        if (state.active_player_seat) {
            // Le joueur au tour repart avec un délai complet
            arm_timer_locked(TimerKind::TURN, *state.active_player_seat, engine_.get_config().time_limit);
        } else if (engine_.can_start_hand()) {
            arm_timer_locked(TimerKind::START_HAND, 0, options_.seat_start_delay);
        }
        spdlog::info("Table {} reprend", engine_.get_config().id);
    }
    flush_outbox();
}

bool DealerService::is_paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

TableState DealerService::get_public_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.get_public_state();
}

TableState DealerService::get_player_state(const std::string& viewer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.get_player_state(viewer_id);
}

bool DealerService::has_pending_timer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value();
}

std::optional<int> DealerService::pending_turn_seat() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_ || pending_->kind != TimerKind::TURN) return std::nullopt;
    return pending_->seat_number;
}

// -----------------------------------------------------------------------------
//  Événements du moteur (mutex_ tenu)
// -----------------------------------------------------------------------------
void DealerService::on_engine_event(const TableEvent& event) {
    Outbound relay;
    relay.event = event;
    outbox_.push_back(std::move(relay));

    if (const auto* turn = std::get_if<PlayerTurn>(&event.payload)) {
        arm_timer_locked(TimerKind::TURN, turn->seat_number, turn->time_limit);
    } else if (std::holds_alternative<PlayerActed>(event.payload)) {
        // L'action humaine annule le timer; le prochain PLAYER_TURN le réarme
        cancel_timer_locked();
        queue_state_locked();
    } else if (std::holds_alternative<CardsDealt>(event.payload) ||
               std::holds_alternative<StreetChanged>(event.payload)) {
        // Blinds postées et cartes distribuées, puis chaque nouvelle street
        queue_state_locked();
    } else if (std::holds_alternative<HandComplete>(event.payload)) {
        cancel_timer_locked();
        queue_state_locked();
        arm_timer_locked(TimerKind::START_HAND, 0, options_.settle_delay);
    }
}

void DealerService::queue_event_locked(TableEventPayload payload) {
    Outbound relay;
    relay.event = TableEvent{engine_.get_config().id, engine_.get_state().hand_number, Clock::now(), std::move(payload)};
    outbox_.push_back(std::move(relay));
}

void DealerService::queue_state_locked() {
    const auto& state = engine_.get_state();
    Outbound relay;
    relay.state    = sanitize_for_broadcast(state);
    relay.snapshot = make_snapshot(state);
    outbox_.push_back(std::move(relay));
}

// -----------------------------------------------------------------------------
//  Timer unique
// -----------------------------------------------------------------------------
void DealerService::arm_timer_locked(TimerKind kind, int seat_number, std::chrono::milliseconds delay) {
    if (paused_) return;
    PendingTimer timer;
    timer.kind        = kind;
    timer.seat_number = seat_number;
    timer.hand_number = engine_.get_state().hand_number;
    timer.generation  = ++generation_;
    timer.deadline    = std::chrono::steady_clock::now() + delay;
    pending_ = timer; // Remplace tout timer précédent
    spdlog::trace("Timer {} armé (siège {}, gen {})", kind == TimerKind::TURN ? "TURN" : "START_HAND",
                  seat_number, timer.generation);
    cv_.notify_all();
}

// Table au repos avec assez de joueurs: démarrage différé
void DealerService::arm_start_if_idle_locked() {
    if (!running_ || paused_ || pending_ || !engine_.can_start_hand()) return;
    arm_timer_locked(TimerKind::START_HAND, 0, options_.seat_start_delay);
}

void DealerService::cancel_timer_locked() {
    if (!pending_) return;
    pending_.reset();
    ++generation_;
    cv_.notify_all();
}

void DealerService::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (!pending_) {
            cv_.wait(lock, [this] { return stopping_ || pending_.has_value(); });
            continue;
        }
        const uint64_t generation = pending_->generation;
        const auto     deadline   = pending_->deadline;
        // Réveillé plus tôt si le timer est annulé ou remplacé
        const bool superseded = cv_.wait_until(lock, deadline, [&] {
            return stopping_ || !pending_ || pending_->generation != generation;
        });
        if (superseded) continue;

        const PendingTimer timer = *pending_;
        pending_.reset();
        fire_locked(timer);

        lock.unlock();
        flush_outbox();
        lock.lock();
    }
}

void DealerService::fire_locked(const PendingTimer& timer) {
    if (paused_) return;
    if (timer.kind == TimerKind::START_HAND) {
        start_hand_locked();
        return;
    }

    const auto& state = engine_.get_state();
    if (state.hand_number != timer.hand_number || state.active_player_seat != timer.seat_number) {
        spdlog::debug("Timer périmé pour le siège {}", timer.seat_number);
        return;
    }
    const Player* p = engine_.get_player(timer.seat_number);
    if (!p) return;

    const ActionType fallback = engine_.get_amount_to_call(timer.seat_number) == 0 ? ActionType::CHECK
                                                                                  : ActionType::FOLD;
    spdlog::warn("Siège {} ({}): temps écoulé, {} automatique", timer.seat_number, p->username,
                 action_type_to_string(fallback));
    queue_event_locked(PlayerTimedOut{timer.seat_number, p->id, fallback});

    const EngineResult result = engine_.process_action(timer.seat_number, fallback);
    if (!result) spdlog::error("Action automatique refusée: {}", describe(result));
}

// -----------------------------------------------------------------------------
//  Envoi hors verrou
// -----------------------------------------------------------------------------
void DealerService::flush_outbox() {
    std::lock_guard<std::mutex> publish_lock(publish_mutex_);
    std::vector<Outbound> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(outbox_);
    }

    for (const auto& relay : batch) {
        if (channel_) {
            try {
                if (relay.event) channel_->publish_event(*relay.event);
                if (relay.state) channel_->publish_state(*relay.state);
            } catch (const std::exception& e) {
                spdlog::error("Relais de la table {} échoué: {}", engine_.get_config().id, e.what());
            }
        }
        if (sink_ && relay.snapshot) {
            try {
                sink_->persist(*relay.snapshot);
            } catch (const std::exception& e) {
                spdlog::error("Snapshot de la main #{} non persisté: {}", relay.snapshot->hand_number, e.what());
            }
        }
    }
}

} // namespace poker_table
