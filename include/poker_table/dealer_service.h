#ifndef POKER_TABLE_DEALER_SERVICE_H
#define POKER_TABLE_DEALER_SERVICE_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "poker_table/errors.h"
#include "poker_table/table_engine.h"
#include "poker_table/table_events.h"
#include "poker_table/table_state.h"

namespace poker_table {

struct DealerOptions {
    std::chrono::milliseconds settle_delay     = std::chrono::milliseconds(3000); // Après HAND_COMPLETE
    std::chrono::milliseconds seat_start_delay = std::chrono::milliseconds(1000); // Après une arrivée, table au repos
};

// Action reçue du réseau: le siège doit appartenir à user_id
struct RemoteAction {
    std::string        user_id;
    int                seat_number = 0;
    ActionType         action = ActionType::FOLD;
    std::optional<int> amount;
};

struct SeatRequest {
    PlayerProfile profile;
    int           seat_number = 0; // 0 = premier siège libre
};

// Instantané persisté à chaque relais
struct TableSnapshot {
    std::string        table_id;
    int                hand_number = 0;
    Street             street = Street::WAITING;
    int                current_bet = 0;
    int                min_raise = 0;
    int                pot_total = 0;
    std::vector<Card>  community_cards;
    int                dealer_seat = 0;
    std::optional<int> active_player_seat;
    Clock::time_point  taken_at;
};

// --- Collaborateurs externes (optionnels, remplaçables) ---

class StateChannel {
public:
    virtual ~StateChannel() = default;
    // État déjà épuré des cartes privées
    virtual void publish_state(const TableState& state) = 0;
    virtual void publish_event(const TableEvent& event) = 0;
};

class SnapshotSink {
public:
    virtual ~SnapshotSink() = default;
    virtual void persist(const TableSnapshot& snapshot) = 0;
};

// Vide toutes les cartes privées sauf à l'abattage
TableState sanitize_for_broadcast(TableState state);
TableSnapshot make_snapshot(const TableState& state);

/**
 * Orchestration d'une table: un TableEngine, un verrou unique, un timer unique.
 * Toute mutation du moteur passe par mutex_. Les relais (canal, persistance)
 * sont mis en file sous le verrou puis envoyés après sa libération.
 * Les collaborateurs ne doivent pas rappeler le service de façon synchrone.
 */
class DealerService {
public:
    DealerService(TableConfig config,
                  DealerOptions options = {},
                  std::shared_ptr<StateChannel> channel = nullptr,
                  std::shared_ptr<SnapshotSink> sink = nullptr,
                  std::optional<uint64_t> deck_seed = std::nullopt);
    ~DealerService();

    DealerService(const DealerService&) = delete;
    DealerService& operator=(const DealerService&) = delete;

    void start();
    void stop();
    bool is_running() const;

    EngineResult handle_seat_request(const SeatRequest& request);
    EngineResult handle_remote_action(const RemoteAction& request);
    std::optional<Player> handle_leave_request(int seat_number);
    // Recave et retour à la table entre deux mains; peuvent relancer une table au repos
    EngineResult handle_top_up(int seat_number, int amount);
    EngineResult handle_presence(int seat_number, PlayerStatus presence);
    EngineResult start_hand_if_ready();

    void pause();
    void resume();
    bool is_paused() const;

    TableState get_public_state() const;
    TableState get_player_state(const std::string& viewer_id) const;
    bool has_pending_timer() const;
    std::optional<int> pending_turn_seat() const;

    // Accès direct au moteur sous le verrou du service (tests, outils)
    template <typename Fn>
    auto with_engine(Fn&& fn) -> decltype(fn(std::declval<TableEngine&>())) {
        using Result = decltype(fn(std::declval<TableEngine&>()));
        if constexpr (std::is_void_v<Result>) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                fn(engine_);
                arm_start_if_idle_locked();
            }
            flush_outbox();
        } else {
            std::optional<Result> result;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                result.emplace(fn(engine_));
                arm_start_if_idle_locked();
            }
            flush_outbox();
            return std::move(*result);
        }
    }

private:
    enum class TimerKind { TURN, START_HAND };

    struct PendingTimer {
        TimerKind                             kind = TimerKind::TURN;
        int                                   seat_number = 0;
        int                                   hand_number = 0;
        uint64_t                              generation = 0;
        std::chrono::steady_clock::time_point deadline;
    };

    struct Outbound {
        std::optional<TableEvent>    event;
        std::optional<TableState>    state;
        std::optional<TableSnapshot> snapshot;
    };

    TableEngine                   engine_;
    DealerOptions                 options_;
    std::shared_ptr<StateChannel> channel_;
    std::shared_ptr<SnapshotSink> sink_;

    mutable std::mutex            mutex_;
    std::condition_variable       cv_;
    std::optional<PendingTimer>   pending_;
    uint64_t                      generation_ = 0;
    bool                          running_ = false;
    bool                          stopping_ = false;
    bool                          paused_ = false;
    std::thread                   worker_;
    std::vector<Outbound>         outbox_;
    std::mutex                    publish_mutex_; // Ordre des relais entre threads

    // Appelés avec mutex_ tenu
    void on_engine_event(const TableEvent& event);
    void arm_timer_locked(TimerKind kind, int seat_number, std::chrono::milliseconds delay);
    void cancel_timer_locked();
    void arm_start_if_idle_locked();
    void fire_locked(const PendingTimer& timer);
    EngineResult start_hand_locked();
    void queue_event_locked(TableEventPayload payload);
    void queue_state_locked();

    void timer_loop();
    void flush_outbox();
};

} // namespace poker_table

#endif // POKER_TABLE_DEALER_SERVICE_H
