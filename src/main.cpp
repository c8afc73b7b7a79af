#include "poker_table/dealer_service.h"
#include "poker_table/game_utils.hpp"
#include "eval/hand_strength.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>  // std::max
#include <chrono>     // std::chrono
#include <cstdint>    // uint64_t
#include <exception>  // std::exception
#include <memory>     // std::make_shared
#include <optional>   // std::optional
#include <random>     // std::mt19937_64
#include <stdexcept>  // std::invalid_argument
#include <string>     // std::string
#include <thread>     // std::this_thread
#include <vector>     // std::vector

namespace {

struct DemoOptions {
    int                        players = 4;
    int                        hands   = 5;
    uint64_t                   seed    = 42;
    poker_table::GameVariant   variant = poker_table::GameVariant::NLH;
    bool                       verbose = false;
};

DemoOptions parse_args(int argc, char* argv[]) {
    DemoOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("Valeur manquante pour " + arg);
            return argv[++i];
        };
        if (arg == "--players")      opts.players = std::stoi(value());
        else if (arg == "--hands")   opts.hands   = std::stoi(value());
        else if (arg == "--seed")    opts.seed    = std::stoull(value());
        else if (arg == "--variant") opts.variant = poker_table::variant_from_string(value());
        else if (arg == "--verbose") opts.verbose = true;
        else throw std::invalid_argument("Argument inconnu: " + arg);
    }
    return opts;
}

// Relais vers les logs (tient lieu de websocket)
class LoggingChannel : public poker_table::StateChannel {
public:
    void publish_state(const poker_table::TableState& state) override {
        spdlog::debug("[relais] état main #{} street {}", state.hand_number,
                      poker_table::street_to_string(state.street));
    }
    void publish_event(const poker_table::TableEvent& event) override {
        spdlog::debug("[relais] {}", poker_table::event_name(event.payload));
    }
};

class LoggingSink : public poker_table::SnapshotSink {
public:
    void persist(const poker_table::TableSnapshot& snapshot) override {
        spdlog::trace("[snapshot] main #{} pot {}", snapshot.hand_number, snapshot.pot_total);
    }
};

// Bot: passe ou suit le plus souvent, mise le minimum avec une bonne main
std::optional<poker_table::RemoteAction> choose_action(const poker_table::TableEngine& engine, std::mt19937_64& rng) {
    const auto& state = engine.get_state();
    if (!state.active_player_seat) return std::nullopt;
    const int seat = *state.active_player_seat;
    const auto actions = engine.get_valid_actions(seat);
    if (actions.empty()) return std::nullopt;

    // Force estimée en Hold'em; neutre en Omaha
    const poker_table::Player* me = engine.get_player(seat);
    int strength = 30;
    if (me->hole_cards && !poker_table::is_omaha(state.config.variant)) {
        strength = poker_table::analyze_hand_strength(*me->hole_cards, state.community_cards).strength;
    }

    std::uniform_int_distribution<int> roll(0, 99);
    const int r = roll(rng) - (strength - 30) / 2;
    auto find = [&](poker_table::ActionType t) -> const poker_table::ValidAction* {
        for (const auto& a : actions) {
            if (a.type == t) return &a;
        }
        return nullptr;
    };

    const poker_table::ValidAction* pick = nullptr;
    if (r < 15) pick = find(poker_table::ActionType::RAISE);
    if (!pick && r < 25) pick = find(poker_table::ActionType::BET);
    if (!pick && r > 70 && find(poker_table::ActionType::CALL)) pick = find(poker_table::ActionType::FOLD);
    if (!pick) pick = find(poker_table::ActionType::CHECK);
    if (!pick) pick = find(poker_table::ActionType::CALL);
    if (!pick) pick = &actions.front();

    poker_table::RemoteAction action;
    action.user_id     = engine.get_player(seat)->id;
    action.seat_number = seat;
    action.action      = pick->type;
    action.amount      = pick->min_amount;
    return action;
}

} // namespace

int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::info);

    try
    {
        const DemoOptions opts = parse_args(argc, argv);
        if (opts.verbose) spdlog::set_level(spdlog::level::debug);
        spdlog::info("Démo: {} joueurs, {} mains, variante {}, seed {}", opts.players, opts.hands,
                     poker_table::game_variant_to_string(opts.variant), opts.seed);

        // ─────────────────────────────────────────────────────────
        // Table
        // ─────────────────────────────────────────────────────────
        poker_table::TableConfig config;
        config.id         = "demo";
        config.name       = "Demo Table";
        config.table_size = std::max(opts.players, poker_table::MIN_TABLE_SIZE);
        config.variant    = opts.variant;
        config.betting_structure = poker_table::is_omaha(opts.variant) ? poker_table::BettingStructure::POT_LIMIT
                                                                         : poker_table::BettingStructure::NO_LIMIT;
        poker_table::validate_config(config);

        poker_table::DealerOptions dealer_options;
        dealer_options.settle_delay     = std::chrono::milliseconds(20);
        dealer_options.seat_start_delay = std::chrono::milliseconds(0);

        poker_table::DealerService dealer(config, dealer_options, std::make_shared<LoggingChannel>(),
                                          std::make_shared<LoggingSink>(), opts.seed);

        for (int i = 1; i <= opts.players; ++i) {
            poker_table::SeatRequest request;
            request.profile = {"p" + std::to_string(i), "Bot" + std::to_string(i), 1000};
            request.seat_number = i;
            const auto result = dealer.handle_seat_request(request);
            if (!result) spdlog::error("Siège {} refusé: {}", i, poker_table::describe(result));
        }

        // ─────────────────────────────────────────────────────────
        // Boucle des bots
        // ─────────────────────────────────────────────────────────
        std::mt19937_64 rng(opts.seed);
        dealer.start();
        const auto give_up_at = std::chrono::steady_clock::now() + std::chrono::seconds(60);
        while (std::chrono::steady_clock::now() < give_up_at) {
            bool finished = false;
            const auto decision = dealer.with_engine([&](poker_table::TableEngine& engine) {
                const auto& state = engine.get_state();
                if (state.street == poker_table::Street::WAITING &&
                    (state.hand_number >= opts.hands || !engine.can_start_hand())) {
                    finished = true;
                }
                return choose_action(engine, rng);
            });
            if (finished) break;
            if (decision) {
                dealer.handle_remote_action(*decision);
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
        }
        dealer.stop();

        // ─────────────────────────────────────────────────────────
        // Bilan
        // ─────────────────────────────────────────────────────────
        dealer.with_engine([](poker_table::TableEngine& engine) {
            engine.print_state();
            if (const auto& last = engine.get_last_completed_hand()) {
                for (const auto& p : last->players) {
                    spdlog::info("{} (siège {}): {} -> {} ({:+})", p.username, p.seat, p.starting_stack,
                                 p.ending_stack, p.profit);
                }
            }
        });
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur fatale: {}", e.what());
        return 1;
    }

    spdlog::info("Démo terminée.");
    return 0;
}
