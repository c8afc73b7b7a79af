#ifndef POKER_TABLE_ERRORS_H
#define POKER_TABLE_ERRORS_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "poker_table/common_types.h"

namespace poker_table {

// ─────────────────────────────────────────────────────────────────────────────
//  Erreurs de programmation: exceptions
// ─────────────────────────────────────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    INVALID_INPUT
};

// Évaluation demandée avec trop peu de cartes (ou cartes invalides)
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}

    ErrorCode code() const noexcept { return ErrorCode::INVALID_INPUT; }
};

// ─────────────────────────────────────────────────────────────────────────────
//  Refus à l'exécution: résultat structuré, jamais d'exception
// ─────────────────────────────────────────────────────────────────────────────

enum class RejectReason : uint8_t {
    NONE,
    INVALID_SEAT,
    SEAT_OCCUPIED,
    SEAT_EMPTY,
    BUY_IN_TOO_SMALL,
    BUY_IN_TOO_LARGE,
    DUPLICATE_PLAYER,
    TABLE_FULL,
    PLAYER_IN_HAND,
    HAND_IN_PROGRESS,
    NOT_ENOUGH_PLAYERS,
    NOT_YOUR_TURN,
    ILLEGAL_ACTION,
    AMOUNT_OUT_OF_RANGE,
    INVALID_AMOUNT,
    PLAYER_MISMATCH,
    TABLE_PAUSED
};

struct EngineResult {
    RejectReason              reason = RejectReason::NONE;
    std::optional<int>        seat;
    std::optional<ActionType> action;
    std::optional<int>        amount;

    static EngineResult success() { return {}; }
    static EngineResult reject(RejectReason r) {
        EngineResult res;
        res.reason = r;
        return res;
    }

    bool ok() const { return reason == RejectReason::NONE; }
    explicit operator bool() const { return ok(); }

    // Contexte optionnel (style fluent)
    EngineResult& with_seat(int s) {
        seat = s;
        return *this;
    }

    EngineResult& with_action(ActionType a) {
        action = a;
        return *this;
    }

    EngineResult& with_amount(int v) {
        amount = v;
        return *this;
    }
};

const char* reject_reason_to_string(RejectReason r);

// Message lisible pour l'UI / les logs
std::string describe(const EngineResult& result);

} // namespace poker_table

#endif // POKER_TABLE_ERRORS_H
