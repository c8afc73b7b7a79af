#include "poker_table/errors.h"
#include "poker_table/game_utils.hpp"
#include <sstream>

namespace poker_table {

const char* reject_reason_to_string(RejectReason r) {
    switch (r) {
        case RejectReason::NONE:                return "NONE";
        case RejectReason::INVALID_SEAT:        return "INVALID_SEAT";
        case RejectReason::SEAT_OCCUPIED:       return "SEAT_OCCUPIED";
        case RejectReason::SEAT_EMPTY:          return "SEAT_EMPTY";
        case RejectReason::BUY_IN_TOO_SMALL:    return "BUY_IN_TOO_SMALL";
        case RejectReason::BUY_IN_TOO_LARGE:    return "BUY_IN_TOO_LARGE";
        case RejectReason::DUPLICATE_PLAYER:    return "DUPLICATE_PLAYER";
        case RejectReason::TABLE_FULL:          return "TABLE_FULL";
        case RejectReason::PLAYER_IN_HAND:      return "PLAYER_IN_HAND";
        case RejectReason::HAND_IN_PROGRESS:    return "HAND_IN_PROGRESS";
        case RejectReason::NOT_ENOUGH_PLAYERS:  return "NOT_ENOUGH_PLAYERS";
        case RejectReason::NOT_YOUR_TURN:       return "NOT_YOUR_TURN";
        case RejectReason::ILLEGAL_ACTION:      return "ILLEGAL_ACTION";
        case RejectReason::AMOUNT_OUT_OF_RANGE: return "AMOUNT_OUT_OF_RANGE";
        case RejectReason::INVALID_AMOUNT:      return "INVALID_AMOUNT";
        case RejectReason::PLAYER_MISMATCH:     return "PLAYER_MISMATCH";
        case RejectReason::TABLE_PAUSED:        return "TABLE_PAUSED";
    }
    return "UNKNOWN";
}

std::string describe(const EngineResult& result) {
    if (result.ok()) return "OK";
    std::stringstream ss;
    ss << reject_reason_to_string(result.reason);
    if (result.seat)   ss << " seat=" << *result.seat;
    if (result.action) ss << " action=" << action_type_to_string(*result.action);
    if (result.amount) ss << " amount=" << *result.amount;
    return ss.str();
}

} // namespace poker_table
