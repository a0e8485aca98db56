#pragma once

#include <stdexcept>
#include <string>

namespace trade_sim {

enum class ErrorCode {
    INVALID_QUANTITY,
    INSUFFICIENT_FUNDS,
    INSUFFICIENT_SETTLED_SHARES,
    UNKNOWN_INSTRUMENT,
    INVALID_ORDER_DATE,
    NOT_FOUND,
    INSUFFICIENT_HISTORY,
    END_OF_CALENDAR,
    INVALID_STATE
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_QUANTITY: return "InvalidQuantity";
        case ErrorCode::INSUFFICIENT_FUNDS: return "InsufficientFunds";
        case ErrorCode::INSUFFICIENT_SETTLED_SHARES: return "InsufficientSettledShares";
        case ErrorCode::UNKNOWN_INSTRUMENT: return "UnknownInstrument";
        case ErrorCode::INVALID_ORDER_DATE: return "InvalidOrderDate";
        case ErrorCode::NOT_FOUND: return "NotFound";
        case ErrorCode::INSUFFICIENT_HISTORY: return "InsufficientHistory";
        case ErrorCode::END_OF_CALENDAR: return "EndOfCalendar";
        case ErrorCode::INVALID_STATE: return "InvalidState";
    }
    return "Unknown";
}

/**
 * Base class for conditions that terminate a run. Order-level failures are
 * reported as Rejection values instead and never thrown.
 */
class SimulationError : public std::runtime_error {
public:
    SimulationError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class EndOfCalendarError : public SimulationError {
public:
    explicit EndOfCalendarError(const std::string& what)
        : SimulationError(ErrorCode::END_OF_CALENDAR, what) {}
};

class InvalidStateError : public SimulationError {
public:
    explicit InvalidStateError(const std::string& what)
        : SimulationError(ErrorCode::INVALID_STATE, what) {}
};

} // namespace trade_sim
