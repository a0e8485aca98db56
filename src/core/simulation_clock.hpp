#pragma once

#include <functional>
#include <vector>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "trading_calendar.hpp"

namespace trade_sim {

enum class ClockState { IDLE, RUNNING, COMPLETED };

inline const char* clock_state_name(ClockState s) {
    switch (s) {
        case ClockState::IDLE: return "Idle";
        case ClockState::RUNNING: return "Running";
        case ClockState::COMPLETED: return "Completed";
    }
    return "Unknown";
}

/**
 * Controls simulated time for a run: Idle -> Running(d0) -> ... -> Completed.
 * Dates only move forward along the calendar; Completed is terminal.
 */
class SimulationClock {
public:
    using DateListener = std::function<void(Timestamp)>;

    explicit SimulationClock(TradingCalendar calendar) : calendar_(std::move(calendar)) {}
    ~SimulationClock() = default;

    SimulationClock(const SimulationClock&) = delete;
    SimulationClock& operator=(const SimulationClock&) = delete;

    ClockState state() const { return state_; }
    bool is_running() const { return state_ == ClockState::RUNNING; }
    bool is_completed() const { return state_ == ClockState::COMPLETED; }

    Timestamp current_date() const {
        if (state_ != ClockState::RUNNING) {
            throw InvalidStateError(std::string("SimulationClock: no current date while ") +
                                    clock_state_name(state_));
        }
        return calendar_.at(index_);
    }

    size_t day_index() const { return index_; }

    bool has_next() const {
        switch (state_) {
            case ClockState::IDLE: return !calendar_.empty();
            case ClockState::RUNNING: return index_ + 1 < calendar_.size();
            case ClockState::COMPLETED: return false;
        }
        return false;
    }

    /**
     * Move to the next trading day and return it. Past the last day the
     * clock completes and EndOfCalendarError is thrown; any call on a
     * completed clock throws InvalidStateError.
     */
    Timestamp advance() {
        if (state_ == ClockState::COMPLETED) {
            throw InvalidStateError("SimulationClock: advance() on a completed clock");
        }
        if (!has_next()) {
            state_ = ClockState::COMPLETED;
            spdlog::info("SimulationClock: calendar exhausted after {} days", calendar_.size());
            throw EndOfCalendarError("SimulationClock: no trading day after the last calendar entry");
        }
        if (state_ == ClockState::IDLE) {
            state_ = ClockState::RUNNING;
            index_ = 0;
        } else {
            ++index_;
        }
        Timestamp ts = calendar_.at(index_);
        notify_listeners(ts);
        return ts;
    }

    void finish() {
        state_ = ClockState::COMPLETED;
    }

    void add_listener(DateListener listener) {
        listeners_.push_back(std::move(listener));
    }

    const TradingCalendar& calendar() const { return calendar_; }

private:
    void notify_listeners(Timestamp ts) {
        for (auto& l : listeners_) l(ts);
    }

    TradingCalendar calendar_;
    ClockState state_{ClockState::IDLE};
    size_t index_{0};
    std::vector<DateListener> listeners_;
};

} // namespace trade_sim
