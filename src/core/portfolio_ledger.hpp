#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include "utils.hpp"

namespace trade_sim {

/**
 * Shares acquired by one buy. A lot is tradable once its settlement date
 * is reached; a lot without a settlement date never settles within the run.
 */
struct Lot {
    int64_t qty{0};
    double price{0.0};
    Timestamp acquired;
    std::optional<Timestamp> settles_on;
    uint64_t sequence{0};

    bool settled_as_of(Timestamp as_of) const {
        return settles_on.has_value() && *settles_on <= as_of;
    }
};

struct Position {
    std::string symbol;
    int64_t qty{0};
    double avg_cost{0.0};
    double cost_basis{0.0};
    double realized_pl{0.0};
    std::deque<Lot> lots;   // oldest first
};

struct AccountState {
    double initial_cash{0.0};
    double cash{0.0};
    double accrued_fees{0.0};
    double realized_pl{0.0};
    uint64_t sequence{0};
};

bool operator==(const Lot& a, const Lot& b);
bool operator==(const Position& a, const Position& b);
bool operator==(const AccountState& a, const AccountState& b);

/**
 * Cash and share positions of one run.
 *
 * Everything public is a read-only query; cash and positions change only
 * through OrderExecutor.
 */
class PortfolioLedger {
public:
    explicit PortfolioLedger(double initial_cash);

    double cash() const { return state_.cash; }
    AccountState state() const { return state_; }
    uint64_t sequence() const { return state_.sequence; }

    std::optional<Position> position(const std::string& symbol) const;
    const std::map<std::string, Position>& positions() const { return positions_; }

    int64_t quantity(const std::string& symbol) const;
    int64_t settled_quantity(const std::string& symbol, Timestamp as_of) const;
    int64_t pending_quantity(const std::string& symbol, Timestamp as_of) const;

    // Market value of all positions; an instrument missing from `prices`
    // is valued at its average cost.
    double market_value(const std::unordered_map<std::string, double>& prices) const;

    // Cash plus market value.
    double mark_to_market(const std::unordered_map<std::string, double>& prices) const;

private:
    friend class OrderExecutor;

    uint64_t next_sequence() { return ++state_.sequence; }

    void apply_buy(const std::string& symbol, int64_t qty, double price, double cost,
                   Timestamp date, std::optional<Timestamp> settles_on, uint64_t sequence);

    // Removes settled lots FIFO; returns the realized P&L net of `cost`.
    double apply_sell(const std::string& symbol, int64_t qty, double price, double cost, Timestamp as_of);

    AccountState state_;
    std::map<std::string, Position> positions_;
};

} // namespace trade_sim
