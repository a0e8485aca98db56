#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "config.hpp"
#include "cost_model.hpp"
#include "data_source.hpp"
#include "errors.hpp"
#include "portfolio_ledger.hpp"
#include "trading_calendar.hpp"

namespace trade_sim {

struct Order {
    std::string symbol;
    OrderSide side{OrderSide::BUY};
    int64_t quantity{0};
    std::optional<Timestamp> date;   // stamped with the current day by the engine
    std::string tag;                 // free-form label from the decision-maker
};

struct Transaction {
    uint64_t sequence{0};
    std::string id;
    Timestamp date;
    std::string symbol;
    OrderSide side{OrderSide::BUY};
    int64_t quantity{0};
    double price{0.0};
    double notional{0.0};
    double commission{0.0};
    double stamp_duty{0.0};
    double total_cost{0.0};
    double cash_delta{0.0};
    double cash_after{0.0};
    double realized_pl{0.0};          // sells only
    std::optional<Timestamp> settles_on;  // buys only
    std::string tag;
};

struct Rejection {
    Order order;
    Timestamp date;
    ErrorCode code{ErrorCode::INVALID_QUANTITY};
    std::string reason;
};

struct ExecutionResult {
    std::optional<Transaction> transaction;
    std::optional<Rejection> rejection;

    bool accepted() const { return transaction.has_value(); }
};

/**
 * Validates an order against the ledger and the day's bar, prices it with
 * the configured fill rule, applies costs and settles it into the ledger.
 *
 * Validation order (first failure wins):
 *   bar matches the order       -> NOT_FOUND
 *   quantity is a positive multiple of the lot size -> INVALID_QUANTITY
 *   buy: cash covers notional + cost                -> INSUFFICIENT_FUNDS
 *   sell: settled shares cover the quantity          -> INSUFFICIENT_SETTLED_SHARES
 * A rejected order leaves the ledger untouched.
 */
class OrderExecutor {
public:
    OrderExecutor(const ExecutionConfig& config, CostModel costs, const TradingCalendar& calendar);

    ExecutionResult execute(const Order& order, PortfolioLedger& ledger, const MarketBar& bar) const;

    double fill_price(const MarketBar& bar) const;

    // Cash needed to buy `qty` shares at the bar's fill price, costs included.
    double buy_cash_required(const MarketBar& bar, int64_t qty) const;

    const CostModel& cost_model() const { return costs_; }
    const ExecutionConfig& config() const { return config_; }

private:
    ExecutionResult reject(const Order& order, Timestamp date, ErrorCode code, std::string reason) const;

    ExecutionConfig config_;
    CostModel costs_;
    const TradingCalendar& calendar_;
};

} // namespace trade_sim
