#include "order_executor.hpp"
#include <cmath>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace trade_sim {

OrderExecutor::OrderExecutor(const ExecutionConfig& config, CostModel costs, const TradingCalendar& calendar)
    : config_(config)
    , costs_(std::move(costs))
    , calendar_(calendar) {}

double OrderExecutor::fill_price(const MarketBar& bar) const {
    switch (config_.fill_price) {
        case FillPriceRule::CLOSE: return bar.close;
        case FillPriceRule::OPEN: return bar.open;
        case FillPriceRule::TYPICAL: return utils::round_money((bar.high + bar.low + bar.close) / 3.0);
    }
    return bar.close;
}

double OrderExecutor::buy_cash_required(const MarketBar& bar, int64_t qty) const {
    double notional = utils::round_money(static_cast<double>(qty) * fill_price(bar));
    return utils::round_money(notional + costs_.calculate(notional, OrderSide::BUY).total);
}

ExecutionResult OrderExecutor::reject(const Order& order, Timestamp date, ErrorCode code, std::string reason) const {
    spdlog::warn("Order rejected: {} {} {} on {} ({}: {})", side_name(order.side), order.quantity, order.symbol,
                 utils::ts_to_date(date), error_code_name(code), reason);
    ExecutionResult out;
    out.rejection = Rejection{order, date, code, std::move(reason)};
    return out;
}

ExecutionResult OrderExecutor::execute(const Order& order, PortfolioLedger& ledger, const MarketBar& bar) const {
    Timestamp date = order.date.value_or(bar.date);

    if (bar.symbol != order.symbol || bar.date != date) {
        return reject(order, date, ErrorCode::NOT_FOUND,
                      fmt::format("no bar for {} on {}", order.symbol, utils::ts_to_date(date)));
    }
    double price = fill_price(bar);
    if (!std::isfinite(price) || price <= 0.0) {
        return reject(order, date, ErrorCode::NOT_FOUND,
                      fmt::format("no valid {} price for {}", fill_price_rule_name(config_.fill_price), order.symbol));
    }

    if (order.quantity <= 0 || order.quantity % config_.lot_size != 0) {
        return reject(order, date, ErrorCode::INVALID_QUANTITY,
                      fmt::format("quantity {} is not a positive multiple of {}", order.quantity, config_.lot_size));
    }

    double notional = utils::round_money(static_cast<double>(order.quantity) * price);
    CostBreakdown cost = costs_.calculate(notional, order.side);

    if (order.side == OrderSide::BUY) {
        double required = utils::round_money(notional + cost.total);
        if (ledger.cash() < required) {
            return reject(order, date, ErrorCode::INSUFFICIENT_FUNDS,
                          fmt::format("need {:.2f}, available {:.2f}", required, ledger.cash()));
        }
    } else {
        int64_t settled = ledger.settled_quantity(order.symbol, date);
        if (settled < order.quantity) {
            return reject(order, date, ErrorCode::INSUFFICIENT_SETTLED_SHARES,
                          fmt::format("settled {} of {} held, requested {}", settled,
                                      ledger.quantity(order.symbol), order.quantity));
        }
    }

    Transaction tx;
    tx.sequence = ledger.next_sequence();
    tx.id = fmt::format("T{:06d}", tx.sequence);
    tx.date = date;
    tx.symbol = order.symbol;
    tx.side = order.side;
    tx.quantity = order.quantity;
    tx.price = price;
    tx.notional = notional;
    tx.commission = cost.commission;
    tx.stamp_duty = cost.stamp_duty;
    tx.total_cost = cost.total;
    tx.tag = order.tag;

    if (order.side == OrderSide::BUY) {
        tx.settles_on = calendar_.offset(date, config_.settlement_lag_days);
        if (!tx.settles_on) {
            spdlog::debug("Lot {} of {} bought on {} has no settlement day in the calendar",
                          tx.id, order.symbol, utils::ts_to_date(date));
        }
        ledger.apply_buy(order.symbol, order.quantity, price, cost.total, date, tx.settles_on, tx.sequence);
        tx.cash_delta = -utils::round_money(notional + cost.total);
    } else {
        tx.realized_pl = ledger.apply_sell(order.symbol, order.quantity, price, cost.total, date);
        tx.cash_delta = utils::round_money(notional - cost.total);
    }
    tx.cash_after = ledger.cash();

    spdlog::debug("Filled {} {} {} {} @ {:.2f} cost={:.2f} cash={:.2f}", tx.id, side_name(tx.side), tx.quantity,
                  tx.symbol, tx.price, tx.total_cost, tx.cash_after);

    ExecutionResult out;
    out.transaction = std::move(tx);
    return out;
}

} // namespace trade_sim
