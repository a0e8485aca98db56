#include "moving_average_agent.hpp"
#include <iterator>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "../core/cost_model.hpp"

namespace trade_sim {

MovingAverageAgent::MovingAverageAgent(AgentConfig config)
    : config_(config) {
    if (config_.lots_per_trade <= 0) {
        throw std::invalid_argument("lots_per_trade must be positive");
    }
}

bool MovingAverageAgent::wants_entry(const IndicatorSet& ind) const {
    if (ind.rsi14 && *ind.rsi14 >= config_.rsi_overbought) return false;
    bool trend = ind.ma5_above_ma20.value_or(false) && ind.price_above_ma5.value_or(false);
    return trend || ind.macd_golden_cross;
}

bool MovingAverageAgent::wants_exit(const IndicatorSet& ind, std::string& why) const {
    if (ind.ma5_above_ma20 && !*ind.ma5_above_ma20) {
        why = "ma5-below-ma20";
        return true;
    }
    if (ind.rsi14 && *ind.rsi14 >= config_.rsi_overbought) {
        why = "rsi-overbought";
        return true;
    }
    return false;
}

std::vector<Order> MovingAverageAgent::decide(const MarketSnapshot& snapshot) {
    ++days_seen_;
    std::vector<Order> sells;
    std::vector<Order> buys;
    CostModel costs(snapshot.fees);
    double budget = snapshot.cash;

    for (const auto& kv : snapshot.instruments) {
        const auto& symbol = kv.first;
        const auto& view = kv.second;
        if (!view.indicators) continue;
        const auto& ind = *view.indicators;

        auto pos = snapshot.positions.find(symbol);
        if (pos != snapshot.positions.end()) {
            std::string why;
            if (pos->second.settled_qty > 0 && wants_exit(ind, why)) {
                sells.push_back(Order{symbol, OrderSide::SELL, pos->second.settled_qty, snapshot.date, why});
            }
            continue;
        }

        if (!wants_entry(ind)) continue;
        int64_t qty = config_.lots_per_trade * snapshot.lot_size;
        double notional = static_cast<double>(qty) * view.bar.close;
        double required = notional + costs.calculate(notional, OrderSide::BUY).total;
        if (required > budget) {
            spdlog::debug("{}: skip {} on {}, need {:.2f} have {:.2f}", name(), symbol,
                          utils::ts_to_date(snapshot.date), required, budget);
            continue;
        }
        budget -= required;
        buys.push_back(Order{symbol, OrderSide::BUY, qty, snapshot.date,
                             ind.macd_golden_cross ? "macd-golden-cross" : "ma5-above-ma20"});
    }

    // exits before entries
    std::vector<Order> orders(std::make_move_iterator(sells.begin()), std::make_move_iterator(sells.end()));
    orders.insert(orders.end(), std::make_move_iterator(buys.begin()), std::make_move_iterator(buys.end()));
    orders_emitted_ += orders.size();
    return orders;
}

} // namespace trade_sim
