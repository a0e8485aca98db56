#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "errors.hpp"
#include "indicators.hpp"
#include "order_executor.hpp"

namespace trade_sim {

struct PositionView {
    std::string symbol;
    int64_t qty{0};
    int64_t settled_qty{0};
    int64_t pending_qty{0};
    double avg_cost{0.0};
    double last_price{0.0};
    double market_value{0.0};
    double unrealized_pl{0.0};
    double unrealized_pl_pct{0.0};
};

struct InstrumentView {
    std::string name;
    MarketBar bar;
    std::optional<IndicatorSet> indicators;
    std::vector<MarketBar> history;   // ascending, ends with `bar`
};

/**
 * Everything a decision-maker may see on one trading day. Built by the
 * engine from the bounded feed; holds no data dated after `date`.
 */
struct MarketSnapshot {
    Timestamp date;
    size_t day_index{0};
    size_t total_days{0};

    double initial_cash{0.0};
    double cash{0.0};
    double market_value{0.0};
    double equity{0.0};
    double cumulative_return{0.0};

    int64_t lot_size{100};
    FeeConfig fees;

    std::map<std::string, PositionView> positions;
    std::map<std::string, InstrumentView> instruments;
    // NOT_FOUND: instrument omitted today. INSUFFICIENT_HISTORY: bar present,
    // indicators omitted.
    std::map<std::string, ErrorCode> unavailable;
};

/**
 * Anything that turns a snapshot into orders for the snapshot's date.
 * Returning no orders is a valid "hold" decision.
 */
class DecisionMaker {
public:
    virtual ~DecisionMaker() = default;

    virtual std::string name() const = 0;

    virtual std::vector<Order> decide(const MarketSnapshot& snapshot) = 0;
};

} // namespace trade_sim
