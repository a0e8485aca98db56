#pragma once

#include "config.hpp"

namespace trade_sim {

enum class OrderSide { BUY, SELL };

inline const char* side_name(OrderSide side) {
    return side == OrderSide::BUY ? "buy" : "sell";
}

struct CostBreakdown {
    double commission{0.0};
    double stamp_duty{0.0};
    double total{0.0};
};

/**
 * Transaction cost for a trade notional: commission as a percentage of
 * notional floored at a minimum fee, plus stamp duty on sells only.
 * Each component is rounded to the currency unit.
 */
class CostModel {
public:
    CostModel() = default;
    explicit CostModel(const FeeConfig& fees) : fees_(fees) {}

    CostBreakdown calculate(double notional, OrderSide side) const;

    const FeeConfig& fees() const { return fees_; }

private:
    FeeConfig fees_;
};

} // namespace trade_sim
