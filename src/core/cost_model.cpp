#include "cost_model.hpp"
#include <algorithm>

namespace trade_sim {

CostBreakdown CostModel::calculate(double notional, OrderSide side) const {
    CostBreakdown out;
    if (notional <= 0.0) return out;
    out.commission = utils::round_money(std::max(notional * fees_.commission_rate, fees_.min_commission));
    if (side == OrderSide::SELL) {
        out.stamp_duty = utils::round_money(notional * fees_.stamp_duty_rate);
    }
    out.total = utils::round_money(out.commission + out.stamp_duty);
    return out;
}

} // namespace trade_sim
