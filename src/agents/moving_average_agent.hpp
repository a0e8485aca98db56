#pragma once

#include <string>
#include <vector>
#include "../core/config.hpp"
#include "../core/decision_maker.hpp"

namespace trade_sim {

/**
 * Rule-based decision-maker driven by the snapshot's indicators.
 *
 * Buys `lots_per_trade` lots of an instrument it does not hold when MA5 is
 * above MA20 with the close above MA5, or on a MACD golden cross, unless
 * RSI is at or above the overbought level. Sells the whole settled holding
 * when MA5 drops below MA20 or RSI turns overbought. Buys are sized against
 * the day's opening cash, costs included.
 */
class MovingAverageAgent : public DecisionMaker {
public:
    explicit MovingAverageAgent(AgentConfig config);

    std::string name() const override { return "moving-average"; }

    std::vector<Order> decide(const MarketSnapshot& snapshot) override;

    size_t days_seen() const { return days_seen_; }
    size_t orders_emitted() const { return orders_emitted_; }

private:
    bool wants_entry(const IndicatorSet& ind) const;
    bool wants_exit(const IndicatorSet& ind, std::string& why) const;

    AgentConfig config_;
    size_t days_seen_{0};
    size_t orders_emitted_{0};
};

} // namespace trade_sim
