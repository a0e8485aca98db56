#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "config.hpp"
#include "data_source.hpp"
#include "decision_maker.hpp"
#include "market_feed.hpp"
#include "order_executor.hpp"
#include "performance.hpp"
#include "portfolio_ledger.hpp"
#include "run_journal.hpp"
#include "simulation_clock.hpp"

namespace trade_sim {

struct DayResult {
    Timestamp date;
    size_t orders_received{0};
    std::vector<ExecutionResult> executions;
    PerformanceSnapshot snapshot;
};

/**
 * Day-stepped trading simulation over a fixed calendar.
 *
 * Per day: begin_day() advances the clock and returns the bounded
 * snapshot, submit_order() executes orders immediately in submission
 * order, end_day() records the day's equity. step() runs that protocol
 * against a DecisionMaker and run() steps until the calendar is exhausted.
 *
 * One engine owns one run; it is single-threaded and must not be
 * re-entered. Independent runs may share a DataSource.
 */
class SimulationEngine {
public:
    // Throws std::invalid_argument for an invalid config or empty universe.
    SimulationEngine(Config config, std::shared_ptr<const DataSource> source);

    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    MarketSnapshot begin_day();
    ExecutionResult submit_order(Order order);
    const PerformanceSnapshot& end_day();

    // Bars and indicators for `symbols` as of the current date only.
    MarketSnapshot snapshot(const std::vector<std::string>& symbols) const;

    DayResult step(DecisionMaker& decision_maker);
    PerformanceMetrics run(DecisionMaker& decision_maker);

    PerformanceMetrics metrics() const;

    void set_journal(std::shared_ptr<RunJournal> journal) { journal_ = std::move(journal); }

    bool in_day() const { return in_day_; }
    const Config& config() const { return config_; }
    const SimulationClock& clock() const { return clock_; }
    const MarketFeed& feed() const { return feed_; }
    const PortfolioLedger& ledger() const { return ledger_; }
    const RunRecorder& recorder() const { return recorder_; }

private:
    static TradingCalendar build_calendar(const Config& config, const std::shared_ptr<const DataSource>& source);

    ExecutionResult reject(const Order& order, Timestamp date, ErrorCode code, std::string reason);
    void record(const ExecutionResult& result);
    std::unordered_map<std::string, double> current_prices() const;

    Config config_;
    std::shared_ptr<const DataSource> source_;
    SimulationClock clock_;
    MarketFeed feed_;
    PortfolioLedger ledger_;
    OrderExecutor executor_;
    RunRecorder recorder_;
    std::unordered_set<std::string> universe_;
    std::shared_ptr<RunJournal> journal_;
    bool in_day_{false};
};

} // namespace trade_sim
