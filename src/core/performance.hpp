#pragma once

#include <chrono>
#include <vector>
#include "order_executor.hpp"

namespace trade_sim {

using Timestamp = std::chrono::system_clock::time_point;

struct PerformanceSnapshot {
    Timestamp date;
    double cash{0.0};
    double market_value{0.0};
    double equity{0.0};
    double daily_return{0.0};
    double cumulative_return{0.0};
    double drawdown{0.0};       // fraction below the running peak
};

struct PerformanceMetrics {
    double initial_equity{0.0};
    double final_equity{0.0};
    double total_return{0.0};
    double annualized_return{0.0};
    double annualized_volatility{0.0};
    double sharpe{0.0};
    double max_drawdown{0.0};
    double max_return{0.0};
    double min_return{0.0};
    double fees_paid{0.0};
    double realized_pl{0.0};
    size_t trading_days{0};
    size_t trade_count{0};
    size_t buy_count{0};
    size_t sell_count{0};
    size_t rejection_count{0};
};

/**
 * Largest peak-to-subsequent-trough decline of `equity`, as a fraction of
 * the peak. Zero for an empty or never-declining series.
 */
double max_drawdown(const std::vector<double>& equity);

/**
 * Terminal statistics over a run's daily snapshots and transactions.
 * Pure: identical inputs give identical outputs. Daily returns are taken
 * against the previous day's equity, the first against initial_equity.
 */
PerformanceMetrics compute_metrics(const std::vector<PerformanceSnapshot>& snapshots,
                                   const std::vector<Transaction>& transactions,
                                   double initial_equity,
                                   double risk_free_rate,
                                   int periods_per_year);

/**
 * Append-only record of a run: one snapshot per trading day plus the
 * transaction and rejection history.
 */
class RunRecorder {
public:
    explicit RunRecorder(double initial_equity);

    // Records the day's equity. Recording the same date again replaces the
    // last snapshot; an earlier date throws InvalidStateError.
    const PerformanceSnapshot& record_day(Timestamp date, double cash, double market_value);
    void record_transaction(const Transaction& tx);
    void record_rejection(const Rejection& rejection);

    const std::vector<PerformanceSnapshot>& snapshots() const { return snapshots_; }
    const std::vector<Transaction>& transactions() const { return transactions_; }
    const std::vector<Rejection>& rejections() const { return rejections_; }
    std::vector<PerformanceSnapshot> points(size_t limit = 0) const;

    double initial_equity() const { return initial_equity_; }

    PerformanceMetrics metrics(double risk_free_rate = 0.0, int periods_per_year = 252) const;

private:
    double initial_equity_;
    double peak_;
    std::vector<PerformanceSnapshot> snapshots_;
    std::vector<Transaction> transactions_;
    std::vector<Rejection> rejections_;
};

} // namespace trade_sim
