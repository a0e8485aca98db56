#include "performance.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include "errors.hpp"

namespace trade_sim {

double max_drawdown(const std::vector<double>& equity) {
    if (equity.empty()) return 0.0;
    double peak = equity.front();
    double max_dd = 0.0;
    for (double e : equity) {
        if (e > peak) peak = e;
        double dd = peak > 0.0 ? (peak - e) / peak : 0.0;
        if (dd > max_dd) max_dd = dd;
    }
    return max_dd;
}

PerformanceMetrics compute_metrics(const std::vector<PerformanceSnapshot>& snapshots,
                                   const std::vector<Transaction>& transactions,
                                   double initial_equity,
                                   double risk_free_rate,
                                   int periods_per_year) {
    PerformanceMetrics out;
    out.initial_equity = initial_equity;
    out.final_equity = initial_equity;
    out.trading_days = snapshots.size();

    for (const auto& tx : transactions) {
        ++out.trade_count;
        if (tx.side == OrderSide::BUY) ++out.buy_count;
        else ++out.sell_count;
        out.fees_paid += tx.total_cost;
        out.realized_pl += tx.realized_pl;
    }
    out.fees_paid = utils::round_money(out.fees_paid);
    out.realized_pl = utils::round_money(out.realized_pl);

    if (snapshots.empty()) return out;

    std::vector<double> curve;
    curve.reserve(snapshots.size() + 1);
    curve.push_back(initial_equity);
    for (const auto& s : snapshots) curve.push_back(s.equity);

    out.final_equity = curve.back();
    if (initial_equity != 0.0) {
        out.total_return = (out.final_equity - initial_equity) / initial_equity;
    }
    out.max_drawdown = max_drawdown(curve);

    out.max_return = snapshots.front().cumulative_return;
    out.min_return = snapshots.front().cumulative_return;
    for (const auto& s : snapshots) {
        out.max_return = std::max(out.max_return, s.cumulative_return);
        out.min_return = std::min(out.min_return, s.cumulative_return);
    }

    double periods = static_cast<double>(periods_per_year);
    double growth = 1.0 + out.total_return;
    if (growth > 0.0) {
        out.annualized_return = std::pow(growth, periods / static_cast<double>(snapshots.size())) - 1.0;
    }

    std::vector<double> rets;
    rets.reserve(curve.size() - 1);
    for (size_t i = 1; i < curve.size(); ++i) {
        double prev = curve[i - 1];
        if (prev != 0.0) rets.push_back((curve[i] - prev) / prev);
    }
    if (rets.size() >= 2) {
        double mean = 0.0;
        for (double r : rets) mean += r;
        mean /= static_cast<double>(rets.size());
        double var = 0.0;
        for (double r : rets) {
            double d = r - mean;
            var += d * d;
        }
        var /= static_cast<double>(rets.size() - 1);
        double stddev = std::sqrt(var);
        out.annualized_volatility = stddev * std::sqrt(periods);
        if (stddev > 0.0) {
            out.sharpe = (mean - risk_free_rate / periods) / stddev * std::sqrt(periods);
        }
    }
    return out;
}

RunRecorder::RunRecorder(double initial_equity)
    : initial_equity_(initial_equity)
    , peak_(initial_equity) {}

const PerformanceSnapshot& RunRecorder::record_day(Timestamp date, double cash, double market_value) {
    if (!snapshots_.empty() && date < snapshots_.back().date) {
        throw InvalidStateError("RunRecorder: snapshot for " + utils::ts_to_date(date) +
                                " precedes " + utils::ts_to_date(snapshots_.back().date));
    }
    bool replace = !snapshots_.empty() && snapshots_.back().date == date;
    if (replace) {
        snapshots_.pop_back();
        // recompute the peak without the replaced day
        peak_ = initial_equity_;
        for (const auto& s : snapshots_) peak_ = std::max(peak_, s.equity);
    }

    PerformanceSnapshot snap;
    snap.date = date;
    snap.cash = cash;
    snap.market_value = utils::round_money(market_value);
    snap.equity = utils::round_money(cash + market_value);
    double prev = snapshots_.empty() ? initial_equity_ : snapshots_.back().equity;
    snap.daily_return = prev != 0.0 ? (snap.equity - prev) / prev : 0.0;
    snap.cumulative_return = initial_equity_ != 0.0 ? (snap.equity - initial_equity_) / initial_equity_ : 0.0;
    peak_ = std::max(peak_, snap.equity);
    snap.drawdown = peak_ > 0.0 ? (peak_ - snap.equity) / peak_ : 0.0;
    snapshots_.push_back(snap);
    return snapshots_.back();
}

void RunRecorder::record_transaction(const Transaction& tx) {
    transactions_.push_back(tx);
}

void RunRecorder::record_rejection(const Rejection& rejection) {
    rejections_.push_back(rejection);
}

std::vector<PerformanceSnapshot> RunRecorder::points(size_t limit) const {
    if (limit == 0 || snapshots_.size() <= limit) return snapshots_;
    return std::vector<PerformanceSnapshot>(snapshots_.end() - static_cast<std::ptrdiff_t>(limit), snapshots_.end());
}

PerformanceMetrics RunRecorder::metrics(double risk_free_rate, int periods_per_year) const {
    auto out = compute_metrics(snapshots_, transactions_, initial_equity_, risk_free_rate, periods_per_year);
    out.rejection_count = rejections_.size();
    return out;
}

} // namespace trade_sim
