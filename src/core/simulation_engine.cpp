#include "simulation_engine.hpp"
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include "run_report.hpp"

namespace trade_sim {

TradingCalendar SimulationEngine::build_calendar(const Config& config,
                                                 const std::shared_ptr<const DataSource>& source) {
    if (!source) {
        throw std::invalid_argument("SimulationEngine requires a data source");
    }
    config.validate();
    if (config.run.instruments.empty()) {
        throw std::invalid_argument("instrument universe is empty");
    }
    if (!config.run.calendar.empty()) {
        return TradingCalendar(config.run.calendar);
    }
    Timestamp start = config.run.start_date.value_or(Timestamp::min());
    Timestamp end = config.run.end_date.value_or(Timestamp::max());
    auto calendar = TradingCalendar::from_data_source(*source, config.run.instruments.front(), start, end);
    if (calendar.empty()) {
        spdlog::warn("No trading days for {} in the requested range", config.run.instruments.front());
    }
    return calendar;
}

SimulationEngine::SimulationEngine(Config config, std::shared_ptr<const DataSource> source)
    : config_(std::move(config))
    , source_(std::move(source))
    , clock_(build_calendar(config_, source_))
    , feed_(source_)
    , ledger_(config_.run.initial_cash)
    , executor_(config_.execution, CostModel(config_.fees), clock_.calendar())
    , recorder_(config_.run.initial_cash)
    , universe_(config_.run.instruments.begin(), config_.run.instruments.end()) {
    clock_.add_listener([this](Timestamp ts) { feed_.set_as_of(ts); });
    const auto& cal = clock_.calendar();
    spdlog::info("SimulationEngine created: {} instruments, {} trading days{}, initial_cash={:.2f}",
                 universe_.size(), cal.size(),
                 cal.empty() ? std::string{}
                             : fmt::format(" ({} to {})", utils::ts_to_date(cal.dates().front()),
                                           utils::ts_to_date(cal.dates().back())),
                 config_.run.initial_cash);
}

std::unordered_map<std::string, double> SimulationEngine::current_prices() const {
    std::unordered_map<std::string, double> prices;
    for (const auto& kv : ledger_.positions()) {
        // last close at or before today; never a later price
        auto bar = feed_.latest_bar(kv.first);
        if (bar && std::isfinite(bar->close) && bar->close > 0.0) {
            prices[kv.first] = bar->close;
        }
    }
    return prices;
}

MarketSnapshot SimulationEngine::snapshot(const std::vector<std::string>& symbols) const {
    Timestamp date = clock_.current_date();

    MarketSnapshot snap;
    snap.date = date;
    snap.day_index = clock_.day_index();
    snap.total_days = clock_.calendar().size();
    snap.initial_cash = config_.run.initial_cash;
    snap.cash = ledger_.cash();
    snap.lot_size = config_.execution.lot_size;
    snap.fees = config_.fees;

    auto prices = current_prices();
    for (const auto& kv : ledger_.positions()) {
        const auto& pos = kv.second;
        PositionView view;
        view.symbol = pos.symbol;
        view.qty = pos.qty;
        view.settled_qty = ledger_.settled_quantity(pos.symbol, date);
        view.pending_qty = pos.qty - view.settled_qty;
        view.avg_cost = pos.avg_cost;
        auto pit = prices.find(pos.symbol);
        view.last_price = pit != prices.end() ? pit->second : pos.avg_cost;
        view.market_value = utils::round_money(view.last_price * static_cast<double>(pos.qty));
        view.unrealized_pl = utils::round_money(view.market_value - pos.cost_basis);
        view.unrealized_pl_pct = pos.cost_basis > 0.0 ? view.unrealized_pl / pos.cost_basis * 100.0 : 0.0;
        snap.positions[pos.symbol] = view;
    }
    snap.market_value = utils::round_money(ledger_.market_value(prices));
    snap.equity = utils::round_money(snap.cash + snap.market_value);
    snap.cumulative_return = (snap.equity - snap.initial_cash) / snap.initial_cash;

    for (const auto& symbol : symbols) {
        auto bar = feed_.get_bar(symbol, date);
        if (!bar) {
            spdlog::debug("Snapshot {}: {} omitted (no bar)", utils::ts_to_date(date), symbol);
            snap.unavailable[symbol] = ErrorCode::NOT_FOUND;
            continue;
        }
        InstrumentView view;
        view.name = feed_.instrument_name(symbol).value_or(symbol);
        view.bar = *bar;
        view.indicators = feed_.get_indicators(symbol, date, config_.run.indicator_window);
        if (!view.indicators) {
            snap.unavailable[symbol] = ErrorCode::INSUFFICIENT_HISTORY;
        }
        view.history = feed_.get_history(symbol, config_.run.history_days);
        snap.instruments[symbol] = std::move(view);
    }
    return snap;
}

MarketSnapshot SimulationEngine::begin_day() {
    if (in_day_) {
        throw InvalidStateError("begin_day() called before end_day() for " +
                                utils::ts_to_date(clock_.current_date()));
    }
    if (clock_.is_completed()) {
        throw InvalidStateError("begin_day() on a completed run");
    }
    clock_.advance();
    in_day_ = true;
    return snapshot(config_.run.instruments);
}

ExecutionResult SimulationEngine::reject(const Order& order, Timestamp date, ErrorCode code, std::string reason) {
    spdlog::warn("Order rejected: {} {} {} on {} ({}: {})", side_name(order.side), order.quantity, order.symbol,
                 utils::ts_to_date(date), error_code_name(code), reason);
    ExecutionResult out;
    out.rejection = Rejection{order, date, code, std::move(reason)};
    return out;
}

void SimulationEngine::record(const ExecutionResult& result) {
    if (result.transaction) {
        recorder_.record_transaction(*result.transaction);
        if (journal_) {
            nlohmann::json j = *result.transaction;
            j["event"] = "fill";
            journal_->append(j);
        }
    } else if (result.rejection) {
        recorder_.record_rejection(*result.rejection);
        if (journal_) {
            nlohmann::json j = *result.rejection;
            j["event"] = "rejection";
            journal_->append(j);
        }
    }
}

ExecutionResult SimulationEngine::submit_order(Order order) {
    if (!in_day_) {
        throw InvalidStateError("submit_order() outside of a trading day");
    }
    Timestamp date = clock_.current_date();

    ExecutionResult result;
    if (order.date && *order.date != date) {
        result = reject(order, date, ErrorCode::INVALID_ORDER_DATE,
                        fmt::format("order dated {} submitted on {}", utils::ts_to_date(*order.date),
                                    utils::ts_to_date(date)));
    } else if (universe_.find(order.symbol) == universe_.end()) {
        result = reject(order, date, ErrorCode::UNKNOWN_INSTRUMENT,
                        fmt::format("{} is not in the instrument universe", order.symbol));
    } else {
        order.date = date;
        auto bar = feed_.get_bar(order.symbol, date);
        if (!bar) {
            result = reject(order, date, ErrorCode::NOT_FOUND,
                            fmt::format("no bar for {} on {}", order.symbol, utils::ts_to_date(date)));
        } else {
            result = executor_.execute(order, ledger_, *bar);
        }
    }
    record(result);
    return result;
}

const PerformanceSnapshot& SimulationEngine::end_day() {
    if (!in_day_) {
        throw InvalidStateError("end_day() outside of a trading day");
    }
    Timestamp date = clock_.current_date();
    double market_value = ledger_.market_value(current_prices());
    const auto& snap = recorder_.record_day(date, ledger_.cash(), market_value);
    in_day_ = false;
    if (journal_) {
        nlohmann::json j = snap;
        j["event"] = "day_close";
        journal_->append(j);
    }
    spdlog::info("[{}/{}] {} cash={:.2f} market_value={:.2f} equity={:.2f} return={:.2f}%",
                 clock_.day_index() + 1, clock_.calendar().size(), utils::ts_to_date(date),
                 snap.cash, snap.market_value, snap.equity, snap.cumulative_return * 100.0);
    return snap;
}

DayResult SimulationEngine::step(DecisionMaker& decision_maker) {
    auto snap = begin_day();

    DayResult day;
    day.date = snap.date;

    std::vector<Order> orders;
    try {
        orders = decision_maker.decide(snap);
    } catch (const SimulationError&) {
        throw;
    } catch (const std::exception& e) {
        // A failed decision counts as no orders for the day.
        spdlog::error("Decision-maker {} failed on {}: {}", decision_maker.name(),
                      utils::ts_to_date(snap.date), e.what());
    }

    day.orders_received = orders.size();
    for (auto& order : orders) {
        day.executions.push_back(submit_order(std::move(order)));
    }
    day.snapshot = end_day();
    return day;
}

PerformanceMetrics SimulationEngine::run(DecisionMaker& decision_maker) {
    if (in_day_) {
        throw InvalidStateError("run() called in the middle of a trading day");
    }
    if (clock_.is_completed()) {
        throw InvalidStateError("run() on a completed run");
    }
    spdlog::info("Run starting: decision-maker={} days={}", decision_maker.name(), clock_.calendar().size());
    while (clock_.has_next()) {
        step(decision_maker);
    }
    clock_.finish();

    auto m = metrics();
    if (journal_) {
        nlohmann::json j = m;
        j["event"] = "run_completed";
        journal_->append(j);
    }
    spdlog::info("Run completed: days={} final_equity={:.2f} return={:.2f}% max_drawdown={:.2f}% sharpe={:.3f} "
                 "trades={} rejections={}",
                 m.trading_days, m.final_equity, m.total_return * 100.0, m.max_drawdown * 100.0, m.sharpe,
                 m.trade_count, m.rejection_count);
    return m;
}

PerformanceMetrics SimulationEngine::metrics() const {
    return recorder_.metrics(config_.metrics.risk_free_rate, config_.metrics.periods_per_year);
}

} // namespace trade_sim
