#include "run_report.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace trade_sim {

using json = nlohmann::json;

void to_json(json& j, const Order& o) {
    j = json{
        {"symbol", o.symbol},
        {"side", side_name(o.side)},
        {"quantity", o.quantity}
    };
    if (o.date) j["date"] = utils::ts_to_date(*o.date);
    if (!o.tag.empty()) j["tag"] = o.tag;
}

void to_json(json& j, const Transaction& tx) {
    j = json{
        {"sequence", tx.sequence},
        {"id", tx.id},
        {"date", utils::ts_to_date(tx.date)},
        {"symbol", tx.symbol},
        {"side", side_name(tx.side)},
        {"quantity", tx.quantity},
        {"price", tx.price},
        {"notional", tx.notional},
        {"commission", tx.commission},
        {"stamp_duty", tx.stamp_duty},
        {"total_cost", tx.total_cost},
        {"cash_delta", tx.cash_delta},
        {"cash_after", tx.cash_after}
    };
    if (tx.side == OrderSide::SELL) j["realized_pl"] = tx.realized_pl;
    if (tx.settles_on) j["settles_on"] = utils::ts_to_date(*tx.settles_on);
    if (!tx.tag.empty()) j["tag"] = tx.tag;
}

void to_json(json& j, const Rejection& r) {
    j = json{
        {"date", utils::ts_to_date(r.date)},
        {"order", r.order},
        {"code", error_code_name(r.code)},
        {"reason", r.reason}
    };
}

void to_json(json& j, const PerformanceSnapshot& s) {
    j = json{
        {"date", utils::ts_to_date(s.date)},
        {"cash", s.cash},
        {"market_value", s.market_value},
        {"equity", s.equity},
        {"daily_return", s.daily_return},
        {"cumulative_return", s.cumulative_return},
        {"drawdown", s.drawdown}
    };
}

void to_json(json& j, const PerformanceMetrics& m) {
    j = json{
        {"initial_equity", m.initial_equity},
        {"final_equity", m.final_equity},
        {"total_return", m.total_return},
        {"annualized_return", m.annualized_return},
        {"annualized_volatility", m.annualized_volatility},
        {"sharpe", m.sharpe},
        {"max_drawdown", m.max_drawdown},
        {"max_return", m.max_return},
        {"min_return", m.min_return},
        {"fees_paid", m.fees_paid},
        {"realized_pl", m.realized_pl},
        {"trading_days", m.trading_days},
        {"trade_count", m.trade_count},
        {"buy_count", m.buy_count},
        {"sell_count", m.sell_count},
        {"rejection_count", m.rejection_count}
    };
}

void to_json(json& j, const Position& p) {
    json lots = json::array();
    for (const auto& lot : p.lots) {
        json l{
            {"qty", lot.qty},
            {"price", lot.price},
            {"acquired", utils::ts_to_date(lot.acquired)}
        };
        if (lot.settles_on) l["settles_on"] = utils::ts_to_date(*lot.settles_on);
        lots.push_back(l);
    }
    j = json{
        {"symbol", p.symbol},
        {"qty", p.qty},
        {"avg_cost", p.avg_cost},
        {"cost_basis", p.cost_basis},
        {"lots", lots}
    };
}

json build_run_report(const Config& config,
                      const std::string& agent_name,
                      const RunRecorder& recorder,
                      const PortfolioLedger& ledger,
                      const PerformanceMetrics& metrics) {
    json j;
    j["agent"] = agent_name;
    j["settings"] = {
        {"initial_cash", config.run.initial_cash},
        {"instruments", config.run.instruments},
        {"commission_rate", config.fees.commission_rate},
        {"stamp_duty_rate", config.fees.stamp_duty_rate},
        {"min_commission", config.fees.min_commission},
        {"lot_size", config.execution.lot_size},
        {"settlement_lag_days", config.execution.settlement_lag_days},
        {"fill_price", fill_price_rule_name(config.execution.fill_price)},
        {"risk_free_rate", config.metrics.risk_free_rate}
    };
    const auto& snaps = recorder.snapshots();
    if (!snaps.empty()) {
        j["period"] = {
            {"start", utils::ts_to_date(snaps.front().date)},
            {"end", utils::ts_to_date(snaps.back().date)}
        };
    }
    j["metrics"] = metrics;
    j["snapshots"] = snaps;
    j["transactions"] = recorder.transactions();
    j["rejections"] = recorder.rejections();

    json positions = json::array();
    for (const auto& kv : ledger.positions()) positions.push_back(kv.second);
    j["final_positions"] = positions;
    j["final_cash"] = ledger.cash();
    return j;
}

void save_run_report(const json& report, const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream f(tmp_path, std::ios::out | std::ios::trunc);
        if (!f.is_open()) {
            throw std::runtime_error("cannot write run report to " + tmp_path);
        }
        f << report.dump(2);
        f.flush();
        if (!f) {
            f.close();
            std::filesystem::remove(tmp_path);
            throw std::runtime_error("failed writing run report to " + tmp_path);
        }
    }
    std::filesystem::rename(tmp_path, path);
    spdlog::info("Saved run report to {}", path);
}

} // namespace trade_sim
