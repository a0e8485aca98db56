#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "utils.hpp"

namespace trade_sim {

using json = nlohmann::json;

enum class FillPriceRule { CLOSE, OPEN, TYPICAL };

inline const char* fill_price_rule_name(FillPriceRule rule) {
    switch (rule) {
        case FillPriceRule::CLOSE: return "close";
        case FillPriceRule::OPEN: return "open";
        case FillPriceRule::TYPICAL: return "typical";
    }
    return "close";
}

inline FillPriceRule parse_fill_price_rule(const std::string& s) {
    if (s == "close") return FillPriceRule::CLOSE;
    if (s == "open") return FillPriceRule::OPEN;
    if (s == "typical") return FillPriceRule::TYPICAL;
    throw std::invalid_argument("unknown fill_price rule: " + s);
}

struct RunSettings {
    double initial_cash{1000000.0};
    std::vector<std::string> instruments;
    // Explicit trading calendar; when empty it is derived from the data
    // source for instruments[0] within [start_date, end_date].
    std::vector<Timestamp> calendar;
    std::optional<Timestamp> start_date;
    std::optional<Timestamp> end_date;
    std::string data_dir{"data"};
    std::string report_path{"results/run_report.json"};
    std::string journal_path{};     // empty = no journal
    size_t history_days{10};        // recent bars handed to the decision-maker
    size_t indicator_window{60};    // bars used for indicator calculation
};

struct FeeConfig {
    double commission_rate{0.0003};
    double stamp_duty_rate{0.001};  // sells only
    double min_commission{5.0};
};

struct ExecutionConfig {
    int64_t lot_size{100};
    int settlement_lag_days{1};     // trading days, T+1 by default
    FillPriceRule fill_price{FillPriceRule::CLOSE};
};

struct MetricsConfig {
    double risk_free_rate{0.0};     // annual
    int periods_per_year{252};
};

struct AgentConfig {
    int64_t lots_per_trade{1};
    double rsi_overbought{70.0};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file{};
};

struct Config {
    RunSettings run;
    FeeConfig fees;
    ExecutionConfig execution;
    MetricsConfig metrics;
    AgentConfig agent;
    LoggingConfig logging;

    /**
     * Reject settings that would break ledger invariants.
     * Throws std::invalid_argument describing the first problem found.
     */
    void validate() const {
        if (!(run.initial_cash > 0.0)) {
            throw std::invalid_argument("initial_cash must be positive");
        }
        if (execution.lot_size <= 0) {
            throw std::invalid_argument("lot_size must be positive");
        }
        if (execution.settlement_lag_days < 0) {
            throw std::invalid_argument("settlement_lag_days must not be negative");
        }
        if (fees.commission_rate < 0.0 || fees.stamp_duty_rate < 0.0 || fees.min_commission < 0.0) {
            throw std::invalid_argument("fee rates must not be negative");
        }
        if (metrics.periods_per_year <= 0) {
            throw std::invalid_argument("periods_per_year must be positive");
        }
        for (size_t i = 1; i < run.calendar.size(); ++i) {
            if (!(run.calendar[i - 1] < run.calendar[i])) {
                throw std::invalid_argument("calendar must be strictly increasing at " +
                                            utils::ts_to_date(run.calendar[i]));
            }
        }
        if (run.start_date && run.end_date && *run.end_date < *run.start_date) {
            throw std::invalid_argument("end_date precedes start_date");
        }
    }
};

inline Timestamp parse_config_date(const std::string& s) {
    auto ts = utils::parse_date(s);
    if (!ts) {
        throw std::invalid_argument("invalid date in config: " + s);
    }
    return *ts;
}

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j = json::parse(f, nullptr, true, true);
    if (j.contains("run")) {
        auto& r = j["run"];
        cfg.run.initial_cash = r.value("initial_cash", cfg.run.initial_cash);
        cfg.run.instruments = r.value("instruments", cfg.run.instruments);
        if (r.contains("calendar")) {
            cfg.run.calendar.clear();
            for (const auto& d : r["calendar"]) {
                cfg.run.calendar.push_back(parse_config_date(d.get<std::string>()));
            }
        }
        if (r.contains("start_date")) {
            cfg.run.start_date = parse_config_date(r["start_date"].get<std::string>());
        }
        if (r.contains("end_date")) {
            cfg.run.end_date = parse_config_date(r["end_date"].get<std::string>());
        }
        cfg.run.data_dir = r.value("data_dir", cfg.run.data_dir);
        cfg.run.report_path = r.value("report_path", cfg.run.report_path);
        cfg.run.journal_path = r.value("journal_path", cfg.run.journal_path);
        cfg.run.history_days = r.value("history_days", cfg.run.history_days);
        cfg.run.indicator_window = r.value("indicator_window", cfg.run.indicator_window);
    }
    if (j.contains("fees")) {
        auto& fe = j["fees"];
        cfg.fees.commission_rate = fe.value("commission_rate", cfg.fees.commission_rate);
        cfg.fees.stamp_duty_rate = fe.value("stamp_duty_rate", cfg.fees.stamp_duty_rate);
        cfg.fees.min_commission = fe.value("min_commission", cfg.fees.min_commission);
    }
    if (j.contains("execution")) {
        auto& e = j["execution"];
        cfg.execution.lot_size = e.value("lot_size", cfg.execution.lot_size);
        cfg.execution.settlement_lag_days = e.value("settlement_lag_days", cfg.execution.settlement_lag_days);
        if (e.contains("fill_price")) {
            cfg.execution.fill_price = parse_fill_price_rule(e["fill_price"].get<std::string>());
        }
    }
    if (j.contains("metrics")) {
        auto& m = j["metrics"];
        cfg.metrics.risk_free_rate = m.value("risk_free_rate", cfg.metrics.risk_free_rate);
        cfg.metrics.periods_per_year = m.value("periods_per_year", cfg.metrics.periods_per_year);
    }
    if (j.contains("agent")) {
        auto& a = j["agent"];
        cfg.agent.lots_per_trade = a.value("lots_per_trade", cfg.agent.lots_per_trade);
        cfg.agent.rsi_overbought = a.value("rsi_overbought", cfg.agent.rsi_overbought);
    }
    if (j.contains("logging")) {
        auto& l = j["logging"];
        cfg.logging.level = l.value("level", cfg.logging.level);
        cfg.logging.file = l.value("file", cfg.logging.file);
    }
}

} // namespace trade_sim
