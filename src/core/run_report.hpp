#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "performance.hpp"
#include "portfolio_ledger.hpp"

namespace trade_sim {

void to_json(nlohmann::json& j, const Order& o);
void to_json(nlohmann::json& j, const Transaction& tx);
void to_json(nlohmann::json& j, const Rejection& r);
void to_json(nlohmann::json& j, const PerformanceSnapshot& s);
void to_json(nlohmann::json& j, const PerformanceMetrics& m);
void to_json(nlohmann::json& j, const Position& p);

/**
 * Full run output: settings summary, metrics, daily snapshots, transaction
 * and rejection history and final positions.
 */
nlohmann::json build_run_report(const Config& config,
                                const std::string& agent_name,
                                const RunRecorder& recorder,
                                const PortfolioLedger& ledger,
                                const PerformanceMetrics& metrics);

// Writes through a temporary file and renames it into place.
// Throws std::runtime_error if the file cannot be written.
void save_run_report(const nlohmann::json& report, const std::string& path);

} // namespace trade_sim
