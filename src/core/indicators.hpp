#pragma once

#include <optional>
#include <vector>
#include "data_source.hpp"

namespace trade_sim {

/**
 * Technical indicators for the latest bar of a history window.
 *
 * Values are plain optional decimals and booleans: a value is absent when
 * the window is too short for that particular indicator.
 */
struct IndicatorSet {
    std::string symbol;
    Timestamp date;
    double close{0.0};
    double volume{0.0};
    std::optional<double> pct_change;

    std::optional<double> ma5;
    std::optional<double> ma10;
    std::optional<double> ma20;
    std::optional<double> ma60;

    std::optional<double> ema12;
    std::optional<double> ema26;
    std::optional<double> macd;
    std::optional<double> macd_signal;
    std::optional<double> macd_hist;

    std::optional<double> rsi14;

    std::optional<double> kdj_k;
    std::optional<double> kdj_d;
    std::optional<double> kdj_j;

    std::optional<double> boll_upper;
    std::optional<double> boll_middle;
    std::optional<double> boll_lower;

    std::optional<double> volume_ma5;
    std::optional<double> volume_ma10;

    std::optional<bool> price_above_ma5;
    std::optional<bool> price_above_ma20;
    std::optional<bool> ma5_above_ma20;
    bool macd_golden_cross{false};
    bool macd_death_cross{false};
};

constexpr size_t kMinIndicatorBars = 20;

/**
 * Compute indicators over `bars` (ascending by date, single symbol).
 * Returns nullopt when fewer than kMinIndicatorBars bars are supplied.
 */
std::optional<IndicatorSet> compute_indicators(const std::vector<MarketBar>& bars);

namespace indicators {

// Simple moving average of the last `period` values, nullopt if too few.
std::optional<double> sma(const std::vector<double>& values, size_t period);

// Exponential moving average series, alpha = 2 / (span + 1), seeded with values[0].
std::vector<double> ema_series(const std::vector<double>& values, size_t span);

// RSI over the last `period` price changes using simple averages of gains and losses.
std::optional<double> rsi(const std::vector<double>& closes, size_t period);

} // namespace indicators
} // namespace trade_sim
