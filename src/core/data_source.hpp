#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "utils.hpp"

namespace trade_sim {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Daily OHLCV bar for one instrument. Dates are midnight UTC.
 */
struct MarketBar {
    std::string symbol;
    Timestamp date;
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    int64_t volume{0};
    std::optional<double> amount;      // turnover
    std::optional<double> pct_change;  // percent vs previous close
};

/**
 * Immutable historical store keyed by instrument and date.
 * Implementations are unbounded; MarketFeed applies the as-of bound.
 */
class DataSource {
public:
    virtual ~DataSource() = default;

    virtual std::optional<MarketBar> get_bar(const std::string& symbol, Timestamp date) const = 0;

    // Bars with start <= date <= end in ascending date order. With limit > 0
    // only the last `limit` bars of that range are returned.
    virtual std::vector<MarketBar> get_bars(const std::string& symbol,
                                            Timestamp start,
                                            Timestamp end,
                                            size_t limit) const = 0;

    virtual std::vector<Timestamp> trading_dates(const std::string& symbol,
                                                 Timestamp start,
                                                 Timestamp end) const = 0;

    virtual std::optional<std::string> instrument_name(const std::string& symbol) const = 0;
};

} // namespace trade_sim
