#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "data_source.hpp"
#include "indicators.hpp"

namespace trade_sim {

/**
 * Read-only view of a DataSource bounded by the simulation's as-of date.
 *
 * No query ever returns a bar dated after as_of(); requests for later
 * dates are refused and counted. Before the first set_as_of() every query
 * is empty.
 */
class MarketFeed {
public:
    explicit MarketFeed(std::shared_ptr<const DataSource> source);

    // Moves the bound forward; throws InvalidStateError if `ts` would move it back.
    void set_as_of(Timestamp ts);
    std::optional<Timestamp> as_of() const { return as_of_; }

    std::optional<MarketBar> get_bar(const std::string& symbol, Timestamp date) const;

    // Most recent bar at or before the bound (last close for a suspended day).
    std::optional<MarketBar> latest_bar(const std::string& symbol) const;

    // Up to `days` most recent bars at or before the bound, ascending.
    std::vector<MarketBar> get_history(const std::string& symbol, size_t days) const;

    // Indicators over the `window` bars ending at `date`; nullopt means the
    // date is beyond the bound or the history is too short.
    std::optional<IndicatorSet> get_indicators(const std::string& symbol,
                                               Timestamp date,
                                               size_t window) const;

    std::optional<std::string> instrument_name(const std::string& symbol) const;

    uint64_t blocked_requests() const { return blocked_requests_; }

private:
    bool beyond_bound(const std::string& symbol, Timestamp date) const;

    std::shared_ptr<const DataSource> source_;
    std::optional<Timestamp> as_of_;
    mutable uint64_t blocked_requests_{0};
};

} // namespace trade_sim
