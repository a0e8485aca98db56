#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <vector>
#include "data_source.hpp"

namespace trade_sim {

/**
 * DataSource backed by per-symbol date-ordered maps. Used directly by tests
 * and as the storage behind CsvDataSource.
 */
class InMemoryDataSource : public DataSource {
public:
    // Inserts or replaces the bar for (bar.symbol, bar.date).
    void add_bar(const MarketBar& bar);
    void set_instrument_name(const std::string& symbol, const std::string& name);

    size_t bar_count(const std::string& symbol) const;
    std::vector<std::string> symbols() const;

    std::optional<MarketBar> get_bar(const std::string& symbol, Timestamp date) const override;

    std::vector<MarketBar> get_bars(const std::string& symbol,
                                    Timestamp start,
                                    Timestamp end,
                                    size_t limit) const override;

    std::vector<Timestamp> trading_dates(const std::string& symbol,
                                         Timestamp start,
                                         Timestamp end) const override;

    std::optional<std::string> instrument_name(const std::string& symbol) const override;

private:
    std::unordered_map<std::string, std::map<Timestamp, MarketBar>> bars_;
    std::unordered_map<std::string, std::string> names_;
};

} // namespace trade_sim
