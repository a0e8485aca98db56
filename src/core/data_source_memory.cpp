#include "data_source_memory.hpp"
#include <algorithm>

namespace trade_sim {

void InMemoryDataSource::add_bar(const MarketBar& bar) {
    bars_[bar.symbol][bar.date] = bar;
}

void InMemoryDataSource::set_instrument_name(const std::string& symbol, const std::string& name) {
    names_[symbol] = name;
}

size_t InMemoryDataSource::bar_count(const std::string& symbol) const {
    auto it = bars_.find(symbol);
    return it == bars_.end() ? 0 : it->second.size();
}

std::vector<std::string> InMemoryDataSource::symbols() const {
    std::vector<std::string> out;
    out.reserve(bars_.size());
    for (const auto& kv : bars_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<MarketBar> InMemoryDataSource::get_bar(const std::string& symbol, Timestamp date) const {
    auto it = bars_.find(symbol);
    if (it == bars_.end()) return std::nullopt;
    auto bit = it->second.find(date);
    if (bit == it->second.end()) return std::nullopt;
    return bit->second;
}

std::vector<MarketBar> InMemoryDataSource::get_bars(const std::string& symbol,
                                                    Timestamp start,
                                                    Timestamp end,
                                                    size_t limit) const {
    std::vector<MarketBar> out;
    auto it = bars_.find(symbol);
    if (it == bars_.end() || end < start) return out;
    auto first = it->second.lower_bound(start);
    auto last = it->second.upper_bound(end);
    if (limit == 0) {
        for (auto bit = first; bit != last; ++bit) {
            out.push_back(bit->second);
        }
        return out;
    }
    // walk back from the end so only `limit` bars are touched
    out.reserve(limit);
    for (auto bit = last; bit != first && out.size() < limit;) {
        --bit;
        out.push_back(bit->second);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<Timestamp> InMemoryDataSource::trading_dates(const std::string& symbol,
                                                         Timestamp start,
                                                         Timestamp end) const {
    std::vector<Timestamp> out;
    auto it = bars_.find(symbol);
    if (it == bars_.end() || end < start) return out;
    auto first = it->second.lower_bound(start);
    auto last = it->second.upper_bound(end);
    for (auto bit = first; bit != last; ++bit) {
        out.push_back(bit->first);
    }
    return out;
}

std::optional<std::string> InMemoryDataSource::instrument_name(const std::string& symbol) const {
    auto it = names_.find(symbol);
    if (it == names_.end()) return std::nullopt;
    return it->second;
}

} // namespace trade_sim
