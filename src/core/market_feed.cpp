#include "market_feed.hpp"
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace trade_sim {

MarketFeed::MarketFeed(std::shared_ptr<const DataSource> source)
    : source_(std::move(source)) {}

void MarketFeed::set_as_of(Timestamp ts) {
    if (as_of_ && ts < *as_of_) {
        throw InvalidStateError("MarketFeed bound cannot move back from " +
                                utils::ts_to_date(*as_of_) + " to " + utils::ts_to_date(ts));
    }
    as_of_ = ts;
}

bool MarketFeed::beyond_bound(const std::string& symbol, Timestamp date) const {
    if (as_of_ && date <= *as_of_) return false;
    ++blocked_requests_;
    spdlog::warn("MarketFeed: refused {} for {} (as_of={})", symbol, utils::ts_to_date(date),
                 as_of_ ? utils::ts_to_date(*as_of_) : std::string("unset"));
    return true;
}

std::optional<MarketBar> MarketFeed::get_bar(const std::string& symbol, Timestamp date) const {
    if (beyond_bound(symbol, date)) return std::nullopt;
    auto bar = source_->get_bar(symbol, date);
    // A misbehaving source must not leak a later bar through.
    if (bar && bar->date > *as_of_) return std::nullopt;
    return bar;
}

std::optional<MarketBar> MarketFeed::latest_bar(const std::string& symbol) const {
    auto bars = get_history(symbol, 1);
    if (bars.empty()) return std::nullopt;
    return bars.back();
}

std::vector<MarketBar> MarketFeed::get_history(const std::string& symbol, size_t days) const {
    if (!as_of_ || days == 0) return {};
    auto bars = source_->get_bars(symbol, Timestamp::min(), *as_of_, days);
    while (!bars.empty() && bars.back().date > *as_of_) bars.pop_back();
    return bars;
}

std::optional<IndicatorSet> MarketFeed::get_indicators(const std::string& symbol,
                                                       Timestamp date,
                                                       size_t window) const {
    if (beyond_bound(symbol, date)) return std::nullopt;
    auto bars = source_->get_bars(symbol, Timestamp::min(), date, window);
    if (bars.empty() || bars.back().date != date) return std::nullopt;
    return compute_indicators(bars);
}

std::optional<std::string> MarketFeed::instrument_name(const std::string& symbol) const {
    return source_->instrument_name(symbol);
}

} // namespace trade_sim
