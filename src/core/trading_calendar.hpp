#pragma once

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "data_source.hpp"
#include "utils.hpp"

namespace trade_sim {

/**
 * Ordered sequence of trading days. Settlement and the day loop count in
 * entries of this sequence, never in calendar days.
 */
class TradingCalendar {
public:
    TradingCalendar() = default;

    explicit TradingCalendar(std::vector<Timestamp> dates) : dates_(std::move(dates)) {
        for (size_t i = 1; i < dates_.size(); ++i) {
            if (!(dates_[i - 1] < dates_[i])) {
                throw std::invalid_argument("trading calendar not strictly increasing at " +
                                            utils::ts_to_date(dates_[i]));
            }
        }
    }

    /**
     * Days on which `symbol` has a bar within [start, end].
     */
    static TradingCalendar from_data_source(const DataSource& source,
                                            const std::string& symbol,
                                            Timestamp start,
                                            Timestamp end) {
        return TradingCalendar(source.trading_dates(symbol, start, end));
    }

    const std::vector<Timestamp>& dates() const { return dates_; }
    size_t size() const { return dates_.size(); }
    bool empty() const { return dates_.empty(); }
    Timestamp at(size_t idx) const { return dates_.at(idx); }

    std::optional<size_t> index_of(Timestamp date) const {
        auto it = std::lower_bound(dates_.begin(), dates_.end(), date);
        if (it == dates_.end() || *it != date) return std::nullopt;
        return static_cast<size_t>(it - dates_.begin());
    }

    /**
     * Trading day `lag` entries after `date`; nullopt if `date` is not a
     * trading day or the calendar ends first.
     */
    std::optional<Timestamp> offset(Timestamp date, int lag) const {
        auto idx = index_of(date);
        if (!idx || lag < 0) return std::nullopt;
        size_t target = *idx + static_cast<size_t>(lag);
        if (target >= dates_.size()) return std::nullopt;
        return dates_[target];
    }

private:
    std::vector<Timestamp> dates_;
};

} // namespace trade_sim
