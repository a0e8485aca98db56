#include "portfolio_ledger.hpp"
#include <algorithm>
#include <stdexcept>

namespace trade_sim {

bool operator==(const Lot& a, const Lot& b) {
    return a.qty == b.qty && a.price == b.price && a.acquired == b.acquired &&
           a.settles_on == b.settles_on && a.sequence == b.sequence;
}

bool operator==(const Position& a, const Position& b) {
    return a.symbol == b.symbol && a.qty == b.qty && a.avg_cost == b.avg_cost &&
           a.cost_basis == b.cost_basis && a.realized_pl == b.realized_pl && a.lots == b.lots;
}

bool operator==(const AccountState& a, const AccountState& b) {
    return a.initial_cash == b.initial_cash && a.cash == b.cash && a.accrued_fees == b.accrued_fees &&
           a.realized_pl == b.realized_pl && a.sequence == b.sequence;
}

PortfolioLedger::PortfolioLedger(double initial_cash) {
    state_.initial_cash = initial_cash;
    state_.cash = initial_cash;
}

std::optional<Position> PortfolioLedger::position(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

int64_t PortfolioLedger::quantity(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    return it == positions_.end() ? 0 : it->second.qty;
}

int64_t PortfolioLedger::settled_quantity(const std::string& symbol, Timestamp as_of) const {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return 0;
    int64_t settled = 0;
    for (const auto& lot : it->second.lots) {
        if (lot.settled_as_of(as_of)) settled += lot.qty;
    }
    return settled;
}

int64_t PortfolioLedger::pending_quantity(const std::string& symbol, Timestamp as_of) const {
    return quantity(symbol) - settled_quantity(symbol, as_of);
}

double PortfolioLedger::market_value(const std::unordered_map<std::string, double>& prices) const {
    double total = 0.0;
    for (const auto& kv : positions_) {
        auto pit = prices.find(kv.first);
        double px = pit != prices.end() ? pit->second : kv.second.avg_cost;
        total += static_cast<double>(kv.second.qty) * px;
    }
    return total;
}

double PortfolioLedger::mark_to_market(const std::unordered_map<std::string, double>& prices) const {
    return state_.cash + market_value(prices);
}

void PortfolioLedger::apply_buy(const std::string& symbol, int64_t qty, double price, double cost,
                                Timestamp date, std::optional<Timestamp> settles_on, uint64_t sequence) {
    double notional = utils::round_money(static_cast<double>(qty) * price);
    auto& pos = positions_[symbol];
    pos.symbol = symbol;
    double total_cost = pos.avg_cost * static_cast<double>(pos.qty) + notional;
    pos.qty += qty;
    pos.avg_cost = total_cost / static_cast<double>(pos.qty);
    pos.cost_basis = utils::round_money(pos.avg_cost * static_cast<double>(pos.qty));
    pos.lots.push_back(Lot{qty, price, date, settles_on, sequence});

    state_.cash = utils::round_money(state_.cash - notional - cost);
    state_.accrued_fees = utils::round_money(state_.accrued_fees + cost);
}

double PortfolioLedger::apply_sell(const std::string& symbol, int64_t qty, double price, double cost,
                                   Timestamp as_of) {
    auto it = positions_.find(symbol);
    if (it == positions_.end() || settled_quantity(symbol, as_of) < qty) {
        throw std::logic_error("PortfolioLedger: sell of " + symbol + " exceeds settled shares");
    }
    auto& pos = it->second;
    int64_t remaining = qty;
    for (auto lot = pos.lots.begin(); lot != pos.lots.end() && remaining > 0;) {
        if (!lot->settled_as_of(as_of)) {
            ++lot;
            continue;
        }
        int64_t take = std::min(lot->qty, remaining);
        lot->qty -= take;
        remaining -= take;
        if (lot->qty == 0) {
            lot = pos.lots.erase(lot);
        } else {
            ++lot;
        }
    }

    double notional = utils::round_money(static_cast<double>(qty) * price);
    double realized = utils::round_money(notional - pos.avg_cost * static_cast<double>(qty) - cost);
    pos.qty -= qty;
    pos.realized_pl = utils::round_money(pos.realized_pl + realized);
    if (pos.qty == 0) {
        positions_.erase(it);
    } else {
        pos.cost_basis = utils::round_money(pos.avg_cost * static_cast<double>(pos.qty));
    }

    state_.cash = utils::round_money(state_.cash + notional - cost);
    state_.accrued_fees = utils::round_money(state_.accrued_fees + cost);
    state_.realized_pl = utils::round_money(state_.realized_pl + realized);
    return realized;
}

} // namespace trade_sim
