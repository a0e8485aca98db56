#include "indicators.hpp"
#include <algorithm>
#include <cmath>

namespace trade_sim {

namespace indicators {

std::optional<double> sma(const std::vector<double>& values, size_t period) {
    if (period == 0 || values.size() < period) return std::nullopt;
    double sum = 0.0;
    for (size_t i = values.size() - period; i < values.size(); ++i) sum += values[i];
    return sum / static_cast<double>(period);
}

std::vector<double> ema_series(const std::vector<double>& values, size_t span) {
    std::vector<double> out;
    if (values.empty()) return out;
    out.reserve(values.size());
    double alpha = 2.0 / (static_cast<double>(span) + 1.0);
    out.push_back(values.front());
    for (size_t i = 1; i < values.size(); ++i) {
        out.push_back(alpha * values[i] + (1.0 - alpha) * out.back());
    }
    return out;
}

std::optional<double> rsi(const std::vector<double>& closes, size_t period) {
    if (period == 0 || closes.size() < period + 1) return std::nullopt;
    double gain = 0.0;
    double loss = 0.0;
    for (size_t i = closes.size() - period; i < closes.size(); ++i) {
        double delta = closes[i] - closes[i - 1];
        if (delta > 0) gain += delta;
        else loss -= delta;
    }
    gain /= static_cast<double>(period);
    loss /= static_cast<double>(period);
    if (loss == 0.0) {
        // flat window has no defined RSI
        if (gain == 0.0) return std::nullopt;
        return 100.0;
    }
    double rs = gain / loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

} // namespace indicators

namespace {

std::optional<double> sample_stddev(const std::vector<double>& values, size_t period) {
    if (period < 2 || values.size() < period) return std::nullopt;
    auto mean = indicators::sma(values, period);
    double var = 0.0;
    for (size_t i = values.size() - period; i < values.size(); ++i) {
        double d = values[i] - *mean;
        var += d * d;
    }
    var /= static_cast<double>(period - 1);
    return std::sqrt(var);
}

// KDJ(9,3,3): RSV over up to `n` bars, K and D smoothed with alpha 1/3.
void compute_kdj(const std::vector<MarketBar>& bars, IndicatorSet& out) {
    const size_t n = 9;
    const double alpha = 1.0 / 3.0;
    double k = 0.0;
    double d = 0.0;
    for (size_t i = 0; i < bars.size(); ++i) {
        size_t from = i + 1 >= n ? i + 1 - n : 0;
        double lo = bars[from].low;
        double hi = bars[from].high;
        for (size_t j = from + 1; j <= i; ++j) {
            lo = std::min(lo, bars[j].low);
            hi = std::max(hi, bars[j].high);
        }
        double rsv = hi > lo ? (bars[i].close - lo) / (hi - lo) * 100.0 : 50.0;
        if (i == 0) {
            k = rsv;
            d = k;
        } else {
            k = alpha * rsv + (1.0 - alpha) * k;
            d = alpha * k + (1.0 - alpha) * d;
        }
    }
    out.kdj_k = k;
    out.kdj_d = d;
    out.kdj_j = 3.0 * k - 2.0 * d;
}

} // namespace

std::optional<IndicatorSet> compute_indicators(const std::vector<MarketBar>& bars) {
    if (bars.size() < kMinIndicatorBars) return std::nullopt;

    std::vector<double> closes;
    std::vector<double> volumes;
    closes.reserve(bars.size());
    volumes.reserve(bars.size());
    for (const auto& b : bars) {
        closes.push_back(b.close);
        volumes.push_back(static_cast<double>(b.volume));
    }

    const auto& latest = bars.back();
    IndicatorSet out;
    out.symbol = latest.symbol;
    out.date = latest.date;
    out.close = latest.close;
    out.volume = static_cast<double>(latest.volume);
    out.pct_change = latest.pct_change;
    if (!out.pct_change && bars.size() >= 2 && bars[bars.size() - 2].close > 0.0) {
        double prev = bars[bars.size() - 2].close;
        out.pct_change = (latest.close - prev) / prev * 100.0;
    }

    out.ma5 = indicators::sma(closes, 5);
    out.ma10 = indicators::sma(closes, 10);
    out.ma20 = indicators::sma(closes, 20);
    out.ma60 = indicators::sma(closes, 60);

    auto ema12 = indicators::ema_series(closes, 12);
    auto ema26 = indicators::ema_series(closes, 26);
    std::vector<double> macd(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) macd[i] = ema12[i] - ema26[i];
    auto signal = indicators::ema_series(macd, 9);
    out.ema12 = ema12.back();
    out.ema26 = ema26.back();
    out.macd = macd.back();
    out.macd_signal = signal.back();
    out.macd_hist = macd.back() - signal.back();
    size_t last = macd.size() - 1;
    out.macd_golden_cross = macd[last - 1] < signal[last - 1] && macd[last] > signal[last];
    out.macd_death_cross = macd[last - 1] > signal[last - 1] && macd[last] < signal[last];

    out.rsi14 = indicators::rsi(closes, 14);

    compute_kdj(bars, out);

    out.boll_middle = indicators::sma(closes, 20);
    auto sd = sample_stddev(closes, 20);
    if (out.boll_middle && sd) {
        out.boll_upper = *out.boll_middle + 2.0 * (*sd);
        out.boll_lower = *out.boll_middle - 2.0 * (*sd);
    }

    out.volume_ma5 = indicators::sma(volumes, 5);
    out.volume_ma10 = indicators::sma(volumes, 10);

    if (out.ma5) out.price_above_ma5 = latest.close > *out.ma5;
    if (out.ma20) out.price_above_ma20 = latest.close > *out.ma20;
    if (out.ma5 && out.ma20) out.ma5_above_ma20 = *out.ma5 > *out.ma20;

    return out;
}

} // namespace trade_sim
