#include <gtest/gtest.h>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include "../src/core/simulation_engine.hpp"
#include "test_support.hpp"

using namespace trade_sim;
using namespace trade_sim::testing_support;

namespace {

class ScriptedAgent : public DecisionMaker {
public:
    using Script = std::function<std::vector<Order>(const MarketSnapshot&)>;

    explicit ScriptedAgent(Script script = nullptr) : script_(std::move(script)) {}

    std::string name() const override { return "scripted"; }

    std::vector<Order> decide(const MarketSnapshot& snapshot) override {
        seen.push_back(snapshot);
        if (!script_) return {};
        return script_(snapshot);
    }

    std::vector<MarketSnapshot> seen;

private:
    Script script_;
};

std::shared_ptr<InMemoryDataSource> make_source() {
    auto source = std::make_shared<InMemoryDataSource>();
    add_series(*source, "AAA", {10, 11, 12, 13, 14});
    for (int d : {0, 2, 3, 4}) {
        source->add_bar(make_bar("BBB", day(d), 50.0));
    }
    source->set_instrument_name("AAA", "Alpha");
    return source;
}

Config make_config() {
    Config cfg;
    cfg.run.instruments = {"AAA", "BBB"};
    cfg.run.initial_cash = 1000000.0;
    return cfg;
}

Order order(const std::string& symbol, OrderSide side, int64_t qty) {
    return Order{symbol, side, qty, std::nullopt, ""};
}

} // namespace

TEST(SimulationEngineTest, HoldingRunKeepsEquityFlat) {
    SimulationEngine engine(make_config(), make_source());
    ScriptedAgent agent;
    auto m = engine.run(agent);

    EXPECT_EQ(agent.seen.size(), 5u);
    EXPECT_EQ(m.trading_days, 5u);
    EXPECT_DOUBLE_EQ(m.final_equity, 1000000.0);
    EXPECT_DOUBLE_EQ(m.total_return, 0.0);
    EXPECT_DOUBLE_EQ(m.max_drawdown, 0.0);
    EXPECT_TRUE(engine.clock().is_completed());
    EXPECT_EQ(engine.feed().blocked_requests(), 0u);
    EXPECT_THROW(engine.run(agent), InvalidStateError);
}

TEST(SimulationEngineTest, BuySettlesNextDay) {
    ScriptedAgent agent([](const MarketSnapshot& s) {
        std::vector<Order> out;
        if (s.day_index == 0) {
            out.push_back(order("AAA", OrderSide::BUY, 1000));
            out.push_back(order("AAA", OrderSide::SELL, 1000));
        } else if (s.day_index == 1) {
            out.push_back(order("AAA", OrderSide::SELL, 500));
        }
        return out;
    });
    SimulationEngine engine(make_config(), make_source());
    engine.run(agent);

    const auto& txs = engine.recorder().transactions();
    ASSERT_EQ(txs.size(), 2u);
    EXPECT_EQ(txs[0].side, OrderSide::BUY);
    EXPECT_DOUBLE_EQ(txs[0].cash_after, 989995.0);
    EXPECT_EQ(txs[1].side, OrderSide::SELL);
    EXPECT_EQ(txs[1].date, day(1));
    EXPECT_DOUBLE_EQ(txs[1].cash_after, 995484.5);

    const auto& rejections = engine.recorder().rejections();
    ASSERT_EQ(rejections.size(), 1u);
    EXPECT_EQ(rejections[0].code, ErrorCode::INSUFFICIENT_SETTLED_SHARES);
    EXPECT_EQ(rejections[0].date, day(0));

    // 500 shares left, marked at the last close of 14
    const auto& last = engine.recorder().snapshots().back();
    EXPECT_DOUBLE_EQ(last.cash, 995484.5);
    EXPECT_DOUBLE_EQ(last.market_value, 7000.0);
    EXPECT_DOUBLE_EQ(last.equity, 1002484.5);
}

TEST(SimulationEngineTest, OrdersExecuteInSubmissionOrder) {
    Config cfg = make_config();
    cfg.run.initial_cash = 2000.0;
    ScriptedAgent agent([](const MarketSnapshot& s) {
        std::vector<Order> out;
        if (s.day_index == 0) {
            out.push_back(order("AAA", OrderSide::BUY, 100));
            out.push_back(order("AAA", OrderSide::BUY, 100));
        }
        return out;
    });
    SimulationEngine engine(cfg, make_source());
    auto day0 = engine.step(agent);

    EXPECT_EQ(day0.orders_received, 2u);
    ASSERT_EQ(day0.executions.size(), 2u);
    EXPECT_TRUE(day0.executions[0].accepted());
    ASSERT_TRUE(day0.executions[1].rejection.has_value());
    EXPECT_EQ(day0.executions[1].rejection->code, ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_DOUBLE_EQ(engine.ledger().cash(), 995.0);
    EXPECT_DOUBLE_EQ(day0.snapshot.equity, 1995.0);
}

TEST(SimulationEngineTest, SnapshotHoldsNothingFromTheFuture) {
    ScriptedAgent agent;
    SimulationEngine engine(make_config(), make_source());
    engine.run(agent);

    for (const auto& snap : agent.seen) {
        for (const auto& kv : snap.instruments) {
            EXPECT_EQ(kv.second.bar.date, snap.date);
            ASSERT_FALSE(kv.second.history.empty());
            EXPECT_EQ(kv.second.history.back().date, snap.date);
            for (const auto& bar : kv.second.history) EXPECT_LE(bar.date, snap.date);
        }
    }
    EXPECT_EQ(agent.seen[2].instruments.at("AAA").history.size(), 3u);
    EXPECT_EQ(agent.seen[0].instruments.at("AAA").name, "Alpha");
    EXPECT_EQ(agent.seen[0].instruments.at("BBB").name, "BBB");
}

TEST(SimulationEngineTest, MissingBarOmitsInstrument) {
    ScriptedAgent agent([](const MarketSnapshot& s) {
        std::vector<Order> out;
        if (s.day_index == 1) out.push_back(order("BBB", OrderSide::BUY, 100));
        return out;
    });
    SimulationEngine engine(make_config(), make_source());
    engine.step(agent);
    auto d1 = engine.step(agent);

    const auto& snap = agent.seen[1];
    EXPECT_EQ(snap.instruments.count("BBB"), 0u);
    ASSERT_EQ(snap.unavailable.count("BBB"), 1u);
    EXPECT_EQ(snap.unavailable.at("BBB"), ErrorCode::NOT_FOUND);
    // AAA is present but too short for indicators
    ASSERT_EQ(snap.instruments.count("AAA"), 1u);
    EXPECT_FALSE(snap.instruments.at("AAA").indicators.has_value());
    EXPECT_EQ(snap.unavailable.at("AAA"), ErrorCode::INSUFFICIENT_HISTORY);

    ASSERT_EQ(d1.executions.size(), 1u);
    ASSERT_TRUE(d1.executions[0].rejection.has_value());
    EXPECT_EQ(d1.executions[0].rejection->code, ErrorCode::NOT_FOUND);
}

TEST(SimulationEngineTest, RejectsUnknownInstrumentAndWrongDate) {
    SimulationEngine engine(make_config(), make_source());
    engine.begin_day();

    auto unknown = engine.submit_order(order("ZZZ", OrderSide::BUY, 100));
    ASSERT_TRUE(unknown.rejection.has_value());
    EXPECT_EQ(unknown.rejection->code, ErrorCode::UNKNOWN_INSTRUMENT);

    Order stale = order("AAA", OrderSide::BUY, 100);
    stale.date = day(3);
    auto wrong_date = engine.submit_order(stale);
    ASSERT_TRUE(wrong_date.rejection.has_value());
    EXPECT_EQ(wrong_date.rejection->code, ErrorCode::INVALID_ORDER_DATE);

    auto ok = engine.submit_order(order("AAA", OrderSide::BUY, 100));
    ASSERT_TRUE(ok.accepted());
    EXPECT_EQ(ok.transaction->date, day(0));
    EXPECT_EQ(engine.recorder().rejections().size(), 2u);
}

TEST(SimulationEngineTest, ProtocolMisuseThrows) {
    Config cfg = make_config();
    cfg.run.end_date = day(1);
    SimulationEngine engine(cfg, make_source());

    EXPECT_THROW(engine.submit_order(order("AAA", OrderSide::BUY, 100)), InvalidStateError);
    EXPECT_THROW(engine.end_day(), InvalidStateError);
    EXPECT_THROW(engine.snapshot({"AAA"}), InvalidStateError);

    engine.begin_day();
    EXPECT_TRUE(engine.in_day());
    EXPECT_THROW(engine.begin_day(), InvalidStateError);
    engine.end_day();
    engine.begin_day();
    engine.end_day();

    EXPECT_THROW(engine.begin_day(), EndOfCalendarError);
    EXPECT_THROW(engine.begin_day(), InvalidStateError);
    EXPECT_EQ(engine.recorder().snapshots().size(), 2u);
}

TEST(SimulationEngineTest, FailingDecisionMakerHoldsForTheDay) {
    int calls = 0;
    ScriptedAgent agent([&calls](const MarketSnapshot&) -> std::vector<Order> {
        ++calls;
        throw std::runtime_error("model unavailable");
    });
    SimulationEngine engine(make_config(), make_source());
    auto m = engine.run(agent);
    EXPECT_EQ(calls, 5);
    EXPECT_EQ(m.trade_count, 0u);
    EXPECT_EQ(m.trading_days, 5u);
}

TEST(SimulationEngineTest, InvalidConfigRejected) {
    Config no_cash = make_config();
    no_cash.run.initial_cash = 0.0;
    EXPECT_THROW(SimulationEngine(no_cash, make_source()), std::invalid_argument);

    Config no_universe = make_config();
    no_universe.run.instruments.clear();
    EXPECT_THROW(SimulationEngine(no_universe, make_source()), std::invalid_argument);

    EXPECT_THROW(SimulationEngine(make_config(), nullptr), std::invalid_argument);
}

TEST(SimulationEngineTest, CalendarRangeAndExplicitCalendar) {
    Config ranged = make_config();
    ranged.run.start_date = day(1);
    ranged.run.end_date = day(3);
    SimulationEngine a(ranged, make_source());
    ASSERT_EQ(a.clock().calendar().size(), 3u);
    EXPECT_EQ(a.clock().calendar().at(0), day(1));

    Config explicit_days = make_config();
    explicit_days.run.calendar = {day(0), day(2), day(4)};
    SimulationEngine b(explicit_days, make_source());
    ScriptedAgent agent;
    b.run(agent);
    ASSERT_EQ(agent.seen.size(), 3u);
    EXPECT_EQ(agent.seen[1].date, day(2));
    EXPECT_EQ(agent.seen[1].total_days, 3u);
}

TEST(SimulationEngineTest, PositionViewSplitsSettledAndPending) {
    ScriptedAgent agent([](const MarketSnapshot& s) {
        std::vector<Order> out;
        if (s.day_index <= 1) out.push_back(order("AAA", OrderSide::BUY, 200));
        return out;
    });
    SimulationEngine engine(make_config(), make_source());
    engine.step(agent);
    engine.step(agent);
    engine.step(agent);

    const auto& d1 = agent.seen[1];
    ASSERT_EQ(d1.positions.count("AAA"), 1u);
    EXPECT_EQ(d1.positions.at("AAA").qty, 200);
    EXPECT_EQ(d1.positions.at("AAA").settled_qty, 200);
    EXPECT_DOUBLE_EQ(d1.positions.at("AAA").last_price, 11.0);
    EXPECT_DOUBLE_EQ(d1.positions.at("AAA").unrealized_pl, 200.0);

    auto d2 = engine.snapshot({"AAA"});
    EXPECT_EQ(d2.positions.at("AAA").qty, 400);
    EXPECT_EQ(d2.positions.at("AAA").settled_qty, 400);

    const auto& mid = agent.seen[2];
    EXPECT_EQ(mid.positions.at("AAA").pending_qty, 0);
    EXPECT_DOUBLE_EQ(mid.equity, mid.cash + mid.market_value);
}

TEST(SimulationEngineTest, JournalRecordsEveryEvent) {
    auto path = (std::filesystem::temp_directory_path() / "trade_sim_engine_journal.jsonl").string();
    ScriptedAgent agent([](const MarketSnapshot& s) {
        std::vector<Order> out;
        if (s.day_index == 0) {
            out.push_back(order("AAA", OrderSide::BUY, 100));
            out.push_back(order("AAA", OrderSide::BUY, 150));
        }
        return out;
    });
    SimulationEngine engine(make_config(), make_source());
    auto journal = std::make_shared<RunJournal>(path);
    engine.set_journal(journal);
    engine.run(agent);
    // 1 fill + 1 rejection + 5 day closes + run summary
    EXPECT_EQ(journal->entries(), 8u);
    std::filesystem::remove(path);
}
