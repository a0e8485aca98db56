#include <gtest/gtest.h>
#include <vector>
#include "../src/core/simulation_clock.hpp"
#include "test_support.hpp"

using namespace trade_sim;
using namespace trade_sim::testing_support;

TEST(SimulationClockTest, WalksCalendarThenCompletes) {
    SimulationClock clock(TradingCalendar(days(3)));
    EXPECT_EQ(clock.state(), ClockState::IDLE);
    EXPECT_THROW(clock.current_date(), InvalidStateError);
    EXPECT_TRUE(clock.has_next());

    EXPECT_EQ(clock.advance(), day(0));
    EXPECT_TRUE(clock.is_running());
    EXPECT_EQ(clock.current_date(), day(0));
    EXPECT_EQ(clock.advance(), day(1));
    EXPECT_EQ(clock.advance(), day(2));
    EXPECT_EQ(clock.day_index(), 2u);
    EXPECT_FALSE(clock.has_next());

    EXPECT_THROW(clock.advance(), EndOfCalendarError);
    EXPECT_TRUE(clock.is_completed());
    EXPECT_THROW(clock.current_date(), InvalidStateError);
    EXPECT_THROW(clock.advance(), InvalidStateError);
}

TEST(SimulationClockTest, EmptyCalendarEndsImmediately) {
    SimulationClock clock{TradingCalendar()};
    EXPECT_FALSE(clock.has_next());
    try {
        clock.advance();
        FAIL() << "expected EndOfCalendarError";
    } catch (const SimulationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::END_OF_CALENDAR);
    }
    EXPECT_TRUE(clock.is_completed());
}

TEST(SimulationClockTest, ListenersSeeEveryDay) {
    SimulationClock clock(TradingCalendar(days(4)));
    std::vector<Timestamp> seen;
    clock.add_listener([&seen](Timestamp ts) { seen.push_back(ts); });
    while (clock.has_next()) clock.advance();
    EXPECT_EQ(seen, days(4));
}

TEST(SimulationClockTest, FinishIsTerminal) {
    SimulationClock clock(TradingCalendar(days(3)));
    clock.advance();
    clock.finish();
    EXPECT_TRUE(clock.is_completed());
    EXPECT_FALSE(clock.has_next());
    EXPECT_THROW(clock.advance(), InvalidStateError);
}

TEST(TradingCalendarTest, RejectsUnorderedDates) {
    EXPECT_THROW(TradingCalendar({day(1), day(0)}), std::invalid_argument);
    EXPECT_THROW(TradingCalendar({day(1), day(1)}), std::invalid_argument);
}

TEST(TradingCalendarTest, OffsetCountsTradingDays) {
    // gaps in the dates are non-trading days
    TradingCalendar calendar({day(0), day(1), day(4), day(5)});
    EXPECT_EQ(calendar.index_of(day(4)), 2u);
    EXPECT_FALSE(calendar.index_of(day(2)).has_value());
    EXPECT_EQ(calendar.offset(day(1), 1), day(4));
    EXPECT_EQ(calendar.offset(day(0), 0), day(0));
    EXPECT_FALSE(calendar.offset(day(5), 1).has_value());
    EXPECT_FALSE(calendar.offset(day(2), 1).has_value());
}

TEST(TradingCalendarTest, DerivedFromDataSource) {
    InMemoryDataSource source;
    add_series(source, "AAA", {10, 11, 12, 13, 14});
    auto calendar = TradingCalendar::from_data_source(source, "AAA", day(1), day(3));
    ASSERT_EQ(calendar.size(), 3u);
    EXPECT_EQ(calendar.at(0), day(1));
    EXPECT_EQ(calendar.at(2), day(3));
    EXPECT_TRUE(TradingCalendar::from_data_source(source, "ZZZ", day(0), day(9)).empty());
}
