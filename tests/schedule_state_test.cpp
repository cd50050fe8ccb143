///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "schedule_state.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>


///////////////////////////
///   SCHEDULE STATE    ///
///////////////////////////
TEST(ScheduleStateTest, EmptyMatrixIsAsWideAsTheLongestTrack) {
    ScheduleState state({traineeA(1, Department::A, {2024, 1}), traineeB(2, Department::B, {2024, 3})});

    EXPECT_EQ(state.width(), 72);
    EXPECT_EQ(state.length(0), 72);
    EXPECT_EQ(state.length(1), 66);
    EXPECT_EQ(state.at(1, 0), kNoStation);
    EXPECT_FALSE(state.isComplete(0));
    EXPECT_EQ(state.ordinalOf(2), 1);
    EXPECT_EQ(state.ordinalOf(99), -1);
    EXPECT_EQ(state.ruleSetVersion(), -1);
    EXPECT_FALSE(state.committedThrough().has_value());
}

TEST(ScheduleStateTest, WritesOutsideARowThrow) {
    ScheduleState state({traineeB(1, Department::A, {2024, 1}), traineeA(2, Department::A, {2024, 1})});

    EXPECT_NO_THROW(state.set(0, 65, 0));
    EXPECT_THROW(state.set(0, 66, 0), std::out_of_range);
    EXPECT_THROW(state.set(0, -1, 0), std::out_of_range);
    EXPECT_THROW(state.set(2, 0, 0), std::out_of_range);
    EXPECT_EQ(state.at(0, 500), kNoStation);
}

TEST(ScheduleStateTest, CalendarMonthsFollowTheStart) {
    ScheduleState state({traineeA(1, Department::A, {2024, 11})});

    EXPECT_EQ(state.calendarMonth(0, 2), toSerial(YearMonth{2025, 1}));
    EXPECT_EQ(state.monthIndexOf(0, toSerial(YearMonth{2025, 6})), 7);
    EXPECT_EQ(state.horizonStart(), toSerial(YearMonth{2024, 11}));
    EXPECT_EQ(state.horizonEnd(), toSerial(YearMonth{2024, 11}) + 72);
}

TEST(ScheduleStateTest, ResizeKeepsCellsAndWidens) {
    ScheduleState state({traineeA(1, Department::A, {2024, 1})});
    state.set(0, 0, 3);
    state.set(0, 71, 4);

    state.resizeTrainee(0, 80);
    EXPECT_EQ(state.width(), 80);
    EXPECT_EQ(state.at(0, 0), 3);
    EXPECT_EQ(state.at(0, 71), 4);
    EXPECT_EQ(state.at(0, 79), kNoStation);

    state.resizeTrainee(0, 70);
    EXPECT_EQ(state.length(0), 70);
    state.resizeTrainee(0, 72);
    EXPECT_EQ(state.at(0, 71), kNoStation);
    EXPECT_THROW(state.resizeTrainee(0, 0), std::invalid_argument);
}

TEST(ScheduleStateTest, AnchorsAreLookedUpByTraineeId) {
    ScheduleState state({traineeA(7, Department::A, {2024, 1}), traineeA(9, Department::B, {2024, 1})});
    state.setAnchors({Assignment{9, 12, 4}});

    EXPECT_FALSE(state.isAnchor(0, 12));
    ASSERT_TRUE(state.anchorAt(1, 12).has_value());
    EXPECT_EQ(*state.anchorAt(1, 12), 4);
}

TEST(ScheduleStateTest, SameMatrixIgnoresMetadata) {
    ScheduleState a({traineeA(1, Department::A, {2024, 1})});
    ScheduleState b = a;
    b.setAnchors({Assignment{1, 0, 2}});
    b.setRuleSetVersion(3);
    EXPECT_TRUE(a.sameMatrix(b));

    b.set(0, 5, 2);
    EXPECT_FALSE(a.sameMatrix(b));
}


///////////////////////////
///  CAPACITY TRACKER   ///
///////////////////////////
TEST(CapacityTrackerTest, CountsPoolsAndSkipsGraduates) {
    const RuleSetPtr rules = stockRules();
    const StationId birth = sid(*rules, "birth");

    Trainee graduate = traineeA(3, Department::A, {2024, 1});
    graduate.active = false;
    ScheduleState state({traineeA(1, Department::A, {2024, 1}), traineeA(2, Department::B, {2024, 2}), graduate});
    state.set(0, 1, birth);
    state.set(1, 0, birth);
    state.set(2, 1, birth);

    CapacityTracker tracker = CapacityTracker::fromState(*rules, state);
    const MonthSerial feb = toSerial(YearMonth{2024, 2});
    EXPECT_EQ(tracker.occupancy(birth, feb), 2);

    tracker.onWrite(feb, birth, kNoStation);
    EXPECT_EQ(tracker.occupancy(birth, feb), 1);
    EXPECT_EQ(tracker.occupancy(birth, toSerial(YearMonth{1999, 1})), 0);
}

TEST(CapacityTrackerTest, AggregatePoolBoundsAndOverrides) {
    const RuleSetPtr stock = stockRules();
    const StationId hrpA = sid(*stock, "hrp_a");
    const StationId hrpB = sid(*stock, "hrp_b");
    std::vector<StationRule> rules = stock->rules();
    rules.push_back(CapacityRule{{hrpA, hrpB}, 1, 2});
    SyllabusRuleSet pooled(2, YearMonth{2020, 1}, std::nullopt, stock->stations(), rules);
    const int pool = pooled.capacityRules().back();

    ScheduleState state({traineeA(1, Department::A, {2024, 1}), traineeA(2, Department::B, {2024, 1}),
                         traineeA(3, Department::B, {2024, 1})});
    for (int t = 0; t < 3; ++t) state.set(t, 0, t == 0 ? hrpA : hrpB);

    const MonthSerial jan = toSerial(YearMonth{2024, 1});
    const std::vector<CapacityOverride> overrides = {CapacityOverride{hrpA, {2024, 2}, 0, "chief", "audit"}};
    CapacityTracker tracker = CapacityTracker::fromState(pooled, state, overrides);

    EXPECT_EQ(tracker.poolOccupancy(pool, jan), 3);
    EXPECT_FALSE(tracker.withinBounds(pool, jan));
    EXPECT_EQ(tracker.minFor(pool, jan), 1);
    EXPECT_EQ(tracker.minFor(pool, jan + 1), 0);
    EXPECT_TRUE(tracker.withinBounds(pool, jan + 1));

    const std::vector<CapacityRow> bad = tracker.violations(jan, jan + 3);
    ASSERT_EQ(bad.size(), 2u);
    EXPECT_EQ(bad[0].ruleIndex, pool);
    EXPECT_EQ(bad[0].month, jan);
    EXPECT_EQ(bad[1].month, jan + 2);
}

TEST(CapacityTrackerTest, EmptyMonthsHaveNoFloor) {
    const RuleSetPtr stock = stockRules();
    const StationId birth = sid(*stock, "birth");
    std::vector<StationRule> rules = stock->rules();
    rules.push_back(CapacityRule{{birth}, 1, 4});
    SyllabusRuleSet floored(2, YearMonth{2018, 1}, std::nullopt, stock->stations(), rules);
    const int floor = floored.capacityRules().back();

    // The first row ends in 2023-12, the second starts in 2024-03.
    ScheduleState state({traineeA(1, Department::A, {2018, 1}), traineeA(2, Department::B, {2024, 3})});
    const CapacityTracker tracker = CapacityTracker::fromState(floored, state);

    const MonthSerial jan = toSerial(YearMonth{2024, 1});
    const MonthSerial mar = toSerial(YearMonth{2024, 3});
    EXPECT_EQ(tracker.enrolled(jan - 1), 1);
    EXPECT_EQ(tracker.enrolled(jan), 0);
    EXPECT_EQ(tracker.enrolled(mar), 1);
    EXPECT_EQ(tracker.minFor(floor, jan), 0);
    EXPECT_EQ(tracker.minFor(floor, jan + 1), 0);
    EXPECT_TRUE(tracker.withinBounds(floor, jan));
    EXPECT_EQ(tracker.minFor(floor, mar), 1);
    EXPECT_FALSE(tracker.withinBounds(floor, mar));
    EXPECT_TRUE(tracker.violations(jan, mar).empty());
}

TEST(CapacityTrackerTest, BottlenecksListCriticalBeforeSaturated) {
    const RuleSetPtr rules = stockRules();
    const StationId supervisor = sid(*rules, "maternity_er_supervisor");
    const StationId womensEr = sid(*rules, "womens_er");

    ScheduleState state({traineeA(1, Department::A, {2024, 1}), traineeA(2, Department::A, {2024, 1}),
                         traineeA(3, Department::B, {2024, 1})});
    state.set(0, 1, supervisor);
    state.set(1, 3, supervisor);
    state.set(2, 3, supervisor);
    for (int t = 0; t < 3; ++t) state.set(t, 2, womensEr);

    CapacityTracker tracker = CapacityTracker::fromState(*rules, state);
    const MonthSerial jan = toSerial(YearMonth{2024, 1});
    const std::vector<Bottleneck> found = tracker.bottlenecks(jan, 6);

    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].severity, BottleneckSeverity::Critical);
    EXPECT_EQ(found[0].row.month, jan + 3);
    EXPECT_EQ(found[1].severity, BottleneckSeverity::Saturated);
    EXPECT_EQ(found[1].row.month, jan + 1);
    EXPECT_EQ(found[2].row.month, jan + 2);
    EXPECT_EQ(found[2].row.occupancy, 3);
}
