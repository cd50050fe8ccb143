///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>


///////////////////////////
///      TIMELINES      ///
///////////////////////////
TEST(FormattingTest, TimelineSplitsRunsAndSkipsEmptyCells) {
    const RuleSetPtr rules = stockRules();
    const StationId birth = sid(*rules, "birth");
    const StationId ivf = sid(*rules, "ivf");

    ScheduleState state({traineeA(1, Department::A, {2024, 1})});
    state.set(0, 0, birth);
    state.set(0, 1, birth);
    state.set(0, 3, birth);
    state.set(0, 4, ivf);

    const std::vector<TimelineBlock> blocks = timelineOf(state, 0);
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].station, birth);
    EXPECT_EQ(blocks[0].months, 2);
    EXPECT_EQ(blocks[1].firstIndex, 3);
    EXPECT_EQ(blocks[1].months, 1);
    EXPECT_EQ(blocks[2].station, ivf);
}

TEST(FormattingTest, TimelinesMarkAnchorsAndCommittedMonths) {
    const RuleSetPtr rules = stockRules();
    const StationId orientation = sid(*rules, "orientation");
    const StationId birth = sid(*rules, "birth");

    ScheduleState state({traineeA(1, Department::A, {2024, 1}), traineeA(2, Department::B, {2024, 1})});
    state.set(0, 0, orientation);
    for (int i = 1; i <= 6; ++i) state.set(0, i, birth);
    state.setAnchors({Assignment{1, 3, birth}});
    state.setCommittedThrough(toSerial(YearMonth{2024, 1}));

    testing::internal::CaptureStdout();
    printTimelines(state, *rules);
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("Trainee 1 (ModelA"), std::string::npos) << out;
    EXPECT_NE(out.find("Orientation #"), std::string::npos) << out;
    EXPECT_NE(out.find("Birth *"), std::string::npos) << out;
    EXPECT_NE(out.find("2024-07"), std::string::npos) << out;
    EXPECT_NE(out.find("(no assignments)"), std::string::npos) << out;
}


///////////////////////////
///      REPORTS        ///
///////////////////////////
TEST(FormattingTest, BottlenecksPrintSeverity) {
    const RuleSetPtr rules = stockRules();
    const int firstRule = rules->capacityRules().front();
    const MonthSerial june = toSerial(YearMonth{2026, 6});

    testing::internal::CaptureStdout();
    printBottlenecks({}, *rules);
    printBottlenecks({Bottleneck{CapacityRow{firstRule, june, 3, 0, 2}, BottleneckSeverity::Critical}}, *rules);
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("No capacity bottlenecks ahead."), std::string::npos);
    EXPECT_NE(out.find("CRITICAL"), std::string::npos);
    EXPECT_NE(out.find("2026-06 " + rules->describeRule(firstRule) + " occupancy 3"), std::string::npos) << out;
}

TEST(FormattingTest, ConflictReportListsItems) {
    const RuleSetPtr rules = stockRules();
    ConflictReport report;
    report.kind = ErrorKind::AnchorConflict;
    report.message = "anchors clash";
    report.minimal = false;
    report.items.push_back(ConflictItem{7, 14, toSerial(YearMonth{2025, 3}), sid(*rules, "ivf"),
                                        ReasonCode::AnchorConflict, -1, "anchor"});

    testing::internal::CaptureStdout();
    printConflictReport(report, *rules);
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("AnchorConflict: anchors clash"), std::string::npos) << out;
    EXPECT_NE(out.find("not minimal"), std::string::npos);
    EXPECT_NE(out.find("trainee 7 month 14 2025-03 IVF"), std::string::npos) << out;
}
