///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_roster.hpp"
#include <gtest/gtest.h>
#include <vector>


///////////////////////////
///     DEMO ROSTER     ///
///////////////////////////
TEST(DemoRosterTest, SizesHaveFixedCounts) {
    EXPECT_EQ(demoTraineeCount(DemoSize::S), 4);
    EXPECT_EQ(demoTraineeCount(DemoSize::M), 12);
    EXPECT_EQ(demoTraineeCount(DemoSize::L), 24);
    EXPECT_EQ(makeDemoRoster(DemoSize::L, YearMonth{2024, 1}).size(), 24u);
}

TEST(DemoRosterTest, IntakesAreStaggered) {
    const std::vector<Trainee> roster = makeDemoRoster(DemoSize::M, YearMonth{2024, 11});
    ASSERT_EQ(roster.size(), 12u);

    for (int i = 0; i < (int)roster.size(); ++i) {
        EXPECT_EQ(roster[i].id, 100 + i);
        EXPECT_EQ(toSerial(roster[i].start), toSerial(YearMonth{2024, 11}) + 2 * i) << i;
        EXPECT_EQ(roster[i].department, i % 2 == 0 ? Department::A : Department::B) << i;
        EXPECT_EQ(roster[i].track, i % 4 == 3 ? Track::ModelB : Track::ModelA) << i;
        EXPECT_TRUE(roster[i].active);
    }
    EXPECT_EQ(roster[1].start, (YearMonth{2025, 1}));
    EXPECT_EQ(roster[3].targetLength, 66);
}

TEST(DemoRosterTest, LeaveGoesToTheSecondTrainee) {
    const std::vector<Trainee> roster = makeDemoRoster(DemoSize::S, YearMonth{2024, 1});
    const std::vector<LeaveEvent> leave = makeDemoLeave(roster);

    ASSERT_EQ(leave.size(), 1u);
    EXPECT_EQ(leave[0].traineeId, roster[1].id);
    EXPECT_EQ(leave[0].start, (YearMonth{2025, 9}));
    EXPECT_EQ(leave[0].durationMonths, 8);
    EXPECT_EQ(leave[0].classification, LeaveClass::WithinSyllabus);

    EXPECT_TRUE(makeDemoLeave({roster[0]}).empty());
}
