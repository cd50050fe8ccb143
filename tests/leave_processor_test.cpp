///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "leave_processor.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>


///////////////////////////
///     APPLY LEAVE     ///
///////////////////////////
TEST(ApplyLeaveTest, WithinSyllabusIsDeductedUpToTheCap) {
    const LeaveEvent leave{1, {2025, 6}, 4, LeaveClass::WithinSyllabus, "sick"};
    const LeaveEffect effect = applyLeave(leave, 72, 14, 0, 6);

    EXPECT_EQ(effect.length, 72);
    EXPECT_EQ(effect.allotment, 10);
    EXPECT_EQ(effect.deducted, 4);
    EXPECT_EQ(effect.extension, 0);
    EXPECT_EQ(effect.capUsed, 4);
}

TEST(ApplyLeaveTest, OverflowPastTheCapExtends) {
    const LeaveEvent leave{1, {2025, 6}, 5, LeaveClass::WithinSyllabus, "maternity"};
    const LeaveEffect effect = applyLeave(leave, 72, 10, 4, 6);

    EXPECT_EQ(effect.deducted, 2);
    EXPECT_EQ(effect.extension, 3);
    EXPECT_EQ(effect.length, 75);
    EXPECT_EQ(effect.allotment, 8);
    EXPECT_EQ(effect.capUsed, 6);
}

TEST(ApplyLeaveTest, ExtensionAlwaysExtends) {
    const LeaveEvent leave{1, {2025, 6}, 3, LeaveClass::Extension, "unpaid"};
    const LeaveEffect effect = applyLeave(leave, 66, 14, 0, 6);

    EXPECT_EQ(effect.length, 69);
    EXPECT_EQ(effect.allotment, 14);
    EXPECT_EQ(effect.deducted, 0);
}

TEST(ApplyLeaveTest, RejectsEmptyLeave) {
    const LeaveEvent leave{1, {2025, 6}, 0, LeaveClass::Extension, ""};
    EXPECT_THROW(applyLeave(leave, 72, 14, 0, 6), std::invalid_argument);
}


///////////////////////////
///   LEAVE PROCESSOR   ///
///////////////////////////
TEST(LeaveProcessorTest, BaseTargetFollowsTrackAndDepartment) {
    const RuleSetPtr rules = stockRules();
    LeaveProcessor processor(*rules);

    const TraineeTarget a = processor.baseTarget(traineeA(1, Department::A, {2024, 1}));
    EXPECT_EQ(a.length, 72);
    EXPECT_EQ(a.allotment, 14);
    EXPECT_EQ(a.durations[sid(*rules, "hrp_a")], 6);
    EXPECT_EQ(a.durations[sid(*rules, "hrp_b")], 0);
    EXPECT_TRUE(a.leaveMonths.empty());

    const TraineeTarget b = processor.baseTarget(traineeB(2, Department::B, {2024, 1}));
    EXPECT_EQ(b.length, 66);
    EXPECT_EQ(b.durations[sid(*rules, "basic_sciences")], 0);
    EXPECT_EQ(b.durations[sid(*rules, "rotation_general")], 2);
}

TEST(LeaveProcessorTest, EightMonthsOfMaternityLeave) {
    const RuleSetPtr rules = stockRules();
    LeaveProcessor processor(*rules);
    const Trainee trainee = traineeA(1, Department::A, {2024, 1});
    const std::vector<LeaveEvent> events = {LeaveEvent{1, {2025, 7}, 8, LeaveClass::WithinSyllabus, "maternity"}};

    const TraineeTarget target = processor.targetFor(trainee, events);
    EXPECT_EQ(target.length, 74);
    EXPECT_EQ(target.allotment, 8);
    EXPECT_EQ(target.creditedLeave, 6);
    EXPECT_EQ(target.durations[rules->allotmentStation()], 8);
    EXPECT_EQ(target.durations[rules->leaveStation()], 8);

    ASSERT_EQ(target.leaveMonths.size(), 8u);
    EXPECT_EQ(target.leaveMonths.front().monthIndex, 18);
    EXPECT_TRUE(target.leaveMonths[5].credited);
    EXPECT_FALSE(target.leaveMonths[6].credited);
    EXPECT_TRUE(target.isLeave(25));
    EXPECT_FALSE(target.isLeave(26));

    int total = 0;
    for (int d : target.durations) total += d;
    EXPECT_EQ(total, target.length);
}

TEST(LeaveProcessorTest, CapIsCumulativeAndOrderIndependent) {
    const RuleSetPtr rules = stockRules();
    LeaveProcessor processor(*rules);
    const Trainee trainee = traineeA(1, Department::A, {2024, 1});
    const LeaveEvent early{1, {2024, 6}, 4, LeaveClass::WithinSyllabus, "sick"};
    const LeaveEvent late{1, {2026, 1}, 4, LeaveClass::WithinSyllabus, "sick"};

    const TraineeTarget forward = processor.targetFor(trainee, {early, late});
    const TraineeTarget backward = processor.targetFor(trainee, {late, early});

    EXPECT_EQ(forward.length, 74);
    EXPECT_EQ(forward.allotment, 8);
    EXPECT_EQ(forward.durations, backward.durations);
    EXPECT_EQ(forward.length, backward.length);
}

TEST(LeaveProcessorTest, RejectsLeaveOutsideTheProgram) {
    const RuleSetPtr rules = stockRules();
    LeaveProcessor processor(*rules);
    const Trainee trainee = traineeB(1, Department::A, {2024, 1});

    EXPECT_THROW(processor.targetFor(trainee, {LeaveEvent{1, {2023, 12}, 2, LeaveClass::Extension, ""}}),
                 std::invalid_argument);
    EXPECT_THROW(processor.targetFor(trainee, {LeaveEvent{1, {2029, 5}, 3, LeaveClass::WithinSyllabus, ""}}),
                 std::invalid_argument);
    EXPECT_THROW(processor.targetFor(trainee, {LeaveEvent{1, {2025, 1}, 3, LeaveClass::Extension, ""},
                                               LeaveEvent{1, {2025, 3}, 2, LeaveClass::Extension, ""}}),
                 std::invalid_argument);
}

TEST(LeaveProcessorTest, BuildTargetsRejectsUnknownTrainees) {
    const RuleSetPtr rules = stockRules();
    LeaveProcessor processor(*rules);
    const std::vector<Trainee> roster = {traineeA(1, Department::A, {2024, 1})};

    EXPECT_EQ(processor.buildTargets(roster, {}).size(), 1u);
    EXPECT_THROW(processor.buildTargets(roster, {LeaveEvent{2, {2024, 5}, 1, LeaveClass::Extension, ""}}),
                 std::invalid_argument);
}

TEST(LeaveProcessorTest, ProgressCountsCreditedLeaveOnly) {
    const RuleSetPtr rules = stockRules();
    LeaveProcessor processor(*rules);
    const StationId orientation = sid(*rules, "orientation");
    const Trainee trainee = traineeA(1, Department::A, {2024, 1});
    const std::vector<LeaveEvent> events = {LeaveEvent{1, {2024, 3}, 8, LeaveClass::WithinSyllabus, ""}};
    const TraineeTarget target = processor.targetFor(trainee, events);

    ScheduleState state({trainee});
    state.resizeTrainee(0, target.length);
    state.set(0, 0, orientation);
    state.set(0, 1, orientation);
    for (const LeaveMonth& m : target.leaveMonths) state.set(0, m.monthIndex, rules->leaveStation());

    const TraineeProgress progress = processor.progressOf(state, 0, target, toSerial(YearMonth{2024, 12}));
    EXPECT_EQ(progress.creditedLeaveMonths, 6);
    EXPECT_EQ(progress.uncreditedLeaveMonths, 2);
    EXPECT_EQ(progress.completedMonths, 8);
    EXPECT_EQ(progress.totalMonths, 72);
    EXPECT_EQ(progress.remainingMonths, 74 - 12);
    EXPECT_NEAR(progress.percent, 100.0 * 8 / 72, 1e-9);
}
