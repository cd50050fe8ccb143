///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "rule_evaluator.hpp"
#include "schedule_validator.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

const CalendarWindowRule& windowOf(const SyllabusRuleSet& rules, StationId station) {
    for (int w : rules.windowRules()) {
        if (rules.windowRule(w).station == station) return rules.windowRule(w);
    }
    throw std::logic_error("no window for station");
}

int sequenceRuleIndex(const SyllabusRuleSet& rules, StationId predecessor, StationId dependent) {
    for (int q : rules.sequenceRules()) {
        if (rules.sequenceRule(q).predecessor == predecessor && rules.sequenceRule(q).dependent == dependent) return q;
    }
    return -1;
}

int capacityRuleIndex(const SyllabusRuleSet& rules, StationId station) {
    for (int c : rules.capacityRules()) {
        if (rules.capacityRule(c).pool == std::vector<StationId>{station}) return c;
    }
    return -1;
}

} // namespace


///////////////////////////
///       WINDOWS       ///
///////////////////////////
TEST(WindowTest, StageAIsAJuneInTheFourthOrFifthYear) {
    const RuleSetPtr rules = stockRules();
    const CalendarWindowRule& window = windowOf(*rules, sid(*rules, "stage_a"));
    const Trainee trainee = traineeA(1, Department::A, {2024, 1});

    EXPECT_FALSE(windowAllows(window, trainee, 72, 29));
    EXPECT_TRUE(windowAllows(window, trainee, 72, 41));
    EXPECT_FALSE(windowAllows(window, trainee, 72, 42));
    EXPECT_TRUE(windowAllows(window, trainee, 72, 53));
    EXPECT_FALSE(windowAllows(window, trainee, 72, 65));
}

TEST(WindowTest, StageBSitsInTheLastYear) {
    const RuleSetPtr rules = stockRules();
    const CalendarWindowRule& window = windowOf(*rules, sid(*rules, "stage_b"));
    const Trainee trainee = traineeA(1, Department::A, {2024, 1});

    EXPECT_FALSE(windowAllows(window, trainee, 72, 58));
    EXPECT_TRUE(windowAllows(window, trainee, 72, 62));
    EXPECT_TRUE(windowAllows(window, trainee, 72, 70));
    EXPECT_FALSE(windowAllows(window, trainee, 72, 66));
    // A longer program moves the last year with it.
    EXPECT_FALSE(windowAllows(window, trainee, 76, 62));
}


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
TEST(RuleEvaluatorTest, DependentBeforePredecessorBreaksTheSequence) {
    const RuleSetPtr rules = stockRules();
    const StationId basic = sid(*rules, "basic_sciences");
    const StationId stageA = sid(*rules, "stage_a");
    const std::vector<Trainee> roster = {traineeA(1, Department::A, {2024, 1})};
    ScheduleState state(roster);
    state.set(0, 10, stageA);
    state.set(0, 20, basic);

    const std::vector<TraineeTarget> targets = LeaveProcessor(*rules).buildTargets(roster, {});
    const CapacityTracker capacity = CapacityTracker::fromState(*rules, state);
    RuleEvaluator evaluator(state, *rules, targets, capacity, toSerial(YearMonth{2023, 12}), EvaluationMode::Pinned);

    const std::vector<RuleViolation> found = evaluator.evaluate(sequenceRuleIndex(*rules, basic, stageA));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].ordinal, 0);
    EXPECT_EQ(found[0].monthIndex, 10);
    EXPECT_EQ(found[0].station, stageA);
}

TEST(RuleEvaluatorTest, PinnedModeOnlyFlagsExcessDurations) {
    const RuleSetPtr rules = stockRules();
    const StationId birth = sid(*rules, "birth");
    const std::vector<Trainee> roster = {traineeA(1, Department::A, {2024, 1}), traineeA(2, Department::A, {2024, 1})};
    ScheduleState state(roster);
    for (int i = 0; i < 3; ++i) state.set(0, i, birth);
    for (int i = 0; i < 7; ++i) state.set(1, 10 + i, birth);

    const std::vector<TraineeTarget> targets = LeaveProcessor(*rules).buildTargets(roster, {});
    const CapacityTracker capacity = CapacityTracker::fromState(*rules, state);
    const MonthSerial boundary = toSerial(YearMonth{2023, 12});

    int durationRule = -1;
    for (int r = 0; r < (int)rules->rules().size(); ++r) {
        const auto* d = std::get_if<DurationRule>(&rules->rules()[r]);
        if (d != nullptr && d->station == birth && d->track == Track::ModelA) durationRule = r;
    }
    ASSERT_GE(durationRule, 0);

    const auto pinned = RuleEvaluator(state, *rules, targets, capacity, boundary, EvaluationMode::Pinned)
                                .evaluate(durationRule);
    ASSERT_EQ(pinned.size(), 1u);
    EXPECT_EQ(pinned[0].ordinal, 1);

    const auto complete = RuleEvaluator(state, *rules, targets, capacity, boundary, EvaluationMode::Complete)
                                  .evaluate(durationRule);
    EXPECT_EQ(complete.size(), 2u);
}

TEST(RuleEvaluatorTest, CapacityOnlyBindsAfterTheBoundary) {
    const RuleSetPtr rules = stockRules();
    const StationId birth = sid(*rules, "birth");
    std::vector<Trainee> roster;
    for (int id = 1; id <= 5; ++id) roster.push_back(traineeA(id, Department::A, {2024, 1}));
    ScheduleState state(roster);
    for (int t = 0; t < 5; ++t) state.set(t, 1, birth);

    const std::vector<TraineeTarget> targets = LeaveProcessor(*rules).buildTargets(roster, {});
    const CapacityTracker capacity = CapacityTracker::fromState(*rules, state);
    const int rule = capacityRuleIndex(*rules, birth);
    ASSERT_GE(rule, 0);

    const MonthSerial feb = toSerial(YearMonth{2024, 2});
    EXPECT_TRUE(RuleEvaluator(state, *rules, targets, capacity, feb, EvaluationMode::Pinned).evaluate(rule).empty());

    const auto live = RuleEvaluator(state, *rules, targets, capacity, feb - 1, EvaluationMode::Pinned).evaluate(rule);
    ASSERT_EQ(live.size(), 1u);
    EXPECT_EQ(live[0].month, feb);
    EXPECT_EQ(live[0].station, birth);
}

TEST(RuleEvaluatorTest, HistoryIsExemptFromWindows) {
    const RuleSetPtr rules = stockRules();
    const StationId stageA = sid(*rules, "stage_a");
    const std::vector<Trainee> roster = {traineeA(1, Department::A, {2024, 1})};
    ScheduleState state(roster);
    state.set(0, 40, stageA);

    const std::vector<TraineeTarget> targets = LeaveProcessor(*rules).buildTargets(roster, {});
    const CapacityTracker capacity = CapacityTracker::fromState(*rules, state);
    const MonthSerial cell = state.calendarMonth(0, 40);

    RuleEvaluator before(state, *rules, targets, capacity, cell - 1, EvaluationMode::Pinned);
    RuleEvaluator after(state, *rules, targets, capacity, cell, EvaluationMode::Pinned);
    EXPECT_EQ(before.evaluateAll().size(), 1u);
    EXPECT_TRUE(after.evaluateAll().empty());
}


///////////////////////////
///     CONTINUITY      ///
///////////////////////////
TEST(ContinuityTest, LeaveDoesNotBreakARun) {
    const RuleSetPtr rules = stockRules();
    const StationId birth = sid(*rules, "birth");
    const StationId leave = rules->leaveStation();

    const auto blocks = stationBlocks({birth, birth, leave, leave, birth}, leave);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].blocks, 1);
    EXPECT_EQ(blocks[0].firstBlock, 3);
}

TEST(ContinuityTest, OnlyTheDeclaredSplitIsFree) {
    const RuleSetPtr rules = stockRules();
    const StationId hrp = sid(*rules, "hrp_a");
    const StationId birth = sid(*rules, "birth");
    const StationId ivf = sid(*rules, "ivf");

    EXPECT_EQ(continuityPenalty({hrp, hrp, hrp, hrp, birth, hrp, hrp}, *rules), 0);
    EXPECT_EQ(continuityPenalty({hrp, hrp, birth, hrp, hrp, hrp, hrp}, *rules), 1);
    EXPECT_EQ(continuityPenalty({ivf, ivf, birth, ivf, ivf}, *rules), 1);
    EXPECT_EQ(continuityPenalty({ivf, birth, ivf, birth, ivf}, *rules), 3);
}


///////////////////////////
///     VALIDATION      ///
///////////////////////////
TEST(ScheduleValidatorTest, ReportsGapsAndIneligibleStations) {
    const RuleSetPtr rules = stockRules();
    const std::vector<Trainee> roster = {traineeA(1, Department::A, {2024, 1})};
    ScheduleState state(roster);
    state.set(0, 0, sid(*rules, "hrp_b"));
    state.setAnchors({Assignment{1, 5, sid(*rules, "birth")}});

    const std::vector<TraineeTarget> targets = LeaveProcessor(*rules).buildTargets(roster, {});
    const ValidationReport report = validateSchedule(state, *rules, targets, toSerial(YearMonth{2023, 12}));

    EXPECT_FALSE(report.ok());
    bool sawGap = false;
    bool sawDepartment = false;
    bool sawAnchor = false;
    for (const std::string& e : report.errors) {
        if (e == "Trainee 1 month 3 is unassigned") sawGap = true;
        if (e.find("hrp_b is not open to department A") != std::string::npos) sawDepartment = true;
        if (e.find("anchor of trainee 1 at month 5") != std::string::npos) sawAnchor = true;
    }
    EXPECT_TRUE(sawGap);
    EXPECT_TRUE(sawDepartment);
    EXPECT_TRUE(sawAnchor);
    EXPECT_EQ(report.summary().rfind("Validation FAILED", 0), 0u);
}

TEST(ScheduleValidatorTest, LengthMustMatchTheTarget) {
    const RuleSetPtr rules = stockRules();
    const std::vector<Trainee> roster = {traineeA(1, Department::A, {2024, 1})};
    const ScheduleState state(roster);
    const std::vector<LeaveEvent> leave = {LeaveEvent{1, {2025, 1}, 2, LeaveClass::Extension, ""}};
    const std::vector<TraineeTarget> targets = LeaveProcessor(*rules).buildTargets(roster, leave);

    const ValidationReport report = validateSchedule(state, *rules, targets, toSerial(YearMonth{2023, 12}));
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.errors.front(), "Trainee 1: length 72 differs from target 74");
}
