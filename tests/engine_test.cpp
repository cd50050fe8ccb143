///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "engine.hpp"
#include "config.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>


///////////////////////////
///       FIXTURE       ///
///////////////////////////
namespace {

class EngineTest : public ::testing::Test {
protected:
    RuleCatalog catalog;
    RuleSetPtr rules;
    std::unique_ptr<RotationEngine> engine;

    void SetUp() override {
        catalog.insert(defaultRuleSet(1, YearMonth{2020, 1}));
        rules = catalog.byVersion(1);
        engine = std::make_unique<RotationEngine>(catalog, EngineConfig{});
    }

    StationId id(const std::string& key) const { return sid(*rules, key); }

    static YearMonth beforeStart() { return YearMonth{2023, 12}; }
};

} // namespace


///////////////////////////
///       RESOLVE       ///
///////////////////////////
TEST_F(EngineTest, PlansASingleTrainee) {
    const ResolveResult result = engine->resolve(planRequest({traineeA(1, Department::A, {2024, 1})}, beforeStart()));

    ASSERT_EQ(result.status, ResolveStatus::ValidState);
    ASSERT_TRUE(result.state.has_value());
    EXPECT_FALSE(result.conflict.has_value());
    EXPECT_TRUE(result.validation.ok());
    EXPECT_EQ(result.ruleSetVersion, 1);
    EXPECT_EQ(result.state->ruleSetVersion(), 1);
    EXPECT_EQ(result.state->committedThrough(), toSerial(beforeStart()));
    EXPECT_FALSE(result.capacity.empty());
    EXPECT_TRUE(result.audit.empty());

    const int stageA = firstIndexOf(*result.state, 0, id("stage_a"));
    const int stageB = firstIndexOf(*result.state, 0, id("stage_b"));
    EXPECT_TRUE(stageA == 41 || stageA == 53) << stageA;
    EXPECT_TRUE(stageB == 62 || stageB == 70) << stageB;
}

TEST_F(EngineTest, SameRequestSameSchedule) {
    const ResolveRequest request = planRequest({traineeA(1, Department::A, {2024, 1}),
                                                traineeB(2, Department::B, {2024, 5})}, beforeStart());
    const ResolveResult first = engine->resolve(request);
    const ResolveResult second = engine->resolve(request);

    ASSERT_EQ(first.status, ResolveStatus::ValidState);
    ASSERT_EQ(second.status, ResolveStatus::ValidState);
    EXPECT_TRUE(first.state->sameMatrix(*second.state));
}

TEST_F(EngineTest, ZeroBudgetTimesOut) {
    ResolveRequest request = planRequest({traineeA(1, Department::A, {2024, 1})}, beforeStart());
    request.timeBudget = std::chrono::milliseconds(0);

    const ResolveResult result = engine->resolve(request);
    EXPECT_EQ(result.status, ResolveStatus::Timeout);
    EXPECT_FALSE(result.state.has_value());
    EXPECT_FALSE(result.conflict.has_value());
}

TEST_F(EngineTest, PresetCancelTimesOut) {
    std::atomic<bool> cancel{true};
    const ResolveResult result =
            engine->resolve(planRequest({traineeA(1, Department::A, {2024, 1})}, beforeStart()), &cancel);
    EXPECT_EQ(result.status, ResolveStatus::Timeout);
    EXPECT_FALSE(result.state.has_value());
}

TEST_F(EngineTest, ReplanKeepsHistoryAndHonoursANewAnchor) {
    const ResolveResult plan = engine->resolve(planRequest({traineeA(1, Department::A, {2024, 1})}, beforeStart()));
    ASSERT_EQ(plan.status, ResolveStatus::ValidState);

    ResolveRequest replan;
    replan.state = *plan.state;
    replan.currentMonth = YearMonth{2025, 6};
    replan.anchors = {Assignment{1, 53, id("stage_a")}};
    replan.actor = "coordinator";
    replan.timestamp = "2025-06-02T10:00:00Z";

    const ResolveResult result = engine->resolve(replan);
    ASSERT_EQ(result.status, ResolveStatus::ValidState);
    for (int i = 0; i <= 17; ++i) EXPECT_EQ(result.state->at(0, i), plan.state->at(0, i)) << i;
    EXPECT_EQ(result.state->at(0, 53), id("stage_a"));
    EXPECT_EQ(monthsAt(*result.state, 0, id("stage_a")), 1);
    EXPECT_EQ(result.state->anchors().size(), 1u);

    ASSERT_EQ(result.audit.size(), 1u);
    EXPECT_EQ(result.audit[0].action, "anchor");
    EXPECT_EQ(result.audit[0].actor, "coordinator");
    EXPECT_EQ(result.audit[0].newStation, "stage_a");
    EXPECT_EQ(result.audit[0].month, "2028-06");
    EXPECT_FALSE(result.audit[0].bypassesHardConstraint);
}

TEST_F(EngineTest, WithinSyllabusLeaveShortensTheDepartmentAllotment) {
    ResolveRequest request = planRequest({traineeA(1, Department::A, {2024, 1})}, beforeStart());
    request.leaveEvents = {LeaveEvent{1, {2025, 7}, 8, LeaveClass::WithinSyllabus, "maternity"}};

    const ResolveResult result = engine->resolve(request);
    ASSERT_EQ(result.status, ResolveStatus::ValidState);
    EXPECT_EQ(result.state->length(0), 74);
    EXPECT_EQ(monthsAt(*result.state, 0, rules->leaveStation()), 8);
    EXPECT_EQ(monthsAt(*result.state, 0, rules->allotmentStation()), 8);
    EXPECT_EQ(result.targets[0].allotment, 8);
    EXPECT_EQ(result.state->leaveEvents().size(), 1u);
}

TEST_F(EngineTest, ClashingAnchorsAreRejectedBeforeSearch) {
    ResolveRequest request = planRequest({traineeA(1, Department::A, {2024, 1})}, beforeStart());
    request.anchors = {Assignment{1, 14, id("birth")}, Assignment{1, 14, id("ivf")}};

    const ResolveResult result = engine->resolve(request);
    EXPECT_EQ(result.status, ResolveStatus::Infeasible);
    EXPECT_FALSE(result.state.has_value());
    ASSERT_TRUE(result.conflict.has_value());
    EXPECT_TRUE(result.conflict->preSearch);
    EXPECT_EQ(result.conflict->kind, ErrorKind::AnchorConflict);
    ASSERT_EQ(result.conflict->items.size(), 1u);
    EXPECT_EQ(result.conflict->items[0].station, id("ivf"));
    EXPECT_EQ(result.conflict->items[0].rule, "anchor clashes with anchor birth");
}

TEST_F(EngineTest, LateRotationAnchorIsExplained) {
    ResolveRequest request = planRequest({traineeA(1, Department::A, {2024, 1})}, beforeStart());
    request.anchors = {Assignment{1, 60, id("rotation_a")}};

    const ResolveResult result = engine->resolve(request);
    ASSERT_EQ(result.status, ResolveStatus::Infeasible);
    ASSERT_TRUE(result.conflict.has_value());
    EXPECT_FALSE(result.conflict->preSearch);

    const std::vector<ConflictItem>& items = result.conflict->items;
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].reason, ReasonCode::SyllabusWindowMissed);
    EXPECT_EQ(items[1].reason, ReasonCode::SequenceViolation);
    EXPECT_EQ(items[2].reason, ReasonCode::AnchorConflict);
    EXPECT_EQ(items[2].monthIndex, 60);
}

TEST_F(EngineTest, UnreachableCapacityFloorIsExplained) {
    RuleCatalog strict;
    strict.insert(ruleSetFromJson(nlohmann::json::parse(R"({
        "version": 3, "effective_from": "2020-01", "stock": true,
        "capacity_bounds": [{"station": "birth", "min": 2, "max": 2}]
    })")));
    RotationEngine strictEngine(strict, EngineConfig{});

    const ResolveResult result =
            strictEngine.resolve(planRequest({traineeA(1, Department::A, {2024, 1})}, beforeStart()));
    ASSERT_EQ(result.status, ResolveStatus::Infeasible);
    ASSERT_TRUE(result.conflict.has_value());
    EXPECT_EQ(result.ruleSetVersion, 3);
    EXPECT_TRUE(hasReason(*result.conflict, ReasonCode::CapacityExceeded));
    EXPECT_EQ(result.conflict->items.front().station, id("birth"));
}

TEST_F(EngineTest, OverridesAreAuditedAsBypasses) {
    ResolveRequest request = planRequest({traineeA(1, Department::A, {2024, 1})}, beforeStart());
    request.overrides = {CapacityOverride{id("birth"), {2025, 3}, 0, "chief", "two trainees on sick leave"}};

    const ResolveResult result = engine->resolve(request);
    ASSERT_EQ(result.status, ResolveStatus::ValidState);
    ASSERT_EQ(result.audit.size(), 1u);
    EXPECT_EQ(result.audit[0].action, "capacity_override");
    EXPECT_EQ(result.audit[0].actor, "chief");
    EXPECT_TRUE(result.audit[0].bypassesHardConstraint);
    EXPECT_EQ(result.audit[0].justification, "two trainees on sick leave");
    EXPECT_EQ(result.audit[0].month, "2025-03");
}

TEST_F(EngineTest, CallerErrorsThrow) {
    ResolveRequest request = planRequest({traineeA(1, Department::A, {2024, 1})}, beforeStart());
    request.overrides = {CapacityOverride{id("birth"), {2025, 3}, 0, "chief", "   "}};
    EXPECT_THROW(engine->resolve(request), std::invalid_argument);

    request.overrides.clear();
    request.anchors = {Assignment{1, 14, id("birth")}};
    request.actor.clear();
    EXPECT_THROW(engine->resolve(request), std::invalid_argument);

    request = planRequest({traineeA(1, Department::A, {2024, 1})}, beforeStart());
    request.leaveEvents = {LeaveEvent{7, {2025, 1}, 2, LeaveClass::Extension, ""}};
    EXPECT_THROW(engine->resolve(request), std::invalid_argument);

    request = planRequest({traineeA(1, Department::A, {2024, 1})}, beforeStart());
    request.ruleSetVersion = 9;
    EXPECT_THROW(engine->resolve(request), UnknownRuleSetVersion);

    request = planRequest({traineeA(1, Department::A, {2024, 1})}, YearMonth{2019, 12});
    EXPECT_THROW(engine->resolve(request), NoRuleSetForDate);
}


///////////////////////////
///    VALIDATE MOVE    ///
///////////////////////////
TEST_F(EngineTest, OtherDepartmentStationIsAnAnchorConflict) {
    const ScheduleState state({traineeA(1, Department::A, {2024, 1})});
    const auto report = engine->validateMove(state, Assignment{1, 10, id("hrp_b")}, beforeStart());

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->kind, ErrorKind::AnchorConflict);
    EXPECT_TRUE(report->preSearch);
    ASSERT_EQ(report->items.size(), 1u);
    EXPECT_EQ(report->items[0].monthIndex, 10);
    EXPECT_EQ(report->items[0].station, id("hrp_b"));
    EXPECT_NE(report->message.find("month 10"), std::string::npos);
    EXPECT_NE(report->message.find("hrp_b"), std::string::npos);

    EXPECT_FALSE(engine->validateMove(state, Assignment{1, 10, id("hrp_a")}, beforeStart()).has_value());
}

TEST_F(EngineTest, PastAndLeaveMonthsCannotBeMoved) {
    ScheduleState state({traineeA(1, Department::A, {2024, 1})});
    state.set(0, 0, id("orientation"));
    state.setLeaveEvents({LeaveEvent{1, {2025, 7}, 8, LeaveClass::WithinSyllabus, "maternity"}});

    const auto past = engine->validateMove(state, Assignment{1, 0, id("birth")}, YearMonth{2024, 6});
    ASSERT_TRUE(past.has_value());
    EXPECT_EQ(past->kind, ErrorKind::AnchorConflict);
    EXPECT_EQ(past->items[0].rule, "anchor differs from committed orientation");

    const auto onLeave = engine->validateMove(state, Assignment{1, 20, id("birth")}, YearMonth{2024, 6});
    ASSERT_TRUE(onLeave.has_value());
    EXPECT_EQ(onLeave->items[0].rule, "anchor on a leave month");

    EXPECT_FALSE(engine->validateMove(state, Assignment{1, 0, id("orientation")}, YearMonth{2024, 6}).has_value());
}

TEST_F(EngineTest, ExamOutsideItsWindowIsAHardRuleViolation) {
    const ScheduleState state({traineeA(1, Department::A, {2024, 1})});
    const auto report = engine->validateMove(state, Assignment{1, 40, id("stage_a")}, beforeStart());

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->kind, ErrorKind::RuleViolationHard);
    EXPECT_EQ(report->reason, ReasonCode::SyllabusWindowMissed);
    EXPECT_FALSE(engine->validateMove(state, Assignment{1, 41, id("stage_a")}, beforeStart()).has_value());
}

TEST_F(EngineTest, PinnedMonthsBeyondTheDurationConflict) {
    ScheduleState state({traineeA(1, Department::A, {2024, 1})});
    state.setAnchors({Assignment{1, 30, id("gyneco_oncology")}, Assignment{1, 31, id("gyneco_oncology")}});

    const auto report = engine->validateMove(state, Assignment{1, 32, id("gyneco_oncology")}, beforeStart());
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->kind, ErrorKind::AnchorConflict);
    EXPECT_EQ(report->items[0].monthIndex, 32);

    // Replacing one of the two anchors keeps the count at two.
    EXPECT_FALSE(engine->validateMove(state, Assignment{1, 31, id("gyneco_oncology")}, beforeStart()).has_value());
}

TEST_F(EngineTest, FullSingleSeatStationIsCapacityExceeded) {
    ScheduleState state({traineeA(1, Department::A, {2024, 1}), traineeA(2, Department::B, {2024, 1})});
    state.setAnchors({Assignment{1, 60, id("maternity_er_supervisor")}});

    const auto report = engine->validateMove(state, Assignment{2, 60, id("maternity_er_supervisor")}, beforeStart());
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->kind, ErrorKind::CapacityExceeded);
    EXPECT_EQ(report->items[0].calendarMonth, toSerial(YearMonth{2029, 1}));

    EXPECT_FALSE(engine->validateMove(state, Assignment{2, 61, id("maternity_er_supervisor")}, beforeStart())
                         .has_value());
}

TEST_F(EngineTest, SupervisorBeforeStageAIsASequenceViolation) {
    ScheduleState state({traineeA(1, Department::A, {2024, 1})});
    state.setAnchors({Assignment{1, 41, id("stage_a")}});

    const auto report = engine->validateMove(state, Assignment{1, 30, id("maternity_er_supervisor")}, beforeStart());
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->kind, ErrorKind::RuleViolationHard);
    EXPECT_EQ(report->reason, ReasonCode::SequenceViolation);
    EXPECT_EQ(report->items[0].monthIndex, 30);
}
