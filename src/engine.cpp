///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "engine.hpp"
#include "backtracking_solver.hpp"
#include "conflict_explainer.hpp"
#include "logger.hpp"
#include "rule_evaluator.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

ErrorKind kindFor(ReasonCode reason) {
    switch (reason) {
        case ReasonCode::CapacityExceeded: return ErrorKind::CapacityExceeded;
        case ReasonCode::AnchorConflict: return ErrorKind::AnchorConflict;
        case ReasonCode::SyllabusWindowMissed:
        case ReasonCode::SequenceViolation: return ErrorKind::RuleViolationHard;
    }
    return ErrorKind::RuleViolationHard;
}

/**
 * @brief "Name month 14 (2025-03) hrp_b: rule" for the first item of a report.
 */
std::string describeItem(const ScheduleState& state, const SyllabusRuleSet& rules, const ConflictItem& item) {
    std::string out;
    const int t = state.ordinalOf(item.traineeId);
    if (t >= 0) out += state.trainee(t).name;
    else if (item.traineeId >= 0) out += "trainee " + std::to_string(item.traineeId);

    if (item.monthIndex >= 0) out += (out.empty() ? "" : " ") + std::string("month ") + std::to_string(item.monthIndex);
    if (item.calendarMonth > 0) out += " (" + formatYearMonth(fromSerial(item.calendarMonth)) + ")";
    if (item.station < rules.stationCount()) out += " " + rules.station(item.station).key;
    return out + ": " + item.rule;
}

ConflictReport preSearchReport(ErrorKind kind, std::vector<ConflictItem> items, const ScheduleState& state,
                               const SyllabusRuleSet& rules) {
    ConflictReport report;
    report.kind = kind;
    report.reason = items.front().reason;
    report.preSearch = true;
    report.minimal = true;
    report.message = std::string(reasonCodeName(report.reason)) + " " + describeItem(state, rules, items.front());
    report.items = std::move(items);
    return report;
}

std::string stationKey(const SyllabusRuleSet& rules, StationId id) {
    return id < rules.stationCount() ? rules.station(id).key : std::string();
}

bool blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

/**
 * @brief Copy of a state resized to the revised target lengths.
 */
ScheduleState withTargetLengths(const ScheduleState& state, const std::vector<TraineeTarget>& targets) {
    ScheduleState out = state;
    for (int t = 0; t < out.traineeCount(); ++t) {
        if (out.length(t) != targets[t].length) out.resizeTrainee(t, targets[t].length);
    }
    return out;
}

/**
 * @brief Only the pinned cells of a state: history, leave and anchors.
 */
ScheduleState pinnedCells(const ScheduleState& state, const SyllabusRuleSet& rules,
                          const std::vector<TraineeTarget>& targets, const std::vector<Assignment>& anchors,
                          MonthSerial boundary) {
    ScheduleState out = state;
    for (int t = 0; t < out.traineeCount(); ++t) {
        for (int i = 0; i < out.length(t); ++i) {
            if (out.calendarMonth(t, i) > boundary) out.set(t, i, kNoStation);
        }
        for (const LeaveMonth& m : targets[t].leaveMonths) out.set(t, m.monthIndex, rules.leaveStation());
    }
    for (const Assignment& a : anchors) {
        const int t = out.ordinalOf(a.traineeId);
        if (t >= 0 && a.monthIndex >= 0 && a.monthIndex < out.length(t)) out.set(t, a.monthIndex, a.station);
    }
    return out;
}

} // namespace


///////////////////////////
///     PIN CHECKS      ///
///////////////////////////
/**
 * @brief Walk history, then leave, then anchors, pinning cells as they pass.
 *
 * Each anchor is checked against what is already pinned, so the first of
 * two disagreeing anchors stands and the second is reported.
 */
std::vector<ConflictItem> pinConflicts(const ScheduleState& state, const SyllabusRuleSet& rules,
                                       const std::vector<TraineeTarget>& targets,
                                       const std::vector<Assignment>& anchors, MonthSerial boundary) {
    std::vector<ConflictItem> items;
    auto add = [&](int traineeId, int monthIndex, MonthSerial month, StationId station, ReasonCode reason,
                   int ruleIndex, std::string rule) {
        items.push_back(ConflictItem{traineeId, monthIndex, month, station, reason, ruleIndex, std::move(rule)});
    };

    const int T = state.traineeCount();
    std::vector<std::vector<StationId>> pinned(T);
    std::vector<std::vector<char>> anchored(T);

    for (int t = 0; t < T; ++t) {
        const Trainee& trainee = state.trainee(t);
        if (!trainee.active) continue;
        pinned[t].assign(state.length(t), kNoStation);
        anchored[t].assign(state.length(t), 0);

        for (int i = 0; i < state.length(t); ++i) {
            if (state.calendarMonth(t, i) <= boundary) pinned[t][i] = state.at(t, i);
        }
        for (const LeaveMonth& m : targets[t].leaveMonths) {
            const StationId prior = pinned[t][m.monthIndex];
            if (prior != kNoStation && prior != rules.leaveStation()) {
                add(trainee.id, m.monthIndex, state.calendarMonth(t, m.monthIndex), prior, ReasonCode::AnchorConflict,
                    -1, "leave over a committed " + stationKey(rules, prior) + " month");
                continue;
            }
            pinned[t][m.monthIndex] = rules.leaveStation();
        }
    }

    for (const Assignment& a : anchors) {
        const int t = state.ordinalOf(a.traineeId);
        if (t < 0 || !state.trainee(t).active) {
            add(a.traineeId, a.monthIndex, 0, a.station, ReasonCode::AnchorConflict, -1,
                "anchor names an unknown or inactive trainee");
            continue;
        }
        const Trainee& trainee = state.trainee(t);
        if (a.monthIndex < 0 || a.monthIndex >= state.length(t)) {
            add(a.traineeId, a.monthIndex, 0, a.station, ReasonCode::AnchorConflict, -1,
                "anchor outside the program (" + std::to_string(state.length(t)) + " months)");
            continue;
        }
        const MonthSerial month = state.calendarMonth(t, a.monthIndex);
        if (a.station >= rules.stationCount()) {
            add(a.traineeId, a.monthIndex, month, a.station, ReasonCode::AnchorConflict, -1,
                "anchor names an unknown station");
            continue;
        }
        if (a.station == rules.leaveStation()) {
            add(a.traineeId, a.monthIndex, month, a.station, ReasonCode::AnchorConflict, -1,
                "leave months are set by leave events only");
            continue;
        }
        if (targets[t].isLeave(a.monthIndex)) {
            add(a.traineeId, a.monthIndex, month, a.station, ReasonCode::AnchorConflict, -1,
                "anchor on a leave month");
            continue;
        }

        const StationId prior = pinned[t][a.monthIndex];
        if (prior != kNoStation && prior != a.station) {
            const bool past = month <= boundary && !anchored[t][a.monthIndex];
            add(a.traineeId, a.monthIndex, month, a.station, ReasonCode::AnchorConflict, -1,
                past ? "anchor differs from committed " + stationKey(rules, prior)
                     : "anchor clashes with anchor " + stationKey(rules, prior));
            continue;
        }
        if (!rules.eligible(a.station, trainee.track, trainee.department)) {
            add(a.traineeId, a.monthIndex, month, a.station, ReasonCode::AnchorConflict, -1,
                "not eligible for department " + std::string(departmentName(trainee.department)) + ", " +
                        trackName(trainee.track));
            continue;
        }

        bool windowed = true;
        const bool history = month <= boundary && prior == a.station && !anchored[t][a.monthIndex];
        for (int w : rules.windowRules()) {
            const CalendarWindowRule& rule = rules.windowRule(w);
            if (rule.station != a.station || history) continue;
            if (!windowAllows(rule, trainee, state.length(t), a.monthIndex)) {
                add(a.traineeId, a.monthIndex, month, a.station, ReasonCode::SyllabusWindowMissed, w,
                    rules.describeRule(w));
                windowed = false;
            }
        }
        if (!windowed) continue;

        pinned[t][a.monthIndex] = a.station;
        anchored[t][a.monthIndex] = 1;
    }

    // Pinned months beyond a station's duration.
    for (int t = 0; t < T; ++t) {
        const Trainee& trainee = state.trainee(t);
        if (!trainee.active) continue;
        for (StationId s = 0; s < rules.stationCount(); ++s) {
            if (s == rules.leaveStation()) continue;
            const int need = targets[t].durations[s];
            int count = 0;
            for (int i = 0; i < state.length(t); ++i) {
                if (pinned[t][i] != s) continue;
                if (++count != need + 1) continue;
                int ruleIndex = -1;
                for (int r = 0; r < (int)rules.rules().size(); ++r) {
                    const auto* d = std::get_if<DurationRule>(&rules.rules()[r]);
                    if (d != nullptr && d->station == s && d->track == trainee.track) ruleIndex = r;
                }
                add(trainee.id, i, state.calendarMonth(t, i), s, ReasonCode::AnchorConflict, ruleIndex,
                    "pinned months exceed the " + std::to_string(need) + " required at " + stationKey(rules, s));
            }
        }
    }
    return items;
}


///////////////////////////
///       ENGINE        ///
///////////////////////////
RotationEngine::RotationEngine(const RuleCatalog& catalog, EngineConfig config)
        : catalog_(catalog), config_(config) {
    if (config_.debug) Logger::SetDebug(true);
}

RuleSetPtr RotationEngine::ruleSetFor(int version, const YearMonth& currentMonth) const {
    return version >= 0 ? catalog_.byVersion(version) : catalog_.effectiveRuleSet(currentMonth);
}

/**
 * @brief Pin checks for the proposal's trainee, then capacity and sequence
 *        rules over the pinned cells only.
 */
std::optional<ConflictReport> RotationEngine::validateMove(const ScheduleState& state, const Assignment& proposal,
                                                           const YearMonth& currentMonth) const {
    const RuleSetPtr rules = ruleSetFor(state.ruleSetVersion(), currentMonth);
    const MonthSerial boundary = toSerial(currentMonth);

    LeaveProcessor leave(*rules);
    const std::vector<TraineeTarget> targets = leave.buildTargets(state.roster(), state.leaveEvents());
    const ScheduleState work = withTargetLengths(state, targets);

    std::vector<Assignment> anchors;
    for (const Assignment& a : state.anchors()) {
        if (a.traineeId != proposal.traineeId || a.monthIndex != proposal.monthIndex) anchors.push_back(a);
    }
    anchors.push_back(proposal);

    std::vector<ConflictItem> items;
    for (ConflictItem& item : pinConflicts(work, *rules, targets, anchors, boundary)) {
        if (item.traineeId == proposal.traineeId) items.push_back(std::move(item));
    }
    if (!items.empty()) return preSearchReport(kindFor(items.front().reason), std::move(items), work, *rules);

    const int t = work.ordinalOf(proposal.traineeId);
    const MonthSerial month = work.calendarMonth(t, proposal.monthIndex);
    const ScheduleState pins = pinnedCells(work, *rules, targets, anchors, boundary);
    const CapacityTracker capacity = CapacityTracker::fromState(*rules, pins);
    const RuleEvaluator evaluator(pins, *rules, targets, capacity, boundary, EvaluationMode::Pinned);

    for (int r : rules->capacityRules()) {
        const CapacityRule& rule = rules->capacityRule(r);
        if (std::find(rule.pool.begin(), rule.pool.end(), proposal.station) == rule.pool.end()) continue;
        for (const RuleViolation& v : evaluator.evaluate(r)) {
            if (v.month != month) continue;
            items.push_back(ConflictItem{-1, -1, v.month, proposal.station, ReasonCode::CapacityExceeded, r,
                                         rules->describeRule(r)});
        }
    }
    for (int q : rules->sequenceRules()) {
        const SequenceRule& rule = rules->sequenceRule(q);
        if (rule.predecessor != proposal.station && rule.dependent != proposal.station) continue;
        for (const RuleViolation& v : evaluator.evaluate(q)) {
            if (v.ordinal != t) continue;
            items.push_back(ConflictItem{proposal.traineeId, proposal.monthIndex, month, proposal.station,
                                         ReasonCode::SequenceViolation, q, rules->describeRule(q)});
        }
    }
    if (items.empty()) return std::nullopt;
    return preSearchReport(kindFor(items.front().reason), std::move(items), work, *rules);
}

/**
 * @brief Targets, pin checks, search, then diagnosis or summaries.
 */
ResolveResult RotationEngine::resolve(const ResolveRequest& request, const std::atomic<bool>* cancel) const {
    const auto started = std::chrono::steady_clock::now();
    const RuleSetPtr rules = ruleSetFor(request.ruleSetVersion, request.currentMonth);
    const MonthSerial boundary = toSerial(request.currentMonth);

    for (const CapacityOverride& o : request.overrides) {
        if (blank(o.justification)) {
            throw std::invalid_argument("capacity override of " + stationKey(*rules, o.station) + " in " +
                                        formatYearMonth(o.month) + " needs a justification");
        }
        if (o.station >= rules->stationCount()) {
            throw std::invalid_argument("capacity override names an unknown station");
        }
    }

    ResolveResult result;
    result.ruleSetVersion = rules->version();

    // Overrides to record: new or changed anchors, then capacity overrides.
    const ScheduleState& prior = request.state;
    for (const Assignment& a : request.anchors) {
        const int t = prior.ordinalOf(a.traineeId);
        if (t < 0 || a.monthIndex < 0) continue;
        const std::optional<StationId> before = prior.anchorAt(t, a.monthIndex);
        if (before && *before == a.station) continue;

        AuditEntry entry;
        entry.actor = request.actor;
        entry.timestamp = request.timestamp;
        entry.action = "anchor";
        entry.traineeId = a.traineeId;
        entry.monthIndex = a.monthIndex;
        entry.month = formatYearMonth(fromSerial(prior.calendarMonth(t, a.monthIndex)));
        entry.priorStation = stationKey(*rules, before ? *before : prior.at(t, a.monthIndex));
        entry.newStation = stationKey(*rules, a.station);
        entry.ruleSetVersion = rules->version();
        result.audit.push_back(entry);
    }
    for (const CapacityOverride& o : request.overrides) {
        AuditEntry entry;
        entry.actor = o.actor;
        entry.timestamp = request.timestamp;
        entry.action = "capacity_override";
        entry.month = formatYearMonth(o.month);
        entry.newStation = stationKey(*rules, o.station);
        entry.bypassesHardConstraint = true;
        entry.justification = o.justification;
        entry.ruleSetVersion = rules->version();
        result.audit.push_back(entry);
    }
    for (const AuditEntry& e : result.audit) {
        if (e.actor.empty()) {
            throw std::invalid_argument("anchors and overrides need an actor for the audit log");
        }
    }

    LeaveProcessor leave(*rules);
    result.targets = leave.buildTargets(prior.roster(), request.leaveEvents);
    ScheduleState input = withTargetLengths(prior, result.targets);
    input.setLeaveEvents(request.leaveEvents);

    std::vector<ConflictItem> pins = pinConflicts(input, *rules, result.targets, request.anchors, boundary);
    if (!pins.empty()) {
        result.status = ResolveStatus::Infeasible;
        result.conflict = preSearchReport(ErrorKind::AnchorConflict, std::move(pins), input, *rules);
        Logger::Warn("resolve rejected before search: " + result.conflict->message);
        return result;
    }

    SolveInput solveInput;
    solveInput.state = &input;
    solveInput.rules = rules.get();
    solveInput.targets = &result.targets;
    solveInput.anchors = request.anchors;
    solveInput.boundary = boundary;
    solveInput.overrides = request.overrides;

    const std::chrono::milliseconds timeBudget =
            request.timeBudget ? *request.timeBudget : std::chrono::milliseconds(config_.timeBudgetMs);
    SolveBudget budget;
    budget.deadline = started + timeBudget;
    budget.strictNodeLimit = config_.strictNodeLimit;
    budget.relaxedNodeLimit = config_.relaxedNodeLimit;
    budget.improvementNodeLimit = config_.improvementNodeLimit;
    budget.cancel = cancel;

    BacktrackingSolver solver;
    SolverOutput out = solver.solve(solveInput, budget);
    result.status = out.status;
    result.stats = out.stats;
    Logger::Info("resolve: " + std::string(resolveStatusName(out.status)) + " after " +
                 std::to_string(out.stats.nodes) + " nodes (" + continuityLevelName(out.stats.level) + ")");

    if (out.status == ResolveStatus::Infeasible) {
        ExplainOptions options;
        options.budget = std::chrono::milliseconds(config_.explainBudgetMs);
        options.checkNodeLimit = config_.explainNodeLimit;
        options.cancel = cancel;
        ConflictExplainer explainer(solver, options);
        result.conflict = explainer.explain(solveInput);
        Logger::Warn("resolve infeasible: " + result.conflict->message);
        return result;
    }
    if (!out.state) {
        Logger::Warn("resolve stopped without a schedule: " + out.detail);
        return result;
    }

    ScheduleState state = std::move(*out.state);
    state.setCommittedThrough(boundary);
    state.setRuleSetVersion(rules->version());

    const CapacityTracker capacity = CapacityTracker::fromState(*rules, state, request.overrides);
    result.capacity = capacity.summary(boundary, capacity.horizonEnd());
    result.bottlenecks = capacity.bottlenecks(boundary, config_.bottleneckLookahead);
    result.validation = validateSchedule(state, *rules, result.targets, boundary, request.overrides);
    if (!result.validation.ok()) {
        // The solver validates every matrix it returns; reaching this is a defect.
        throw std::logic_error("solver returned an invalid schedule: " + result.validation.summary());
    }
    result.state = std::move(state);
    return result;
}
