///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "conflict_explainer.hpp"
#include "logger.hpp"
#include "rule_evaluator.hpp"
#include <algorithm>
#include <string>
#include <utility>


///////////////////////////
///      EXPLAINER      ///
///////////////////////////
ConflictExplainer::ConflictExplainer(ISolver& solver, ExplainOptions options)
        : solver_(solver), options_(options) {}

std::vector<ConstraintGroup> ConflictExplainer::enumerateGroups(const SolveInput& input) {
    const ScheduleState& state = *input.state;
    const SyllabusRuleSet& rules = *input.rules;
    const std::vector<TraineeTarget>& targets = *input.targets;
    std::vector<ConstraintGroup> out;

    const MonthSerial from = input.boundary + 1;
    MonthSerial to = from;
    for (int t = 0; t < state.traineeCount(); ++t) {
        if (state.trainee(t).active) to = std::max(to, state.calendarMonth(t, 0) + state.length(t));
    }
    std::vector<int> cellsPerMonth(to - from, 0);
    for (int t = 0; t < state.traineeCount(); ++t) {
        if (!state.trainee(t).active) continue;
        for (int i = 0; i < state.length(t); ++i) {
            const MonthSerial m = state.calendarMonth(t, i);
            if (m >= from) cellsPerMonth[m - from]++;
        }
    }

    auto keep = [&](const ConstraintGroup& g) {
        if (!input.disabled.count(g)) out.push_back(g);
    };

    for (int r : rules.capacityRules()) {
        for (MonthSerial m = from; m < to; ++m) {
            if (cellsPerMonth[m - from] == 0) continue;
            const int lo = effectiveMinimum(rules, r, m, input.overrides);
            if (lo == 0 && rules.capacityRule(r).maxOccupancy >= cellsPerMonth[m - from]) continue;
            keep(ConstraintGroup{ConstraintGroup::Kind::Capacity, r, -1, m});
        }
    }
    for (int t = 0; t < state.traineeCount(); ++t) {
        if (!state.trainee(t).active) continue;
        for (int w : rules.windowRules()) {
            if (targets[t].durations[rules.windowRule(w).station] > 0) {
                keep(ConstraintGroup{ConstraintGroup::Kind::Window, w, t, -1});
            }
        }
    }
    for (int t = 0; t < state.traineeCount(); ++t) {
        if (!state.trainee(t).active) continue;
        for (int q : rules.sequenceRules()) {
            const SequenceRule& rule = rules.sequenceRule(q);
            if (targets[t].durations[rule.predecessor] > 0 && targets[t].durations[rule.dependent] > 0) {
                keep(ConstraintGroup{ConstraintGroup::Kind::Sequence, q, t, -1});
            }
        }
    }
    return out;
}

/**
 * @brief Relaxed, node-limited solve with only the kept groups enabled.
 */
ConflictExplainer::Outcome ConflictExplainer::check(const SolveInput& input, const std::vector<ConstraintGroup>& all,
                                                    const std::vector<ConstraintGroup>& kept,
                                                    std::chrono::steady_clock::time_point deadline) const {
    SolveInput trial = input;
    const std::set<ConstraintGroup> keptSet(kept.begin(), kept.end());
    for (const ConstraintGroup& g : all) {
        if (!keptSet.count(g)) trial.disabled.insert(g);
    }

    SolveBudget budget;
    budget.deadline = deadline;
    budget.tryStrict = false;
    budget.relaxedNodeLimit = options_.checkNodeLimit;
    budget.improvementNodeLimit = 0;
    budget.cancel = options_.cancel;

    const SolverOutput out = solver_.solve(trial, budget);
    switch (out.status) {
        case ResolveStatus::ValidState: return Outcome::Feasible;
        case ResolveStatus::Infeasible: return Outcome::Infeasible;
        case ResolveStatus::Timeout: return Outcome::Unknown;
    }
    return Outcome::Unknown;
}

ConflictItem ConflictExplainer::itemFor(const SolveInput& input, const ConstraintGroup& group) const {
    const ScheduleState& state = *input.state;
    const SyllabusRuleSet& rules = *input.rules;
    ConflictItem item;
    item.ruleIndex = group.ruleIndex;
    item.rule = rules.describeRule(group.ruleIndex);

    switch (group.kind) {
        case ConstraintGroup::Kind::Capacity:
            item.reason = ReasonCode::CapacityExceeded;
            item.station = rules.capacityRule(group.ruleIndex).pool.front();
            item.calendarMonth = group.month;
            break;

        case ConstraintGroup::Kind::Window: {
            // Name the first month the window would accept.
            const CalendarWindowRule& rule = rules.windowRule(group.ruleIndex);
            const Trainee& trainee = state.trainee(group.ordinal);
            item.reason = ReasonCode::SyllabusWindowMissed;
            item.traineeId = trainee.id;
            item.station = rule.station;
            for (int i = 0; i < state.length(group.ordinal); ++i) {
                if (windowAllows(rule, trainee, state.length(group.ordinal), i)) {
                    item.monthIndex = i;
                    item.calendarMonth = state.calendarMonth(group.ordinal, i);
                    break;
                }
            }
            break;
        }

        case ConstraintGroup::Kind::Sequence: {
            const SequenceRule& rule = rules.sequenceRule(group.ruleIndex);
            const Trainee& trainee = state.trainee(group.ordinal);
            item.reason = ReasonCode::SequenceViolation;
            item.traineeId = trainee.id;
            item.station = rule.dependent;
            for (const Assignment& a : input.anchors) {
                if (a.traineeId == trainee.id && (a.station == rule.predecessor || a.station == rule.dependent)) {
                    item.monthIndex = a.monthIndex;
                    item.calendarMonth = state.calendarMonth(group.ordinal, a.monthIndex);
                    break;
                }
            }
            break;
        }
    }
    return item;
}

/**
 * @brief Chunked deletion, then anchor attribution.
 *
 * Chunks start at half the candidate groups and halve down to single groups;
 * a chunk whose removal keeps the problem infeasible is dropped for good.
 */
ConflictReport ConflictExplainer::explain(const SolveInput& input) const {
    const auto deadline = std::chrono::steady_clock::now() + options_.budget;
    auto expired = [&]() {
        return std::chrono::steady_clock::now() >= deadline ||
               (options_.cancel != nullptr && options_.cancel->load());
    };

    ConflictReport report;
    report.kind = ErrorKind::Infeasible;

    const std::vector<ConstraintGroup> all = enumerateGroups(input);
    std::vector<ConstraintGroup> core = all;
    int checks = 0;

    const Outcome background = check(input, all, {}, deadline);
    checks++;
    if (background == Outcome::Infeasible) {
        core.clear();
    } else {
        if (background == Outcome::Unknown) report.minimal = false;
        std::size_t chunk = std::max<std::size_t>(1, core.size() / 2);
        bool stopped = false;
        while (!core.empty() && !stopped) {
            std::size_t i = 0;
            while (i < core.size()) {
                if (expired()) {
                    stopped = true;
                    break;
                }
                std::vector<ConstraintGroup> trial(core.begin(), core.begin() + i);
                trial.insert(trial.end(), core.begin() + std::min(core.size(), i + chunk), core.end());

                const Outcome r = check(input, all, trial, deadline);
                checks++;
                if (r == Outcome::Infeasible) {
                    core = std::move(trial);
                } else {
                    if (r == Outcome::Unknown) report.minimal = false;
                    i += chunk;
                }
            }
            if (chunk == 1) break;
            chunk = std::max<std::size_t>(1, chunk / 2);
        }
        if (stopped) report.minimal = false;
    }

    for (const ConstraintGroup& g : core) {
        report.items.push_back(itemFor(input, g));
    }

    // An anchor takes part if releasing it makes the core satisfiable.
    const ScheduleState& state = *input.state;
    for (std::size_t j = 0; j < input.anchors.size(); ++j) {
        const Assignment& a = input.anchors[j];
        const int t = state.ordinalOf(a.traineeId);
        if (t < 0) continue;
        const MonthSerial month = state.calendarMonth(t, a.monthIndex);
        if (month <= input.boundary && state.at(t, a.monthIndex) != kNoStation) continue;
        if (expired()) {
            report.minimal = false;
            break;
        }

        SolveInput released = input;
        released.anchors.erase(released.anchors.begin() + j);
        const Outcome r = check(released, all, core, deadline);
        checks++;
        if (r == Outcome::Feasible) {
            ConflictItem item;
            item.traineeId = a.traineeId;
            item.monthIndex = a.monthIndex;
            item.calendarMonth = month;
            item.station = a.station;
            item.reason = ReasonCode::AnchorConflict;
            item.rule = "anchor " + input.rules->station(a.station).key;
            report.items.push_back(item);
        } else if (r == Outcome::Unknown) {
            report.minimal = false;
        }
    }

    if (report.items.empty()) {
        report.reason = ReasonCode::AnchorConflict;
        report.message = "pinned months (history, leave or anchors) cannot be completed to the syllabus";
    } else {
        report.reason = report.items.front().reason;
        report.message = std::to_string(report.items.size()) + " conflicting constraint(s), first: " +
                         reasonCodeName(report.reason) + " " + report.items.front().rule;
    }
    Logger::Debug("explainer: " + std::to_string(checks) + " checks, " + std::to_string(core.size()) +
                  " groups in core" + (report.minimal ? "" : " (not minimal)"));
    return report;
}
