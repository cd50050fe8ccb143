///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "rule_evaluator.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <variant>


///////////////////////////
///       WINDOWS       ///
///////////////////////////
bool windowAllows(const CalendarWindowRule& rule, const Trainee& trainee, int length, int monthIndex) {
    if (monthIndex < rule.minIndex) return false;
    if (rule.maxIndex >= 0 && monthIndex > rule.maxIndex) return false;
    if (rule.maxFromEnd >= 0 && length - monthIndex > rule.maxFromEnd) return false;
    if (rule.calendarMonths.empty()) return true;

    const int calendar = calendarMonthOf(toSerial(trainee.start) + monthIndex);
    return std::find(rule.calendarMonths.begin(), rule.calendarMonths.end(), calendar) != rule.calendarMonths.end();
}


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief Per-kind checks, dispatched by std::visit.
 */
struct RuleEvaluator::Visitor {
    const RuleEvaluator& ev;
    int ruleIndex;
    std::vector<RuleViolation>& out;

    void add(int ordinal, int monthIndex, MonthSerial month, StationId station, std::string message) const {
        out.push_back(RuleViolation{ruleIndex, ordinal, monthIndex, month, station, std::move(message)});
    }

    void operator()(const DurationRule& rule) const {
        const ScheduleState& state = ev.state_;
        const std::string key = ev.rules_.station(rule.station).key;
        for (int t = 0; t < state.traineeCount(); ++t) {
            const Trainee& trainee = state.trainee(t);
            if (!trainee.active || trainee.track != rule.track) continue;

            int count = 0;
            for (int i = 0; i < state.length(t); ++i) {
                if (state.at(t, i) == rule.station) count++;
            }
            const int need = ev.targets_[t].durations[rule.station];
            const bool broken = ev.mode_ == EvaluationMode::Complete ? count != need : count > need;
            if (broken) {
                add(t, -1, 0, rule.station,
                    trainee.name + ": " + std::to_string(count) + " months at " + key + ", needs " +
                    std::to_string(need));
            }
        }
    }

    void operator()(const CapacityRule& rule) const {
        const CapacityTracker& cap = ev.capacity_;
        const MonthSerial from = std::max(ev.boundary_ + 1, cap.horizonStart());
        for (MonthSerial m = from; m < cap.horizonEnd(); ++m) {
            const int occ = cap.poolOccupancy(ruleIndex, m);
            const int lo = cap.minFor(ruleIndex, m);
            const bool over = occ > rule.maxOccupancy;
            const bool under = ev.mode_ == EvaluationMode::Complete && occ < lo;
            if (over || under) {
                add(-1, -1, m, rule.pool.front(),
                    ev.rules_.describeRule(ruleIndex) + " has " + std::to_string(occ) + " in " +
                    formatYearMonth(fromSerial(m)));
            }
        }
    }

    void operator()(const SequenceRule& rule) const {
        const ScheduleState& state = ev.state_;
        for (int t = 0; t < state.traineeCount(); ++t) {
            if (!state.trainee(t).active) continue;
            int lastPred = -1;
            int firstDep = -1;
            for (int i = 0; i < state.length(t); ++i) {
                StationId s = state.at(t, i);
                if (s == rule.predecessor) lastPred = i;
                if (s == rule.dependent && firstDep < 0) firstDep = i;
            }
            if (lastPred >= 0 && firstDep >= 0 && firstDep < lastPred) {
                add(t, firstDep, state.calendarMonth(t, firstDep), rule.dependent,
                    state.trainee(t).name + ": " + ev.rules_.station(rule.dependent).key + " at month " +
                    std::to_string(firstDep) + " precedes " + ev.rules_.station(rule.predecessor).key +
                    " at month " + std::to_string(lastPred));
            }
        }
    }

    void operator()(const CalendarWindowRule& rule) const {
        const ScheduleState& state = ev.state_;
        for (int t = 0; t < state.traineeCount(); ++t) {
            const Trainee& trainee = state.trainee(t);
            if (!trainee.active) continue;
            for (int i = 0; i < state.length(t); ++i) {
                if (state.at(t, i) != rule.station) continue;
                const MonthSerial m = state.calendarMonth(t, i);
                if (m <= ev.boundary_) continue;
                if (!windowAllows(rule, trainee, state.length(t), i)) {
                    add(t, i, m, rule.station,
                        trainee.name + ": " + ev.rules_.station(rule.station).key + " in " +
                        formatYearMonth(fromSerial(m)) + " is outside its window");
                }
            }
        }
    }
};

RuleEvaluator::RuleEvaluator(const ScheduleState& state, const SyllabusRuleSet& rules,
                             const std::vector<TraineeTarget>& targets, const CapacityTracker& capacity,
                             MonthSerial boundary, EvaluationMode mode)
        : state_(state), rules_(rules), targets_(targets), capacity_(capacity), boundary_(boundary), mode_(mode) {}

std::vector<RuleViolation> RuleEvaluator::evaluate(int ruleIndex) const {
    std::vector<RuleViolation> out;
    std::visit(Visitor{*this, ruleIndex, out}, rules_.rules().at(ruleIndex));
    return out;
}

std::vector<RuleViolation> RuleEvaluator::evaluateAll() const {
    std::vector<RuleViolation> out;
    for (int r = 0; r < (int)rules_.rules().size(); ++r) {
        std::visit(Visitor{*this, r, out}, rules_.rules()[r]);
    }
    return out;
}
