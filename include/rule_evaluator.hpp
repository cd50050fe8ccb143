#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "rule_catalog.hpp"
#include "schedule_state.hpp"
#include "leave_processor.hpp"
#include <string>
#include <vector>


///////////////////////////
///     EVALUATION      ///
///////////////////////////
/**
 * @brief Whether a calendar window admits a trainee's month index.
 *
 * @param rule      Window rule.
 * @param trainee   Trainee (start month).
 * @param length    The trainee's revised program length.
 * @param monthIndex Month index relative to the trainee's start.
 */
bool windowAllows(const CalendarWindowRule& rule, const Trainee& trainee, int length, int monthIndex);

/**
 * @brief One broken rule instance found by the evaluator.
 */
struct RuleViolation {
    int ruleIndex;
    int ordinal; ///< Trainee ordinal, -1 for capacity.
    int monthIndex; ///< -1 if not tied to one month of a trainee.
    MonthSerial month; ///< Calendar month, 0 if not tied to one month.
    StationId station;
    std::string message;
};

/**
 * @brief What a matrix is checked as.
 */
enum class EvaluationMode {
    Complete, ///< Every cell is final: durations must match, capacity minima must hold.
    Pinned ///< Only pinned cells are set: flag only what adding cells cannot repair.
};

/**
 * @brief Evaluates station rules against a schedule matrix.
 *
 * Every rule kind is handled by one visitor over the StationRule variant.
 * Capacity and window rules only bind months after the boundary; durations
 * and sequences bind the whole program. Duration checks use the revised
 * targets rather than the nominal rule months.
 */
class RuleEvaluator {
public:
    RuleEvaluator(const ScheduleState& state, const SyllabusRuleSet& rules,
                  const std::vector<TraineeTarget>& targets, const CapacityTracker& capacity,
                  MonthSerial boundary, EvaluationMode mode);

    /// Violations of one rule.
    std::vector<RuleViolation> evaluate(int ruleIndex) const;

    /// Violations of every rule, in rule order.
    std::vector<RuleViolation> evaluateAll() const;

private:
    const ScheduleState& state_;
    const SyllabusRuleSet& rules_;
    const std::vector<TraineeTarget>& targets_;
    const CapacityTracker& capacity_;
    MonthSerial boundary_;
    EvaluationMode mode_;

    struct Visitor;
};
