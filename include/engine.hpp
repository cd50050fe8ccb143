#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "rule_catalog.hpp"
#include "schedule_state.hpp"
#include "leave_processor.hpp"
#include "solver_base.hpp"
#include "audit_log.hpp"
#include "config.hpp"
#include "schedule_validator.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///      REQUESTS       ///
///////////////////////////
/**
 * @brief Inputs of a full resolve.
 */
struct ResolveRequest {
    ScheduleState state; ///< Last committed state (roster and matrix).
    int ruleSetVersion = -1; ///< Negative: the version effective at currentMonth.
    std::vector<Assignment> anchors; ///< Complete anchor set to honour.
    std::vector<LeaveEvent> leaveEvents; ///< Complete leave event list.
    std::vector<CapacityOverride> overrides; ///< Approved minimum relaxations.
    std::optional<std::chrono::milliseconds> timeBudget; ///< Engine default if absent.
    YearMonth currentMonth{}; ///< Months up to and including this one are history.
    std::string actor; ///< Who asked for the resolve, for the audit trail.
    std::string timestamp; ///< Caller-supplied time of the request.
};

/**
 * @brief Outcome of a full resolve.
 *
 * A state is present for ValidState, and for Timeout when a complete valid
 * matrix was found before the budget ran out. The conflict is present for
 * Infeasible. Audit entries are only meant to be committed with the state.
 */
struct ResolveResult {
    ResolveStatus status = ResolveStatus::Infeasible;
    std::optional<ScheduleState> state;
    std::optional<ConflictReport> conflict;
    std::vector<CapacityRow> capacity; ///< Occupancy per capacity rule and month from currentMonth on.
    std::vector<Bottleneck> bottlenecks; ///< Look-ahead from currentMonth.
    std::vector<TraineeTarget> targets; ///< Revised targets by roster ordinal.
    std::vector<AuditEntry> audit; ///< Overrides this resolve would record.
    ValidationReport validation; ///< Report of the returned matrix.
    SolveStats stats;
    int ruleSetVersion = -1;
};


///////////////////////////
///       ENGINE        ///
///////////////////////////
/**
 * @brief Stateless facade over the solver core.
 *
 * Every call binds to one rule set version and to the current month passed
 * in; nothing is read from the clock for scheduling decisions. The engine
 * never keeps a schedule: callers own states and commit results themselves.
 */
class RotationEngine {
public:
    RotationEngine(const RuleCatalog& catalog, EngineConfig config);

    const EngineConfig& config() const { return config_; }

    /**
     * @brief Admissibility of one anchor against a committed state.
     *
     * Read-only. Rejects only what no resolve could repair: unknown trainee
     * or month, changes to the immutable past, leave months, stations the
     * trainee's department or track cannot take, calendar windows, and
     * pinned cells that already overrun a duration, a capacity maximum or a
     * sequence. The proposal replaces an existing anchor on the same cell.
     *
     * @return std::nullopt if the move is admissible.
     */
    std::optional<ConflictReport> validateMove(const ScheduleState& state, const Assignment& proposal,
                                               const YearMonth& currentMonth) const;

    /**
     * @brief Complete the schedule around anchors, leave and history.
     *
     * Pin conflicts are rejected before search as Infeasible with a
     * pre-search report. An Infeasible search is diagnosed by the conflict
     * explainer.
     *
     * @param request Resolve inputs.
     * @param cancel  Optional flag; setting it stops the search early.
     *
     * @throws std::invalid_argument on caller errors (override without a
     *         justification, leave naming an unknown trainee or overrunning
     *         the program).
     * @throws NoRuleSetForDate, UnknownRuleSetVersion if no rules apply.
     */
    ResolveResult resolve(const ResolveRequest& request, const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief Rule set a call binds to.
     */
    RuleSetPtr ruleSetFor(int version, const YearMonth& currentMonth) const;

private:
    const RuleCatalog& catalog_;
    EngineConfig config_;
};

/**
 * @brief Conflicts among pinned cells that make any search pointless.
 *
 * The state rows must already have the targets' lengths. Checks anchors of
 * unknown trainees or outside their rows, duplicate anchors that disagree,
 * anchors on leave months, on the Leave station or on committed past cells
 * they differ from, ineligible anchors, anchors outside a calendar window,
 * leave over a differing committed past cell, and pinned cells that exceed a
 * station duration.
 *
 * @return Items in the order found; empty if the pins are consistent.
 */
std::vector<ConflictItem> pinConflicts(const ScheduleState& state, const SyllabusRuleSet& rules,
                                       const std::vector<TraineeTarget>& targets,
                                       const std::vector<Assignment>& anchors, MonthSerial boundary);
