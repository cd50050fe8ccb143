#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "rule_catalog.hpp"
#include "schedule_state.hpp"
#include "leave_processor.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Error taxonomy of the engine.
 */
enum class ErrorKind {
    RuleViolationHard, ///< Duration, sequence or window broken.
    CapacityExceeded, ///< Station headcount outside its bounds.
    AnchorConflict, ///< Anchors clash with each other or with history.
    Infeasible, ///< No assignment satisfies every hard constraint.
    Timeout ///< Budget exhausted before a conclusion.
};

/**
 * @brief Reason attached to each item of a conflict report.
 */
enum class ReasonCode {
    CapacityExceeded,
    SyllabusWindowMissed,
    AnchorConflict,
    SequenceViolation
};

const char* errorKindName(ErrorKind kind);

/// Wire name, e.g. "CAPACITY_EXCEEDED".
const char* reasonCodeName(ReasonCode code);

/**
 * @brief One (trainee, month, station, rule) tuple implicated in a conflict.
 */
struct ConflictItem {
    int traineeId = -1; ///< -1 for station-wide items (capacity).
    int monthIndex = -1; ///< Relative to the trainee's start, -1 if not trainee-specific.
    MonthSerial calendarMonth = 0;
    StationId station = kNoStation;
    ReasonCode reason = ReasonCode::AnchorConflict;
    int ruleIndex = -1; ///< Index into the rule set, -1 for anchors.
    std::string rule; ///< Readable rule description.
};

/**
 * @brief Diagnosis of a rejected move or an unsatisfiable resolve.
 */
struct ConflictReport {
    ErrorKind kind = ErrorKind::Infeasible;
    ReasonCode reason = ReasonCode::AnchorConflict; ///< Reason of the first item.
    std::vector<ConflictItem> items;
    bool minimal = true; ///< False if the explainer ran out of budget.
    bool preSearch = false; ///< Rejected before the solver ran.
    std::string message;
};


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief How strictly the soft continuity objective is enforced.
 */
enum class ContinuityLevel {
    Strict, ///< One block per station, splittable stations may break once.
    Relaxed ///< No continuity requirement; blocks are only minimized.
};

const char* continuityLevelName(ContinuityLevel level);

/**
 * @brief Terminal outcome of a solve or resolve.
 */
enum class ResolveStatus { ValidState, Infeasible, Timeout };

const char* resolveStatusName(ResolveStatus status);

/**
 * @brief A group of hard constraints the conflict explainer can switch off.
 *
 * Capacity groups are (rule, calendar month); window and sequence groups are
 * (trainee ordinal, rule). Unused fields are -1.
 */
struct ConstraintGroup {
    enum class Kind { Capacity, Window, Sequence };

    Kind kind;
    int ruleIndex;
    int ordinal;
    MonthSerial month;

    bool operator<(const ConstraintGroup& other) const {
        return std::tie(kind, ruleIndex, ordinal, month) <
               std::tie(other.kind, other.ruleIndex, other.ordinal, other.month);
    }
    bool operator==(const ConstraintGroup& other) const {
        return kind == other.kind && ruleIndex == other.ruleIndex && ordinal == other.ordinal &&
               month == other.month;
    }
};

/**
 * @brief Everything a solver needs for one solve; all pointers are non-owning.
 */
struct SolveInput {
    /// Roster with revised lengths and the committed cells.
    const ScheduleState* state = nullptr;

    /// Rule set version the whole solve binds to.
    const SyllabusRuleSet* rules = nullptr;

    /// Revised syllabus targets, indexed by roster ordinal.
    const std::vector<TraineeTarget>* targets = nullptr;

    /// Caller-fixed cells.
    std::vector<Assignment> anchors;

    /// Current month: cells at or before it are history.
    MonthSerial boundary = 0;

    /// Approved capacity minimum relaxations.
    std::vector<CapacityOverride> overrides;

    /// Constraint groups left out of this solve (conflict explanation only).
    std::set<ConstraintGroup> disabled;
};

/**
 * @brief Limits of one solve.
 *
 * Node limits make the outcome reproducible; the deadline and cancel flag
 * only ever stop a search early.
 */
struct SolveBudget {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    long long strictNodeLimit = 200000;
    long long relaxedNodeLimit = 0; ///< 0: until the deadline.
    long long improvementNodeLimit = 20000;
    bool tryStrict = true; ///< False: go straight to the relaxed level.
    const std::atomic<bool>* cancel = nullptr;
};

/**
 * @brief Search statistics of a solve.
 */
struct SolveStats {
    long long nodes = 0;
    long long failures = 0;
    ContinuityLevel level = ContinuityLevel::Strict;
    int penalty = 0; ///< Extra continuity blocks of the returned matrix.
    double elapsedMs = 0.0;
};

/**
 * @brief Result of a solve.
 *
 * A state is present for ValidState and, when a complete matrix was found
 * before the budget ran out, for Timeout. Every returned state satisfies all
 * hard constraints.
 */
struct SolverOutput {
    ResolveStatus status = ResolveStatus::Infeasible;
    std::optional<ScheduleState> state;
    SolveStats stats;
    bool rootFailure = false; ///< Propagation failed before any decision.
    std::string detail;
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for rotation solvers.
 */
class ISolver {
public:
    virtual ~ISolver() = default;

    /**
     * @brief Complete the schedule around its pinned cells.
     *
     * Implementations never change anchors, leave months or history, and
     * never return a matrix that violates a hard constraint.
     */
    virtual SolverOutput solve(const SolveInput& input, const SolveBudget& budget) = 0;
};
