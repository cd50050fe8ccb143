#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include <chrono>
#include <limits>
#include <optional>
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Single-threaded propagate-and-branch solver for rotation schedules.
 *
 * Runs a depth-first search over the decision cells of a SolveModel,
 * propagating duration, capacity and sequence bounds after every decision.
 * The search first demands continuous station blocks (Strict) and falls back
 * to a search without continuity (Relaxed) that minimizes extra blocks for a
 * bounded number of nodes. Hard constraints are never relaxed. A relaxed node
 * limit of 0 leaves the relaxed search bounded by the deadline alone.
 */
class BacktrackingSolver : public ISolver {
public:
    BacktrackingSolver() = default;

    /**
     * @brief Solve one instance.
     *
     * @return ValidState with a complete matrix, Infeasible once the relaxed
     *         search is exhausted, or Timeout when the budget stopped the
     *         search first (with the best complete matrix if one was found).
     *         With an unlimited relaxed level, Timeout means the deadline or
     *         the cancel flag stopped it.
     */
    SolverOutput solve(const SolveInput& input, const SolveBudget& budget) override;

private:
    /// Why a level's search stopped.
    enum class Stop { None, NodeLimit, Deadline, Cancelled, Done };

    const SolveModel* model_ = nullptr;
    SearchState* state_ = nullptr;
    const SolveBudget* budget_ = nullptr;

    ContinuityLevel level_ = ContinuityLevel::Strict;
    long long nodes_ = 0;
    long long totalNodes_ = 0;
    long long failures_ = 0;
    long long nodeLimit_ = 0;
    long long improvementStart_ = -1;
    Stop stop_ = Stop::None;

    /// Best complete matrix of the current level, one station per cell.
    std::optional<std::vector<StationId>> best_;
    int bestPenalty_ = std::numeric_limits<int>::max();

    /// Continuity breaks already present in each row's history.
    std::vector<int> basePenalty_;

    /**
     * @brief Search one continuity level from the root state.
     */
    void runLevel(ContinuityLevel level, long long nodeLimit);

    /**
     * @brief Recursive depth-first search from a position in the decision order.
     *
     * @return true when the search must unwind (solution accepted or budget hit).
     */
    bool backtrack(int pos);

    /**
     * @brief Handle a complete assignment.
     *
     * @return true when no further solutions are wanted.
     */
    bool onLeaf();

    /// Candidate stations of a cell, in preference order.
    std::vector<StationId> candidates(int cell) const;

    /**
     * @brief Strict-level admissibility of a value and the block it opens.
     *
     * @param run Set to the number of months to commit from this cell.
     */
    bool strictAllows(int cell, StationId value, int& run) const;

    /// Fix a block of months (skipping leave) to one station and propagate.
    bool commitBlock(int cell, StationId value, int run);

    /// Non-leave stations of a row before a month index.
    std::vector<StationId> prefix(int ordinal, int monthIndex) const;

    /// Current values of a whole row.
    std::vector<StationId> rowValues(int ordinal) const;

    bool checkBudget();
    ScheduleState buildState(const std::vector<StationId>& values) const;
};
