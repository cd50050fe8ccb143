#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include <atomic>
#include <chrono>
#include <set>
#include <vector>


///////////////////////////
///      EXPLAINER      ///
///////////////////////////
/**
 * @brief Limits of one explanation.
 */
struct ExplainOptions {
    std::chrono::milliseconds budget{2000}; ///< Wall-clock budget for the whole diagnosis.
    long long checkNodeLimit = 20000; ///< Node limit of each feasibility check; 0 runs to the deadline.
    const std::atomic<bool>* cancel = nullptr;
};

/**
 * @brief Reduces an infeasible solve to a small set of conflicting constraints.
 *
 * Constraint groups (capacity per rule and month, windows and sequences per
 * trainee and rule) are removed chunk by chunk while the remainder stays
 * infeasible; durations, leave and history stay in the background. Each
 * anchor is then released against the core to see whether it takes part.
 * A check that neither finds a schedule nor proves infeasibility keeps its
 * groups, and the report is flagged non-minimal, as it is when the budget
 * runs out.
 */
class ConflictExplainer {
public:
    ConflictExplainer(ISolver& solver, ExplainOptions options);

    /**
     * @brief Diagnose an infeasible input.
     */
    ConflictReport explain(const SolveInput& input) const;

    /**
     * @brief Groups of an input that can constrain anything, in report order.
     *
     * Capacity groups come first, then windows, then sequences.
     */
    static std::vector<ConstraintGroup> enumerateGroups(const SolveInput& input);

private:
    enum class Outcome { Feasible, Infeasible, Unknown };

    ISolver& solver_;
    ExplainOptions options_;

    Outcome check(const SolveInput& input, const std::vector<ConstraintGroup>& all,
                  const std::vector<ConstraintGroup>& kept,
                  std::chrono::steady_clock::time_point deadline) const;

    ConflictItem itemFor(const SolveInput& input, const ConstraintGroup& group) const;
};
