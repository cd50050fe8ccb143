///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "backtracking_solver.hpp"
#include "logger.hpp"
#include "schedule_validator.hpp"
#include <string>
#include <utility>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Compile the model, check root consistency, then search level by level.
 *
 * The strict level gives up on exhaustion or on its node limit and hands
 * over to the relaxed level from the same root. Only the relaxed level can
 * prove infeasibility, because continuity never prunes there.
 */
SolverOutput BacktrackingSolver::solve(const SolveInput& input, const SolveBudget& budget) {
    const auto started = std::chrono::steady_clock::now();
    SolverOutput out;
    budget_ = &budget;
    totalNodes_ = 0;
    failures_ = 0;

    SolveModel model(input);
    model_ = &model;

    auto finish = [&](ResolveStatus status) {
        out.status = status;
        out.stats.nodes = totalNodes_;
        out.stats.failures = failures_;
        out.stats.level = level_;
        out.stats.penalty = best_ ? bestPenalty_ : 0;
        out.stats.elapsedMs =
                std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
        if (best_) out.state = buildState(*best_);
        model_ = nullptr;
        state_ = nullptr;
        return out;
    };

    level_ = budget.tryStrict ? ContinuityLevel::Strict : ContinuityLevel::Relaxed;
    best_.reset();

    if (!model.consistent()) {
        out.rootFailure = true;
        out.detail = model.failure();
        Logger::Debug("solver: " + out.detail);
        return finish(ResolveStatus::Infeasible);
    }

    SearchState state(model);
    state_ = &state;
    if (!state.initialize()) {
        out.rootFailure = true;
        out.detail = "constraints are contradictory before any decision";
        Logger::Debug("solver: " + out.detail);
        return finish(ResolveStatus::Infeasible);
    }
    const std::size_t root = state.mark();

    // Breaks already present in history are not held against the strict level.
    basePenalty_.assign(model.traineeCount(), 0);
    for (int t = 0; t < model.traineeCount(); ++t) {
        std::vector<StationId> history;
        for (int i = 0; i < model.rowLength(t); ++i) {
            const int id = model.rowStart(t) + i;
            if (model.cell(id).kind == CellKind::History) history.push_back(state.value(id));
        }
        basePenalty_[t] = continuityPenalty(history, model.rules());
    }

    if (budget.tryStrict) {
        runLevel(ContinuityLevel::Strict, budget.strictNodeLimit);
        if (best_) return finish(ResolveStatus::ValidState);
        if (stop_ == Stop::Deadline || stop_ == Stop::Cancelled) return finish(ResolveStatus::Timeout);
        Logger::Debug("solver: strict level " + std::string(stop_ == Stop::NodeLimit ? "hit its node limit" : "exhausted") +
                      " after " + std::to_string(nodes_) + " nodes, relaxing continuity");
        state.undoTo(root);
    }

    runLevel(ContinuityLevel::Relaxed, budget.relaxedNodeLimit);
    if (best_) {
        const bool cut = stop_ == Stop::Deadline || stop_ == Stop::Cancelled;
        return finish(cut ? ResolveStatus::Timeout : ResolveStatus::ValidState);
    }
    if (stop_ == Stop::None) {
        out.detail = "relaxed search exhausted";
        return finish(ResolveStatus::Infeasible);
    }
    out.detail = stop_ == Stop::NodeLimit ? "node limit reached" : "stopped before a schedule was found";
    Logger::Debug("solver: " + out.detail + " after " + std::to_string(totalNodes_) + " nodes");
    return finish(ResolveStatus::Timeout);
}

void BacktrackingSolver::runLevel(ContinuityLevel level, long long nodeLimit) {
    level_ = level;
    nodes_ = 0;
    nodeLimit_ = nodeLimit;
    improvementStart_ = -1;
    stop_ = Stop::None;
    best_.reset();
    bestPenalty_ = std::numeric_limits<int>::max();
    backtrack(0);
}

/**
 * @brief Poll limits; the clock and the cancel flag are read every 256 nodes.
 */
bool BacktrackingSolver::checkBudget() {
    if (stop_ != Stop::None) return true;
    if (improvementStart_ >= 0) {
        if (nodes_ - improvementStart_ >= budget_->improvementNodeLimit) stop_ = Stop::Done;
    } else if (nodeLimit_ > 0 && nodes_ >= nodeLimit_) {
        stop_ = Stop::NodeLimit;
    }
    if (stop_ == Stop::None && (nodes_ & 255) == 0) {
        if (budget_->cancel != nullptr && budget_->cancel->load()) {
            stop_ = Stop::Cancelled;
        } else if (std::chrono::steady_clock::now() >= budget_->deadline) {
            stop_ = Stop::Deadline;
        }
    }
    return stop_ != Stop::None;
}

bool BacktrackingSolver::backtrack(int pos) {
    const std::vector<int>& order = model_->decisionOrder();
    while (pos < (int)order.size() && state_->fixed(order[pos])) ++pos;
    if (pos == (int)order.size()) return onLeaf();
    if (checkBudget()) return true;

    ++nodes_;
    ++totalNodes_;
    const int cell = order[pos];

    for (StationId v : candidates(cell)) {
        const std::size_t mark = state_->mark();
        bool ok;
        if (level_ == ContinuityLevel::Strict) {
            int run = 1;
            if (!strictAllows(cell, v, run)) continue;
            ok = commitBlock(cell, v, run);
        } else {
            ok = state_->restrict(cell, stationBit(v)) && state_->propagate();
        }

        if (ok && backtrack(pos + 1)) return true;
        state_->undoTo(mark);
        ++failures_;
    }
    return false;
}

/**
 * @brief Accept, reject or record a complete assignment.
 *
 * A strict leaf must not add continuity breaks; a relaxed leaf is kept if it
 * beats the best penalty so far. The relaxed search then keeps looking for
 * fewer breaks until the improvement node limit runs out.
 */
bool BacktrackingSolver::onLeaf() {
    int penalty = 0;
    for (int t = 0; t < model_->traineeCount(); ++t) {
        if (model_->rowLength(t) == 0) continue;
        const int rowPenalty = continuityPenalty(rowValues(t), model_->rules());
        if (level_ == ContinuityLevel::Strict && rowPenalty > basePenalty_[t]) {
            ++failures_;
            return false;
        }
        penalty += rowPenalty;
    }
    if (best_ && penalty >= bestPenalty_) return false;

    std::vector<StationId> values(model_->cellCount());
    for (int id = 0; id < model_->cellCount(); ++id) values[id] = state_->value(id);

    // Every full-constraint matrix is re-checked before it can be returned.
    const SolveInput& input = model_->input();
    if (input.disabled.empty()) {
        ValidationReport report =
                validateSchedule(buildState(values), *input.rules, *input.targets, input.boundary, input.overrides);
        if (!report.ok()) {
            Logger::Error("solver: rejected a matrix that fails validation: " + report.errors.front());
            ++failures_;
            return false;
        }
    }

    best_ = std::move(values);
    bestPenalty_ = penalty;
    Logger::Debug("solver: " + std::string(continuityLevelName(level_)) + " solution after " +
                  std::to_string(nodes_) + " nodes, " + std::to_string(penalty) + " extra blocks");

    if (level_ == ContinuityLevel::Strict || penalty == 0 || budget_->improvementNodeLimit <= 0) {
        stop_ = Stop::Done;
        return true;
    }
    if (improvementStart_ < 0) improvementStart_ = nodes_;
    return false;
}

std::vector<StationId> BacktrackingSolver::prefix(int ordinal, int monthIndex) const {
    std::vector<StationId> out;
    const int start = model_->rowStart(ordinal);
    for (int i = 0; i < monthIndex; ++i) {
        if (model_->cell(start + i).kind == CellKind::Leave) continue;
        out.push_back(state_->value(start + i));
    }
    return out;
}

std::vector<StationId> BacktrackingSolver::rowValues(int ordinal) const {
    std::vector<StationId> out;
    const int start = model_->rowStart(ordinal);
    for (int i = 0; i < model_->rowLength(ordinal); ++i) out.push_back(state_->value(start + i));
    return out;
}

/**
 * @brief Value order: continue the previous station, then windowed stations,
 *        then catalog order.
 */
std::vector<StationId> BacktrackingSolver::candidates(int cell) const {
    const SolveCell& c = model_->cell(cell);
    std::uint32_t remaining = state_->domain(cell);
    std::vector<StationId> out;

    const std::vector<StationId> before = prefix(c.ordinal, c.monthIndex);
    if (!before.empty() && before.back() != kNoStation && (remaining & stationBit(before.back()))) {
        out.push_back(before.back());
        remaining &= ~stationBit(before.back());
    }
    for (std::uint32_t m = remaining & model_->windowedStations(); m != 0; m &= m - 1) {
        out.push_back(lowestStation(m));
    }
    remaining &= ~model_->windowedStations();
    for (std::uint32_t m = remaining; m != 0; m &= m - 1) {
        out.push_back(lowestStation(m));
    }
    return out;
}

/**
 * @brief Continuity rules of the strict level.
 *
 * A station that is under way must go on unless it is a splittable station
 * sitting exactly at its split point. A new value either opens its first block
 * or resumes a split station for the rest of its months.
 */
bool BacktrackingSolver::strictAllows(int cell, StationId value, int& run) const {
    const SolveCell& c = model_->cell(cell);
    const SyllabusRuleSet& rules = model_->rules();
    const std::vector<StationId> before = prefix(c.ordinal, c.monthIndex);
    const std::vector<StationBlocks> blocks = stationBlocks(before, rules.leaveStation());

    auto countOf = [&](StationId s) {
        int n = 0;
        for (StationId x : before) {
            if (x == s) n++;
        }
        return n;
    };
    auto blocksOf = [&](StationId s) {
        for (const StationBlocks& b : blocks) {
            if (b.station == s) return b.blocks;
        }
        return 0;
    };
    auto atSplitPoint = [&](StationId s, int done) {
        const StationDef& def = rules.station(s);
        return def.splittable && blocksOf(s) == 1 && done == def.splitFirst;
    };

    const StationId prev = before.empty() ? kNoStation : before.back();
    if (prev != kNoStation && prev != value) {
        const int done = countOf(prev);
        if (done < model_->need(c.ordinal, prev) && !atSplitPoint(prev, done)) return false;
    }

    const int done = countOf(value);
    const int need = model_->need(c.ordinal, value);
    const StationDef& def = rules.station(value);
    if (done == 0) {
        run = def.splittable && def.splitFirst < need ? def.splitFirst : need;
    } else if (value == prev || atSplitPoint(value, done)) {
        run = need - done;
    } else {
        return false;
    }
    return run > 0;
}

bool BacktrackingSolver::commitBlock(int cell, StationId value, int run) {
    const SolveCell& c = model_->cell(cell);
    const int start = model_->rowStart(c.ordinal);
    int placed = 0;
    for (int i = c.monthIndex; i < model_->rowLength(c.ordinal) && placed < run; ++i) {
        if (model_->cell(start + i).kind == CellKind::Leave) continue;
        if (!state_->restrict(start + i, stationBit(value))) return false;
        ++placed;
    }
    return placed == run && state_->propagate();
}

ScheduleState BacktrackingSolver::buildState(const std::vector<StationId>& values) const {
    const SolveInput& input = model_->input();
    ScheduleState out = *input.state;
    for (int id = 0; id < model_->cellCount(); ++id) {
        const SolveCell& c = model_->cell(id);
        if (c.kind != CellKind::History) out.set(c.ordinal, c.monthIndex, values[id]);
    }
    out.setAnchors(input.anchors);
    return out;
}
