///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include "rule_evaluator.hpp"
#include <algorithm>
#include <stdexcept>
#include <tuple>


///////////////////////////
///     SOLVE MODEL     ///
///////////////////////////
StationId lowestStation(std::uint32_t mask) {
    StationId s = 0;
    while ((mask & 1u) == 0) {
        mask >>= 1;
        ++s;
    }
    return s;
}

SolveModel::SolveModel(const SolveInput& input)
        : input_(input) {
    if (input_.state == nullptr || input_.rules == nullptr || input_.targets == nullptr) {
        throw std::invalid_argument("solve input needs a state, a rule set and targets");
    }
    if ((int)input_.targets->size() != input_.state->traineeCount()) {
        throw std::invalid_argument("one target per roster entry is required");
    }
    stationCount_ = input_.rules->stationCount();
    buildCells();
    buildCapacity();
    buildSequences();
}

const std::vector<int>& SolveModel::capacityAt(MonthSerial month) const {
    static const std::vector<int> kNone;
    const int k = month - monthBase_;
    if (k < 0 || k >= (int)capacityByMonth_.size()) return kNone;
    return capacityByMonth_[k];
}

/**
 * @brief Lay out the rows and compute every cell's initial domain.
 *
 * Precedence of pins is history, then leave, then anchor; a pin that
 * contradicts another leaves an empty domain, recorded as the model failure.
 */
void SolveModel::buildCells() {
    const ScheduleState& state = *input_.state;
    const SyllabusRuleSet& rules = *input_.rules;
    const std::vector<TraineeTarget>& targets = *input_.targets;
    const int T = state.traineeCount();
    const std::uint32_t leaveBit = stationBit(rules.leaveStation());

    need_.assign((size_t)T * stationCount_, 0);
    rowStart_.assign(T, 0);
    rowLength_.assign(T, 0);
    std::vector<std::uint32_t> baseDomain(T, 0);

    for (int t = 0; t < T; ++t) {
        rowStart_[t] = (int)cells_.size();
        const Trainee& trainee = state.trainee(t);
        if (!trainee.active) continue;

        const TraineeTarget& target = targets[t];
        if (target.length != state.length(t) || (int)target.durations.size() != stationCount_) {
            throw std::invalid_argument("target of trainee " + std::to_string(trainee.id) +
                                        " does not match the schedule row");
        }
        rowLength_[t] = target.length;

        for (StationId s = 0; s < stationCount_; ++s) {
            need_[t * stationCount_ + s] = target.durations[s];
            if (target.durations[s] > 0 && s != rules.leaveStation()) baseDomain[t] |= stationBit(s);
        }

        for (int i = 0; i < target.length; ++i) {
            const MonthSerial month = state.calendarMonth(t, i);
            CellKind kind = CellKind::Decision;
            std::uint32_t domain = baseDomain[t];

            if (target.isLeave(i)) {
                kind = CellKind::Leave;
                domain = leaveBit;
            }
            const StationId prior = state.at(t, i);
            if (month <= input_.boundary && prior != kNoStation) {
                domain = (kind == CellKind::Leave ? domain : ~0u) & stationBit(prior);
                kind = CellKind::History;
            }
            cells_.push_back(SolveCell{t, i, month, kind});
            initialDomains_.push_back(domain);
        }
    }

    for (const Assignment& a : input_.anchors) {
        const int t = state.ordinalOf(a.traineeId);
        if (t < 0 || !state.trainee(t).active) {
            throw std::invalid_argument("anchor names unknown or inactive trainee " + std::to_string(a.traineeId));
        }
        if (a.monthIndex < 0 || a.monthIndex >= rowLength_[t] || a.station >= stationCount_) {
            throw std::invalid_argument("anchor of trainee " + std::to_string(a.traineeId) + " at month " +
                                        std::to_string(a.monthIndex) + " is outside the schedule");
        }
        const int id = rowStart_[t] + a.monthIndex;
        if (cells_[id].kind == CellKind::Decision) {
            cells_[id].kind = CellKind::Anchor;
            initialDomains_[id] = baseDomain[t] & stationBit(a.station);
        } else {
            initialDomains_[id] &= stationBit(a.station);
        }
    }

    for (int w : rules.windowRules()) {
        const CalendarWindowRule& rule = rules.windowRule(w);
        windowed_ |= stationBit(rule.station);
        for (int t = 0; t < T; ++t) {
            if (rowLength_[t] == 0) continue;
            if (input_.disabled.count(ConstraintGroup{ConstraintGroup::Kind::Window, w, t, -1})) continue;
            for (int i = 0; i < rowLength_[t]; ++i) {
                const int id = rowStart_[t] + i;
                if (cells_[id].kind == CellKind::History) continue;
                if (!windowAllows(rule, state.trainee(t), rowLength_[t], i)) {
                    initialDomains_[id] &= ~stationBit(rule.station);
                }
            }
        }
    }

    for (int id = 0; id < (int)cells_.size(); ++id) {
        if (initialDomains_[id] != 0) continue;
        const SolveCell& c = cells_[id];
        failure_ = state.trainee(c.ordinal).name + " month " + std::to_string(c.monthIndex) + " (" +
                   formatYearMonth(fromSerial(c.month)) + ") has no admissible station";
        break;
    }

    // Row by row; a trainee's months are decided together.
    for (int id = 0; id < (int)cells_.size(); ++id) {
        if (cells_[id].kind == CellKind::Decision) order_.push_back(id);
    }
    std::sort(order_.begin(), order_.end(), [this](int a, int b) {
        const SolveCell& x = cells_[a];
        const SolveCell& y = cells_[b];
        return std::tie(x.ordinal, x.monthIndex) < std::tie(y.ordinal, y.monthIndex);
    });
}

/**
 * @brief One constraint per (capacity rule, month after the boundary).
 *
 * Months no trainee is enrolled in carry no bounds, and bounds no assignment
 * can break are left out.
 */
void SolveModel::buildCapacity() {
    const SyllabusRuleSet& rules = *input_.rules;
    MonthSerial last = input_.boundary + 1;
    for (const SolveCell& c : cells_) last = std::max(last, c.month + 1);

    monthBase_ = input_.boundary + 1;
    const int months = last - monthBase_;
    capacityByMonth_.assign(months, {});

    std::vector<std::vector<int>> cellsByMonth(months);
    for (int id = 0; id < (int)cells_.size(); ++id) {
        const int k = cells_[id].month - monthBase_;
        if (k >= 0 && k < months) cellsByMonth[k].push_back(id);
    }

    for (int r : rules.capacityRules()) {
        const CapacityRule& rule = rules.capacityRule(r);
        std::uint32_t pool = 0;
        for (StationId s : rule.pool) pool |= stationBit(s);

        for (int k = 0; k < months; ++k) {
            if (cellsByMonth[k].empty()) continue;
            const MonthSerial month = monthBase_ + k;
            if (input_.disabled.count(ConstraintGroup{ConstraintGroup::Kind::Capacity, r, -1, month})) continue;

            const int lo = effectiveMinimum(rules, r, month, input_.overrides);
            const int hi = rule.maxOccupancy;
            if (lo == 0 && hi >= (int)cellsByMonth[k].size()) continue;

            capacityByMonth_[k].push_back((int)capacity_.size());
            capacity_.push_back(CapacityConstraint{r, month, lo, hi, pool, cellsByMonth[k]});
        }
    }
}

void SolveModel::buildSequences() {
    const SyllabusRuleSet& rules = *input_.rules;
    sequencesByRow_.assign(rowStart_.size(), {});
    for (int t = 0; t < (int)rowStart_.size(); ++t) {
        if (rowLength_[t] == 0) continue;
        for (int q : rules.sequenceRules()) {
            const SequenceRule& rule = rules.sequenceRule(q);
            if (need(t, rule.predecessor) == 0 || need(t, rule.dependent) == 0) continue;
            if (input_.disabled.count(ConstraintGroup{ConstraintGroup::Kind::Sequence, q, t, -1})) continue;
            sequencesByRow_[t].push_back((int)sequences_.size());
            sequences_.push_back(SequenceConstraint{q, t, rule.predecessor, rule.dependent});
        }
    }
}


///////////////////////////
///    SEARCH STATE     ///
///////////////////////////
SearchState::SearchState(const SolveModel& model)
        : model_(model),
          durationCount_(model.traineeCount() * model.stationCount()) {
    domains_.resize(model.cellCount());
    assigned_.assign(durationCount_, 0);
    possible_.assign(durationCount_, 0);
    capCertain_.assign(model.capacity().size(), 0);
    capPossible_.assign(model.capacity().size(), 0);
    inQueue_.assign(durationCount_ + model.capacity().size() + model.sequences().size(), 0);

    for (int id = 0; id < model.cellCount(); ++id) {
        domains_[id] = model.initialDomain(id);
        count(id, domains_[id], +1);
    }
}

StationId SearchState::value(int cell) const {
    const std::uint32_t d = domains_[cell];
    return isSingleton(d) ? lowestStation(d) : kNoStation;
}

/**
 * @brief Add or remove a domain's contribution to the counters.
 */
void SearchState::count(int cell, std::uint32_t domain, int sign) {
    if (domain == 0) return;
    const SolveCell& c = model_.cell(cell);
    const int base = c.ordinal * model_.stationCount();

    if (isSingleton(domain)) {
        assigned_[base + lowestStation(domain)] += sign;
    } else {
        for (std::uint32_t m = domain; m != 0; m &= m - 1) {
            possible_[base + lowestStation(m)] += sign;
        }
    }

    for (int k : model_.capacityAt(c.month)) {
        const std::uint32_t pool = model_.capacity()[k].pool;
        if ((domain & pool) == 0) continue;
        if ((domain & ~pool) == 0) capCertain_[k] += sign;
        else capPossible_[k] += sign;
    }
}

void SearchState::enqueue(int propagator) {
    if (inQueue_[propagator]) return;
    inQueue_[propagator] = 1;
    queue_.push_back(propagator);
}

/**
 * @brief Queue the propagators watching the stations a change touched.
 */
void SearchState::schedule(int cell, std::uint32_t before, std::uint32_t after) {
    const SolveCell& c = model_.cell(cell);
    const std::uint32_t touched = (before & ~after) | (isSingleton(after) ? after : 0);

    for (std::uint32_t m = touched; m != 0; m &= m - 1) {
        enqueue(c.ordinal * model_.stationCount() + lowestStation(m));
    }
    for (int k : model_.capacityAt(c.month)) {
        if (model_.capacity()[k].pool & before) enqueue(durationCount_ + k);
    }
    const int seqBase = durationCount_ + (int)model_.capacity().size();
    for (int q : model_.sequencesOf(c.ordinal)) {
        const SequenceConstraint& seq = model_.sequences()[q];
        if (touched & (stationBit(seq.predecessor) | stationBit(seq.dependent))) enqueue(seqBase + q);
    }
}

void SearchState::clearQueue() {
    for (std::size_t i = head_; i < queue_.size(); ++i) inQueue_[queue_[i]] = 0;
    queue_.clear();
    head_ = 0;
}

bool SearchState::restrict(int cell, std::uint32_t mask) {
    const std::uint32_t before = domains_[cell];
    const std::uint32_t after = before & mask;
    if (after == before) return true;
    if (after == 0) return false;

    trail_.emplace_back(cell, before);
    count(cell, before, -1);
    count(cell, after, +1);
    domains_[cell] = after;
    schedule(cell, before, after);
    return true;
}

bool SearchState::propagate() {
    const int capCount = (int)model_.capacity().size();
    while (head_ < queue_.size()) {
        const int p = queue_[head_++];
        inQueue_[p] = 0;

        bool ok;
        if (p < durationCount_) {
            ok = runDuration(p / model_.stationCount(), (StationId)(p % model_.stationCount()));
        } else if (p < durationCount_ + capCount) {
            ok = runCapacity(p - durationCount_);
        } else {
            ok = runSequence(p - durationCount_ - capCount);
        }
        if (!ok) {
            clearQueue();
            return false;
        }
    }
    clearQueue();
    return true;
}

bool SearchState::initialize() {
    for (int t = 0; t < model_.traineeCount(); ++t) {
        if (model_.rowLength(t) == 0) continue;
        for (int s = 0; s < model_.stationCount(); ++s) enqueue(t * model_.stationCount() + s);
    }
    const int capCount = (int)model_.capacity().size();
    for (int k = 0; k < capCount; ++k) enqueue(durationCount_ + k);
    for (int q = 0; q < (int)model_.sequences().size(); ++q) enqueue(durationCount_ + capCount + q);
    return propagate();
}

void SearchState::undoTo(std::size_t mark) {
    while (trail_.size() > mark) {
        const auto [cell, before] = trail_.back();
        trail_.pop_back();
        count(cell, domains_[cell], -1);
        count(cell, before, +1);
        domains_[cell] = before;
    }
    clearQueue();
}

/**
 * @brief Keep a trainee's months at a station equal to its need.
 */
bool SearchState::runDuration(int ordinal, StationId station) {
    const int need = model_.need(ordinal, station);
    const int a = assigned(ordinal, station);
    const int p = possible_[ordinal * model_.stationCount() + station];
    if (a > need || a + p < need) return false;
    if (p == 0 || (a != need && a + p != need)) return true;

    // Either the station is complete (drop it elsewhere) or every candidate month is needed.
    const std::uint32_t bit = stationBit(station);
    const std::uint32_t mask = a == need ? ~bit : bit;
    const int start = model_.rowStart(ordinal);
    for (int i = 0; i < model_.rowLength(ordinal); ++i) {
        const std::uint32_t d = domains_[start + i];
        if ((d & bit) == 0 || isSingleton(d)) continue;
        if (!restrict(start + i, mask)) return false;
    }
    return true;
}

bool SearchState::runCapacity(int index) {
    const CapacityConstraint& c = model_.capacity()[index];
    const int a = capCertain_[index];
    const int p = capPossible_[index];
    if (a > c.maxOccupancy || a + p < c.minOccupancy) return false;
    if (p == 0 || (a != c.maxOccupancy && a + p != c.minOccupancy)) return true;

    const std::uint32_t mask = a == c.maxOccupancy ? ~c.pool : c.pool;
    for (int cell : c.cells) {
        const std::uint32_t d = domains_[cell];
        if ((d & c.pool) == 0 || (d & ~c.pool) == 0) continue;
        if (!restrict(cell, mask)) return false;
    }
    return true;
}

bool SearchState::runSequence(int index) {
    const SequenceConstraint& seq = model_.sequences()[index];
    const int start = model_.rowStart(seq.ordinal);
    const int length = model_.rowLength(seq.ordinal);
    const int needPred = model_.need(seq.ordinal, seq.predecessor);
    const int needDep = model_.need(seq.ordinal, seq.dependent);
    const std::uint32_t predBit = stationBit(seq.predecessor);
    const std::uint32_t depBit = stationBit(seq.dependent);

    // Earliest month the predecessor can be complete.
    int seen = 0;
    int predDone = -1;
    int lastPred = -1;
    for (int i = 0; i < length; ++i) {
        const std::uint32_t d = domains_[start + i];
        if ((d & predBit) == 0) continue;
        if (++seen == needPred && predDone < 0) predDone = i;
        if (d == predBit) lastPred = i;
    }
    if (predDone < 0) return false;
    for (int i = 0; i <= std::max(predDone, lastPred); ++i) {
        const std::uint32_t d = domains_[start + i];
        if ((d & depBit) == 0) continue;
        if (d == depBit || !restrict(start + i, ~depBit)) return false;
    }

    // Latest month the dependent can start.
    seen = 0;
    int depStart = -1;
    int firstDep = length;
    for (int i = length - 1; i >= 0; --i) {
        const std::uint32_t d = domains_[start + i];
        if ((d & depBit) == 0) continue;
        if (++seen == needDep && depStart < 0) depStart = i;
        if (d == depBit) firstDep = i;
    }
    if (depStart < 0) return false;
    for (int i = std::min(depStart, firstDep); i < length; ++i) {
        const std::uint32_t d = domains_[start + i];
        if ((d & predBit) == 0) continue;
        if (d == predBit || !restrict(start + i, ~predBit)) return false;
    }
    return true;
}
