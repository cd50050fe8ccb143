///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "schedule_state.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>


///////////////////////////
///   SCHEDULE STATE    ///
///////////////////////////
/**
 * @brief Build an empty matrix sized to the longest trainee.
 */
ScheduleState::ScheduleState(std::vector<Trainee> roster)
        : roster_(std::move(roster)) {
    int widest = 0;
    for (const Trainee& t : roster_) {
        if (t.targetLength <= 0) {
            throw std::invalid_argument("trainee " + std::to_string(t.id) + " has a non-positive target length");
        }
        widest = std::max(widest, t.targetLength);
    }
    width_ = widest;
    cells_.assign((size_t)roster_.size() * width_, kNoStation);
}

int ScheduleState::ordinalOf(int traineeId) const {
    for (int i = 0; i < (int)roster_.size(); ++i) {
        if (roster_[i].id == traineeId) return i;
    }
    return -1;
}

StationId ScheduleState::at(int ordinal, int monthIndex) const {
    if (monthIndex < 0 || monthIndex >= width_) return kNoStation;
    return cells_[(size_t)ordinal * width_ + monthIndex];
}

void ScheduleState::set(int ordinal, int monthIndex, StationId station) {
    if (ordinal < 0 || ordinal >= (int)roster_.size() || monthIndex < 0 || monthIndex >= length(ordinal)) {
        throw std::out_of_range("cell (" + std::to_string(ordinal) + ", " + std::to_string(monthIndex) +
                                ") is outside the schedule");
    }
    cells_[(size_t)ordinal * width_ + monthIndex] = station;
}

MonthSerial ScheduleState::calendarMonth(int ordinal, int monthIndex) const {
    return toSerial(roster_[ordinal].start) + monthIndex;
}

int ScheduleState::monthIndexOf(int ordinal, MonthSerial month) const {
    return month - toSerial(roster_[ordinal].start);
}

/**
 * @brief Re-layout the flat buffer for a new row width.
 */
void ScheduleState::reshape(int newWidth) {
    std::vector<StationId> next((size_t)roster_.size() * newWidth, kNoStation);
    const int copy = std::min(width_, newWidth);
    for (int t = 0; t < (int)roster_.size(); ++t) {
        for (int i = 0; i < copy; ++i) {
            next[(size_t)t * newWidth + i] = cells_[(size_t)t * width_ + i];
        }
    }
    cells_ = std::move(next);
    width_ = newWidth;
}

void ScheduleState::resizeTrainee(int ordinal, int newLength) {
    if (newLength <= 0) {
        throw std::invalid_argument("target length must be positive");
    }
    if (newLength > width_) reshape(newLength);

    Trainee& t = roster_.at(ordinal);
    for (int i = newLength; i < t.targetLength; ++i) {
        cells_[(size_t)ordinal * width_ + i] = kNoStation;
    }
    t.targetLength = newLength;
}

bool ScheduleState::isComplete(int ordinal) const {
    for (int i = 0; i < length(ordinal); ++i) {
        if (at(ordinal, i) == kNoStation) return false;
    }
    return true;
}

std::optional<StationId> ScheduleState::anchorAt(int ordinal, int monthIndex) const {
    const int traineeId = roster_.at(ordinal).id;
    for (const Assignment& a : anchors_) {
        if (a.traineeId == traineeId && a.monthIndex == monthIndex) return a.station;
    }
    return std::nullopt;
}

MonthSerial ScheduleState::horizonStart() const {
    MonthSerial first = std::numeric_limits<MonthSerial>::max();
    for (const Trainee& t : roster_) {
        if (t.active) first = std::min(first, toSerial(t.start));
    }
    return first == std::numeric_limits<MonthSerial>::max() ? 0 : first;
}

MonthSerial ScheduleState::horizonEnd() const {
    MonthSerial last = 0;
    bool any = false;
    for (const Trainee& t : roster_) {
        if (!t.active) continue;
        last = std::max(last, toSerial(t.start) + t.targetLength);
        any = true;
    }
    return any ? last : 0;
}

bool ScheduleState::sameMatrix(const ScheduleState& other) const {
    if (roster_.size() != other.roster_.size()) return false;
    for (int t = 0; t < (int)roster_.size(); ++t) {
        if (roster_[t].id != other.roster_[t].id || length(t) != other.length(t)) return false;
        for (int i = 0; i < length(t); ++i) {
            if (at(t, i) != other.at(t, i)) return false;
        }
    }
    return true;
}


///////////////////////////
///  CAPACITY TRACKER   ///
///////////////////////////
CapacityTracker::CapacityTracker(const SyllabusRuleSet& rules, MonthSerial horizonStart, MonthSerial horizonEnd,
                                 std::vector<CapacityOverride> overrides)
        : rules_(&rules),
          horizonStart_(horizonStart),
          horizonEnd_(std::max(horizonStart, horizonEnd)),
          months_(std::max(0, horizonEnd - horizonStart)),
          counts_((size_t)rules.stationCount() * std::max(0, horizonEnd - horizonStart), 0),
          enrolled_(std::max(0, horizonEnd - horizonStart), 0),
          overrides_(std::move(overrides)) {}

/**
 * @brief Count every assigned cell of the active trainees.
 *
 * Inactive (graduated) trainees no longer occupy stations.
 */
CapacityTracker CapacityTracker::fromState(const SyllabusRuleSet& rules, const ScheduleState& state,
                                           std::vector<CapacityOverride> overrides) {
    CapacityTracker tracker(rules, state.horizonStart(), state.horizonEnd(), std::move(overrides));
    for (int t = 0; t < state.traineeCount(); ++t) {
        if (!state.trainee(t).active) continue;
        for (int i = 0; i < state.length(t); ++i) {
            tracker.recordEnrolled(state.calendarMonth(t, i), +1);
            StationId s = state.at(t, i);
            if (s != kNoStation) tracker.record(s, state.calendarMonth(t, i), +1);
        }
    }
    return tracker;
}

void CapacityTracker::record(StationId station, MonthSerial month, int delta) {
    if (station == kNoStation || !inHorizon(month) || station >= rules_->stationCount()) return;
    counts_[(size_t)station * months_ + (month - horizonStart_)] += delta;
}

void CapacityTracker::onWrite(MonthSerial month, StationId before, StationId after) {
    if (before == after) return;
    record(before, month, -1);
    record(after, month, +1);
}

void CapacityTracker::recordEnrolled(MonthSerial month, int delta) {
    if (inHorizon(month)) enrolled_[month - horizonStart_] += delta;
}

int CapacityTracker::enrolled(MonthSerial month) const {
    return inHorizon(month) ? enrolled_[month - horizonStart_] : 0;
}

int CapacityTracker::occupancy(StationId station, MonthSerial month) const {
    if (station == kNoStation || !inHorizon(month) || station >= rules_->stationCount()) return 0;
    return counts_[(size_t)station * months_ + (month - horizonStart_)];
}

int CapacityTracker::poolOccupancy(int ruleIndex, MonthSerial month) const {
    int total = 0;
    for (StationId s : rules_->capacityRule(ruleIndex).pool) {
        total += occupancy(s, month);
    }
    return total;
}

int CapacityTracker::minFor(int ruleIndex, MonthSerial month) const {
    if (enrolled(month) == 0) return 0;
    return effectiveMinimum(*rules_, ruleIndex, month, overrides_);
}

int CapacityTracker::maxFor(int ruleIndex, MonthSerial month) const {
    return rules_->capacityRule(ruleIndex).maxOccupancy;
}

bool CapacityTracker::withinBounds(int ruleIndex, MonthSerial month) const {
    const int occ = poolOccupancy(ruleIndex, month);
    return occ >= minFor(ruleIndex, month) && occ <= maxFor(ruleIndex, month);
}

std::vector<CapacityRow> CapacityTracker::summary(MonthSerial from, MonthSerial to) const {
    std::vector<CapacityRow> rows;
    from = std::max(from, horizonStart_);
    to = std::min(to, horizonEnd_);
    for (int ruleIndex : rules_->capacityRules()) {
        for (MonthSerial m = from; m < to; ++m) {
            rows.push_back(CapacityRow{ruleIndex, m, poolOccupancy(ruleIndex, m), minFor(ruleIndex, m),
                                       maxFor(ruleIndex, m)});
        }
    }
    return rows;
}

std::vector<CapacityRow> CapacityTracker::violations(MonthSerial from, MonthSerial to) const {
    std::vector<CapacityRow> out;
    for (const CapacityRow& row : summary(from, to)) {
        if (row.occupancy < row.minOccupancy || row.occupancy > row.maxOccupancy) out.push_back(row);
    }
    return out;
}

std::vector<Bottleneck> CapacityTracker::bottlenecks(MonthSerial from, int lookaheadMonths) const {
    std::vector<Bottleneck> out;
    for (const CapacityRow& row : summary(from, from + lookaheadMonths)) {
        if (row.occupancy < row.minOccupancy || row.occupancy > row.maxOccupancy) {
            out.push_back(Bottleneck{row, BottleneckSeverity::Critical});
        } else if (row.maxOccupancy != kUnbounded && row.occupancy == row.maxOccupancy) {
            out.push_back(Bottleneck{row, BottleneckSeverity::Saturated});
        }
    }
    // Critical findings first, then chronological.
    std::stable_sort(out.begin(), out.end(), [](const Bottleneck& a, const Bottleneck& b) {
        if (a.severity != b.severity) return a.severity == BottleneckSeverity::Critical;
        return a.row.month < b.row.month;
    });
    return out;
}
