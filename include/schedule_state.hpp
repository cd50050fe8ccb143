#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "rule_catalog.hpp"
#include <optional>
#include <utility>
#include <vector>


///////////////////////////
///   SCHEDULE STATE    ///
///////////////////////////
/**
 * @brief Dense assignment matrix for one program roster.
 *
 * Rows are roster ordinals, columns are month indices relative to each
 * trainee's start. The matrix is as wide as the longest target length; cells
 * past a trainee's own length are unused. Alongside the matrix the state
 * carries the anchors and leave events it was committed with, the committed
 * current-month boundary and the rule set version it was solved against.
 */
class ScheduleState {
public:
    ScheduleState() = default;

    /**
     * @brief Empty matrix for a roster (every cell kNoStation).
     */
    explicit ScheduleState(std::vector<Trainee> roster);

    const std::vector<Trainee>& roster() const { return roster_; }
    int traineeCount() const { return (int)roster_.size(); }
    const Trainee& trainee(int ordinal) const { return roster_.at(ordinal); }

    /// Roster ordinal of a trainee id, or -1 if unknown.
    int ordinalOf(int traineeId) const;

    /// Target length of a row.
    int length(int ordinal) const { return roster_[ordinal].targetLength; }
    int width() const { return width_; }

    StationId at(int ordinal, int monthIndex) const;
    void set(int ordinal, int monthIndex, StationId station);

    /// Absolute calendar month of a cell.
    MonthSerial calendarMonth(int ordinal, int monthIndex) const;

    /// Month index of an absolute month for a row (may be out of range).
    int monthIndexOf(int ordinal, MonthSerial month) const;

    /**
     * @brief Change a row's target length.
     *
     * Widens the matrix when needed; cells beyond a shortened length are cleared.
     */
    void resizeTrainee(int ordinal, int newLength);

    /// True if every month of the row holds a station.
    bool isComplete(int ordinal) const;

    const std::vector<Assignment>& anchors() const { return anchors_; }
    void setAnchors(std::vector<Assignment> anchors) { anchors_ = std::move(anchors); }

    /// Anchor at a cell, if any.
    std::optional<StationId> anchorAt(int ordinal, int monthIndex) const;
    bool isAnchor(int ordinal, int monthIndex) const { return anchorAt(ordinal, monthIndex).has_value(); }

    const std::vector<LeaveEvent>& leaveEvents() const { return leaveEvents_; }
    void setLeaveEvents(std::vector<LeaveEvent> events) { leaveEvents_ = std::move(events); }

    /// Boundary the state was last committed with (months at or before it are history).
    std::optional<MonthSerial> committedThrough() const { return committedThrough_; }
    void setCommittedThrough(MonthSerial month) { committedThrough_ = month; }

    /// Rule set version of the last commit, or -1.
    int ruleSetVersion() const { return ruleSetVersion_; }
    void setRuleSetVersion(int version) { ruleSetVersion_ = version; }

    /// First calendar month any active trainee occupies.
    MonthSerial horizonStart() const;

    /// One past the last calendar month any active trainee occupies.
    MonthSerial horizonEnd() const;

    /// Same roster, lengths and cells (anchors and metadata are not compared).
    bool sameMatrix(const ScheduleState& other) const;

private:
    std::vector<Trainee> roster_;
    int width_ = 0;

    /// cells_[ordinal * width_ + monthIndex] = station or kNoStation.
    std::vector<StationId> cells_;

    std::vector<Assignment> anchors_;
    std::vector<LeaveEvent> leaveEvents_;
    std::optional<MonthSerial> committedThrough_;
    int ruleSetVersion_ = -1;

    void reshape(int newWidth);
};


///////////////////////////
///  CAPACITY TRACKER   ///
///////////////////////////
/**
 * @brief One (capacity rule, calendar month) line of a capacity summary.
 */
struct CapacityRow {
    int ruleIndex; ///< Index into SyllabusRuleSet::rules().
    MonthSerial month; ///< Calendar month.
    int occupancy; ///< Trainees in the pool that month.
    int minOccupancy; ///< Minimum after overrides.
    int maxOccupancy; ///< Maximum (kUnbounded if none).
};

/**
 * @brief How serious a look-ahead capacity finding is.
 */
enum class BottleneckSeverity {
    Saturated, ///< At the maximum: no room for a manual move in.
    Critical ///< Outside the bounds.
};

struct Bottleneck {
    CapacityRow row;
    BottleneckSeverity severity;
};

/**
 * @brief Per-(station, calendar month) occupancy counters.
 *
 * Every matrix write is mirrored by onWrite(); reads are O(1) for a station
 * and O(pool size) for a capacity rule. Anchors are plain cells here. A month
 * in which no trainee is enrolled has no minimum headcount.
 */
class CapacityTracker {
public:
    /**
     * @brief Zeroed counters over [horizonStart, horizonEnd).
     */
    CapacityTracker(const SyllabusRuleSet& rules, MonthSerial horizonStart, MonthSerial horizonEnd,
                    std::vector<CapacityOverride> overrides = {});

    /**
     * @brief Counters for every active trainee cell of a state.
     */
    static CapacityTracker fromState(const SyllabusRuleSet& rules, const ScheduleState& state,
                                     std::vector<CapacityOverride> overrides = {});

    /// Add delta trainees at a station in a month (ignored outside the horizon).
    void record(StationId station, MonthSerial month, int delta);

    /// Mirror a cell write.
    void onWrite(MonthSerial month, StationId before, StationId after);

    /// Add delta enrolled trainees to a month, assigned or not.
    void recordEnrolled(MonthSerial month, int delta);

    /// Trainees enrolled in a month.
    int enrolled(MonthSerial month) const;

    int occupancy(StationId station, MonthSerial month) const;
    int poolOccupancy(int ruleIndex, MonthSerial month) const;
    int minFor(int ruleIndex, MonthSerial month) const;
    int maxFor(int ruleIndex, MonthSerial month) const;
    bool withinBounds(int ruleIndex, MonthSerial month) const;

    /// Rows for all capacity rules over [from, to), clipped to the horizon.
    std::vector<CapacityRow> summary(MonthSerial from, MonthSerial to) const;

    /// Rows outside the bounds over [from, to).
    std::vector<CapacityRow> violations(MonthSerial from, MonthSerial to) const;

    /**
     * @brief Look-ahead of capacity trouble starting at a month.
     *
     * Critical rows are outside the bounds, saturated rows sit at the maximum.
     */
    std::vector<Bottleneck> bottlenecks(MonthSerial from, int lookaheadMonths) const;

    MonthSerial horizonStart() const { return horizonStart_; }
    MonthSerial horizonEnd() const { return horizonEnd_; }

private:
    const SyllabusRuleSet* rules_;
    MonthSerial horizonStart_;
    MonthSerial horizonEnd_;
    int months_;

    /// counts_[station * months_ + (month - horizonStart_)]
    std::vector<int> counts_;
    std::vector<int> enrolled_; ///< [month - horizonStart_]
    std::vector<CapacityOverride> overrides_;

    bool inHorizon(MonthSerial month) const { return month >= horizonStart_ && month < horizonEnd_; }
};
