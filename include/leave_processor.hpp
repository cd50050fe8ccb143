#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "rule_catalog.hpp"
#include "schedule_state.hpp"
#include <vector>


///////////////////////////
///       TARGETS       ///
///////////////////////////
/**
 * @brief A month a trainee spends on leave, pinned to the Leave station.
 */
struct LeaveMonth {
    int monthIndex; ///< Index relative to the trainee's start.
    bool credited; ///< Counted as program time (within-syllabus, under the cap).
};

/**
 * @brief Revised syllabus target of one trainee after all leave events.
 *
 * durations[s] is the number of months the solver must place at station s;
 * the Leave station's entry equals leaveMonths.size(). The durations always
 * add up to length.
 */
struct TraineeTarget {
    int traineeId = -1;
    int length = 0; ///< Revised program length in months.
    int allotment = 0; ///< Months left in the department allotment.
    int creditedLeave = 0; ///< Within-syllabus months deducted from the allotment so far.
    std::vector<int> durations; ///< Months per station id.
    std::vector<LeaveMonth> leaveMonths; ///< Sorted by month index.

    /// True if the month index is a leave month.
    bool isLeave(int monthIndex) const;
};

/**
 * @brief Effect of a single leave event on a trainee's target.
 */
struct LeaveEffect {
    int length; ///< Program length after the event.
    int allotment; ///< Department allotment after the event.
    int capUsed; ///< Within-syllabus months credited so far, including this event.
    int deducted; ///< Months of this event taken from the allotment.
    int extension; ///< Months this event added to the program length.
};

/**
 * @brief Apply one leave event to a (length, allotment) pair.
 *
 * Within-syllabus leave is deducted from the allotment while the cumulative
 * cap allows it; whatever exceeds the cap extends the program. Extension leave
 * always extends the program by its full duration.
 *
 * @param event     Leave event (only duration and classification are read).
 * @param length    Current target length.
 * @param allotment Current department allotment.
 * @param capUsed   Within-syllabus months already deducted for this trainee.
 * @param cap       Policy cap on deducted months.
 *
 * @throws std::invalid_argument on a non-positive duration.
 */
LeaveEffect applyLeave(const LeaveEvent& event, int length, int allotment, int capUsed, int cap);


///////////////////////////
///      PROGRESS       ///
///////////////////////////
/**
 * @brief Completed share of a trainee's program up to the current month.
 */
struct TraineeProgress {
    int traineeId;
    int completedMonths; ///< Station months plus credited leave, up to the boundary.
    int creditedLeaveMonths; ///< Leave months counted towards completion.
    int uncreditedLeaveMonths; ///< Leave months that only extend the program.
    int totalMonths; ///< Nominal track length.
    int remainingMonths; ///< Revised length minus elapsed months.
    double percent; ///< completedMonths / totalMonths, in percent.
};


///////////////////////////
///   LEAVE PROCESSOR   ///
///////////////////////////
/**
 * @brief Turns leave events into revised per-trainee syllabus targets.
 *
 * The processor only reshapes what the solver must satisfy; it never assigns
 * stations. Targets are recomputed from scratch from the full event list, so
 * the result does not depend on the order events were reported in.
 */
class LeaveProcessor {
public:
    explicit LeaveProcessor(const SyllabusRuleSet& rules);

    /**
     * @brief Target of a trainee with no leave.
     */
    TraineeTarget baseTarget(const Trainee& trainee) const;

    /**
     * @brief Target of a trainee after its leave events, in chronological order.
     *
     * Events of other trainees are ignored.
     *
     * @throws std::invalid_argument if a leave starts before the trainee's start,
     *         runs past the revised length or overlaps another leave.
     */
    TraineeTarget targetFor(const Trainee& trainee, const std::vector<LeaveEvent>& events) const;

    /**
     * @brief Targets for a whole roster, indexed by roster ordinal.
     *
     * @throws std::invalid_argument if an event names a trainee not in the roster.
     */
    std::vector<TraineeTarget> buildTargets(const std::vector<Trainee>& roster,
                                            const std::vector<LeaveEvent>& events) const;

    /**
     * @brief Progress of a trainee up to and including the boundary month.
     */
    TraineeProgress progressOf(const ScheduleState& state, int ordinal, const TraineeTarget& target,
                               MonthSerial boundary) const;

private:
    const SyllabusRuleSet& rules_;
};
