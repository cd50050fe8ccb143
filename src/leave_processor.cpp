///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "leave_processor.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>


///////////////////////////
///       TARGETS       ///
///////////////////////////
bool TraineeTarget::isLeave(int monthIndex) const {
    for (const LeaveMonth& m : leaveMonths) {
        if (m.monthIndex == monthIndex) return true;
    }
    return false;
}

LeaveEffect applyLeave(const LeaveEvent& event, int length, int allotment, int capUsed, int cap) {
    if (event.durationMonths <= 0) {
        throw std::invalid_argument("leave of trainee " + std::to_string(event.traineeId) +
                                    " must last at least one month");
    }

    LeaveEffect effect{length, allotment, capUsed, 0, 0};
    const int d = event.durationMonths;

    if (event.classification == LeaveClass::Extension) {
        effect.length += d;
        effect.extension = d;
        return effect;
    }

    // Within-syllabus: deduct what the cap (and the allotment itself) still allows.
    const int capRemaining = std::max(0, cap - capUsed);
    const int deducted = std::min({d, capRemaining, std::max(0, allotment)});
    effect.allotment -= deducted;
    effect.capUsed += deducted;
    effect.deducted = deducted;
    effect.extension = d - deducted;
    effect.length += effect.extension;
    return effect;
}


///////////////////////////
///   LEAVE PROCESSOR   ///
///////////////////////////
LeaveProcessor::LeaveProcessor(const SyllabusRuleSet& rules)
        : rules_(rules) {}

TraineeTarget LeaveProcessor::baseTarget(const Trainee& trainee) const {
    TraineeTarget target;
    target.traineeId = trainee.id;
    target.length = trackLength(trainee.track);
    target.durations.assign(rules_.stationCount(), 0);
    for (const StationDef& s : rules_.stations()) {
        if (rules_.eligible(s.id, trainee.track, trainee.department)) {
            target.durations[s.id] = rules_.duration(s.id, trainee.track);
        }
    }
    target.allotment = target.durations[rules_.allotmentStation()];
    return target;
}

/**
 * @brief Fold a trainee's leave events into its base target.
 *
 * Events are applied by start month so the cumulative cap is consumed by the
 * earliest leave first. Each leave's months are validated against the length
 * in effect once that leave has been applied.
 */
TraineeTarget LeaveProcessor::targetFor(const Trainee& trainee, const std::vector<LeaveEvent>& events) const {
    TraineeTarget target = baseTarget(trainee);

    std::vector<LeaveEvent> own;
    for (const LeaveEvent& e : events) {
        if (e.traineeId == trainee.id) own.push_back(e);
    }
    std::stable_sort(own.begin(), own.end(), [](const LeaveEvent& a, const LeaveEvent& b) {
        return toSerial(a.start) < toSerial(b.start);
    });

    const int cap = rules_.leavePolicy().withinSyllabusCap;
    const MonthSerial startSerial = toSerial(trainee.start);

    for (const LeaveEvent& e : own) {
        LeaveEffect effect = applyLeave(e, target.length, target.allotment, target.creditedLeave, cap);

        const int first = toSerial(e.start) - startSerial;
        if (first < 0) {
            throw std::invalid_argument("leave of trainee " + std::to_string(trainee.id) + " starts " +
                                        formatYearMonth(e.start) + ", before the program start");
        }
        if (first + e.durationMonths > effect.length) {
            throw std::invalid_argument("leave of trainee " + std::to_string(trainee.id) + " starting " +
                                        formatYearMonth(e.start) + " runs past the end of the program");
        }
        for (int k = 0; k < e.durationMonths; ++k) {
            if (target.isLeave(first + k)) {
                throw std::invalid_argument("leave events of trainee " + std::to_string(trainee.id) +
                                            " overlap at " + formatYearMonth(fromSerial(startSerial + first + k)));
            }
            // The deducted part of a leave is its first months.
            target.leaveMonths.push_back(LeaveMonth{first + k, k < effect.deducted});
        }

        target.length = effect.length;
        target.allotment = effect.allotment;
        target.creditedLeave = effect.capUsed;
    }

    std::sort(target.leaveMonths.begin(), target.leaveMonths.end(),
              [](const LeaveMonth& a, const LeaveMonth& b) { return a.monthIndex < b.monthIndex; });
    target.durations[rules_.allotmentStation()] = target.allotment;
    target.durations[rules_.leaveStation()] = (int)target.leaveMonths.size();
    return target;
}

std::vector<TraineeTarget> LeaveProcessor::buildTargets(const std::vector<Trainee>& roster,
                                                        const std::vector<LeaveEvent>& events) const {
    for (const LeaveEvent& e : events) {
        bool known = false;
        for (const Trainee& t : roster) {
            if (t.id == e.traineeId) known = true;
        }
        if (!known) {
            throw std::invalid_argument("leave event names unknown trainee " + std::to_string(e.traineeId));
        }
    }

    std::vector<TraineeTarget> targets;
    targets.reserve(roster.size());
    for (const Trainee& t : roster) {
        targets.push_back(targetFor(t, events));
    }
    return targets;
}

/**
 * @brief Count completed months the way the program office does.
 *
 * Every station month up to the boundary counts once; leave months count
 * only when they were deducted from the allotment.
 */
TraineeProgress LeaveProcessor::progressOf(const ScheduleState& state, int ordinal, const TraineeTarget& target,
                                           MonthSerial boundary) const {
    const Trainee& trainee = state.trainee(ordinal);
    const int elapsed = std::max(0, std::min(target.length, state.monthIndexOf(ordinal, boundary) + 1));

    TraineeProgress progress{trainee.id, 0, 0, 0, trackLength(trainee.track), target.length - elapsed, 0.0};

    for (int i = 0; i < elapsed; ++i) {
        StationId s = state.at(ordinal, i);
        if (s == kNoStation) continue;
        if (s != rules_.leaveStation()) {
            progress.completedMonths++;
            continue;
        }
        bool credited = false;
        for (const LeaveMonth& m : target.leaveMonths) {
            if (m.monthIndex == i) credited = m.credited;
        }
        if (credited) {
            progress.creditedLeaveMonths++;
            progress.completedMonths++;
        } else {
            progress.uncreditedLeaveMonths++;
        }
    }

    if (progress.totalMonths > 0) {
        progress.percent = 100.0 * progress.completedMonths / progress.totalMonths;
    }
    return progress;
}
