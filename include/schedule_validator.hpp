#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "rule_catalog.hpp"
#include "schedule_state.hpp"
#include "leave_processor.hpp"
#include <string>
#include <vector>


///////////////////////////
///     CONTINUITY      ///
///////////////////////////
/**
 * @brief Consecutive runs of one station in a trainee's row.
 */
struct StationBlocks {
    StationId station;
    int blocks; ///< Number of separate runs.
    int firstBlock; ///< Length of the first run.
};

/**
 * @brief Runs per station of a row, leave months skipped.
 *
 * A station interrupted only by leave still counts as one run.
 */
std::vector<StationBlocks> stationBlocks(const std::vector<StationId>& row, StationId leaveStation);

/**
 * @brief Extra runs beyond what the syllabus accepts.
 *
 * One run per station is free, and so is the single split of a splittable
 * station whose first run lasts exactly its split point.
 */
int continuityPenalty(const std::vector<StationId>& row, const SyllabusRuleSet& rules);


///////////////////////////
///     VALIDATION      ///
///////////////////////////
/**
 * @brief Outcome of validating a finished schedule.
 */
struct ValidationReport {
    std::vector<std::string> errors; ///< Hard constraint violations.
    std::vector<std::string> warnings; ///< Continuity breaks.
    std::vector<std::string> info; ///< Accepted splits.

    bool ok() const { return errors.empty(); }

    /// Multi-line readable summary.
    std::string summary() const;
};

/**
 * @brief Check a complete matrix against every rule.
 *
 * Covers completeness, eligibility by department and track, leave months,
 * anchors recorded on the state, durations against the revised targets,
 * sequences, calendar windows and capacity bounds on months after the
 * boundary. Continuity is soft: breaks are warnings.
 */
ValidationReport validateSchedule(const ScheduleState& state, const SyllabusRuleSet& rules,
                                  const std::vector<TraineeTarget>& targets, MonthSerial boundary,
                                  const std::vector<CapacityOverride>& overrides = {});
