#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "rule_catalog.hpp"
#include "schedule_state.hpp"
#include "leave_processor.hpp"
#include "solver_base.hpp"
#include "schedule_validator.hpp"
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief One run of a station in a trainee's row.
 */
struct TimelineBlock {
    StationId station;
    int firstIndex; ///< First month index of the run.
    int months; ///< Length of the run.
};

/// Consecutive runs of a row, empty cells skipped.
std::vector<TimelineBlock> timelineOf(const ScheduleState& state, int ordinal);

void printTimelines(const ScheduleState& state, const SyllabusRuleSet& rules);
void printProgress(const ScheduleState& state, const SyllabusRuleSet& rules,
                   const std::vector<TraineeTarget>& targets, MonthSerial boundary);
void printCapacitySummary(const std::vector<CapacityRow>& rows, const SyllabusRuleSet& rules);
void printBottlenecks(const std::vector<Bottleneck>& bottlenecks, const SyllabusRuleSet& rules);
void printConflictReport(const ConflictReport& report, const SyllabusRuleSet& rules);
void printValidation(const ValidationReport& report);
