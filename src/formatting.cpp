///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include <iostream>
#include <iomanip>
#include <map>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::string stationLabel(const SyllabusRuleSet& rules, StationId id) {
    if (id == kNoStation || id >= rules.stationCount()) return "-";
    return rules.station(id).name;
}

/**
 * @brief Print the header row of a trainee timeline table.
 */
static void printTimelineHeader() {
    std::cout << "    "
              << std::left << std::setw(24) << "Station"
              << " | " << std::left << std::setw(7) << "From"
              << " | " << std::left << std::setw(7) << "To"
              << " | " << std::left << std::setw(6) << "Months"
              << "\n";

    std::cout << "    "
              << std::string(24, '-')
              << "-+-" << std::string(7, '-')
              << "-+-" << std::string(7, '-')
              << "-+-" << std::string(6, '-')
              << "\n";
}

std::vector<TimelineBlock> timelineOf(const ScheduleState& state, int ordinal) {
    std::vector<TimelineBlock> blocks;
    for (int i = 0; i < state.length(ordinal); ++i) {
        const StationId s = state.at(ordinal, i);
        if (s == kNoStation) continue;
        if (!blocks.empty() && blocks.back().station == s && blocks.back().firstIndex + blocks.back().months == i) {
            blocks.back().months++;
        } else {
            blocks.push_back(TimelineBlock{s, i, 1});
        }
    }
    return blocks;
}

/**
 * @brief Print every active trainee's rotation blocks in calendar order.
 *
 * Anchored blocks are marked with '*', months at or before the committed
 * boundary with '#'.
 */
void printTimelines(const ScheduleState& state, const SyllabusRuleSet& rules) {
    for (int t = 0; t < state.traineeCount(); ++t) {
        const Trainee& trainee = state.trainee(t);
        if (!trainee.active) continue;

        std::cout << "----------------------------------------\n";
        std::cout << trainee.name << " (" << trackName(trainee.track) << ", department "
                  << departmentName(trainee.department) << ", " << state.length(t) << " months from "
                  << formatYearMonth(trainee.start) << "):\n";

        const std::vector<TimelineBlock> blocks = timelineOf(state, t);
        if (blocks.empty()) {
            std::cout << "  (no assignments)\n";
            continue;
        }
        printTimelineHeader();
        for (const TimelineBlock& b : blocks) {
            bool anchored = false;
            for (int i = b.firstIndex; i < b.firstIndex + b.months; ++i) {
                if (state.isAnchor(t, i)) anchored = true;
            }
            const MonthSerial first = state.calendarMonth(t, b.firstIndex);
            const MonthSerial last = first + b.months - 1;
            const bool past = state.committedThrough() && last <= *state.committedThrough();

            std::string label = stationLabel(rules, b.station);
            if (anchored) label += " *";
            if (past) label += " #";

            std::cout << "    "
                      << std::left << std::setw(24) << label
                      << " | " << std::left << std::setw(7) << formatYearMonth(fromSerial(first))
                      << " | " << std::left << std::setw(7) << formatYearMonth(fromSerial(last))
                      << " | " << std::right << std::setw(6) << b.months
                      << "\n";
        }
    }
    std::cout << "\n";
}

void printProgress(const ScheduleState& state, const SyllabusRuleSet& rules,
                   const std::vector<TraineeTarget>& targets, MonthSerial boundary) {
    LeaveProcessor leave(rules);
    std::cout << "Progress at " << formatYearMonth(fromSerial(boundary)) << ":\n";
    for (int t = 0; t < state.traineeCount(); ++t) {
        if (!state.trainee(t).active) continue;
        const TraineeProgress p = leave.progressOf(state, t, targets[t], boundary);
        std::cout << "  " << std::left << std::setw(20) << state.trainee(t).name
                  << std::right << std::setw(3) << p.completedMonths << "/" << p.totalMonths
                  << " (" << std::fixed << std::setprecision(1) << p.percent << "%)"
                  << ", leave credited " << p.creditedLeaveMonths
                  << ", extending " << p.uncreditedLeaveMonths
                  << ", " << p.remainingMonths << " months to go\n";
    }
    std::cout << std::defaultfloat << "\n";
}

/**
 * @brief Print the bounded capacity rules as a month-by-rule occupancy grid.
 */
void printCapacitySummary(const std::vector<CapacityRow>& rows, const SyllabusRuleSet& rules) {
    std::map<int, std::map<MonthSerial, const CapacityRow*>> byRule;
    for (const CapacityRow& r : rows) byRule[r.ruleIndex][r.month] = &r;

    for (const auto& entry : byRule) {
        std::cout << "  " << rules.describeRule(entry.first) << "\n    ";
        int column = 0;
        for (const auto& cell : entry.second) {
            const CapacityRow& r = *cell.second;
            const bool bad = r.occupancy < r.minOccupancy || r.occupancy > r.maxOccupancy;
            std::cout << formatYearMonth(fromSerial(r.month)) << "=" << r.occupancy << (bad ? "!" : " ") << " ";
            if (++column % 8 == 0) std::cout << "\n    ";
        }
        std::cout << "\n";
    }
}

void printBottlenecks(const std::vector<Bottleneck>& bottlenecks, const SyllabusRuleSet& rules) {
    if (bottlenecks.empty()) {
        std::cout << "No capacity bottlenecks ahead.\n";
        return;
    }
    std::cout << "Capacity bottlenecks:\n";
    for (const Bottleneck& b : bottlenecks) {
        std::cout << "  " << (b.severity == BottleneckSeverity::Critical ? "CRITICAL  " : "saturated ")
                  << formatYearMonth(fromSerial(b.row.month)) << " " << rules.describeRule(b.row.ruleIndex)
                  << " occupancy " << b.row.occupancy << "\n";
    }
}

void printConflictReport(const ConflictReport& report, const SyllabusRuleSet& rules) {
    std::cout << errorKindName(report.kind) << ": " << report.message << "\n";
    if (!report.minimal) std::cout << "  (diagnosis not minimal, budget exhausted)\n";
    for (const ConflictItem& item : report.items) {
        std::cout << "  " << std::left << std::setw(22) << reasonCodeName(item.reason);
        if (item.traineeId >= 0) std::cout << " trainee " << item.traineeId;
        if (item.monthIndex >= 0) std::cout << " month " << item.monthIndex;
        if (item.calendarMonth > 0) std::cout << " " << formatYearMonth(fromSerial(item.calendarMonth));
        std::cout << " " << stationLabel(rules, item.station) << "  " << item.rule << "\n";
    }
}

void printValidation(const ValidationReport& report) {
    std::cout << report.summary();
}
