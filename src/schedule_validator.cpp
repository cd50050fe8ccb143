///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "schedule_validator.hpp"
#include "rule_evaluator.hpp"
#include <sstream>


///////////////////////////
///     CONTINUITY      ///
///////////////////////////
std::vector<StationBlocks> stationBlocks(const std::vector<StationId>& row, StationId leaveStation) {
    std::vector<StationBlocks> out;
    auto find = [&](StationId s) -> StationBlocks* {
        for (StationBlocks& b : out) {
            if (b.station == s) return &b;
        }
        return nullptr;
    };

    StationId prev = kNoStation;
    for (StationId s : row) {
        if (s == leaveStation || s == kNoStation) continue;
        StationBlocks* b = find(s);
        if (b == nullptr) {
            out.push_back(StationBlocks{s, 1, 1});
        } else if (s != prev) {
            b->blocks++;
        } else if (b->blocks == 1) {
            b->firstBlock++;
        }
        prev = s;
    }
    return out;
}

int continuityPenalty(const std::vector<StationId>& row, const SyllabusRuleSet& rules) {
    int penalty = 0;
    for (const StationBlocks& b : stationBlocks(row, rules.leaveStation())) {
        const StationDef& def = rules.station(b.station);
        const bool allowedSplit = def.splittable && b.blocks == 2 && b.firstBlock == def.splitFirst;
        penalty += b.blocks - 1 - (allowedSplit ? 1 : 0);
    }
    return penalty;
}


///////////////////////////
///     VALIDATION      ///
///////////////////////////
std::string ValidationReport::summary() const {
    std::ostringstream out;
    out << (ok() ? "Validation PASSED" : "Validation FAILED");
    auto section = [&](const char* title, const std::vector<std::string>& lines) {
        if (lines.empty()) return;
        out << "\n" << title << " (" << lines.size() << "):";
        for (const std::string& line : lines) out << "\n  - " << line;
    };
    section("Errors", errors);
    section("Warnings", warnings);
    section("Info", info);
    return out.str();
}

ValidationReport validateSchedule(const ScheduleState& state, const SyllabusRuleSet& rules,
                                  const std::vector<TraineeTarget>& targets, MonthSerial boundary,
                                  const std::vector<CapacityOverride>& overrides) {
    ValidationReport report;
    if ((int)targets.size() != state.traineeCount()) {
        report.errors.push_back("expected one target per trainee");
        return report;
    }
    const StationId leave = rules.leaveStation();

    // Rows: length, completeness, eligibility and leave months.
    for (int t = 0; t < state.traineeCount(); ++t) {
        const Trainee& trainee = state.trainee(t);
        if (!trainee.active) continue;
        const TraineeTarget& target = targets[t];

        if (state.length(t) != target.length) {
            report.errors.push_back(trainee.name + ": length " + std::to_string(state.length(t)) +
                                    " differs from target " + std::to_string(target.length));
            continue;
        }

        std::vector<StationId> row;
        for (int i = 0; i < state.length(t); ++i) {
            const StationId s = state.at(t, i);
            row.push_back(s);
            const std::string where = trainee.name + " month " + std::to_string(i);
            if (s == kNoStation) {
                report.errors.push_back(where + " is unassigned");
            } else if (target.isLeave(i) != (s == leave)) {
                report.errors.push_back(where + (s == leave ? " is leave without a leave event"
                                                            : " should be leave"));
            } else if (s != leave && !rules.eligible(s, trainee.track, trainee.department)) {
                report.errors.push_back(where + ": " + rules.station(s).key + " is not open to department " +
                                        departmentName(trainee.department) + " / " + trackName(trainee.track));
            }
        }

        for (const StationBlocks& b : stationBlocks(row, leave)) {
            if (b.blocks == 1) continue;
            const StationDef& def = rules.station(b.station);
            const std::string line = trainee.name + ": " + def.name + " runs in " + std::to_string(b.blocks) + " blocks";
            if (def.splittable && b.blocks == 2 && b.firstBlock == def.splitFirst) {
                report.info.push_back(line + " (split after " + std::to_string(def.splitFirst) + " months)");
            } else {
                report.warnings.push_back(line);
            }
        }
    }

    for (const Assignment& a : state.anchors()) {
        const int t = state.ordinalOf(a.traineeId);
        if (t < 0 || a.monthIndex < 0 || a.monthIndex >= state.length(t) || state.at(t, a.monthIndex) != a.station) {
            report.errors.push_back("anchor of trainee " + std::to_string(a.traineeId) + " at month " +
                                    std::to_string(a.monthIndex) + " is not reproduced");
        }
    }

    CapacityTracker capacity = CapacityTracker::fromState(rules, state, overrides);
    RuleEvaluator evaluator(state, rules, targets, capacity, boundary, EvaluationMode::Complete);
    for (const RuleViolation& v : evaluator.evaluateAll()) {
        report.errors.push_back(v.message);
    }

    // The leave station carries no duration rule of its own.
    for (int t = 0; t < state.traineeCount(); ++t) {
        if (!state.trainee(t).active || state.length(t) != targets[t].length) continue;
        int leaveMonths = 0;
        for (int i = 0; i < state.length(t); ++i) {
            if (state.at(t, i) == leave) leaveMonths++;
        }
        if (leaveMonths != targets[t].durations[leave]) {
            report.errors.push_back(state.trainee(t).name + ": " + std::to_string(leaveMonths) +
                                    " leave months, expected " + std::to_string(targets[t].durations[leave]));
        }
    }
    return report;
}
