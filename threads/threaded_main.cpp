///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "program_scheduler.hpp"
#include "model.hpp"
#include "config.hpp"
#include "formatting.hpp"
#include "demo_roster.hpp"
#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <exception>
#include <thread>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static void reportMove(const ProgramScheduler& scheduler, const SyllabusRuleSet& rules, const Assignment& move,
                       const YearMonth& currentMonth) {
    const auto conflict = scheduler.validateMove(move, currentMonth);
    std::cout << "validateMove trainee " << move.traineeId << " month " << move.monthIndex << " -> "
              << rules.station(move.station).key << ": ";
    if (!conflict) {
        std::cout << "admissible\n";
    } else {
        printConflictReport(*conflict, rules);
    }
}


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Background resolves against one program.
 *
 * Usage: rotation_threaded [engine.json]
 *
 * Plans a demo cohort on a background task while move validations run
 * against the committed snapshot, then re-plans a year later with a new
 * anchor and cancels a third run to show that a cancelled resolve leaves
 * the committed state alone.
 */
int main(int argc, char** argv) {
    try {
        EngineConfig config = argc > 1 ? loadEngineConfig(argv[1]) : EngineConfig{};
        if (config.debug) Logger::SetDebug(true);

        RuleCatalog catalog;
        catalog.insert(defaultRuleSet(1, YearMonth{2020, 1}));
        const RuleSetPtr rules = catalog.byVersion(1);
        RotationEngine engine(catalog, config);

        const std::vector<Trainee> roster = makeDemoRoster(DemoSize::M, YearMonth{2024, 1});
        ProgramScheduler scheduler(engine, ScheduleState(roster));

        // Initial plan.
        ResolveCommand plan;
        plan.currentMonth = YearMonth{2023, 12};
        plan.leaveEvents = makeDemoLeave(roster);
        plan.actor = "program-office";
        plan.timestamp = "2023-12-01T09:00:00Z";

        auto start = std::chrono::high_resolution_clock::now();
        ResolveTask task = scheduler.startResolve(plan);

        // Validations run against the last committed snapshot while the plan is computed.
        const StationId hrpA = *rules->findStation("hrp_a");
        const StationId birth = *rules->findStation("birth");
        while (!task.ready()) {
            reportMove(scheduler, *rules, Assignment{roster[1].id, 10, hrpA}, plan.currentMonth);
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        const ResolveResult& first = task.wait();
        double ms = std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count();

        std::cout << "========================================\n";
        std::cout << "THREADED ROTATION SCHEDULER\n";
        std::cout << "Trainees: " << roster.size() << "\n";
        std::cout << "Status: " << resolveStatusName(first.status) << ", " << first.stats.nodes << " nodes\n";
        std::cout << "Time: " << ms << " ms\n\n";
        if (first.conflict) printConflictReport(*first.conflict, *rules);
        if (first.status != ResolveStatus::ValidState) return 2;

        // A year later: pin the first trainee to Birth and re-plan the rest.
        ResolveCommand replan = plan;
        replan.currentMonth = YearMonth{2024, 12};
        replan.anchors.push_back(Assignment{roster[0].id, 14, birth});
        replan.timestamp = "2024-12-01T09:00:00Z";
        reportMove(scheduler, *rules, replan.anchors.back(), replan.currentMonth);

        const ResolveResult second = scheduler.startResolve(replan).wait();
        std::cout << "Re-plan: " << resolveStatusName(second.status) << "\n";
        if (second.conflict) printConflictReport(*second.conflict, *rules);

        // Cancelling stops the run at its next budget check; only a ValidState is committed.
        const int commitsBefore = scheduler.commits();
        ResolveCommand third = replan;
        third.anchors.push_back(Assignment{roster[2].id, 20, birth});
        ResolveTask cancelled = scheduler.startResolve(third);
        cancelled.cancel();
        const ResolveResult& stopped = cancelled.wait();
        std::cout << "Cancelled run: " << resolveStatusName(stopped.status) << ", commits "
                  << commitsBefore << " -> " << scheduler.commits() << "\n\n";

        printTimelines(*scheduler.snapshot(), *rules);
        std::cout << "Audit log:\n" << scheduler.auditLog().toJson().dump(2) << "\n";
        return 0;
    } catch (const std::exception& e) {
        Logger::Error(e.what());
        return 1;
    }
}
