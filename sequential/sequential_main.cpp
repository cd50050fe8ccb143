///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "formatting.hpp"
#include "demo_roster.hpp"
#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <exception>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Plan a cohort from scratch on the calling thread.
 *
 * Usage: rotation_sequential [engine.json] [catalog.json] [roster.json]
 *
 * Without a catalog the stock syllabus is used; without a roster a small
 * demo cohort with one maternity leave is planned.
 */
int main(int argc, char** argv) {
    try {
        EngineConfig config = argc > 1 ? loadEngineConfig(argv[1]) : EngineConfig{};
        if (config.debug) Logger::SetDebug(true);

        RuleCatalog catalog;
        if (argc > 2) {
            loadRuleCatalog(argv[2], catalog);
        } else {
            catalog.insert(defaultRuleSet(1, YearMonth{2020, 1}));
        }

        const bool demo = argc <= 3;
        std::vector<Trainee> roster = demo ? makeDemoRoster(DemoSize::S, YearMonth{2024, 1})
                                           : rosterFromJson(readJsonFile(argv[3]));

        RotationEngine engine(catalog, config);

        // Planning before the first intake: nothing is history yet.
        ResolveRequest request;
        request.state = ScheduleState(roster);
        request.currentMonth = YearMonth{2023, 12};
        if (demo) request.leaveEvents = makeDemoLeave(roster);
        request.actor = "program-office";
        request.timestamp = "2023-12-01T09:00:00Z";

        auto start = std::chrono::high_resolution_clock::now();
        ResolveResult result = engine.resolve(request);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        const RuleSetPtr rules = engine.ruleSetFor(result.ruleSetVersion, request.currentMonth);

        std::cout << "========================================\n";
        std::cout << "SEQUENTIAL ROTATION SOLVER\n";
        std::cout << "Trainees: " << roster.size() << ", rule set v" << result.ruleSetVersion << "\n";
        std::cout << "Status: " << resolveStatusName(result.status) << " ("
                  << continuityLevelName(result.stats.level) << ", " << result.stats.nodes << " nodes, "
                  << result.stats.penalty << " extra blocks)\n";
        std::cout << "Time: " << ms << " ms\n\n";

        if (result.conflict) {
            printConflictReport(*result.conflict, *rules);
            return 2;
        }
        if (!result.state) {
            std::cout << "No schedule found within the budget.\n";
            return 3;
        }

        printTimelines(*result.state, *rules);
        printProgress(*result.state, *rules, result.targets, toSerial(request.currentMonth) + 30);
        std::cout << "Capacity summary:\n";
        printCapacitySummary(result.capacity, *rules);
        std::cout << "\n";
        printBottlenecks(result.bottlenecks, *rules);
        std::cout << "\n";
        printValidation(result.validation);
        return 0;
    } catch (const std::exception& e) {
        Logger::Error(e.what());
        return 1;
    }
}
