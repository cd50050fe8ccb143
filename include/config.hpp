#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "rule_catalog.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>


///////////////////////////
///    ENGINE CONFIG    ///
///////////////////////////
/**
 * @brief Tuning knobs of the engine.
 *
 * Node limits bound each search deterministically; the time budgets are
 * wall-clock safety nets on top of them.
 */
struct EngineConfig {
    int timeBudgetMs = 10000; ///< Default resolve budget.
    int explainBudgetMs = 2000; ///< Budget of a conflict diagnosis.
    long long strictNodeLimit = 200000;
    long long relaxedNodeLimit = 0; ///< 0: relaxed search runs until the time budget.
    long long improvementNodeLimit = 20000;
    long long explainNodeLimit = 20000; ///< Per feasibility check.
    int bottleneckLookahead = 12; ///< Months covered by the bottleneck report.
    bool debug = false; ///< Enable debug logging.
};

/**
 * @brief Read an engine config object; missing keys keep their defaults.
 *
 * @throws std::runtime_error naming the offending key on a type mismatch or
 *         a non-positive budget.
 */
EngineConfig engineConfigFromJson(const nlohmann::json& j);

/**
 * @brief Load an engine config file.
 *
 * @throws std::runtime_error if the file cannot be read or parsed.
 */
EngineConfig loadEngineConfig(const std::string& path);


///////////////////////////
///      CATALOGS       ///
///////////////////////////
/**
 * @brief Build a rule set from JSON.
 *
 * With "stock": true the stock syllabus is the starting point and
 * "capacity_bounds" adjusts or adds single-station capacity rules;
 * otherwise "stations" and "rules" spell out the whole rule set.
 *
 * @throws std::runtime_error on malformed JSON or unknown station keys.
 * @throws std::invalid_argument if the resulting rule set is inconsistent.
 */
SyllabusRuleSet ruleSetFromJson(const nlohmann::json& j);

/**
 * @brief Insert every rule set of a catalog file ({"rule_sets": [...]}).
 */
void loadRuleCatalog(const std::string& path, RuleCatalog& catalog);


///////////////////////////
///       ROSTER        ///
///////////////////////////
Track parseTrack(const std::string& text);
Department parseDepartment(const std::string& text);

/**
 * @brief Read a roster array of {id, name, track, department, start, active}.
 *
 * @throws std::runtime_error on malformed entries or duplicate ids.
 */
std::vector<Trainee> rosterFromJson(const nlohmann::json& j);

/**
 * @brief Read leave events {trainee_id, start, months, classification, note}.
 */
std::vector<LeaveEvent> leaveEventsFromJson(const nlohmann::json& j);

/**
 * @brief Parse a JSON file.
 *
 * @throws std::runtime_error if the file is missing or not valid JSON.
 */
nlohmann::json readJsonFile(const std::string& path);
