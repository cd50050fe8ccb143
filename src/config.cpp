///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/**
 * @brief Typed read of an optional key, keeping the current value when absent.
 */
template <typename T>
void readOptional(const nlohmann::json& j, const char* key, T& value) {
    if (!j.contains(key)) return;
    try {
        value = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("config key '") + key + "': " + e.what());
    }
}

template <typename T>
T readRequired(const nlohmann::json& j, const char* key, const std::string& context) {
    if (!j.contains(key)) {
        throw std::runtime_error(context + ": missing key '" + key + "'");
    }
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(context + ": key '" + key + "': " + e.what());
    }
}

/**
 * @brief Run a reader, reporting nlohmann type errors under a context name.
 */
template <typename F>
auto withContext(const std::string& context, F&& read) -> decltype(read()) {
    try {
        return read();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(context + ": " + e.what());
    }
}

YearMonth readMonth(const nlohmann::json& j, const char* key, const std::string& context) {
    const std::string text = readRequired<std::string>(j, key, context);
    try {
        return parseYearMonth(text);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(context + ": key '" + key + "': " + e.what());
    }
}

StationId stationByKey(const std::vector<StationDef>& stations, const std::string& key, const std::string& context) {
    for (const StationDef& s : stations) {
        if (s.key == key) return s.id;
    }
    throw std::runtime_error(context + ": unknown station '" + key + "'");
}

StationScope parseScope(const std::string& text) {
    if (text == "shared") return StationScope::Shared;
    if (text == "department_a") return StationScope::DepartmentA;
    if (text == "department_b") return StationScope::DepartmentB;
    throw std::runtime_error("unknown station scope '" + text + "'");
}

StationKind parseKind(const std::string& text) {
    if (text == "clinical") return StationKind::Clinical;
    if (text == "exam") return StationKind::Exam;
    if (text == "allotment") return StationKind::Allotment;
    if (text == "leave") return StationKind::Leave;
    throw std::runtime_error("unknown station kind '" + text + "'");
}

std::vector<StationId> readPool(const nlohmann::json& j, const std::vector<StationDef>& stations,
                                const std::string& context) {
    std::vector<StationId> pool;
    if (j.contains("pool")) {
        for (const std::string& key : readRequired<std::vector<std::string>>(j, "pool", context)) {
            pool.push_back(stationByKey(stations, key, context));
        }
    } else {
        pool.push_back(stationByKey(stations, readRequired<std::string>(j, "station", context), context));
    }
    return pool;
}

StationDef stationFromJson(const nlohmann::json& j, StationId id) {
    const std::string context = "station " + std::to_string(id);
    StationDef def;
    def.id = id;
    def.key = readRequired<std::string>(j, "key", context);
    def.name = j.value("name", def.key);
    def.logicalKey = j.value("logical_key", def.key);
    def.scope = parseScope(j.value("scope", "shared"));
    def.kind = parseKind(j.value("kind", "clinical"));
    def.splitFirst = j.value("split_first", 0);
    def.splittable = def.splitFirst > 0;
    return def;
}

StationRule ruleFromJson(const nlohmann::json& j, const std::vector<StationDef>& stations, int index) {
    const std::string context = "rule " + std::to_string(index);
    const std::string kind = readRequired<std::string>(j, "kind", context);

    if (kind == "duration") {
        return DurationRule{stationByKey(stations, readRequired<std::string>(j, "station", context), context),
                            parseTrack(readRequired<std::string>(j, "track", context)),
                            readRequired<int>(j, "months", context)};
    }
    if (kind == "capacity") {
        CapacityRule rule;
        rule.pool = readPool(j, stations, context);
        rule.minOccupancy = j.value("min", 0);
        rule.maxOccupancy = j.value("max", kUnbounded);
        return rule;
    }
    if (kind == "sequence") {
        return SequenceRule{stationByKey(stations, readRequired<std::string>(j, "predecessor", context), context),
                            stationByKey(stations, readRequired<std::string>(j, "dependent", context), context)};
    }
    if (kind == "window") {
        CalendarWindowRule rule;
        rule.station = stationByKey(stations, readRequired<std::string>(j, "station", context), context);
        rule.calendarMonths = j.value("calendar_months", std::vector<int>{});
        rule.minIndex = j.value("min_index", 0);
        rule.maxIndex = j.value("max_index", -1);
        rule.maxFromEnd = j.value("max_from_end", -1);
        return rule;
    }
    throw std::runtime_error(context + ": unknown rule kind '" + kind + "'");
}

/**
 * @brief Apply {station|pool, min, max} entries to the capacity rules.
 *
 * An entry whose pool matches an existing rule updates it; any other entry
 * adds a rule.
 */
void applyCapacityBounds(const nlohmann::json& bounds, const std::vector<StationDef>& stations,
                         std::vector<StationRule>& rules) {
    for (std::size_t n = 0; n < bounds.size(); ++n) {
        const nlohmann::json& b = bounds[n];
        const std::string context = "capacity_bounds[" + std::to_string(n) + "]";
        std::vector<StationId> pool = readPool(b, stations, context);

        CapacityRule* target = nullptr;
        for (StationRule& rule : rules) {
            auto* cap = std::get_if<CapacityRule>(&rule);
            if (cap != nullptr && cap->pool == pool) target = cap;
        }
        if (target == nullptr) {
            rules.push_back(CapacityRule{pool, 0, kUnbounded});
            target = &std::get<CapacityRule>(rules.back());
        }
        readOptional(b, "min", target->minOccupancy);
        readOptional(b, "max", target->maxOccupancy);
    }
}

} // namespace


///////////////////////////
///    ENGINE CONFIG    ///
///////////////////////////
EngineConfig engineConfigFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("engine config must be a JSON object");
    }
    EngineConfig config;
    readOptional(j, "time_budget_ms", config.timeBudgetMs);
    readOptional(j, "explain_budget_ms", config.explainBudgetMs);
    readOptional(j, "strict_node_limit", config.strictNodeLimit);
    readOptional(j, "relaxed_node_limit", config.relaxedNodeLimit);
    readOptional(j, "improvement_node_limit", config.improvementNodeLimit);
    readOptional(j, "explain_node_limit", config.explainNodeLimit);
    readOptional(j, "bottleneck_lookahead", config.bottleneckLookahead);
    readOptional(j, "debug", config.debug);

    if (config.timeBudgetMs < 0) throw std::runtime_error("config key 'time_budget_ms' must not be negative");
    if (config.explainBudgetMs < 0) throw std::runtime_error("config key 'explain_budget_ms' must not be negative");
    if (config.strictNodeLimit <= 0) throw std::runtime_error("config key 'strict_node_limit' must be positive");
    if (config.relaxedNodeLimit < 0) throw std::runtime_error("config key 'relaxed_node_limit' must not be negative");
    if (config.explainNodeLimit <= 0) throw std::runtime_error("config key 'explain_node_limit' must be positive");
    if (config.improvementNodeLimit < 0) {
        throw std::runtime_error("config key 'improvement_node_limit' must not be negative");
    }
    return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
    return engineConfigFromJson(readJsonFile(path));
}

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}


///////////////////////////
///      CATALOGS       ///
///////////////////////////
SyllabusRuleSet ruleSetFromJson(const nlohmann::json& j) {
    const int version = readRequired<int>(j, "version", "rule set");
    const std::string context = "rule set " + std::to_string(version);
    const YearMonth from = readMonth(j, "effective_from", context);
    std::optional<YearMonth> to;
    if (j.contains("effective_to")) to = readMonth(j, "effective_to", context);

    LeavePolicy policy;
    if (j.contains("leave_policy")) {
        readOptional(j.at("leave_policy"), "within_syllabus_cap", policy.withinSyllabusCap);
    }

    std::vector<StationDef> stations;
    std::vector<StationRule> rules;

    if (withContext(context, [&]() { return j.value("stock", false); })) {
        SyllabusRuleSet stock = defaultRuleSet(version, from, to);
        stations = stock.stations();
        rules = stock.rules();
    } else {
        const nlohmann::json& list = j.contains("stations") ? j.at("stations") : nlohmann::json::array();
        if (!list.is_array() || list.empty()) {
            throw std::runtime_error(context + ": 'stations' must be a non-empty array");
        }
        for (const nlohmann::json& s : list) {
            const StationId id = (StationId)stations.size();
            stations.push_back(withContext(context, [&]() { return stationFromJson(s, id); }));
        }
        if (j.contains("rules")) {
            int index = 0;
            for (const nlohmann::json& r : j.at("rules")) {
                rules.push_back(withContext(context, [&]() { return ruleFromJson(r, stations, index); }));
                index++;
            }
        }
    }

    if (j.contains("capacity_bounds")) {
        applyCapacityBounds(j.at("capacity_bounds"), stations, rules);
    }
    return SyllabusRuleSet(version, from, to, std::move(stations), std::move(rules), policy);
}

void loadRuleCatalog(const std::string& path, RuleCatalog& catalog) {
    const nlohmann::json j = readJsonFile(path);
    if (!j.contains("rule_sets") || !j.at("rule_sets").is_array()) {
        throw std::runtime_error(path + ": missing array 'rule_sets'");
    }
    for (const nlohmann::json& entry : j.at("rule_sets")) {
        catalog.insert(ruleSetFromJson(entry));
    }
}


///////////////////////////
///       ROSTER        ///
///////////////////////////
Track parseTrack(const std::string& text) {
    if (text == "ModelA" || text == "A") return Track::ModelA;
    if (text == "ModelB" || text == "B") return Track::ModelB;
    throw std::runtime_error("unknown track '" + text + "'");
}

Department parseDepartment(const std::string& text) {
    if (text == "A") return Department::A;
    if (text == "B") return Department::B;
    throw std::runtime_error("unknown department '" + text + "'");
}

std::vector<Trainee> rosterFromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::runtime_error("roster must be a JSON array");
    }
    std::vector<Trainee> roster;
    std::set<int> ids;
    for (std::size_t n = 0; n < j.size(); ++n) {
        const nlohmann::json& e = j[n];
        const std::string context = "roster[" + std::to_string(n) + "]";
        const int id = readRequired<int>(e, "id", context);
        if (!ids.insert(id).second) {
            throw std::runtime_error(context + ": duplicate trainee id " + std::to_string(id));
        }
        roster.push_back(withContext(context, [&]() {
            Trainee t = makeTrainee(id, e.value("name", "Trainee " + std::to_string(id)),
                                    parseTrack(readRequired<std::string>(e, "track", context)),
                                    parseDepartment(readRequired<std::string>(e, "department", context)),
                                    readMonth(e, "start", context));
            t.active = e.value("active", true);
            return t;
        }));
    }
    return roster;
}

std::vector<LeaveEvent> leaveEventsFromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::runtime_error("leave events must be a JSON array");
    }
    std::vector<LeaveEvent> events;
    for (std::size_t n = 0; n < j.size(); ++n) {
        const nlohmann::json& e = j[n];
        const std::string context = "leave[" + std::to_string(n) + "]";
        const std::string classification =
                withContext(context, [&]() { return e.value("classification", std::string("within_syllabus")); });
        LeaveClass cls;
        if (classification == "within_syllabus") cls = LeaveClass::WithinSyllabus;
        else if (classification == "extension") cls = LeaveClass::Extension;
        else throw std::runtime_error(context + ": unknown classification '" + classification + "'");

        events.push_back(LeaveEvent{readRequired<int>(e, "trainee_id", context), readMonth(e, "start", context),
                                    readRequired<int>(e, "months", context), cls,
                                    withContext(context, [&]() { return e.value("note", std::string()); })});
    }
    return events;
}
