///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "rule_catalog.hpp"
#include <string>
#include <utility>
#include <vector>


///////////////////////////
///   DEFAULT SYLLABUS  ///
///////////////////////////
namespace {

/**
 * @brief One row of the stock syllabus table.
 */
struct StationSpec {
    const char* key;
    const char* name;
    const char* logicalKey;
    StationScope scope;
    StationKind kind;
    int monthsA; ///< Model A duration.
    int monthsB; ///< Model B duration.
    int maxOccupancy; ///< kUnbounded for no capacity rule.
    int splitFirst; ///< 0 if not splittable.
};

// Catalog order doubles as the solver's placement preference: early clinical
// stations first, allotment and electives later.
const StationSpec kStockStations[] = {
        {"orientation",             "Orientation",             "orientation",    StationScope::Shared,      StationKind::Clinical,  1,  1,  kUnbounded, 0},
        {"maternity_intro",         "Maternity",               "maternity",      StationScope::Shared,      StationKind::Clinical,  1,  1,  kUnbounded, 0},
        {"hrp_a",                   "HRP A",                   "hrp",            StationScope::DepartmentA, StationKind::Clinical,  6,  6,  2,          4},
        {"hrp_b",                   "HRP B",                   "hrp",            StationScope::DepartmentB, StationKind::Clinical,  6,  6,  2,          4},
        {"birth",                   "Birth",                   "birth",          StationScope::Shared,      StationKind::Clinical,  6,  6,  4,          4},
        {"gynecology_a",            "Gynecology A",            "gynecology",     StationScope::DepartmentA, StationKind::Clinical,  6,  6,  2,          4},
        {"gynecology_b",            "Gynecology B",            "gynecology",     StationScope::DepartmentB, StationKind::Clinical,  6,  6,  2,          4},
        {"maternity_er",            "Maternity ER",            "maternity_er",   StationScope::Shared,      StationKind::Clinical,  6,  6,  4,          3},
        {"womens_er",               "Womens ER",               "womens_er",      StationScope::Shared,      StationKind::Clinical,  3,  3,  3,          0},
        {"gynecology_day",          "Gynecology Day",          "gynecology_day", StationScope::Shared,      StationKind::Clinical,  3,  3,  2,          0},
        {"midwifery_day",           "Midwifery Day",           "midwifery_day",  StationScope::Shared,      StationKind::Clinical,  3,  3,  2,          0},
        {"basic_sciences",          "Basic Sciences",          "basic_sciences", StationScope::Shared,      StationKind::Clinical,  5,  0,  kUnbounded, 0},
        {"rotation_a",              "Rotation A",              "rotation_a",     StationScope::Shared,      StationKind::Clinical,  3,  3,  kUnbounded, 0},
        {"stage_a",                 "Stage A",                 "stage_a",        StationScope::Shared,      StationKind::Exam,      1,  1,  kUnbounded, 0},
        {"rotation_b",              "Rotation B",              "rotation_b",     StationScope::Shared,      StationKind::Clinical,  3,  3,  kUnbounded, 0},
        {"stage_b",                 "Stage B",                 "stage_b",        StationScope::Shared,      StationKind::Exam,      1,  1,  kUnbounded, 0},
        {"department",              "Department",              "department",     StationScope::Shared,      StationKind::Allotment, 14, 14, kUnbounded, 0},
        {"ivf",                     "IVF",                     "ivf",            StationScope::Shared,      StationKind::Clinical,  4,  4,  4,          0},
        {"gyneco_oncology",         "Gyneco-Oncology",         "gyneco_oncology",StationScope::Shared,      StationKind::Clinical,  2,  2,  2,          0},
        {"rotation_general",        "Rotation",                "rotation",       StationScope::Shared,      StationKind::Clinical,  3,  2,  kUnbounded, 0},
        {"maternity_er_supervisor", "Maternity ER Supervisor", "mer_supervisor", StationScope::Shared,      StationKind::Clinical,  1,  1,  1,          0},
        {"leave",                   "Leave",                   "leave",          StationScope::Shared,      StationKind::Leave,     0,  0,  kUnbounded, 0},
};

StationId idOf(const std::vector<StationDef>& stations, const std::string& key) {
    for (const StationDef& s : stations) {
        if (s.key == key) return s.id;
    }
    throw std::invalid_argument("stock syllabus has no station '" + key + "'");
}

} // namespace

SyllabusRuleSet defaultRuleSet(int version, YearMonth effectiveFrom, std::optional<YearMonth> effectiveTo) {
    std::vector<StationDef> stations;
    std::vector<StationRule> rules;

    for (const StationSpec& spec : kStockStations) {
        StationDef def;
        def.id = (StationId)stations.size();
        def.key = spec.key;
        def.name = spec.name;
        def.logicalKey = spec.logicalKey;
        def.scope = spec.scope;
        def.kind = spec.kind;
        def.splittable = spec.splitFirst > 0;
        def.splitFirst = spec.splitFirst;
        stations.push_back(def);

        if (spec.monthsA > 0) rules.push_back(DurationRule{def.id, Track::ModelA, spec.monthsA});
        if (spec.monthsB > 0) rules.push_back(DurationRule{def.id, Track::ModelB, spec.monthsB});
        if (spec.maxOccupancy != kUnbounded) {
            CapacityRule cap;
            cap.pool = {def.id};
            cap.minOccupancy = 0;
            cap.maxOccupancy = spec.maxOccupancy;
            rules.push_back(cap);
        }
    }

    const StationId basicSciences = idOf(stations, "basic_sciences");
    const StationId rotationA = idOf(stations, "rotation_a");
    const StationId stageA = idOf(stations, "stage_a");
    const StationId rotationB = idOf(stations, "rotation_b");
    const StationId stageB = idOf(stations, "stage_b");
    const StationId supervisor = idOf(stations, "maternity_er_supervisor");

    rules.push_back(SequenceRule{basicSciences, stageA});
    rules.push_back(SequenceRule{rotationA, stageA});
    rules.push_back(SequenceRule{rotationB, stageB});
    rules.push_back(SequenceRule{stageA, stageB});
    rules.push_back(SequenceRule{stageA, supervisor});

    // Stage A: June, 3 to 4.5 years after start.
    CalendarWindowRule stageAWindow;
    stageAWindow.station = stageA;
    stageAWindow.calendarMonths = {6};
    stageAWindow.minIndex = 36;
    stageAWindow.maxIndex = 54;
    rules.push_back(stageAWindow);

    // Stage B: November or March, during the last year.
    CalendarWindowRule stageBWindow;
    stageBWindow.station = stageB;
    stageBWindow.calendarMonths = {11, 3};
    stageBWindow.maxFromEnd = 12;
    rules.push_back(stageBWindow);

    return SyllabusRuleSet(version, effectiveFrom, effectiveTo, std::move(stations), std::move(rules));
}
