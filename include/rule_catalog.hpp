#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>


///////////////////////////
///      STATIONS       ///
///////////////////////////
/**
 * @brief Which departments may be assigned to a station.
 *
 * Department-scoped stations are the per-department specializations of one
 * logical station (e.g. HRP A / HRP B share the logical key "hrp").
 */
enum class StationScope { Shared, DepartmentA, DepartmentB };

/**
 * @brief Role of a station in the syllabus.
 */
enum class StationKind {
    Clinical, ///< Ordinary rotation/ward.
    Exam, ///< Calendar-windowed qualifying exam month.
    Allotment, ///< Department ("rotation") allotment that within-syllabus leave deducts from.
    Leave ///< Placeholder for leave months; never chosen by the solver.
};

/**
 * @brief Static description of one station.
 */
struct StationDef {
    StationId id = kNoStation; ///< Index in the rule set.
    std::string key; ///< Stable key, e.g. "hrp_a".
    std::string name; ///< Display name.
    std::string logicalKey; ///< Logical station shared by department variants.
    StationScope scope = StationScope::Shared; ///< Department scoping.
    StationKind kind = StationKind::Clinical; ///< Syllabus role.
    bool splittable = false; ///< May run as two blocks.
    int splitFirst = 0; ///< Length of the first block when split.
};


///////////////////////////
///        RULES        ///
///////////////////////////
/// Upper capacity bound meaning "no limit".
static constexpr int kUnbounded = std::numeric_limits<int>::max();

/**
 * @brief Required cumulative months at a station for one track.
 */
struct DurationRule {
    StationId station;
    Track track;
    int months;
};

/**
 * @brief Per-calendar-month headcount bounds over a pool of stations.
 *
 * A pool with several stations aggregates department variants into one bound.
 */
struct CapacityRule {
    std::vector<StationId> pool;
    int minOccupancy = 0;
    int maxOccupancy = kUnbounded;
};

/**
 * @brief Every dependent month must fall strictly after every predecessor month.
 */
struct SequenceRule {
    StationId predecessor;
    StationId dependent;
};

/**
 * @brief Calendar and program-relative window for a station (exam months).
 *
 * A month index i of a trainee with length L is allowed when its calendar
 * month is listed (an empty list allows any), minIndex <= i, i <= maxIndex
 * (if maxIndex >= 0) and L - i <= maxFromEnd (if maxFromEnd >= 0).
 */
struct CalendarWindowRule {
    StationId station;
    std::vector<int> calendarMonths;
    int minIndex = 0;
    int maxIndex = -1;
    int maxFromEnd = -1;
};

/// Closed set of rule kinds, dispatched by a single evaluator.
using StationRule = std::variant<DurationRule, CapacityRule, SequenceRule, CalendarWindowRule>;

/**
 * @brief Short name of a rule's kind ("duration", "capacity", ...).
 */
const char* ruleKindName(const StationRule& rule);

/**
 * @brief Leave handling policy.
 */
struct LeavePolicy {
    int withinSyllabusCap = 6; ///< Max months of within-syllabus leave deducted from the allotment.
};

/**
 * @brief Caller-approved relaxation of one capacity minimum for one month.
 */
struct CapacityOverride {
    StationId station; ///< Station whose pool minimum is lowered.
    YearMonth month; ///< Calendar month concerned.
    int newMin; ///< Relaxed minimum.
    std::string actor; ///< Who approved it.
    std::string justification; ///< Mandatory reason, recorded in the audit log.
};


///////////////////////////
///      RULE SETS      ///
///////////////////////////
/**
 * @brief Immutable, versioned snapshot of all station rules over a date range.
 *
 * The constructor validates the rules and precomputes lookups; nothing
 * mutates a rule set afterwards, so it is shared as a pointer-to-const.
 */
class SyllabusRuleSet {
public:
    /**
     * @brief Build and validate a rule set.
     *
     * @throws std::invalid_argument if station ids are out of range, bounds are
     *         inconsistent, a track's durations do not add up to its length,
     *         or the Leave / Allotment stations are missing.
     */
    SyllabusRuleSet(int version, YearMonth effectiveFrom, std::optional<YearMonth> effectiveTo,
                    std::vector<StationDef> stations, std::vector<StationRule> rules,
                    LeavePolicy leavePolicy = LeavePolicy{});

    int version() const { return version_; }
    YearMonth effectiveFrom() const { return effectiveFrom_; }
    std::optional<YearMonth> effectiveTo() const { return effectiveTo_; }

    /// True if date lies in [effectiveFrom, effectiveTo).
    bool covers(const YearMonth& date) const;

    const std::vector<StationDef>& stations() const { return stations_; }
    const StationDef& station(StationId id) const { return stations_.at(id); }
    int stationCount() const { return (int)stations_.size(); }
    std::optional<StationId> findStation(const std::string& key) const;

    const std::vector<StationRule>& rules() const { return rules_; }
    const LeavePolicy& leavePolicy() const { return leavePolicy_; }

    /// Required months at a station for a track (0 if no rule).
    int duration(StationId station, Track track) const;

    /// Whether the solver may place a trainee of this track/department at the station.
    bool eligible(StationId station, Track track, Department department) const;

    /// Bitmask of eligible stations.
    std::uint32_t eligibleMask(Track track, Department department) const;

    StationId leaveStation() const { return leaveStation_; }
    StationId allotmentStation() const { return allotmentStation_; }

    const std::vector<int>& capacityRules() const { return capacityRules_; }
    const std::vector<int>& sequenceRules() const { return sequenceRules_; }
    const std::vector<int>& windowRules() const { return windowRules_; }

    /// Typed access; the index must refer to a rule of that kind.
    const CapacityRule& capacityRule(int ruleIndex) const;
    const SequenceRule& sequenceRule(int ruleIndex) const;
    const CalendarWindowRule& windowRule(int ruleIndex) const;

    /// Human-readable description of a rule, e.g. "capacity[birth] 0..4".
    std::string describeRule(int ruleIndex) const;

private:
    int version_;
    YearMonth effectiveFrom_;
    std::optional<YearMonth> effectiveTo_;
    std::vector<StationDef> stations_;
    std::vector<StationRule> rules_;
    LeavePolicy leavePolicy_;

    /// durations_[station * 2 + track]
    std::vector<int> durations_;
    StationId leaveStation_ = kNoStation;
    StationId allotmentStation_ = kNoStation;
    std::vector<int> capacityRules_;
    std::vector<int> sequenceRules_;
    std::vector<int> windowRules_;

    void validate() const;
    void compile();
};

/// Shared, immutable handle to a rule set version.
using RuleSetPtr = std::shared_ptr<const SyllabusRuleSet>;

/**
 * @brief Lowest permitted headcount of a capacity rule in a month, after overrides.
 */
int effectiveMinimum(const SyllabusRuleSet& rules, int ruleIndex, MonthSerial month,
                     const std::vector<CapacityOverride>& overrides);


///////////////////////////
///       CATALOG       ///
///////////////////////////
/**
 * @brief Thrown when no rule set version covers a date.
 */
class NoRuleSetForDate : public std::runtime_error {
public:
    explicit NoRuleSetForDate(const YearMonth& date);
};

/**
 * @brief Thrown when a rule set version number is not in the catalog.
 */
class UnknownRuleSetVersion : public std::runtime_error {
public:
    explicit UnknownRuleSetVersion(int version);
};

/**
 * @brief Versioned collection of rule sets.
 *
 * Updates are inserts of new versions; existing versions are never replaced,
 * which keeps a record of which rules applied when. Safe for concurrent
 * readers and writers.
 */
class RuleCatalog {
public:
    RuleCatalog() = default;
    RuleCatalog(const RuleCatalog&) = delete;
    RuleCatalog& operator=(const RuleCatalog&) = delete;

    /**
     * @brief Add a new version.
     *
     * @throws std::invalid_argument on a duplicate version number or an
     *         effective range overlapping an existing version.
     */
    void insert(SyllabusRuleSet ruleSet);

    /**
     * @brief The version whose effective range covers the date.
     *
     * @throws NoRuleSetForDate if none does.
     */
    RuleSetPtr effectiveRuleSet(const YearMonth& date) const;

    /**
     * @brief Look up a version by number.
     *
     * @throws UnknownRuleSetVersion if absent.
     */
    RuleSetPtr byVersion(int version) const;

    std::vector<int> versions() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::vector<RuleSetPtr> versions_; ///< Sorted by effectiveFrom.
};

/**
 * @brief The stock OB/GYN residency syllabus.
 *
 * Model A adds up to 72 months and Model B (no Basic Sciences, shorter
 * general rotation) to 66. Minimum headcounts are 0; programs configure their
 * staffing floors through the JSON catalog.
 */
SyllabusRuleSet defaultRuleSet(int version, YearMonth effectiveFrom,
                               std::optional<YearMonth> effectiveTo = std::nullopt);
