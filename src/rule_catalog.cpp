///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "rule_catalog.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <utility>


///////////////////////////
///        RULES        ///
///////////////////////////
const char* ruleKindName(const StationRule& rule) {
    if (std::holds_alternative<DurationRule>(rule)) return "duration";
    if (std::holds_alternative<CapacityRule>(rule)) return "capacity";
    if (std::holds_alternative<SequenceRule>(rule)) return "sequence";
    return "window";
}


///////////////////////////
///      RULE SETS      ///
///////////////////////////
/**
 * @brief Construct, number the stations, validate and precompute lookups.
 */
SyllabusRuleSet::SyllabusRuleSet(int version, YearMonth effectiveFrom, std::optional<YearMonth> effectiveTo,
                                 std::vector<StationDef> stations, std::vector<StationRule> rules,
                                 LeavePolicy leavePolicy)
        : version_(version),
          effectiveFrom_(effectiveFrom),
          effectiveTo_(effectiveTo),
          stations_(std::move(stations)),
          rules_(std::move(rules)),
          leavePolicy_(leavePolicy) {
    if (stations_.empty() || (int)stations_.size() > kMaxStations) {
        throw std::invalid_argument("rule set v" + std::to_string(version_) +
                                    ": station count must be 1.." + std::to_string(kMaxStations));
    }
    // Station ids are positions, whatever the caller filled in.
    for (int i = 0; i < (int)stations_.size(); ++i) {
        stations_[i].id = (StationId)i;
    }
    compile();
    validate();
}

bool SyllabusRuleSet::covers(const YearMonth& date) const {
    if (date < effectiveFrom_) return false;
    if (effectiveTo_ && !(date < *effectiveTo_)) return false;
    return true;
}

std::optional<StationId> SyllabusRuleSet::findStation(const std::string& key) const {
    for (const StationDef& s : stations_) {
        if (s.key == key) return s.id;
    }
    return std::nullopt;
}

int SyllabusRuleSet::duration(StationId station, Track track) const {
    if (station >= stations_.size()) return 0;
    return durations_[station * 2 + (track == Track::ModelA ? 0 : 1)];
}

bool SyllabusRuleSet::eligible(StationId station, Track track, Department department) const {
    if (station >= stations_.size()) return false;
    const StationDef& def = stations_[station];
    if (def.kind == StationKind::Leave) return false;
    if (duration(station, track) <= 0) return false;
    if (def.scope == StationScope::DepartmentA && department != Department::A) return false;
    if (def.scope == StationScope::DepartmentB && department != Department::B) return false;
    return true;
}

std::uint32_t SyllabusRuleSet::eligibleMask(Track track, Department department) const {
    std::uint32_t mask = 0;
    for (const StationDef& s : stations_) {
        if (eligible(s.id, track, department)) mask |= (1u << s.id);
    }
    return mask;
}

const CapacityRule& SyllabusRuleSet::capacityRule(int ruleIndex) const {
    return std::get<CapacityRule>(rules_.at(ruleIndex));
}

const SequenceRule& SyllabusRuleSet::sequenceRule(int ruleIndex) const {
    return std::get<SequenceRule>(rules_.at(ruleIndex));
}

const CalendarWindowRule& SyllabusRuleSet::windowRule(int ruleIndex) const {
    return std::get<CalendarWindowRule>(rules_.at(ruleIndex));
}

std::string SyllabusRuleSet::describeRule(int ruleIndex) const {
    const StationRule& rule = rules_.at(ruleIndex);
    auto keyOf = [&](StationId id) -> std::string {
        return id < stations_.size() ? stations_[id].key : std::string("?");
    };

    std::ostringstream out;
    out << ruleKindName(rule) << "[";
    if (const auto* d = std::get_if<DurationRule>(&rule)) {
        out << keyOf(d->station) << "] " << trackName(d->track) << "=" << d->months;
    } else if (const auto* c = std::get_if<CapacityRule>(&rule)) {
        for (std::size_t i = 0; i < c->pool.size(); ++i) {
            if (i > 0) out << "+";
            out << keyOf(c->pool[i]);
        }
        out << "] " << c->minOccupancy << "..";
        if (c->maxOccupancy == kUnbounded) out << "inf";
        else out << c->maxOccupancy;
    } else if (const auto* q = std::get_if<SequenceRule>(&rule)) {
        out << keyOf(q->predecessor) << " -> " << keyOf(q->dependent) << "]";
    } else if (const auto* w = std::get_if<CalendarWindowRule>(&rule)) {
        out << keyOf(w->station) << "] months={";
        for (std::size_t i = 0; i < w->calendarMonths.size(); ++i) {
            if (i > 0) out << ",";
            out << w->calendarMonths[i];
        }
        out << "}";
    }
    return out.str();
}

/**
 * @brief Precompute per-track durations and per-kind rule index lists.
 */
void SyllabusRuleSet::compile() {
    durations_.assign(stations_.size() * 2, 0);
    for (int i = 0; i < (int)rules_.size(); ++i) {
        const StationRule& rule = rules_[i];
        if (const auto* d = std::get_if<DurationRule>(&rule)) {
            if (d->station < stations_.size()) {
                durations_[d->station * 2 + (d->track == Track::ModelA ? 0 : 1)] = d->months;
            }
        } else if (std::holds_alternative<CapacityRule>(rule)) {
            capacityRules_.push_back(i);
        } else if (std::holds_alternative<SequenceRule>(rule)) {
            sequenceRules_.push_back(i);
        } else {
            windowRules_.push_back(i);
        }
    }
    for (const StationDef& s : stations_) {
        if (s.kind == StationKind::Leave && leaveStation_ == kNoStation) leaveStation_ = s.id;
        if (s.kind == StationKind::Allotment && allotmentStation_ == kNoStation) allotmentStation_ = s.id;
    }
}

/**
 * @brief Reject rule sets the engine cannot honour.
 *
 * The per-track duration check is what guarantees that a trainee's row can be
 * filled exactly: every department's eligible durations must add up to the
 * track length.
 */
void SyllabusRuleSet::validate() const {
    const std::string where = "rule set v" + std::to_string(version_) + ": ";
    const int n = (int)stations_.size();
    auto checkStation = [&](StationId id, const char* what) {
        if (id >= n) {
            throw std::invalid_argument(where + what + " refers to unknown station " + std::to_string(id));
        }
    };

    if (effectiveTo_ && !(effectiveFrom_ < *effectiveTo_)) {
        throw std::invalid_argument(where + "empty effective range");
    }

    int leaveCount = 0;
    int allotmentCount = 0;
    std::set<std::string> keys;
    for (const StationDef& s : stations_) {
        if (s.kind == StationKind::Leave) leaveCount++;
        if (s.kind == StationKind::Allotment) allotmentCount++;
        if (s.key.empty() || !keys.insert(s.key).second) {
            throw std::invalid_argument(where + "station keys must be unique and non-empty ('" + s.key + "')");
        }
        if (s.splittable && s.splitFirst <= 0) {
            throw std::invalid_argument(where + "splittable station '" + s.key + "' needs a positive split point");
        }
    }
    if (leaveCount != 1 || allotmentCount != 1) {
        throw std::invalid_argument(where + "exactly one Leave and one Allotment station are required");
    }
    if (leavePolicy_.withinSyllabusCap < 0) {
        throw std::invalid_argument(where + "negative leave cap");
    }

    std::set<std::pair<int, int>> seenDurations;
    for (const StationRule& rule : rules_) {
        if (const auto* d = std::get_if<DurationRule>(&rule)) {
            checkStation(d->station, "duration rule");
            if (d->months < 0) throw std::invalid_argument(where + "negative duration");
            if (!seenDurations.insert({d->station, (int)d->track}).second) {
                throw std::invalid_argument(where + "duplicate duration rule for '" + stations_[d->station].key + "'");
            }
            if (stations_[d->station].kind == StationKind::Leave && d->months != 0) {
                throw std::invalid_argument(where + "the leave station cannot carry a duration");
            }
        } else if (const auto* c = std::get_if<CapacityRule>(&rule)) {
            if (c->pool.empty()) throw std::invalid_argument(where + "capacity rule with empty pool");
            for (StationId id : c->pool) checkStation(id, "capacity rule");
            if (c->minOccupancy < 0 || c->minOccupancy > c->maxOccupancy) {
                throw std::invalid_argument(where + "capacity bounds must satisfy 0 <= min <= max");
            }
        } else if (const auto* q = std::get_if<SequenceRule>(&rule)) {
            checkStation(q->predecessor, "sequence rule");
            checkStation(q->dependent, "sequence rule");
            if (q->predecessor == q->dependent) {
                throw std::invalid_argument(where + "sequence rule links a station to itself");
            }
        } else if (const auto* w = std::get_if<CalendarWindowRule>(&rule)) {
            checkStation(w->station, "window rule");
            for (int m : w->calendarMonths) {
                if (m < 1 || m > 12) throw std::invalid_argument(where + "window month out of range");
            }
        }
    }

    const Track tracks[] = {Track::ModelA, Track::ModelB};
    const Department departments[] = {Department::A, Department::B};
    for (Track track : tracks) {
        for (Department dep : departments) {
            int total = 0;
            for (const StationDef& s : stations_) {
                if (!eligible(s.id, track, dep)) continue;
                int months = duration(s.id, track);
                if (s.splittable && s.splitFirst >= months) {
                    throw std::invalid_argument(where + "split point of '" + s.key + "' must be below its duration");
                }
                total += months;
            }
            if (total != trackLength(track)) {
                throw std::invalid_argument(where + trackName(track) + " department " + departmentName(dep) +
                                            " durations add up to " + std::to_string(total) +
                                            ", expected " + std::to_string(trackLength(track)));
            }
        }
    }
}

int effectiveMinimum(const SyllabusRuleSet& rules, int ruleIndex, MonthSerial month,
                     const std::vector<CapacityOverride>& overrides) {
    const CapacityRule& rule = rules.capacityRule(ruleIndex);
    int lo = rule.minOccupancy;
    for (const CapacityOverride& o : overrides) {
        if (toSerial(o.month) != month) continue;
        if (std::find(rule.pool.begin(), rule.pool.end(), o.station) == rule.pool.end()) continue;
        lo = std::max(0, std::min(lo, o.newMin));
    }
    return lo;
}


///////////////////////////
///       CATALOG       ///
///////////////////////////
NoRuleSetForDate::NoRuleSetForDate(const YearMonth& date)
        : std::runtime_error("NoRuleSetForDate: no rule set version covers " + formatYearMonth(date)) {}

UnknownRuleSetVersion::UnknownRuleSetVersion(int version)
        : std::runtime_error("UnknownRuleSetVersion: rule set v" + std::to_string(version) + " is not in the catalog") {}

/**
 * @brief Insert a new version, keeping versions ordered by start date.
 */
void RuleCatalog::insert(SyllabusRuleSet ruleSet) {
    auto incoming = std::make_shared<const SyllabusRuleSet>(std::move(ruleSet));
    const MonthSerial from = toSerial(incoming->effectiveFrom());
    const MonthSerial to = incoming->effectiveTo() ? toSerial(*incoming->effectiveTo())
                                                   : std::numeric_limits<int>::max();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const RuleSetPtr& existing : versions_) {
        if (existing->version() == incoming->version()) {
            throw std::invalid_argument("rule set v" + std::to_string(incoming->version()) + " already exists");
        }
        const MonthSerial otherFrom = toSerial(existing->effectiveFrom());
        const MonthSerial otherTo = existing->effectiveTo() ? toSerial(*existing->effectiveTo())
                                                            : std::numeric_limits<int>::max();
        if (from < otherTo && otherFrom < to) {
            throw std::invalid_argument("rule set v" + std::to_string(incoming->version()) +
                                        " overlaps the effective range of v" + std::to_string(existing->version()));
        }
    }
    auto pos = std::upper_bound(versions_.begin(), versions_.end(), incoming,
                                [](const RuleSetPtr& a, const RuleSetPtr& b) {
                                    return a->effectiveFrom() < b->effectiveFrom();
                                });
    versions_.insert(pos, incoming);
}

RuleSetPtr RuleCatalog::effectiveRuleSet(const YearMonth& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const RuleSetPtr& rs : versions_) {
        if (rs->covers(date)) return rs;
    }
    throw NoRuleSetForDate(date);
}

RuleSetPtr RuleCatalog::byVersion(int version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const RuleSetPtr& rs : versions_) {
        if (rs->version() == version) return rs;
    }
    throw UnknownRuleSetVersion(version);
}

std::vector<int> RuleCatalog::versions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> out;
    for (const RuleSetPtr& rs : versions_) out.push_back(rs->version());
    return out;
}

bool RuleCatalog::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return versions_.empty();
}
