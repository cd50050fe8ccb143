///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "audit_log.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>


///////////////////////////
///        JSON         ///
///////////////////////////
void to_json(nlohmann::json& j, const AuditEntry& entry) {
    j = nlohmann::json{
            {"actor", entry.actor},
            {"timestamp", entry.timestamp},
            {"action", entry.action},
            {"trainee_id", entry.traineeId},
            {"month_index", entry.monthIndex},
            {"month", entry.month},
            {"prior_station", entry.priorStation},
            {"new_station", entry.newStation},
            {"bypasses_hard_constraint", entry.bypassesHardConstraint},
            {"justification", entry.justification},
            {"rule_set_version", entry.ruleSetVersion},
    };
}

void from_json(const nlohmann::json& j, AuditEntry& entry) {
    entry.actor = j.at("actor").get<std::string>();
    entry.timestamp = j.value("timestamp", "");
    entry.action = j.value("action", "");
    entry.traineeId = j.value("trainee_id", -1);
    entry.monthIndex = j.value("month_index", -1);
    entry.month = j.value("month", "");
    entry.priorStation = j.value("prior_station", "");
    entry.newStation = j.value("new_station", "");
    entry.bypassesHardConstraint = j.value("bypasses_hard_constraint", false);
    entry.justification = j.value("justification", "");
    entry.ruleSetVersion = j.value("rule_set_version", -1);
}


///////////////////////////
///      AUDIT LOG      ///
///////////////////////////
void AuditLog::append(AuditEntry entry) {
    const bool blank = std::all_of(entry.justification.begin(), entry.justification.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (entry.bypassesHardConstraint && blank) {
        throw std::invalid_argument("override by '" + entry.actor + "' bypasses a hard constraint without justification");
    }
    if (entry.actor.empty()) {
        throw std::invalid_argument("audit entries need an actor");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
}

std::vector<AuditEntry> AuditLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t AuditLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

nlohmann::json AuditLog::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json out = nlohmann::json::array();
    for (const AuditEntry& e : entries_) out.push_back(e);
    return out;
}
