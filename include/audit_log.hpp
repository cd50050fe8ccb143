#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>


///////////////////////////
///      AUDIT LOG      ///
///////////////////////////
/**
 * @brief One manual override, as recorded for the program office.
 *
 * Stations are stored by key so entries stay readable across rule set
 * versions. The timestamp is supplied by the caller.
 */
struct AuditEntry {
    std::string actor;
    std::string timestamp;
    std::string action; ///< "anchor" or "capacity_override".
    int traineeId = -1; ///< -1 for station-wide overrides.
    int monthIndex = -1;
    std::string month; ///< Calendar month, "YYYY-MM".
    std::string priorStation; ///< Empty if the cell was unassigned.
    std::string newStation;
    bool bypassesHardConstraint = false;
    std::string justification; ///< Mandatory when bypassing a hard constraint.
    int ruleSetVersion = -1;
};

void to_json(nlohmann::json& j, const AuditEntry& entry);
void from_json(const nlohmann::json& j, AuditEntry& entry);

/**
 * @brief Append-only record of overrides.
 *
 * Entries are never edited or removed. The solver has no access to the log;
 * the engine only writes to it and collaborators read an exported copy.
 */
class AuditLog {
public:
    AuditLog() = default;
    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    /**
     * @brief Append one entry.
     *
     * @throws std::invalid_argument if the entry bypasses a hard constraint
     *         without a justification, or has no actor.
     */
    void append(AuditEntry entry);

    /// Snapshot of all entries in append order.
    std::vector<AuditEntry> entries() const;

    std::size_t size() const;

    /// Export as a JSON array.
    nlohmann::json toJson() const;

private:
    mutable std::mutex mutex_;
    std::vector<AuditEntry> entries_;
};
