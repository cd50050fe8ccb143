///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "audit_log.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

AuditEntry anchorEntry(const std::string& actor, int traineeId, int monthIndex) {
    AuditEntry entry;
    entry.actor = actor;
    entry.timestamp = "2025-06-01T08:30:00Z";
    entry.action = "anchor";
    entry.traineeId = traineeId;
    entry.monthIndex = monthIndex;
    entry.month = "2028-06";
    entry.priorStation = "department";
    entry.newStation = "stage_a";
    entry.ruleSetVersion = 1;
    return entry;
}

} // namespace


///////////////////////////
///      AUDIT LOG      ///
///////////////////////////
TEST(AuditLogTest, KeepsAppendOrder) {
    AuditLog log;
    log.append(anchorEntry("coordinator", 1, 53));
    log.append(anchorEntry("chief", 2, 12));

    const std::vector<AuditEntry> entries = log.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].actor, "coordinator");
    EXPECT_EQ(entries[1].traineeId, 2);
    EXPECT_EQ(log.size(), 2u);
}

TEST(AuditLogTest, BypassNeedsAJustification) {
    AuditLog log;
    AuditEntry entry = anchorEntry("chief", 1, 30);
    entry.bypassesHardConstraint = true;
    entry.justification = "  \t";
    EXPECT_THROW(log.append(entry), std::invalid_argument);

    entry.justification = "staff shortage approved by the board";
    log.append(entry);
    EXPECT_EQ(log.size(), 1u);
}

TEST(AuditLogTest, EntriesNeedAnActor) {
    AuditLog log;
    EXPECT_THROW(log.append(anchorEntry("", 1, 30)), std::invalid_argument);
    EXPECT_EQ(log.size(), 0u);
}

TEST(AuditLogTest, ExportsSnakeCaseJson) {
    AuditLog log;
    AuditEntry entry = anchorEntry("coordinator", 1, 53);
    log.append(entry);

    const nlohmann::json out = log.toJson();
    ASSERT_TRUE(out.is_array());
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["trainee_id"], 1);
    EXPECT_EQ(out[0]["month_index"], 53);
    EXPECT_EQ(out[0]["prior_station"], "department");
    EXPECT_EQ(out[0]["new_station"], "stage_a");
    EXPECT_EQ(out[0]["bypasses_hard_constraint"], false);
    EXPECT_EQ(out[0]["rule_set_version"], 1);

    const AuditEntry back = out[0].get<AuditEntry>();
    EXPECT_EQ(back.actor, entry.actor);
    EXPECT_EQ(back.month, "2028-06");
    EXPECT_EQ(back.newStation, "stage_a");
}

TEST(AuditLogTest, ConcurrentAppendsAreAllKept) {
    AuditLog log;
    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&log, w]() {
            for (int k = 0; k < 50; ++k) log.append(anchorEntry("writer-" + std::to_string(w), w, k));
        });
    }
    for (std::thread& t : writers) t.join();

    EXPECT_EQ(log.size(), 200u);
    EXPECT_EQ(log.toJson().size(), 200u);
}
