#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "engine.hpp"
#include "audit_log.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///      COMMANDS       ///
///////////////////////////
/**
 * @brief A resolve as submitted to a program; the state is the program's own.
 */
struct ResolveCommand {
    int ruleSetVersion = -1;
    std::vector<Assignment> anchors;
    std::vector<LeaveEvent> leaveEvents;
    std::vector<CapacityOverride> overrides;
    std::optional<std::chrono::milliseconds> timeBudget;
    YearMonth currentMonth{};
    std::string actor;
    std::string timestamp;
};

/**
 * @brief Handle of a background resolve.
 *
 * Copies share the same run. The outcome is read through poll() or wait();
 * cancel() asks the search to stop at its next budget check, after which the
 * run finishes as Timeout with the best schedule it had, if any.
 */
class ResolveTask {
public:
    ResolveTask() = default;
    ResolveTask(std::shared_future<ResolveResult> future, std::shared_ptr<std::atomic<bool>> cancel);

    bool valid() const { return future_.valid(); }

    /// True once the result is available.
    bool ready() const;

    /// Status of a finished run, std::nullopt while it is still running.
    std::optional<ResolveStatus> poll() const;

    /**
     * @brief Block until the run finishes.
     *
     * @throws whatever the resolve threw (e.g. std::invalid_argument).
     */
    const ResolveResult& wait() const;

    void cancel();

private:
    std::shared_future<ResolveResult> future_;
    std::shared_ptr<std::atomic<bool>> cancel_;
};


///////////////////////////
///      SCHEDULER      ///
///////////////////////////
/**
 * @brief Owner of one program's committed schedule.
 *
 * Resolves are serialized by a writer mutex held for the whole run. The
 * committed state is an immutable snapshot replaced in one pointer swap, and
 * only when a resolve returns ValidState; readers copy the pointer under a
 * short lock and never see a partial matrix. Move validations run against
 * such a snapshot and may overlap each other and an in-flight resolve.
 *
 * The scheduler must outlive every task it started.
 */
class ProgramScheduler {
public:
    ProgramScheduler(const RotationEngine& engine, ScheduleState initial);
    ProgramScheduler(const ProgramScheduler&) = delete;
    ProgramScheduler& operator=(const ProgramScheduler&) = delete;

    /// Last committed state.
    std::shared_ptr<const ScheduleState> snapshot() const;

    /**
     * @brief Check one anchor against the last committed state (read-only).
     */
    std::optional<ConflictReport> validateMove(const Assignment& proposal, const YearMonth& currentMonth) const;

    /**
     * @brief Run a resolve on the calling thread and commit a ValidState.
     *
     * Waits for any resolve already in progress.
     */
    ResolveResult resolve(const ResolveCommand& command, const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Run a resolve on a background thread.
     */
    ResolveTask startResolve(ResolveCommand command);

    /// Overrides recorded by committed resolves.
    const AuditLog& auditLog() const { return audit_; }

    /// Number of commits so far.
    int commits() const { return commits_.load(); }

private:
    const RotationEngine& engine_;

    mutable std::mutex snapshotMutex_; ///< Guards committed_ (pointer only).
    std::shared_ptr<const ScheduleState> committed_;

    std::mutex writerMutex_; ///< Held for the whole of a resolve.
    AuditLog audit_;
    std::atomic<int> commits_{0};
};
