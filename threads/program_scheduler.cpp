///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "program_scheduler.hpp"
#include "logger.hpp"
#include <utility>


///////////////////////////
///        TASKS        ///
///////////////////////////
ResolveTask::ResolveTask(std::shared_future<ResolveResult> future, std::shared_ptr<std::atomic<bool>> cancel)
        : future_(std::move(future)), cancel_(std::move(cancel)) {}

bool ResolveTask::ready() const {
    return future_.valid() && future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

std::optional<ResolveStatus> ResolveTask::poll() const {
    if (!ready()) return std::nullopt;
    return future_.get().status;
}

const ResolveResult& ResolveTask::wait() const {
    return future_.get();
}

void ResolveTask::cancel() {
    if (cancel_) cancel_->store(true);
}


///////////////////////////
///      SCHEDULER      ///
///////////////////////////
ProgramScheduler::ProgramScheduler(const RotationEngine& engine, ScheduleState initial)
        : engine_(engine), committed_(std::make_shared<const ScheduleState>(std::move(initial))) {}

std::shared_ptr<const ScheduleState> ProgramScheduler::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return committed_;
}

std::optional<ConflictReport> ProgramScheduler::validateMove(const Assignment& proposal,
                                                             const YearMonth& currentMonth) const {
    const std::shared_ptr<const ScheduleState> state = snapshot();
    return engine_.validateMove(*state, proposal, currentMonth);
}

/**
 * @brief Resolve against the current snapshot; commit on ValidState only.
 *
 * Audit entries are appended before the swap so that a reader who sees the
 * new state also finds its overrides in the log.
 */
ResolveResult ProgramScheduler::resolve(const ResolveCommand& command, const std::atomic<bool>* cancel) {
    std::lock_guard<std::mutex> writer(writerMutex_);

    ResolveRequest request;
    request.state = *snapshot();
    request.ruleSetVersion = command.ruleSetVersion;
    request.anchors = command.anchors;
    request.leaveEvents = command.leaveEvents;
    request.overrides = command.overrides;
    request.timeBudget = command.timeBudget;
    request.currentMonth = command.currentMonth;
    request.actor = command.actor;
    request.timestamp = command.timestamp;

    ResolveResult result = engine_.resolve(request, cancel);
    if (result.status != ResolveStatus::ValidState || !result.state) {
        Logger::Info("program: " + std::string(resolveStatusName(result.status)) + ", committed state kept");
        return result;
    }

    for (const AuditEntry& entry : result.audit) audit_.append(entry);
    auto next = std::make_shared<const ScheduleState>(*result.state);
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        committed_ = std::move(next);
    }
    commits_++;
    Logger::Info("program: committed through " + formatYearMonth(command.currentMonth) + " (rule set v" +
                 std::to_string(result.ruleSetVersion) + ")");
    return result;
}

ResolveTask ProgramScheduler::startResolve(ResolveCommand command) {
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    std::shared_future<ResolveResult> future =
            std::async(std::launch::async, [this, command = std::move(command), cancel]() {
                return resolve(command, cancel.get());
            }).share();
    return ResolveTask(std::move(future), cancel);
}
