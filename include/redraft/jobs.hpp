/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "redraft/admission.hpp"
#include "redraft/broadcaster.hpp"
#include "redraft/cancel.hpp"
#include "redraft/config.hpp"
#include "redraft/model.hpp"
#include "redraft/pipeline.hpp"
#include "redraft/store.hpp"
#include "redraft/supervisor.hpp"

namespace redraft {

struct JobRequest {
    std::optional<JobId> id;  // generated when absent
    std::string text;
    std::string mode = "paper_polish_enhance";
    std::map<Stage, ModelConfig> overrides;
};

enum class ControlError : uint8_t {
    None = 0,
    NotFound,
    InvalidState,
    Busy,
    StoreError
};

struct ControlResult {
    bool ok = false;
    ControlError error = ControlError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct JobSnapshot {
    Job job;
    std::size_t completedSegments = 0;
    std::optional<std::size_t> queuePosition;
    std::optional<std::size_t> estimatedWaitSeconds;
};

// Job control for callers: everything here is safe to call while runs are in flight.
class Jobs {
public:
    Jobs(Store& store, LanguageModel& model, const Settings& settings);
    ~Jobs();

    Jobs(const Jobs&) = delete;
    Jobs& operator=(const Jobs&) = delete;
    Jobs(Jobs&&) = delete;
    Jobs& operator=(Jobs&&) = delete;

    [[nodiscard]] SubmitResult submit(const JobRequest& request);
    [[nodiscard]] std::optional<JobSnapshot> status(const JobId& id) const;

    [[nodiscard]] SubscriptionPtr subscribe(const JobId& id);
    void unsubscribe(const JobId& id, const SubscriptionPtr& subscription);

    [[nodiscard]] ControlResult retry(const JobId& id);
    [[nodiscard]] ControlResult stop(const JobId& id);

    // Final text of a completed job.
    [[nodiscard]] std::optional<std::string> result(const JobId& id) const;

    // Relaunches jobs a previous process left queued or processing.
    std::size_t recover();

    [[nodiscard]] std::vector<TaskReport> reports();
    [[nodiscard]] bool wait(const JobId& id, std::chrono::milliseconds timeout);

    // Runs whose cancellation or stop state is still held. Finished runs are
    // released once reports() has returned them.
    [[nodiscard]] std::size_t trackedRunCount() const;

    void setConcurrencyLimit(std::size_t limit);
    [[nodiscard]] AdmissionStatus admissionStatus() const { return admission_.status(); }

    // Cancels active runs and joins them. Runs cut short here go back to
    // queued so recover() picks them up next time.
    void shutdown() noexcept;

private:
    [[nodiscard]] bool launchLocked(const JobId& id);
    [[nodiscard]] std::string rejectReason(const JobRequest& request, SubmissionError& code) const;

    Store& store_;
    Settings settings_;
    AdmissionController admission_;
    EventBroadcaster events_;
    PipelineRunner runner_;

    mutable std::mutex controlMutex_;
    std::unordered_map<JobId, std::shared_ptr<CancelToken>> tokens_;
    std::unordered_set<JobId> stopRequested_;
    bool shuttingDown_ = false;

    Supervisor supervisor_;
};

}
