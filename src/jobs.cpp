/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/jobs.hpp"
#include "redraft/logger.hpp"
#include "redraft/text.hpp"
#include <algorithm>

namespace redraft {

namespace {
constexpr const char* kRetryPrefix = "[retrying] previous failure: ";
constexpr const char* kShutdownMessage = "Interrupted by shutdown";
}

Jobs::Jobs(Store& store, LanguageModel& model, const Settings& settings)
    : store_(store),
      settings_(settings),
      admission_(static_cast<std::size_t>(std::max(1, settings.maxConcurrent))),
      events_(settings.subscriberQueueCapacity),
      runner_(store, admission_, events_, model, settings_) {
    LOG_DEBUG("Jobs created: max_concurrent=" + std::to_string(admission_.limit()));
}

Jobs::~Jobs() {
    shutdown();
}

std::string Jobs::rejectReason(const JobRequest& request, SubmissionError& code) const {
    if (trimCopy(request.text).empty()) {
        code = SubmissionError::InvalidContent;
        return "Text is empty";
    }
    if (request.text.size() > settings_.maxDocumentBytes) {
        code = SubmissionError::InvalidSize;
        return "Text exceeds maximum size limit (" + std::to_string(settings_.maxDocumentBytes) + " bytes)";
    }
    if (!parseMode(request.mode)) {
        code = SubmissionError::InvalidMode;
        return "Unknown processing mode: " + request.mode;
    }
    if (request.id && request.id->empty()) {
        code = SubmissionError::InvalidContent;
        return "Job id is empty";
    }
    code = SubmissionError::None;
    return "";
}

SubmitResult Jobs::submit(const JobRequest& request) {
    SubmissionError code = SubmissionError::None;
    std::string reason = rejectReason(request, code);
    if (code != SubmissionError::None) {
        LOG_DEBUG("Submission rejected: " + reason);
        return {false, "", code, reason};
    }

    std::lock_guard<std::mutex> lock(controlMutex_);
    if (shuttingDown_) {
        return {false, "", SubmissionError::ShuttingDown, "Service is shutting down"};
    }

    Job job;
    job.id = request.id ? *request.id : generateJobId();
    job.originalText = request.text;
    job.mode = *parseMode(request.mode);
    job.overrides = request.overrides;
    job.status = JobStatus::Queued;
    job.currentStage = stagesFor(job.mode).front();
    job.createdAt = std::chrono::system_clock::now();

    if (store_.loadJob(job.id)) {
        return {false, job.id, SubmissionError::Duplicate, "Job already exists: " + job.id};
    }
    if (!store_.createJob(job)) {
        LOG_ERROR("Failed to create job record: " + job.id);
        return {false, job.id, SubmissionError::StoreError, "Failed to create job record"};
    }
    if (!launchLocked(job.id)) {
        // The record stays queued; recover() launches it later
        LOG_ERROR("Failed to launch job: " + job.id);
        return {false, job.id, SubmissionError::StoreError, "Job created but could not be started"};
    }

    LOG_INFO("Job submitted: " + job.id + " (" + toString(job.mode) + ", " +
             std::to_string(job.originalText.size()) + " bytes)");
    return {true, job.id, SubmissionError::None, ""};
}

bool Jobs::launchLocked(const JobId& id) {
    auto token = std::make_shared<CancelToken>();
    tokens_[id] = token;
    stopRequested_.erase(id);
    return supervisor_.launch(id, [this, id, token] { return runner_.run(id, *token); });
}

std::optional<JobSnapshot> Jobs::status(const JobId& id) const {
    auto job = store_.loadJob(id);
    if (!job) {
        return std::nullopt;
    }

    JobSnapshot snapshot;
    for (const auto& segment : store_.loadSegments(id)) {
        if (segment.status == SegmentStatus::Completed) {
            ++snapshot.completedSegments;
        }
    }
    AdmissionStatus admission = admission_.status(id);
    snapshot.queuePosition = admission.position;
    snapshot.estimatedWaitSeconds = admission.estimatedWaitSeconds;
    snapshot.job = std::move(*job);
    return snapshot;
}

SubscriptionPtr Jobs::subscribe(const JobId& id) {
    return events_.subscribe(id);
}

void Jobs::unsubscribe(const JobId& id, const SubscriptionPtr& subscription) {
    events_.unsubscribe(id, subscription);
}

ControlResult Jobs::retry(const JobId& id) {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (shuttingDown_) {
        return {false, ControlError::Busy, "Service is shutting down"};
    }

    auto job = store_.loadJob(id);
    if (!job) {
        return {false, ControlError::NotFound, "Job not found: " + id};
    }
    if (job->status != JobStatus::Failed && job->status != JobStatus::Stopped) {
        return {false, ControlError::InvalidState,
                std::string("Only failed or stopped jobs can be retried (status: ") + toString(job->status) + ")"};
    }
    if (supervisor_.isRunning(id)) {
        return {false, ControlError::Busy, "Previous run is still finishing: " + id};
    }

    std::string previous = job->error;
    job->status = JobStatus::Queued;
    job->error = previous.empty() ? "" : kRetryPrefix + previous;
    job->completedAt.reset();
    if (!store_.saveJob(*job)) {
        return {false, ControlError::StoreError, "Failed to update job: " + id};
    }
    if (!launchLocked(id)) {
        return {false, ControlError::Busy, "Could not start job: " + id};
    }

    LOG_INFO("Job retried: " + id);
    return {true, ControlError::None, "Retry started"};
}

ControlResult Jobs::stop(const JobId& id) {
    std::lock_guard<std::mutex> lock(controlMutex_);
    auto job = store_.loadJob(id);
    if (!job) {
        return {false, ControlError::NotFound, "Job not found: " + id};
    }
    if (job->status != JobStatus::Queued && job->status != JobStatus::Processing) {
        return {false, ControlError::InvalidState,
                std::string("Only queued or processing jobs can be stopped (status: ") + toString(job->status) + ")"};
    }

    if (supervisor_.isRunning(id)) {
        stopRequested_.insert(id);
        auto it = tokens_.find(id);
        if (it != tokens_.end()) {
            it->second->cancel();
        }
        admission_.interrupt();
        LOG_INFO("Stop requested for job: " + id);
        return {true, ControlError::None, "Stop requested"};
    }

    job->status = JobStatus::Stopped;
    job->error = kStopMessage;
    if (!store_.saveJob(*job)) {
        return {false, ControlError::StoreError, "Failed to update job: " + id};
    }
    Event event;
    event.type = EventType::Stopped;
    event.jobId = id;
    event.progress = job->progress;
    event.message = kStopMessage;
    events_.publish(id, event);

    LOG_INFO("Idle job stopped: " + id);
    return {true, ControlError::None, "Stopped"};
}

std::optional<std::string> Jobs::result(const JobId& id) const {
    auto job = store_.loadJob(id);
    if (!job || job->status != JobStatus::Completed) {
        return std::nullopt;
    }
    return assembleOutput(store_.loadSegments(id), job->mode);
}

std::size_t Jobs::recover() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (shuttingDown_) {
        return 0;
    }

    std::size_t launched = 0;
    for (const auto& id : store_.listJobs()) {
        auto job = store_.loadJob(id);
        if (!job || (job->status != JobStatus::Queued && job->status != JobStatus::Processing)) {
            continue;
        }
        if (supervisor_.isRunning(id)) {
            continue;
        }
        if (launchLocked(id)) {
            ++launched;
            LOG_INFO("Recovered job: " + id + " (was " + toString(job->status) + ")");
        }
    }
    return launched;
}

std::vector<TaskReport> Jobs::reports() {
    auto reports = supervisor_.drainReports();
    std::lock_guard<std::mutex> lock(controlMutex_);
    for (const auto& report : reports) {
        if (!supervisor_.isRunning(report.id)) {
            tokens_.erase(report.id);
            stopRequested_.erase(report.id);
        }
    }
    return reports;
}

bool Jobs::wait(const JobId& id, std::chrono::milliseconds timeout) {
    return supervisor_.waitFor(id, timeout);
}

std::size_t Jobs::trackedRunCount() const {
    std::lock_guard<std::mutex> lock(controlMutex_);
    return tokens_.size() + stopRequested_.size();
}

void Jobs::setConcurrencyLimit(std::size_t limit) {
    admission_.updateLimit(limit);
    LOG_INFO("Concurrency limit set to " + std::to_string(admission_.limit()));
}

void Jobs::shutdown() noexcept {
    std::vector<JobId> interrupted;
    try {
        {
            std::lock_guard<std::mutex> lock(controlMutex_);
            if (shuttingDown_) {
                return;
            }
            shuttingDown_ = true;
            for (auto& entry : tokens_) {
                if (supervisor_.isRunning(entry.first)) {
                    if (stopRequested_.count(entry.first) == 0) {
                        interrupted.push_back(entry.first);
                    }
                    entry.second->cancel();
                }
            }
        }
        admission_.interrupt();
        supervisor_.shutdown();

        for (const auto& id : interrupted) {
            auto job = store_.loadJob(id);
            if (!job || job->status != JobStatus::Stopped) {
                continue;
            }
            job->status = JobStatus::Queued;
            job->error = kShutdownMessage;
            if (!store_.saveJob(*job)) {
                LOG_ERROR("Failed to requeue interrupted job: " + id);
            }
        }
        if (!interrupted.empty()) {
            LOG_INFO("Requeued " + std::to_string(interrupted.size()) + " interrupted job(s)");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error during shutdown: " + std::string(e.what()));
    }
}

}
