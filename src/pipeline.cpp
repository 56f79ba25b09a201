/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/pipeline.hpp"
#include "redraft/logger.hpp"
#include "redraft/prompts.hpp"
#include "redraft/text.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace redraft {

namespace {

// Raw history entries kept verbatim when history is compressed
constexpr std::size_t kRecentEntries = 3;

std::size_t measureHistory(const std::vector<HistoryEntry>& entries) {
    std::size_t total = 0;
    for (const auto& entry : entries) {
        total += countCjk(entry.content);
    }
    return total;
}

}

PipelineRunner::PipelineRunner(Store& store, AdmissionController& admission, EventBroadcaster& events,
                               LanguageModel& model, const Settings& settings)
    : store_(store), admission_(admission), events_(events), model_(model),
      compressor_(model), settings_(settings) {
}

double PipelineRunner::progressFor(std::size_t stageIndex, std::size_t stageCount,
                                   std::size_t i, std::size_t n) noexcept {
    if (stageCount == 0 || n == 0) {
        return 0.0;
    }
    const double share = 100.0 / static_cast<double>(stageCount);
    double progress = share * static_cast<double>(stageIndex) +
                      share * static_cast<double>(i) / static_cast<double>(n);
    return std::min(progress, 100.0);
}

std::string PipelineRunner::segmentError(std::size_t index, Stage stage,
                                         const std::string& message, std::size_t maxChars) {
    std::string error = "Segment " + std::to_string(index + 1) + " failed in " +
                        toString(stage) + " stage: " + message;
    return truncateText(error, maxChars);
}

RunOutcome PipelineRunner::run(const JobId& id, const CancelToken& cancel) noexcept {
    try {
        auto job = store_.loadJob(id);
        if (!job) {
            LOG_ERROR("Cannot run unknown job: " + id);
            return {JobStatus::Failed, "Job not found: " + id};
        }

        if (!admission_.acquire(id, &cancel)) {
            LOG_INFO("Job stopped while waiting for a slot: " + id);
            return finishStopped(*job);
        }
        AdmissionGuard guard(admission_, id);
        LOG_INFO("Job admitted: " + id);

        return process(*job, cancel);
    } catch (const std::exception& e) {
        LOG_ERROR("Run aborted for job " + id + ": " + std::string(e.what()));
        return recordFailure(id, "Internal error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Run aborted for job " + id + ": unknown error");
        return recordFailure(id, "Internal error");
    }
}

RunOutcome PipelineRunner::process(Job& job, const CancelToken& cancel) {
    // The failure point belongs to the stage that was running when it was recorded
    std::optional<Resume> resume;
    if (job.failedSegmentIndex) {
        resume = Resume{job.currentStage, *job.failedSegmentIndex};
        LOG_INFO("Resuming job " + job.id + " at segment " + std::to_string(*job.failedSegmentIndex) +
                 " of stage " + toString(job.currentStage));
    }

    job.status = JobStatus::Processing;
    job.error.clear();
    job.completedAt.reset();
    persistJob(job);

    std::vector<Segment> segments = prepareSegments(job);
    const auto stages = stagesFor(job.mode);

    for (std::size_t s = 0; s < stages.size(); ++s) {
        if (auto outcome = runStage(job, segments, s, stages.size(), resume, cancel)) {
            return *outcome;
        }
    }

    job.status = JobStatus::Completed;
    job.progress = 100.0;
    job.currentPosition = segments.size();
    job.failedSegmentIndex.reset();
    job.completedAt = std::chrono::system_clock::now();
    persistJob(job);

    LOG_INFO("JOB COMPLETED: " + job.id + " (" + std::to_string(segments.size()) + " segments)");
    publish(job, EventType::Completed, std::nullopt, std::nullopt, {}, "Processing complete");
    return {JobStatus::Completed, ""};
}

std::vector<Segment> PipelineRunner::prepareSegments(Job& job) {
    std::vector<Segment> segments = store_.loadSegments(job.id);
    if (segments.empty()) {
        auto pieces = segmentText(job.originalText, settings_.maxSegmentSize);
        segments.reserve(pieces.size());
        for (std::size_t i = 0; i < pieces.size(); ++i) {
            Segment segment;
            segment.index = i;
            segment.originalText = std::move(pieces[i]);
            segments.push_back(std::move(segment));
        }
        if (!segments.empty() && !store_.createSegments(job.id, segments)) {
            throw std::runtime_error("failed to store segments");
        }
        LOG_INFO("Job " + job.id + " split into " + std::to_string(segments.size()) + " segments");
    } else {
        // A retry reprocesses the failed segment; only the new run may mark one failed
        for (auto& segment : segments) {
            if (segment.status == SegmentStatus::Failed) {
                segment.status = SegmentStatus::Pending;
                persistSegment(job.id, segment);
            }
        }
    }

    job.totalSegments = segments.size();
    persistJob(job);
    return segments;
}

std::optional<RunOutcome> PipelineRunner::runStage(Job& job, std::vector<Segment>& segments,
                                                   std::size_t stageIndex, std::size_t stageCount,
                                                   const std::optional<Resume>& resume,
                                                   const CancelToken& cancel) {
    const Stage stage = stagesFor(job.mode)[stageIndex];
    const std::size_t n = segments.size();

    job.currentStage = stage;
    persistJob(job);
    LOG_INFO("[STAGE START] " + std::string(toString(stage)) + " for job " + job.id);
    publish(job, EventType::StageStarted, stage);

    auto overrides = job.overrides.find(stage);
    const ModelConfig config = settings_.resolve(
        stage, overrides == job.overrides.end() ? ModelConfig{} : overrides->second);

    std::size_t offset = 0;
    if (resume && resume->stage == stage) {
        offset = std::min(resume->index, n);
    }

    HistoryContext history = loadHistory(job, stage, segments, offset);
    LOG_DEBUG("Stage " + std::string(toString(stage)) + " starts at " + std::to_string(offset) +
              " with " + std::to_string(history.entries.size()) + " history entries (size " +
              std::to_string(history.measuredSize) + ")");

    for (std::size_t i = offset; i < n; ++i) {
        if (cancel.cancelled()) {
            return finishStopped(job);
        }

        job.currentPosition = i;
        job.progress = progressFor(stageIndex, stageCount, i, n);
        persistJob(job);
        publish(job, EventType::Progress, stage, i);

        Segment& segment = segments[i];

        if (measureLength(segment.originalText) < settings_.trivialThreshold) {
            if (!segment.trivial || segment.status != SegmentStatus::Completed ||
                !segment.firstOutput || !segment.secondOutput) {
                segment.trivial = true;
                segment.firstOutput = segment.originalText;
                segment.secondOutput = segment.originalText;
                segment.status = SegmentStatus::Completed;
                segment.stage = stage;
                persistSegment(job.id, segment);
                LOG_DEBUG("Segment " + std::to_string(i) + " passed through unchanged");
            }
            continue;
        }

        auto& output = segment.outputFor(stage);
        if (output) {
            // Work kept from an earlier run still counts as context for later segments
            if (!history.compressed) {
                history.entries.push_back({"assistant", *output});
                history.measuredSize += countCjk(*output);
            }
            if (segment.status != SegmentStatus::Completed) {
                segment.status = SegmentStatus::Completed;
                persistSegment(job.id, segment);
            }
            continue;
        }

        const std::string input = stage == Stage::Enhance
            ? segment.firstOutput.value_or(segment.originalText)
            : segment.originalText;

        segment.status = SegmentStatus::Processing;
        segment.stage = stage;
        persistSegment(job.id, segment);

        LOG_INFO("[SEGMENT " + std::to_string(i) + "] " + std::to_string(i + 1) + "/" + std::to_string(n) +
                 " stage " + toString(stage) + ", input length " + std::to_string(measureLength(input)));

        ChatRequest request;
        request.model = config;
        request.messages = prompts::buildMessages(history.entries, stage, input);
        request.temperature = settings_.temperature;

        RunResult result = model_.complete(request);
        if (!result.ok) {
            return failSegment(job, segment, stage, result.error);
        }

        output = result.output;
        segment.status = SegmentStatus::Completed;
        persistSegment(job.id, segment);

        ChangeRecord change;
        change.segmentIndex = i;
        change.stage = stage;
        change.before = input;
        change.after = result.output;
        change.beforeLength = measureLength(input);
        change.afterLength = measureLength(result.output);
        change.changed = input != result.output;
        if (!store_.saveChange(job.id, change)) {
            throw std::runtime_error("failed to store change record for segment " + std::to_string(i));
        }

        publish(job, EventType::Content, stage, i, result.output);

        history.entries.push_back({"assistant", result.output});
        history.measuredSize += countCjk(result.output);

        if (history.measuredSize > settings_.historyCompressionThreshold) {
            RunResult compressed = compressHistory(job, stage, history);
            if (!compressed.ok) {
                return failSegment(job, segment, stage, "history compression failed: " + compressed.error);
            }
        }
    }

    job.failedSegmentIndex.reset();
    persistJob(job);
    LOG_INFO("[STAGE DONE] " + std::string(toString(stage)) + " for job " + job.id);
    return std::nullopt;
}

HistoryContext PipelineRunner::loadHistory(const Job& job, Stage stage,
                                           const std::vector<Segment>& segments, std::size_t offset) const {
    if (auto stored = store_.loadHistory(job.id, stage)) {
        stored->measuredSize = measureHistory(stored->entries);
        return *stored;
    }

    HistoryContext history;
    history.stage = stage;
    for (std::size_t i = 0; i < offset && i < segments.size(); ++i) {
        const auto& segment = segments[i];
        if (segment.trivial) {
            continue;
        }
        if (const auto& output = segment.outputFor(stage)) {
            history.entries.push_back({"assistant", *output});
        }
    }
    history.measuredSize = measureHistory(history.entries);
    return history;
}

RunResult PipelineRunner::compressHistory(const Job& job, Stage stage, HistoryContext& history) {
    LOG_INFO("[HISTORY COMPRESS] stage " + std::string(toString(stage)) + ", before: " +
             std::to_string(history.measuredSize) + " chars, " + std::to_string(history.entries.size()) + " entries");

    std::vector<HistoryEntry> source;
    std::vector<HistoryEntry> raw;
    for (const auto& entry : history.entries) {
        if (entry.role == "system") {
            source.push_back(entry);
        } else {
            raw.push_back(entry);
        }
    }
    std::size_t start = raw.size() > kRecentEntries ? raw.size() - kRecentEntries : 0;
    source.insert(source.end(), raw.begin() + static_cast<std::ptrdiff_t>(start), raw.end());

    RunResult result = compressor_.compress(source, prompts::compressionFor(stage), settings_.compression);
    if (!result.ok) {
        LOG_WARN("History compression failed for job " + job.id + ": " + result.error);
        return result;
    }

    HistoryContext compressed;
    compressed.stage = stage;
    compressed.entries.push_back({"system", std::string(prompts::kSummaryPrefix) + result.output});
    compressed.measuredSize = measureHistory(compressed.entries);
    compressed.compressed = true;
    history = std::move(compressed);

    if (!store_.saveHistory(job.id, history)) {
        throw std::runtime_error("failed to store compressed history");
    }

    LOG_INFO("[HISTORY COMPRESS] after: " + std::to_string(history.measuredSize) + " chars");
    publish(job, EventType::HistoryCompressed, stage, std::nullopt, {},
            "History compressed for " + std::string(toString(stage)) + " stage", history.measuredSize);
    return result;
}

RunOutcome PipelineRunner::failSegment(Job& job, Segment& segment, Stage stage, const std::string& message) {
    segment.status = SegmentStatus::Failed;
    segment.stage = stage;
    persistSegment(job.id, segment);

    job.status = JobStatus::Failed;
    job.failedSegmentIndex = segment.index;
    job.error = segmentError(segment.index, stage, message, settings_.errorMaxLength);
    persistJob(job);

    LOG_WARN("Job failed: " + job.id + " - " + job.error);
    publish(job, EventType::Failed, stage, segment.index, {}, job.error);
    return {JobStatus::Failed, job.error};
}

RunOutcome PipelineRunner::finishStopped(Job& job) {
    job.status = JobStatus::Stopped;
    job.error = kStopMessage;
    persistJob(job);

    LOG_INFO("Job stopped: " + job.id);
    publish(job, EventType::Stopped, std::nullopt, std::nullopt, {}, kStopMessage);
    return {JobStatus::Stopped, kStopMessage};
}

RunOutcome PipelineRunner::recordFailure(const JobId& id, const std::string& message) noexcept {
    std::string error = truncateText(message, settings_.errorMaxLength);
    try {
        if (auto job = store_.loadJob(id)) {
            job->status = JobStatus::Failed;
            job->error = error;
            if (!store_.saveJob(*job)) {
                LOG_ERROR("Failed to record failure for job: " + id);
            }
            publish(*job, EventType::Failed, std::nullopt, std::nullopt, {}, error);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record failure for job " + id + ": " + std::string(e.what()));
    }
    return {JobStatus::Failed, error};
}

void PipelineRunner::persistJob(const Job& job) {
    if (!store_.saveJob(job)) {
        throw std::runtime_error("failed to store job " + job.id);
    }
}

void PipelineRunner::persistSegment(const JobId& id, const Segment& segment) {
    if (!store_.saveSegment(id, segment)) {
        throw std::runtime_error("failed to store segment " + std::to_string(segment.index));
    }
}

void PipelineRunner::publish(const Job& job, EventType type, std::optional<Stage> stage,
                             std::optional<std::size_t> segmentIndex, std::string content,
                             std::string message, std::size_t measuredSize) {
    Event event;
    event.type = type;
    event.jobId = job.id;
    event.stage = stage;
    event.segmentIndex = segmentIndex;
    event.progress = job.progress;
    event.content = std::move(content);
    event.message = std::move(message);
    event.measuredSize = measuredSize;
    events_.publish(job.id, event);
}

}
