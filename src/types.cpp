/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/types.hpp"
#include <atomic>
#include <chrono>
#include <sstream>
#include <unistd.h>

namespace redraft {

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Queued: return "queued";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        case JobStatus::Stopped: return "stopped";
        default: return "unknown";
    }
}

const char* toString(SegmentStatus status) noexcept {
    switch (status) {
        case SegmentStatus::Pending: return "pending";
        case SegmentStatus::Processing: return "processing";
        case SegmentStatus::Completed: return "completed";
        case SegmentStatus::Failed: return "failed";
        default: return "unknown";
    }
}

const char* toString(Stage stage) noexcept {
    switch (stage) {
        case Stage::Polish: return "polish";
        case Stage::Enhance: return "enhance";
        case Stage::EmotionPolish: return "emotion_polish";
        default: return "unknown";
    }
}

const char* toString(ProcessingMode mode) noexcept {
    switch (mode) {
        case ProcessingMode::PaperPolish: return "paper_polish";
        case ProcessingMode::PaperPolishEnhance: return "paper_polish_enhance";
        case ProcessingMode::EmotionPolish: return "emotion_polish";
        default: return "unknown";
    }
}

std::optional<JobStatus> parseJobStatus(const std::string& value) noexcept {
    if (value == "queued") return JobStatus::Queued;
    if (value == "processing") return JobStatus::Processing;
    if (value == "completed") return JobStatus::Completed;
    if (value == "failed") return JobStatus::Failed;
    if (value == "stopped") return JobStatus::Stopped;
    return std::nullopt;
}

std::optional<SegmentStatus> parseSegmentStatus(const std::string& value) noexcept {
    if (value == "pending") return SegmentStatus::Pending;
    if (value == "processing") return SegmentStatus::Processing;
    if (value == "completed") return SegmentStatus::Completed;
    if (value == "failed") return SegmentStatus::Failed;
    return std::nullopt;
}

std::optional<Stage> parseStage(const std::string& value) noexcept {
    if (value == "polish") return Stage::Polish;
    if (value == "enhance") return Stage::Enhance;
    if (value == "emotion_polish") return Stage::EmotionPolish;
    return std::nullopt;
}

std::optional<ProcessingMode> parseMode(const std::string& value) noexcept {
    if (value == "paper_polish") return ProcessingMode::PaperPolish;
    if (value == "paper_polish_enhance") return ProcessingMode::PaperPolishEnhance;
    if (value == "emotion_polish") return ProcessingMode::EmotionPolish;
    return std::nullopt;
}

std::vector<Stage> stagesFor(ProcessingMode mode) {
    switch (mode) {
        case ProcessingMode::PaperPolish: return {Stage::Polish};
        case ProcessingMode::PaperPolishEnhance: return {Stage::Polish, Stage::Enhance};
        case ProcessingMode::EmotionPolish: return {Stage::EmotionPolish};
    }
    return {};
}

JobId generateJobId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << std::to_string(now) << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

}
