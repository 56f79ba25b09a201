/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "redraft/types.hpp"

namespace redraft {

// Which model serves a stage, and where. Empty fields mean "use the default".
struct ModelConfig {
    std::string model;
    std::string apiKey;
    std::string baseUrl;
};

struct Job {
    JobId id;
    std::string originalText;
    ProcessingMode mode = ProcessingMode::PaperPolishEnhance;
    std::map<Stage, ModelConfig> overrides;

    JobStatus status = JobStatus::Queued;
    Stage currentStage = Stage::Polish;
    std::size_t currentPosition = 0;
    std::size_t totalSegments = 0;
    double progress = 0.0;
    std::string error;
    std::optional<std::size_t> failedSegmentIndex;

    std::chrono::system_clock::time_point createdAt;
    std::optional<std::chrono::system_clock::time_point> completedAt;
};

struct Segment {
    std::size_t index = 0;
    Stage stage = Stage::Polish;
    std::string originalText;
    std::optional<std::string> firstOutput;  // polish / emotion_polish
    std::optional<std::string> secondOutput; // enhance
    bool trivial = false;
    SegmentStatus status = SegmentStatus::Pending;

    [[nodiscard]] const std::optional<std::string>& outputFor(Stage s) const noexcept {
        return writesSecondOutput(s) ? secondOutput : firstOutput;
    }
    [[nodiscard]] std::optional<std::string>& outputFor(Stage s) noexcept {
        return writesSecondOutput(s) ? secondOutput : firstOutput;
    }
};

struct HistoryEntry {
    std::string role;
    std::string content;

    bool operator==(const HistoryEntry& other) const {
        return role == other.role && content == other.content;
    }
};

struct HistoryContext {
    Stage stage = Stage::Polish;
    std::vector<HistoryEntry> entries;
    std::size_t measuredSize = 0;
    bool compressed = false;
};

struct ChangeRecord {
    std::size_t segmentIndex = 0;
    Stage stage = Stage::Polish;
    std::string before;
    std::string after;
    std::size_t beforeLength = 0;
    std::size_t afterLength = 0;
    bool changed = false;
};

}
