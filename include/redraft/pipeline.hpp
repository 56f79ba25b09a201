/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "redraft/admission.hpp"
#include "redraft/broadcaster.hpp"
#include "redraft/cancel.hpp"
#include "redraft/config.hpp"
#include "redraft/model.hpp"
#include "redraft/records.hpp"
#include "redraft/store.hpp"

namespace redraft {

inline constexpr const char* kStopMessage = "Stopped by request";

struct RunOutcome {
    JobStatus status = JobStatus::Failed;
    std::string message;
};

// Drives one job through the stages of its mode. A run is resumable: it
// skips segments whose output for the stage is already stored and starts the
// failed stage at the recorded failure point.
class PipelineRunner {
public:
    PipelineRunner(Store& store, AdmissionController& admission, EventBroadcaster& events,
                   LanguageModel& model, const Settings& settings);

    PipelineRunner(const PipelineRunner&) = delete;
    PipelineRunner& operator=(const PipelineRunner&) = delete;

    // Blocks for admission, then processes. Always returns with the slot released.
    [[nodiscard]] RunOutcome run(const JobId& id, const CancelToken& cancel) noexcept;

    // Progress percentage before processing segment i of n in the stageIndex-th
    // of stageCount stages.
    [[nodiscard]] static double progressFor(std::size_t stageIndex, std::size_t stageCount,
                                            std::size_t i, std::size_t n) noexcept;

    // "Segment N failed in STAGE stage: MESSAGE", N 1-based, cut to maxChars.
    [[nodiscard]] static std::string segmentError(std::size_t index, Stage stage,
                                                  const std::string& message, std::size_t maxChars);

private:
    struct Resume {
        Stage stage;
        std::size_t index;
    };

    [[nodiscard]] RunOutcome process(Job& job, const CancelToken& cancel);
    [[nodiscard]] std::vector<Segment> prepareSegments(Job& job);
    [[nodiscard]] std::optional<RunOutcome> runStage(Job& job, std::vector<Segment>& segments,
                                                     std::size_t stageIndex, std::size_t stageCount,
                                                     const std::optional<Resume>& resume,
                                                     const CancelToken& cancel);
    [[nodiscard]] HistoryContext loadHistory(const Job& job, Stage stage,
                                             const std::vector<Segment>& segments, std::size_t offset) const;
    [[nodiscard]] RunResult compressHistory(const Job& job, Stage stage, HistoryContext& history);

    [[nodiscard]] RunOutcome failSegment(Job& job, Segment& segment, Stage stage, const std::string& message);
    [[nodiscard]] RunOutcome finishStopped(Job& job);
    [[nodiscard]] RunOutcome recordFailure(const JobId& id, const std::string& message) noexcept;

    void persistJob(const Job& job);
    void persistSegment(const JobId& id, const Segment& segment);
    void publish(const Job& job, EventType type, std::optional<Stage> stage = std::nullopt,
                 std::optional<std::size_t> segmentIndex = std::nullopt, std::string content = {},
                 std::string message = {}, std::size_t measuredSize = 0);

    Store& store_;
    AdmissionController& admission_;
    EventBroadcaster& events_;
    LanguageModel& model_;
    Compressor compressor_;
    Settings settings_;
};

}
