/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "redraft/records.hpp"
#include "redraft/types.hpp"

namespace redraft {

// Persistence used by the pipeline and the job façade. Writes report success
// by value and reads return empty results on failure; implementations never throw.
class Store {
public:
    virtual ~Store() = default;

    [[nodiscard]] virtual bool createJob(const Job& job) noexcept = 0;
    [[nodiscard]] virtual std::optional<Job> loadJob(const JobId& id) const noexcept = 0;
    [[nodiscard]] virtual bool saveJob(const Job& job) noexcept = 0;
    [[nodiscard]] virtual std::vector<JobId> listJobs() const noexcept = 0;

    // Segments are created once per job, ordered by index.
    [[nodiscard]] virtual bool createSegments(const JobId& id, const std::vector<Segment>& segments) noexcept = 0;
    [[nodiscard]] virtual std::vector<Segment> loadSegments(const JobId& id) const noexcept = 0;
    [[nodiscard]] virtual bool saveSegment(const JobId& id, const Segment& segment) noexcept = 0;

    // Only compressed history is stored; one record per (job, stage).
    [[nodiscard]] virtual std::optional<HistoryContext> loadHistory(const JobId& id, Stage stage) const noexcept = 0;
    [[nodiscard]] virtual bool saveHistory(const JobId& id, const HistoryContext& history) noexcept = 0;

    // One record per (job, segment, stage).
    [[nodiscard]] virtual bool saveChange(const JobId& id, const ChangeRecord& change) noexcept = 0;
    [[nodiscard]] virtual std::vector<ChangeRecord> loadChanges(const JobId& id) const noexcept = 0;
};

class MemoryStore final : public Store {
public:
    MemoryStore() = default;

    [[nodiscard]] bool createJob(const Job& job) noexcept override;
    [[nodiscard]] std::optional<Job> loadJob(const JobId& id) const noexcept override;
    [[nodiscard]] bool saveJob(const Job& job) noexcept override;
    [[nodiscard]] std::vector<JobId> listJobs() const noexcept override;

    [[nodiscard]] bool createSegments(const JobId& id, const std::vector<Segment>& segments) noexcept override;
    [[nodiscard]] std::vector<Segment> loadSegments(const JobId& id) const noexcept override;
    [[nodiscard]] bool saveSegment(const JobId& id, const Segment& segment) noexcept override;

    [[nodiscard]] std::optional<HistoryContext> loadHistory(const JobId& id, Stage stage) const noexcept override;
    [[nodiscard]] bool saveHistory(const JobId& id, const HistoryContext& history) noexcept override;

    [[nodiscard]] bool saveChange(const JobId& id, const ChangeRecord& change) noexcept override;
    [[nodiscard]] std::vector<ChangeRecord> loadChanges(const JobId& id) const noexcept override;

private:
    mutable std::mutex mutex_;
    std::map<JobId, Job> jobs_;
    std::unordered_map<JobId, std::vector<Segment>> segments_;
    std::map<std::pair<JobId, Stage>, HistoryContext> history_;
    std::map<std::tuple<JobId, std::size_t, Stage>, ChangeRecord> changes_;
};

// Final text of a job: the last stage's output of every segment, blank-line separated.
[[nodiscard]] std::string assembleOutput(const std::vector<Segment>& segments, ProcessingMode mode);

}
