/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <mutex>

#include "redraft/store.hpp"

namespace redraft {

// Directory-per-job store. Layout under <root>/jobs/<id>/:
//   original.txt, overrides.txt, state.txt, error.txt
//   segments/<n>/{original,first,second,state}.txt
//   history/<stage>.txt
//   changes/<n>_<stage>/{before,after,detail}.txt
// Every file is replaced by rename, so other processes (rdctl) can read
// while the daemon writes.
class FileStore final : public Store {
public:
    explicit FileStore(const std::filesystem::path& root, bool createIfMissing = true);

    FileStore(const FileStore&) = delete;
    FileStore& operator=(const FileStore&) = delete;

    [[nodiscard]] bool valid() const noexcept { return valid_; }
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

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
    std::filesystem::path root_;
    bool valid_ = false;
    mutable std::mutex mutex_;

    [[nodiscard]] std::filesystem::path jobPath(const JobId& id) const;
    [[nodiscard]] bool writeJobLocked(const Job& job) noexcept;
    [[nodiscard]] bool writeSegmentLocked(const JobId& id, const Segment& segment) noexcept;
    [[nodiscard]] std::optional<Segment> readSegmentLocked(const std::filesystem::path& dir) const;
};

// Serialized history: a measured_size line, then per entry "<role> <bytes>\n<content>\n".
[[nodiscard]] std::string encodeHistory(const HistoryContext& history);
[[nodiscard]] std::optional<HistoryContext> decodeHistory(Stage stage, const std::string& data);

}
