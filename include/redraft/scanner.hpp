/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "redraft/jobs.hpp"
#include "redraft/types.hpp"
#include "redraft/work.hpp"

namespace redraft {

struct ControlRequest {
    JobId id;
    ControlAction action = ControlAction::Stop;
    std::filesystem::path file;
};

// Daemon side of the workspace inbox.
class Scanner {
public:
    explicit Scanner(const std::filesystem::path& workspace) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    // Published documents, oldest id first.
    [[nodiscard]] std::vector<JobId> scan() const noexcept;
    [[nodiscard]] std::size_t readyJobCount() const noexcept;

    [[nodiscard]] std::optional<JobRequest> load(const JobId& id) const noexcept;
    [[nodiscard]] bool consume(const JobId& id) const noexcept;
    // Moves the document to inbox/rejected/<id>/ with the reason in error.txt.
    [[nodiscard]] bool reject(const JobId& id, const std::string& reason) const noexcept;

    [[nodiscard]] std::vector<ControlRequest> scanControls() const noexcept;
    [[nodiscard]] bool consumeControl(const ControlRequest& request) const noexcept;

private:
    std::filesystem::path workspace_;
    std::filesystem::path readyPath_;
    std::filesystem::path controlPath_;

    [[nodiscard]] bool isValidJobDirectory(const std::filesystem::path& dir) const noexcept;
    [[nodiscard]] JobId extractJobId(const std::filesystem::path& dir) const noexcept;
};

}
