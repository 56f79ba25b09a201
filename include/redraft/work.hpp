/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "redraft/records.hpp"
#include "redraft/types.hpp"

namespace redraft {

enum class ControlAction : uint8_t {
    Stop = 0,
    Retry = 1
};

[[nodiscard]] const char* toString(ControlAction action) noexcept;
[[nodiscard]] std::optional<ControlAction> parseControlAction(const std::string& value) noexcept;

// Client side of the workspace inbox. Documents are staged under
// inbox/writing/<id>/ and published to inbox/ready/ with a single rename;
// control requests are files named inbox/control/<id>.<action>.
class Work final {
public:
    explicit Work(const std::filesystem::path& workspace, bool createIfMissing = true);

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;
    Work(Work&&) noexcept = default;
    Work& operator=(Work&&) noexcept = default;

    [[nodiscard]] SubmitResult submit(const std::string& text,
                                      const std::string& mode = "paper_polish_enhance",
                                      const std::map<Stage, ModelConfig>& overrides = {});

    [[nodiscard]] bool requestControl(const JobId& id, ControlAction action);

    void setMaxSize(std::size_t maxBytes) noexcept { maxBytes_ = maxBytes; }
    [[nodiscard]] std::size_t maxSize() const noexcept { return maxBytes_; }

private:
    std::filesystem::path workspace_;
    std::size_t maxBytes_ = 10'000'000; // 10MB

    [[nodiscard]] bool createWorkspace(bool createIfMissing) noexcept;
    [[nodiscard]] bool isValidText(const std::string& text) const noexcept;

    [[nodiscard]] bool createJobDirectory(const JobId& jobId) const noexcept;
    [[nodiscard]] bool writeInboxFile(const JobId& jobId, const char* name, const std::string& content) const noexcept;
    [[nodiscard]] bool atomicPublish(const JobId& jobId) const noexcept;
    void cleanupFailedJob(const JobId& jobId) const noexcept;
};

}
