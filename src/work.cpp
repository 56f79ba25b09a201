/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/work.hpp"
#include "redraft/config.hpp"
#include "redraft/fsio.hpp"
#include "redraft/logger.hpp"
#include "redraft/text.hpp"
#include <fstream>

namespace redraft {

const char* toString(ControlAction action) noexcept {
    switch (action) {
        case ControlAction::Stop: return "stop";
        case ControlAction::Retry: return "retry";
        default: return "unknown";
    }
}

std::optional<ControlAction> parseControlAction(const std::string& value) noexcept {
    if (value == "stop") return ControlAction::Stop;
    if (value == "retry") return ControlAction::Retry;
    return std::nullopt;
}

Work::Work(const std::filesystem::path& workspace, bool createIfMissing)
    : workspace_(workspace),
      maxBytes_(env::getSize("REDRAFT_MAX_DOCUMENT_BYTES", 10'000'000)) {
    if (!createWorkspace(createIfMissing)) {
        LOG_ERROR("Failed to initialize workspace: " + workspace_.string());
    }
}

SubmitResult Work::submit(const std::string& text, const std::string& mode,
                          const std::map<Stage, ModelConfig>& overrides) {
    if (!isValidText(text)) {
        if (trimCopy(text).empty()) {
            LOG_DEBUG("Invalid document: empty");
            return {false, "", SubmissionError::InvalidContent, "Document is empty"};
        } else {
            LOG_DEBUG("Document exceeds size limit: " + std::to_string(text.size()) + " > " + std::to_string(maxBytes_));
            return {false, "", SubmissionError::InvalidSize, "Document exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)"};
        }
    }
    if (!parseMode(mode)) {
        return {false, "", SubmissionError::InvalidMode, "Unknown processing mode: " + mode};
    }

    JobId jobId = generateJobId();
    LOG_DEBUG("Generated job ID: " + jobId);

    if (!createJobDirectory(jobId)) {
        LOG_ERROR("Failed to create inbox directory for: " + jobId);
        return {false, "", SubmissionError::IoError, "Failed to create inbox directory"};
    }

    if (!writeInboxFile(jobId, "text.txt", text)) {
        LOG_ERROR("Failed to write document for: " + jobId);
        cleanupFailedJob(jobId);
        return {false, "", SubmissionError::IoError, "Failed to write document file"};
    }

    if (!writeInboxFile(jobId, "mode.txt", mode)) {
        LOG_ERROR("Failed to write mode file for: " + jobId);
        cleanupFailedJob(jobId);
        return {false, "", SubmissionError::IoError, "Failed to write mode file"};
    }

    if (!overrides.empty() && !writeInboxFile(jobId, "overrides.txt", fsio::formatOverrides(overrides))) {
        LOG_ERROR("Failed to write overrides file for: " + jobId);
        cleanupFailedJob(jobId);
        return {false, "", SubmissionError::IoError, "Failed to write overrides file"};
    }

    if (!atomicPublish(jobId)) {
        LOG_ERROR("Failed to publish job: " + jobId);
        cleanupFailedJob(jobId);
        return {false, "", SubmissionError::IoError, "Failed to publish job"};
    }

    LOG_INFO("Document submitted successfully: " + jobId);
    return {true, jobId, SubmissionError::None, ""};
}

bool Work::requestControl(const JobId& id, ControlAction action) {
    if (id.empty() || id.find('/') != std::string::npos) {
        LOG_ERROR("Invalid job id for control request: " + id);
        return false;
    }
    auto path = workspace_ / "inbox" / "control" / (id + "." + toString(action));
    if (!fsio::writeFileAtomic(path, toString(action))) {
        LOG_ERROR("Failed to write control request: " + path.string());
        return false;
    }
    LOG_INFO(std::string("Requested ") + toString(action) + " for job: " + id);
    return true;
}

bool Work::createWorkspace(bool createIfMissing) noexcept {
    try {
        if (!std::filesystem::exists(workspace_)) {
            if (!createIfMissing) {
                return false;
            }
            std::filesystem::create_directories(workspace_);
        }

        std::filesystem::create_directories(workspace_ / "inbox" / "writing");
        std::filesystem::create_directories(workspace_ / "inbox" / "ready");
        std::filesystem::create_directories(workspace_ / "inbox" / "control");
        std::filesystem::create_directories(workspace_ / "inbox" / "rejected");

        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    } catch (...) {
        LOG_ERROR("Unknown error creating workspace");
        return false;
    }
}

bool Work::isValidText(const std::string& text) const noexcept {
    return text.size() <= maxBytes_ && !trimCopy(text).empty();
}

bool Work::createJobDirectory(const JobId& jobId) const noexcept {
    try {
        auto jobPath = workspace_ / "inbox" / "writing" / jobId;
        std::filesystem::create_directories(jobPath);
        return std::filesystem::exists(jobPath) && std::filesystem::is_directory(jobPath);
    } catch (...) {
        return false;
    }
}

bool Work::writeInboxFile(const JobId& jobId, const char* name, const std::string& content) const noexcept {
    try {
        auto path = workspace_ / "inbox" / "writing" / jobId / name;
        std::ofstream file(path, std::ios::binary);
        if (!file) return false;

        file << content;
        file.flush();
        file.close();

        return file.good();
    } catch (...) {
        return false;
    }
}

bool Work::atomicPublish(const JobId& jobId) const noexcept {
    try {
        auto writingPath = workspace_ / "inbox" / "writing" / jobId;
        auto readyPath = workspace_ / "inbox" / "ready" / jobId;

        std::filesystem::rename(writingPath, readyPath);
        return true;
    } catch (...) {
        return false;
    }
}

void Work::cleanupFailedJob(const JobId& jobId) const noexcept {
    std::error_code ec;
    std::filesystem::remove_all(workspace_ / "inbox" / "writing" / jobId, ec);
}

}
