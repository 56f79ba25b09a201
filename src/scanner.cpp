/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/scanner.hpp"
#include "redraft/fsio.hpp"
#include "redraft/logger.hpp"
#include "redraft/text.hpp"
#include <algorithm>

namespace redraft {

Scanner::Scanner(const std::filesystem::path& workspace) noexcept
    : workspace_(workspace),
      readyPath_(workspace / "inbox" / "ready"),
      controlPath_(workspace / "inbox" / "control") {
}

std::vector<JobId> Scanner::scan() const noexcept {
    std::vector<JobId> jobs;

    try {
        if (!std::filesystem::exists(readyPath_)) {
            LOG_DEBUG("Ready directory does not exist: " + readyPath_.string());
            return jobs;
        }

        for (const auto& entry : std::filesystem::directory_iterator(readyPath_)) {
            if (entry.is_directory()) {
                JobId jobId = extractJobId(entry.path());
                if (!jobId.empty() && isValidJobDirectory(entry.path())) {
                    jobs.push_back(jobId);
                    LOG_TRACE("Found document: " + jobId);
                }
            }
        }

        // Sort by job ID for consistent ordering (timestamp is in the ID)
        std::sort(jobs.begin(), jobs.end());

        if (!jobs.empty()) {
            LOG_DEBUG("Scanner found " + std::to_string(jobs.size()) + " ready documents");
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Unknown scanner error");
    }

    return jobs;
}

std::size_t Scanner::readyJobCount() const noexcept {
    std::size_t count = 0;

    try {
        if (!std::filesystem::exists(readyPath_)) {
            return 0;
        }

        for (const auto& entry : std::filesystem::directory_iterator(readyPath_)) {
            if (entry.is_directory() && isValidJobDirectory(entry.path())) {
                ++count;
            }
        }
    } catch (...) {
        // Return what we counted so far
    }

    return count;
}

std::optional<JobRequest> Scanner::load(const JobId& id) const noexcept {
    try {
        auto dir = readyPath_ / id;
        auto text = fsio::readFile(dir / "text.txt");
        if (!text) {
            LOG_ERROR("Failed to read document for: " + id);
            return std::nullopt;
        }

        JobRequest request;
        request.id = id;
        request.text = std::move(*text);
        if (auto mode = fsio::readFile(dir / "mode.txt")) {
            std::string trimmed = trimCopy(*mode);
            if (!trimmed.empty()) {
                request.mode = trimmed;
            }
        }
        if (auto overrides = fsio::readFile(dir / "overrides.txt")) {
            request.overrides = fsio::parseOverrides(*overrides);
        }
        return request;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception reading document " + id + ": " + std::string(e.what()));
        return std::nullopt;
    }
}

bool Scanner::consume(const JobId& id) const noexcept {
    std::error_code ec;
    std::filesystem::remove_all(readyPath_ / id, ec);
    if (ec) {
        LOG_ERROR("Failed to remove consumed document " + id + ": " + ec.message());
        return false;
    }
    return true;
}

bool Scanner::reject(const JobId& id, const std::string& reason) const noexcept {
    try {
        auto rejectedDir = workspace_ / "inbox" / "rejected";
        std::filesystem::create_directories(rejectedDir);

        std::error_code ec;
        std::filesystem::rename(readyPath_ / id, rejectedDir / id, ec);
        if (ec) {
            LOG_ERROR("Failed to move rejected document " + id + ": " + ec.message());
            return consume(id);
        }
        if (!fsio::writeFileAtomic(rejectedDir / id / "error.txt", reason)) {
            LOG_WARN("Failed to record rejection reason for: " + id);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to reject document " + id + ": " + std::string(e.what()));
        return false;
    }
}

std::vector<ControlRequest> Scanner::scanControls() const noexcept {
    std::vector<ControlRequest> requests;

    try {
        if (!std::filesystem::exists(controlPath_)) {
            return requests;
        }

        for (const auto& entry : std::filesystem::directory_iterator(controlPath_)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            const auto& path = entry.path();
            auto action = parseControlAction(path.extension().string().substr(path.extension().empty() ? 0 : 1));
            if (!action) {
                // Includes .tmp files still being written
                continue;
            }
            requests.push_back({path.stem().string(), *action, path});
        }

        std::sort(requests.begin(), requests.end(), [](const ControlRequest& a, const ControlRequest& b) {
            return a.file < b.file;
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Control scan error: " + std::string(e.what()));
    }

    return requests;
}

bool Scanner::consumeControl(const ControlRequest& request) const noexcept {
    std::error_code ec;
    std::filesystem::remove(request.file, ec);
    if (ec) {
        LOG_ERROR("Failed to remove control request " + request.file.string() + ": " + ec.message());
        return false;
    }
    return true;
}

bool Scanner::isValidJobDirectory(const std::filesystem::path& dir) const noexcept {
    try {
        if (!std::filesystem::is_directory(dir)) {
            return false;
        }

        // Must contain text.txt
        auto textFile = dir / "text.txt";
        if (!std::filesystem::exists(textFile) || !std::filesystem::is_regular_file(textFile)) {
            LOG_DEBUG("Invalid inbox directory (missing text.txt): " + dir.string());
            return false;
        }

        return true;
    } catch (...) {
        return false;
    }
}

JobId Scanner::extractJobId(const std::filesystem::path& dir) const noexcept {
    try {
        return dir.filename().string();
    } catch (...) {
        return "";
    }
}

}
