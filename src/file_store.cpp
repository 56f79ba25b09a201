/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/file_store.hpp"
#include "redraft/fsio.hpp"
#include "redraft/logger.hpp"
#include <algorithm>
#include <sstream>

namespace redraft {

namespace {

using Clock = std::chrono::system_clock;

std::string toMillis(Clock::time_point tp) {
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count());
}

Clock::time_point fromMillis(const std::string& value) {
    return Clock::time_point(std::chrono::milliseconds(std::stoll(value)));
}

std::string valueOr(const std::map<std::string, std::string>& values, const char* key, const std::string& defv) {
    auto it = values.find(key);
    return it == values.end() ? defv : it->second;
}

bool isValidId(const JobId& id) {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    return id.find('/') == std::string::npos && id.find('\\') == std::string::npos;
}

}

FileStore::FileStore(const std::filesystem::path& root, bool createIfMissing)
    : root_(root) {
    try {
        if (!std::filesystem::exists(root_ / "jobs")) {
            if (!createIfMissing) {
                LOG_ERROR("Store does not exist: " + root_.string());
                return;
            }
            std::filesystem::create_directories(root_ / "jobs");
        }
        valid_ = true;
        LOG_DEBUG("FileStore opened at: " + root_.string());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to open store at " + root_.string() + ": " + std::string(e.what()));
    }
}

std::filesystem::path FileStore::jobPath(const JobId& id) const {
    return root_ / "jobs" / id;
}

bool FileStore::createJob(const Job& job) noexcept {
    if (!valid_ || !isValidId(job.id)) {
        return false;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto dir = jobPath(job.id);
        if (std::filesystem::exists(dir)) {
            LOG_WARN("Job already exists in store: " + job.id);
            return false;
        }
        std::filesystem::create_directories(dir / "segments");
        std::filesystem::create_directories(dir / "history");
        std::filesystem::create_directories(dir / "changes");

        if (!fsio::writeFileAtomic(dir / "original.txt", job.originalText)) return false;
        if (!fsio::writeFileAtomic(dir / "overrides.txt", fsio::formatOverrides(job.overrides))) return false;
        return writeJobLocked(job);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create job " + job.id + ": " + std::string(e.what()));
        return false;
    } catch (...) {
        return false;
    }
}

bool FileStore::writeJobLocked(const Job& job) noexcept {
    try {
        std::map<std::string, std::string> state;
        state["mode"] = toString(job.mode);
        state["status"] = toString(job.status);
        state["current_stage"] = toString(job.currentStage);
        state["current_position"] = std::to_string(job.currentPosition);
        state["total_segments"] = std::to_string(job.totalSegments);
        std::ostringstream progress;
        progress << job.progress;
        state["progress"] = progress.str();
        state["failed_segment_index"] = job.failedSegmentIndex ? std::to_string(*job.failedSegmentIndex) : "";
        state["created_at"] = toMillis(job.createdAt);
        state["completed_at"] = job.completedAt ? toMillis(*job.completedAt) : "";

        auto dir = jobPath(job.id);
        // Error text can span lines, so it lives beside the scalars
        if (!fsio::writeFileAtomic(dir / "error.txt", job.error)) return false;
        return fsio::writeFileAtomic(dir / "state.txt", fsio::formatKeyValues(state));
    } catch (...) {
        return false;
    }
}

std::optional<Job> FileStore::loadJob(const JobId& id) const noexcept {
    if (!valid_ || !isValidId(id)) {
        return std::nullopt;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto dir = jobPath(id);
        auto stateText = fsio::readFile(dir / "state.txt");
        auto original = fsio::readFile(dir / "original.txt");
        if (!stateText || !original) {
            return std::nullopt;
        }
        auto state = fsio::parseKeyValues(*stateText);

        auto mode = parseMode(valueOr(state, "mode", ""));
        auto status = parseJobStatus(valueOr(state, "status", ""));
        auto stage = parseStage(valueOr(state, "current_stage", ""));
        if (!mode || !status || !stage) {
            LOG_ERROR("Corrupt state file for job: " + id);
            return std::nullopt;
        }

        Job job;
        job.id = id;
        job.originalText = std::move(*original);
        job.mode = *mode;
        job.status = *status;
        job.currentStage = *stage;
        job.currentPosition = std::stoull(valueOr(state, "current_position", "0"));
        job.totalSegments = std::stoull(valueOr(state, "total_segments", "0"));
        job.progress = std::stod(valueOr(state, "progress", "0"));
        std::string failed = valueOr(state, "failed_segment_index", "");
        if (!failed.empty()) {
            job.failedSegmentIndex = std::stoull(failed);
        }
        job.createdAt = fromMillis(valueOr(state, "created_at", "0"));
        std::string completed = valueOr(state, "completed_at", "");
        if (!completed.empty()) {
            job.completedAt = fromMillis(completed);
        }
        job.error = fsio::readFile(dir / "error.txt").value_or("");
        if (auto overrides = fsio::readFile(dir / "overrides.txt")) {
            job.overrides = fsio::parseOverrides(*overrides);
        }
        return job;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load job " + id + ": " + std::string(e.what()));
        return std::nullopt;
    } catch (...) {
        return std::nullopt;
    }
}

bool FileStore::saveJob(const Job& job) noexcept {
    if (!valid_ || !isValidId(job.id)) {
        return false;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!std::filesystem::exists(jobPath(job.id))) {
            return false;
        }
        return writeJobLocked(job);
    } catch (...) {
        return false;
    }
}

std::vector<JobId> FileStore::listJobs() const noexcept {
    std::vector<JobId> ids;
    if (!valid_) {
        return ids;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : std::filesystem::directory_iterator(root_ / "jobs")) {
            if (entry.is_directory() && std::filesystem::exists(entry.path() / "state.txt")) {
                ids.push_back(entry.path().filename().string());
            }
        }
        std::sort(ids.begin(), ids.end());
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing jobs: " + std::string(e.what()));
    }
    return ids;
}

bool FileStore::createSegments(const JobId& id, const std::vector<Segment>& segments) noexcept {
    if (!valid_ || !isValidId(id)) {
        return false;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto dir = jobPath(id) / "segments";
        if (!std::filesystem::exists(jobPath(id))) {
            return false;
        }
        if (std::filesystem::exists(dir) && !std::filesystem::is_empty(dir)) {
            return false;
        }
        for (const auto& segment : segments) {
            auto segDir = dir / std::to_string(segment.index);
            std::filesystem::create_directories(segDir);
            if (!fsio::writeFileAtomic(segDir / "original.txt", segment.originalText)) return false;
            if (!writeSegmentLocked(id, segment)) return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create segments for job " + id + ": " + std::string(e.what()));
        return false;
    } catch (...) {
        return false;
    }
}

bool FileStore::writeSegmentLocked(const JobId& id, const Segment& segment) noexcept {
    try {
        auto segDir = jobPath(id) / "segments" / std::to_string(segment.index);
        if (!std::filesystem::exists(segDir)) {
            return false;
        }
        std::error_code ec;
        if (segment.firstOutput) {
            if (!fsio::writeFileAtomic(segDir / "first.txt", *segment.firstOutput)) return false;
        } else {
            std::filesystem::remove(segDir / "first.txt", ec);
        }
        if (segment.secondOutput) {
            if (!fsio::writeFileAtomic(segDir / "second.txt", *segment.secondOutput)) return false;
        } else {
            std::filesystem::remove(segDir / "second.txt", ec);
        }

        std::map<std::string, std::string> state;
        state["stage"] = toString(segment.stage);
        state["trivial"] = segment.trivial ? "1" : "0";
        state["status"] = toString(segment.status);
        return fsio::writeFileAtomic(segDir / "state.txt", fsio::formatKeyValues(state));
    } catch (...) {
        return false;
    }
}

std::optional<Segment> FileStore::readSegmentLocked(const std::filesystem::path& dir) const {
    auto original = fsio::readFile(dir / "original.txt");
    auto stateText = fsio::readFile(dir / "state.txt");
    if (!original || !stateText) {
        return std::nullopt;
    }
    auto state = fsio::parseKeyValues(*stateText);
    auto stage = parseStage(valueOr(state, "stage", ""));
    auto status = parseSegmentStatus(valueOr(state, "status", ""));
    if (!stage || !status) {
        return std::nullopt;
    }

    Segment segment;
    segment.index = std::stoull(dir.filename().string());
    segment.stage = *stage;
    segment.originalText = std::move(*original);
    segment.firstOutput = fsio::readFile(dir / "first.txt");
    segment.secondOutput = fsio::readFile(dir / "second.txt");
    segment.trivial = valueOr(state, "trivial", "0") == "1";
    segment.status = *status;
    return segment;
}

std::vector<Segment> FileStore::loadSegments(const JobId& id) const noexcept {
    std::vector<Segment> segments;
    if (!valid_ || !isValidId(id)) {
        return segments;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto dir = jobPath(id) / "segments";
        if (!std::filesystem::exists(dir)) {
            return segments;
        }
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (!entry.is_directory()) {
                continue;
            }
            auto segment = readSegmentLocked(entry.path());
            if (!segment) {
                LOG_ERROR("Corrupt segment " + entry.path().string());
                return {};
            }
            segments.push_back(std::move(*segment));
        }
        std::sort(segments.begin(), segments.end(),
            [](const Segment& a, const Segment& b) { return a.index < b.index; });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load segments for job " + id + ": " + std::string(e.what()));
        segments.clear();
    }
    return segments;
}

bool FileStore::saveSegment(const JobId& id, const Segment& segment) noexcept {
    if (!valid_ || !isValidId(id)) {
        return false;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        return writeSegmentLocked(id, segment);
    } catch (...) {
        return false;
    }
}

std::optional<HistoryContext> FileStore::loadHistory(const JobId& id, Stage stage) const noexcept {
    if (!valid_ || !isValidId(id)) {
        return std::nullopt;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto data = fsio::readFile(jobPath(id) / "history" / (std::string(toString(stage)) + ".txt"));
        if (!data) {
            return std::nullopt;
        }
        return decodeHistory(stage, *data);
    } catch (...) {
        return std::nullopt;
    }
}

bool FileStore::saveHistory(const JobId& id, const HistoryContext& history) noexcept {
    if (!valid_ || !isValidId(id) || !history.compressed) {
        return false;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto dir = jobPath(id) / "history";
        std::filesystem::create_directories(dir);
        return fsio::writeFileAtomic(dir / (std::string(toString(history.stage)) + ".txt"),
                                     encodeHistory(history));
    } catch (...) {
        return false;
    }
}

bool FileStore::saveChange(const JobId& id, const ChangeRecord& change) noexcept {
    if (!valid_ || !isValidId(id)) {
        return false;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto dir = jobPath(id) / "changes" /
            (std::to_string(change.segmentIndex) + "_" + toString(change.stage));
        std::filesystem::create_directories(dir);

        std::map<std::string, std::string> detail;
        detail["segment_index"] = std::to_string(change.segmentIndex);
        detail["stage"] = toString(change.stage);
        detail["before_length"] = std::to_string(change.beforeLength);
        detail["after_length"] = std::to_string(change.afterLength);
        detail["changed"] = change.changed ? "1" : "0";

        if (!fsio::writeFileAtomic(dir / "before.txt", change.before)) return false;
        if (!fsio::writeFileAtomic(dir / "after.txt", change.after)) return false;
        return fsio::writeFileAtomic(dir / "detail.txt", fsio::formatKeyValues(detail));
    } catch (...) {
        return false;
    }
}

std::vector<ChangeRecord> FileStore::loadChanges(const JobId& id) const noexcept {
    std::vector<ChangeRecord> changes;
    if (!valid_ || !isValidId(id)) {
        return changes;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto dir = jobPath(id) / "changes";
        if (!std::filesystem::exists(dir)) {
            return changes;
        }
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            auto detailText = fsio::readFile(entry.path() / "detail.txt");
            if (!entry.is_directory() || !detailText) {
                continue;
            }
            auto detail = fsio::parseKeyValues(*detailText);
            auto stage = parseStage(valueOr(detail, "stage", ""));
            if (!stage) {
                continue;
            }
            ChangeRecord change;
            change.segmentIndex = std::stoull(valueOr(detail, "segment_index", "0"));
            change.stage = *stage;
            change.before = fsio::readFile(entry.path() / "before.txt").value_or("");
            change.after = fsio::readFile(entry.path() / "after.txt").value_or("");
            change.beforeLength = std::stoull(valueOr(detail, "before_length", "0"));
            change.afterLength = std::stoull(valueOr(detail, "after_length", "0"));
            change.changed = valueOr(detail, "changed", "0") == "1";
            changes.push_back(std::move(change));
        }
        std::sort(changes.begin(), changes.end(), [](const ChangeRecord& a, const ChangeRecord& b) {
            if (a.segmentIndex != b.segmentIndex) return a.segmentIndex < b.segmentIndex;
            return a.stage < b.stage;
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load changes for job " + id + ": " + std::string(e.what()));
        changes.clear();
    }
    return changes;
}

std::string encodeHistory(const HistoryContext& history) {
    std::string out = "measured_size=" + std::to_string(history.measuredSize) + "\n";
    for (const auto& entry : history.entries) {
        out += entry.role + " " + std::to_string(entry.content.size()) + "\n";
        out += entry.content;
        out += '\n';
    }
    return out;
}

std::optional<HistoryContext> decodeHistory(Stage stage, const std::string& data) {
    HistoryContext history;
    history.stage = stage;
    history.compressed = true;

    std::size_t pos = data.find('\n');
    if (pos == std::string::npos || data.compare(0, 14, "measured_size=") != 0) {
        return std::nullopt;
    }
    try {
        history.measuredSize = std::stoull(data.substr(14, pos - 14));
    } catch (...) {
        return std::nullopt;
    }
    ++pos;

    while (pos < data.size()) {
        std::size_t eol = data.find('\n', pos);
        if (eol == std::string::npos) {
            return std::nullopt;
        }
        std::string header = data.substr(pos, eol - pos);
        std::size_t space = header.find(' ');
        if (space == std::string::npos) {
            return std::nullopt;
        }
        std::size_t length = 0;
        try {
            length = std::stoull(header.substr(space + 1));
        } catch (...) {
            return std::nullopt;
        }
        pos = eol + 1;
        if (pos + length > data.size()) {
            return std::nullopt;
        }
        history.entries.push_back({header.substr(0, space), data.substr(pos, length)});
        pos += length + 1; // content is followed by a newline
    }
    return history;
}

}
