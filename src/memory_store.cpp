/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/store.hpp"
#include "redraft/logger.hpp"

namespace redraft {

bool MemoryStore::createJob(const Job& job) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.emplace(job.id, job).second;
    } catch (...) {
        return false;
    }
}

std::optional<Job> MemoryStore::loadJob(const JobId& id) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return std::nullopt;
        }
        return it->second;
    } catch (...) {
        return std::nullopt;
    }
}

bool MemoryStore::saveJob(const Job& job) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(job.id);
        if (it == jobs_.end()) {
            return false;
        }
        it->second = job;
        return true;
    } catch (...) {
        return false;
    }
}

std::vector<JobId> MemoryStore::listJobs() const noexcept {
    std::vector<JobId> ids;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(jobs_.size());
        for (const auto& entry : jobs_) {
            ids.push_back(entry.first);
        }
    } catch (...) {
        LOG_ERROR("Failed to list jobs");
    }
    return ids;
}

bool MemoryStore::createSegments(const JobId& id, const std::vector<Segment>& segments) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (jobs_.count(id) == 0) {
            return false;
        }
        auto& stored = segments_[id];
        if (!stored.empty()) {
            return false;
        }
        stored = segments;
        return true;
    } catch (...) {
        return false;
    }
}

std::vector<Segment> MemoryStore::loadSegments(const JobId& id) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = segments_.find(id);
        if (it == segments_.end()) {
            return {};
        }
        return it->second;
    } catch (...) {
        return {};
    }
}

bool MemoryStore::saveSegment(const JobId& id, const Segment& segment) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = segments_.find(id);
        if (it == segments_.end() || segment.index >= it->second.size()) {
            return false;
        }
        it->second[segment.index] = segment;
        return true;
    } catch (...) {
        return false;
    }
}

std::optional<HistoryContext> MemoryStore::loadHistory(const JobId& id, Stage stage) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = history_.find({id, stage});
        if (it == history_.end()) {
            return std::nullopt;
        }
        return it->second;
    } catch (...) {
        return std::nullopt;
    }
}

bool MemoryStore::saveHistory(const JobId& id, const HistoryContext& history) noexcept {
    if (!history.compressed) {
        return false;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        history_[{id, history.stage}] = history;
        return true;
    } catch (...) {
        return false;
    }
}

bool MemoryStore::saveChange(const JobId& id, const ChangeRecord& change) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        changes_[std::make_tuple(id, change.segmentIndex, change.stage)] = change;
        return true;
    } catch (...) {
        return false;
    }
}

std::vector<ChangeRecord> MemoryStore::loadChanges(const JobId& id) const noexcept {
    std::vector<ChangeRecord> result;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : changes_) {
            if (std::get<0>(entry.first) == id) {
                result.push_back(entry.second);
            }
        }
    } catch (...) {
        LOG_ERROR("Failed to load changes for job: " + id);
    }
    return result;
}

std::string assembleOutput(const std::vector<Segment>& segments, ProcessingMode mode) {
    auto stages = stagesFor(mode);
    Stage last = stages.empty() ? Stage::Polish : stages.back();

    std::string out;
    for (const auto& segment : segments) {
        const auto& text = segment.outputFor(last);
        if (!out.empty()) {
            out += "\n\n";
        }
        out += text ? *text : segment.originalText;
    }
    return out;
}

}
