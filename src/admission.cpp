/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/admission.hpp"
#include "redraft/logger.hpp"
#include <algorithm>

namespace redraft {

AdmissionController::AdmissionController(std::size_t limit)
    : limit_(std::max<std::size_t>(1, limit)) {
    LOG_DEBUG("Admission controller created with limit " + std::to_string(limit_));
}

bool AdmissionController::acquire(const JobId& id, const CancelToken* cancel) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (active_.count(id) > 0) {
        return true;
    }
    if (cancel && cancel->cancelled()) {
        removeFromQueueLocked(id);
        return false;
    }
    if (!isQueuedLocked(id) && queue_.empty() && active_.size() < limit_) {
        active_.insert(id);
        LOG_DEBUG("Admitted immediately: " + id + " (" + std::to_string(active_.size()) +
                  "/" + std::to_string(limit_) + ")");
        return true;
    }

    if (!isQueuedLocked(id)) {
        queue_.push_back(id);
    }
    LOG_INFO("Job waiting for a slot: " + id + " (position " + std::to_string(queue_.size()) + ")");

    changed_.wait(lock, [&] {
        return active_.count(id) > 0 || !isQueuedLocked(id) || (cancel && cancel->cancelled());
    });

    if (active_.count(id) > 0) {
        LOG_DEBUG("Admitted from queue: " + id);
        return true;
    }
    removeFromQueueLocked(id);
    LOG_INFO("Job left the wait queue: " + id);
    return false;
}

void AdmissionController::release(const JobId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(id);
        removeFromQueueLocked(id);
        promoteLocked();
    }
    changed_.notify_all();
}

void AdmissionController::updateLimit(std::size_t limit) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        limit_ = std::max<std::size_t>(1, limit);
        LOG_INFO("Concurrency limit set to " + std::to_string(limit_));
        promoteLocked();
    }
    changed_.notify_all();
}

void AdmissionController::interrupt() {
    // Taking the lock orders the wake-up after any token change made by the caller
    { std::lock_guard<std::mutex> lock(mutex_); }
    changed_.notify_all();
}

AdmissionStatus AdmissionController::status(const std::optional<JobId>& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    AdmissionStatus s;
    s.active = active_.size();
    s.limit = limit_;
    s.queueLength = queue_.size();
    if (id) {
        auto it = std::find(queue_.begin(), queue_.end(), *id);
        if (it != queue_.end()) {
            std::size_t position = static_cast<std::size_t>(it - queue_.begin()) + 1;
            s.position = position;
            s.estimatedWaitSeconds = position * kAverageJobSeconds;
        }
    }
    return s;
}

bool AdmissionController::isActive(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(id) > 0;
}

std::size_t AdmissionController::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

std::size_t AdmissionController::limit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limit_;
}

void AdmissionController::promoteLocked() {
    while (!queue_.empty() && active_.size() < limit_) {
        JobId next = queue_.front();
        queue_.pop_front();
        active_.insert(next);
        LOG_DEBUG("Promoted from queue: " + next);
    }
}

bool AdmissionController::isQueuedLocked(const JobId& id) const {
    return std::find(queue_.begin(), queue_.end(), id) != queue_.end();
}

void AdmissionController::removeFromQueueLocked(const JobId& id) {
    queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
}

}
