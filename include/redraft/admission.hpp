/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <utility>

#include "redraft/cancel.hpp"
#include "redraft/types.hpp"

namespace redraft {

struct AdmissionStatus {
    std::size_t active = 0;
    std::size_t limit = 0;
    std::size_t queueLength = 0;
    std::optional<std::size_t> position;           // 1-based, only while waiting
    std::optional<std::size_t> estimatedWaitSeconds;
};

// Bounds how many jobs run at once. Jobs beyond the limit wait in FIFO order.
class AdmissionController {
public:
    static constexpr std::size_t kAverageJobSeconds = 300;

    explicit AdmissionController(std::size_t limit);

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;
    AdmissionController(AdmissionController&&) = delete;
    AdmissionController& operator=(AdmissionController&&) = delete;

    // Blocks until the id holds a slot. Returns false only when the token is
    // cancelled before that happens; the id is then no longer queued.
    [[nodiscard]] bool acquire(const JobId& id, const CancelToken* cancel = nullptr);
    void release(const JobId& id);
    void updateLimit(std::size_t limit);

    // Wakes every waiter so it can re-check its cancellation token.
    void interrupt();

    [[nodiscard]] AdmissionStatus status(const std::optional<JobId>& id = std::nullopt) const;
    [[nodiscard]] bool isActive(const JobId& id) const;
    [[nodiscard]] std::size_t activeCount() const;
    [[nodiscard]] std::size_t limit() const;

private:
    void promoteLocked();
    [[nodiscard]] bool isQueuedLocked(const JobId& id) const;
    void removeFromQueueLocked(const JobId& id);

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::size_t limit_;
    std::unordered_set<JobId> active_;
    std::deque<JobId> queue_;
};

// Releases the slot when the owning scope exits.
class AdmissionGuard {
public:
    AdmissionGuard(AdmissionController& admission, JobId id) noexcept
        : admission_(admission), id_(std::move(id)) {}
    ~AdmissionGuard() { admission_.release(id_); }

    AdmissionGuard(const AdmissionGuard&) = delete;
    AdmissionGuard& operator=(const AdmissionGuard&) = delete;

private:
    AdmissionController& admission_;
    JobId id_;
};

}
