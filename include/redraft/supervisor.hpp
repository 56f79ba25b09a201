/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "redraft/pipeline.hpp"
#include "redraft/types.hpp"

namespace redraft {

using JobTask = std::function<RunOutcome()>;

// What became of one run. Exceptions escaping a task are reported as Failed.
struct TaskReport {
    JobId id;
    JobStatus status = JobStatus::Failed;
    std::string message;
};

// One thread per job run, at most one run per id.
class Supervisor {
public:
    Supervisor() noexcept = default;
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;
    Supervisor(Supervisor&&) = delete;
    Supervisor& operator=(Supervisor&&) = delete;

    // False while a run for the id is still active, or after shutdown().
    [[nodiscard]] bool launch(const JobId& id, JobTask task);

    [[nodiscard]] bool isRunning(const JobId& id) const;
    [[nodiscard]] std::size_t runningCount() const;

    // Waits until no run for the id is active. False on timeout.
    [[nodiscard]] bool waitFor(const JobId& id, std::chrono::milliseconds timeout);

    [[nodiscard]] std::vector<TaskReport> drainReports();

    // Refuses further launches and joins every thread.
    void shutdown() noexcept;

private:
    struct Run {
        std::thread thread;
        bool finished = false;
    };

    void runTask(const JobId& id, const JobTask& task);
    [[nodiscard]] std::vector<std::thread> collectFinishedLocked();
    static void joinAll(std::vector<std::thread>& threads) noexcept;

    mutable std::mutex mutex_;
    std::condition_variable finished_;
    std::unordered_map<JobId, Run> runs_;
    std::deque<TaskReport> reports_;
    std::atomic<bool> shutdown_{false};
};

}
