/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/supervisor.hpp"
#include "redraft/logger.hpp"
#include <iterator>

namespace redraft {

Supervisor::~Supervisor() {
    shutdown();
}

bool Supervisor::launch(const JobId& id, JobTask task) {
    if (!task) {
        LOG_ERROR("Invalid task provided for job: " + id);
        return false;
    }

    std::vector<std::thread> done;
    bool launched = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_.load()) {
            LOG_DEBUG("Cannot launch job on stopped supervisor: " + id);
            return false;
        }
        done = collectFinishedLocked();

        if (runs_.count(id) == 0) {
            try {
                Run& run = runs_[id];
                run.thread = std::thread(&Supervisor::runTask, this, id, std::move(task));
                launched = true;
            } catch (const std::exception& e) {
                runs_.erase(id);
                LOG_ERROR("Failed to start thread for job " + id + ": " + std::string(e.what()));
            }
        } else {
            LOG_WARN("Job already has an active run: " + id);
        }
    }
    joinAll(done);

    if (launched) {
        LOG_DEBUG("Launched run for job: " + id);
    }
    return launched;
}

void Supervisor::runTask(const JobId& id, const JobTask& task) {
    setThreadName(jobThreadName(id));

    TaskReport report;
    report.id = id;
    try {
        RunOutcome outcome = task();
        report.status = outcome.status;
        report.message = std::move(outcome.message);
    } catch (const std::exception& e) {
        LOG_ERROR("Job task error: " + std::string(e.what()) + " (job: " + id + ")");
        report.status = JobStatus::Failed;
        report.message = "Task error: " + std::string(e.what());
    } catch (...) {
        LOG_ERROR("Unknown job task error (job: " + id + ")");
        report.status = JobStatus::Failed;
        report.message = "Unknown task error";
    }
    LOG_DEBUG("Run finished for job " + id + ": " + toString(report.status));
    clearThreadName();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        reports_.push_back(std::move(report));
        auto it = runs_.find(id);
        if (it != runs_.end()) {
            it->second.finished = true;
        }
    }
    finished_.notify_all();
}

bool Supervisor::isRunning(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(id);
    return it != runs_.end() && !it->second.finished;
}

std::size_t Supervisor::runningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& entry : runs_) {
        if (!entry.second.finished) {
            ++count;
        }
    }
    return count;
}

bool Supervisor::waitFor(const JobId& id, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return finished_.wait_for(lock, timeout, [&] {
        auto it = runs_.find(id);
        return it == runs_.end() || it->second.finished;
    });
}

std::vector<TaskReport> Supervisor::drainReports() {
    std::vector<TaskReport> reports;
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reports.assign(std::make_move_iterator(reports_.begin()), std::make_move_iterator(reports_.end()));
        reports_.clear();
        done = collectFinishedLocked();
    }
    joinAll(done);
    return reports;
}

void Supervisor::shutdown() noexcept {
    std::vector<std::thread> threads;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_.exchange(true) && runs_.empty()) {
            return;
        }
        for (auto& entry : runs_) {
            threads.push_back(std::move(entry.second.thread));
        }
        runs_.clear();
    } catch (...) {
        LOG_ERROR("Error collecting job threads during shutdown");
    }

    if (!threads.empty()) {
        LOG_DEBUG("Waiting for " + std::to_string(threads.size()) + " job thread(s)");
    }
    joinAll(threads);
}

std::vector<std::thread> Supervisor::collectFinishedLocked() {
    std::vector<std::thread> done;
    for (auto it = runs_.begin(); it != runs_.end();) {
        if (it->second.finished) {
            done.push_back(std::move(it->second.thread));
            it = runs_.erase(it);
        } else {
            ++it;
        }
    }
    return done;
}

void Supervisor::joinAll(std::vector<std::thread>& threads) noexcept {
    for (auto& thread : threads) {
        if (thread.joinable()) {
            try {
                thread.join();
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to join job thread: " + std::string(e.what()));
            }
        }
    }
    threads.clear();
}

}
