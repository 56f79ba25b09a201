/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/file_store.hpp"
#include "redraft/logger.hpp"
#include "redraft/work.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <unistd.h>

using namespace redraft;

void printUsage(const char* progName) {
    std::cout << "redraft job control tool\n\n";
    std::cout << "Usage: " << progName << " <workspace> <command> [job_id] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  list [n]            Most recent jobs (default 10)\n";
    std::cout << "  status <job_id>     Status, stage and progress\n";
    std::cout << "  result <job_id>     Final text of a completed job\n";
    std::cout << "  changes <job_id>    Per-segment change records\n";
    std::cout << "  watch <job_id>      Follow progress until the job finishes\n";
    std::cout << "  stop <job_id>       Ask the daemon to stop a job\n";
    std::cout << "  retry <job_id>      Ask the daemon to resume a failed or stopped job\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait          With result: block until the job finishes\n\n";
    std::cout << "Exit codes: 0 ok, 1 error or failed job, 2 job not finished\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  REDRAFT_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace list\n";
    std::cout << "  " << progName << " ./workspace result 1731808123456_12345_0 --wait\n";
    std::cout << "  rdsub ./workspace --file draft.md | xargs " << progName << " ./workspace watch\n";
}

std::string formatProgress(double progress) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << progress << "%";
    return oss.str();
}

void printStatus(const Job& job, std::size_t completedSegments) {
    std::cout << "id         " << job.id << "\n";
    std::cout << "status     " << toString(job.status) << "\n";
    std::cout << "mode       " << toString(job.mode) << "\n";
    std::cout << "stage      " << toString(job.currentStage) << "\n";
    std::cout << "segments   " << completedSegments << "/" << job.totalSegments << "\n";
    std::cout << "position   " << job.currentPosition << "\n";
    std::cout << "progress   " << formatProgress(job.progress) << "\n";
    if (job.failedSegmentIndex) {
        std::cout << "failed at  segment " << (*job.failedSegmentIndex + 1) << "\n";
    }
    if (!job.error.empty()) {
        std::cout << "error      " << job.error << "\n";
    }
}

std::size_t countCompleted(const std::vector<Segment>& segments) {
    std::size_t count = 0;
    for (const auto& segment : segments) {
        if (segment.status == SegmentStatus::Completed) ++count;
    }
    return count;
}

// Polls until the job reaches a terminal state. Empty when it disappears.
std::optional<Job> waitForJob(const FileStore& store, const JobId& id, bool verbose) {
    std::string lastLine;
    while (true) {
        auto job = store.loadJob(id);
        if (!job) {
            return std::nullopt;
        }
        if (verbose) {
            std::ostringstream line;
            line << toString(job->status) << "  " << toString(job->currentStage)
                 << "  segment " << std::min(job->currentPosition + 1, std::max<std::size_t>(job->totalSegments, 1))
                 << "/" << job->totalSegments << "  " << formatProgress(job->progress);
            if (line.str() != lastLine) {
                lastLine = line.str();
                std::cout << lastLine << std::endl;
            }
        }
        if (isTerminal(job->status)) {
            return job;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
}

int printResult(const FileStore& store, const Job& job) {
    if (job.status == JobStatus::Completed) {
        std::cout << assembleOutput(store.loadSegments(job.id), job.mode) << std::endl;
        return 0;
    }
    if (job.status == JobStatus::Failed || job.status == JobStatus::Stopped) {
        std::cerr << "Job " << toString(job.status) << ": " << job.id << std::endl;
        if (!job.error.empty()) {
            std::cerr << "Error: " << job.error << std::endl;
        }
        return 1;
    }
    std::cerr << "Job not ready: " << job.id << " (status: " << toString(job.status)
              << ", " << formatProgress(job.progress) << ")" << std::endl;
    return 2; // Different exit code for "not ready"
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    if (!std::getenv("REDRAFT_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string command = argv[2];
    std::string jobId;
    bool wait = false;

    for (int i = 3; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else {
            jobId = arg;
        }
    }

    // Check piped input for JobID if not provided
    if (jobId.empty() && command != "list" && !isatty(fileno(stdin))) {
        std::cin >> jobId;
    }

    try {
        if (command == "stop" || command == "retry") {
            if (jobId.empty()) {
                std::cerr << "Error: " << command << " requires a job id\n";
                return 1;
            }
            Work work(workspace, false);
            auto action = parseControlAction(command);
            if (!action || !work.requestControl(jobId, *action)) {
                std::cerr << "Error: Failed to queue " << command << " request for " << jobId << "\n";
                return 1;
            }
            std::cout << command << " requested: " << jobId << std::endl;
            return 0;
        }

        FileStore store(workspace, false);
        if (!store.valid()) {
            std::cerr << "Error: Not a redraft workspace: " << workspace << "\n";
            return 1;
        }

        if (command == "list") {
            std::size_t max = 10;
            if (!jobId.empty()) {
                try {
                    max = static_cast<std::size_t>(std::stoul(jobId));
                } catch (const std::exception&) {
                    std::cerr << "Error: Invalid count: " << jobId << "\n";
                    return 1;
                }
            }
            std::vector<Job> jobs;
            for (const auto& id : store.listJobs()) {
                if (auto job = store.loadJob(id)) jobs.push_back(std::move(*job));
            }
            std::sort(jobs.begin(), jobs.end(),
                      [](const Job& a, const Job& b) { return a.createdAt > b.createdAt; });
            if (jobs.size() > max) jobs.resize(max);
            for (const auto& job : jobs) {
                std::cout << std::left << std::setw(32) << job.id << " "
                          << std::setw(10) << toString(job.status) << " "
                          << std::setw(21) << toString(job.mode) << " "
                          << formatProgress(job.progress) << "\n";
            }
            return 0;
        }

        if (jobId.empty()) {
            std::cerr << "Error: " << command << " requires a job id\n";
            return 1;
        }

        auto job = store.loadJob(jobId);
        if (!job) {
            std::cerr << "Job not found: " << jobId << std::endl;
            return 1;
        }

        if (command == "status") {
            printStatus(*job, countCompleted(store.loadSegments(jobId)));
            return 0;
        }

        if (command == "result") {
            if (wait) {
                job = waitForJob(store, jobId, false);
                if (!job) {
                    std::cerr << "Job not found: " << jobId << std::endl;
                    return 1;
                }
            }
            return printResult(store, *job);
        }

        if (command == "watch") {
            job = waitForJob(store, jobId, true);
            if (!job) {
                std::cerr << "Job not found: " << jobId << std::endl;
                return 1;
            }
            if (!job->error.empty()) {
                std::cerr << "Error: " << job->error << std::endl;
            }
            return job->status == JobStatus::Completed ? 0 : 1;
        }

        if (command == "changes") {
            for (const auto& change : store.loadChanges(jobId)) {
                std::cout << "segment " << (change.segmentIndex + 1) << "  " << toString(change.stage)
                          << "  " << change.beforeLength << " -> " << change.afterLength
                          << (change.changed ? "  changed" : "  unchanged") << "\n";
            }
            return 0;
        }

        std::cerr << "Error: Unknown command: " << command << "\n";
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
