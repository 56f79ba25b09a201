/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/server.hpp"
#include "redraft/file_store.hpp"
#include "redraft/jobs.hpp"
#include "redraft/logger.hpp"
#include "redraft/scanner.hpp"
#include <chrono>
#include <ctime>
#include <iostream>

namespace redraft {

namespace {
std::mutex g_output_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return buf;
}

const char* colorFor(EventType type) {
    switch (type) {
        case EventType::Completed: return "\033[32m";
        case EventType::Failed: return "\033[31m";
        case EventType::Stopped: return "\033[33m";
        default: return "\033[90m";
    }
}

}

// Note: Signal handling is done by the CLI (redraftd.cpp), not by Server class

Server::Server(const std::filesystem::path& workspace, LanguageModel& model, const Settings& settings)
    : workspace_(workspace), model_(model), settings_(settings) {
    LOG_DEBUG("Server created - workspace: " + workspace_.string() +
              ", max_concurrent: " + std::to_string(settings_.maxConcurrent));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting redraft server...");

    if (!createWorkspace()) {
        LOG_ERROR("Failed to create workspace");
        return false;
    }

    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("Workspace: " + workspace_.string());
    LOG_DEBUG("Polish model: " + settings_.polish.model);
    LOG_DEBUG("Enhance model: " + settings_.enhance.model);
    LOG_DEBUG("Emotion model: " + settings_.emotion.model);
    LOG_DEBUG("Compression model: " + settings_.compression.model);
    LOG_DEBUG("Max concurrent: " + std::to_string(settings_.maxConcurrent));
    LOG_DEBUG("========================================");

    try {
        store_ = std::make_unique<FileStore>(workspace_);
        if (!store_->valid()) {
            LOG_ERROR("Failed to open job store");
            return false;
        }
        jobs_ = std::make_unique<Jobs>(*store_, model_, settings_);
        scanner_ = std::make_unique<Scanner>(workspace_);

        // Pick up jobs left queued or processing by a previous daemon
        std::size_t recovered = jobs_->recover();
        if (recovered > 0) {
            LOG_INFO("Recovered " + std::to_string(recovered) + " unfinished job(s)");
        }

        running_.store(true);
        shutdown_.store(false);

        scannerThread_ = std::thread(&Server::scanLoop, this);

        LOG_DEBUG("Server started successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");

    shutdown_.store(true);
    running_.store(false);

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }

    if (jobs_) {
        jobs_->shutdown();
    }
    joinWatchers();

    jobs_.reset();
    scanner_.reset();
    store_.reset();

    LOG_INFO("Server shutdown complete");
}

bool Server::createWorkspace() noexcept {
    try {
        std::filesystem::create_directories(workspace_ / "inbox" / "writing");
        std::filesystem::create_directories(workspace_ / "inbox" / "ready");
        std::filesystem::create_directories(workspace_ / "inbox" / "control");
        std::filesystem::create_directories(workspace_ / "inbox" / "rejected");
        std::filesystem::create_directories(workspace_ / "jobs");

        LOG_DEBUG("Workspace created: " + workspace_.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

std::size_t Server::scanOnce() {
    if (!jobs_ || !scanner_) {
        return 0;
    }

    std::size_t handled = 0;
    for (const auto& id : scanner_->scan()) {
        if (shutdown_.load()) break;
        handleDocument(id);
        ++handled;
    }

    for (const auto& request : scanner_->scanControls()) {
        if (shutdown_.load()) break;
        handleControl(request.id, toString(request.action));
        if (!scanner_->consumeControl(request)) {
            LOG_WARN("Control request left in place: " + request.file.string());
        }
        ++handled;
    }

    reapWatchers();

    for (const auto& report : jobs_->reports()) {
        LOG_DEBUG("Run report: " + report.id + " -> " + toString(report.status) +
                  (report.message.empty() ? "" : " (" + report.message + ")"));
    }
    return handled;
}

void Server::handleDocument(const JobId& id) {
    auto request = scanner_->load(id);
    if (!request) {
        (void)scanner_->reject(id, "Unreadable document");
        return;
    }

    // Subscribe before the run starts so no event is missed
    SubscriptionPtr subscription;
    if (follow_) {
        subscription = jobs_->subscribe(id);
    }

    SubmitResult result = jobs_->submit(*request);
    if (!result.ok) {
        if (subscription) {
            jobs_->unsubscribe(id, subscription);
        }
        LOG_WARN("Rejected document " + id + ": " + result.message);
        if (result.error == SubmissionError::ShuttingDown) {
            return;  // leave it for the next daemon
        }
        if (!scanner_->reject(id, result.message)) {
            LOG_ERROR("Failed to move rejected document: " + id);
        }
        return;
    }

    if (!scanner_->consume(id)) {
        LOG_WARN("Submitted document left in inbox: " + id);
    }

    LOG_INFO("Queued " + id + " (" + request->mode + ", " + std::to_string(request->text.size()) + " bytes)");

    if (subscription) {
        try {
            std::lock_guard<std::mutex> lock(watchersMutex_);
            watchers_.push_back({subscription, std::thread(&Server::watch, this, id, subscription)});
        } catch (const std::exception& e) {
            jobs_->unsubscribe(id, subscription);
            LOG_ERROR("Failed to start watcher for " + id + ": " + std::string(e.what()));
        }
    }
}

void Server::handleControl(const JobId& id, const std::string& action) {
    ControlResult result = action == "retry" ? jobs_->retry(id) : jobs_->stop(id);
    if (result.ok) {
        LOG_INFO("Control " + action + " for " + id + ": " + result.message);
    } else {
        LOG_WARN("Control " + action + " for " + id + " refused: " + result.message);
    }
}

void Server::watch(JobId id, SubscriptionPtr subscription) {
    setThreadName("Watch-" + id.substr(id.size() > 8 ? id.size() - 8 : 0));

    while (true) {
        auto event = subscription->next(std::chrono::seconds(1));
        if (!event) {
            if (subscription->closed()) {
                break;
            }
            continue;  // keep-alive tick
        }
        {
            std::lock_guard<std::mutex> lock(g_output_mutex);
            std::cout << "    \033[90m" << timestamp() << "\033[0m  " << id << "  "
                      << colorFor(event->type) << describe(*event) << "\033[0m\n" << std::flush;
        }
        if (event->type == EventType::Completed || event->type == EventType::Failed ||
            event->type == EventType::Stopped) {
            break;
        }
    }

    // jobs_ outlives every watcher: shutdown() joins them before the reset
    jobs_->unsubscribe(id, subscription);
    clearThreadName();

    std::lock_guard<std::mutex> lock(watchersMutex_);
    for (auto& watcher : watchers_) {
        if (watcher.subscription == subscription) {
            watcher.finished = true;
        }
    }
}

void Server::reapWatchers() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(watchersMutex_);
        for (auto it = watchers_.begin(); it != watchers_.end();) {
            if (it->finished) {
                done.push_back(std::move(it->thread));
                it = watchers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& thread : done) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

std::size_t Server::watcherCount() const {
    std::lock_guard<std::mutex> lock(watchersMutex_);
    return watchers_.size();
}

void Server::joinWatchers() noexcept {
    std::vector<Watcher> watchers;
    {
        std::lock_guard<std::mutex> lock(watchersMutex_);
        watchers.swap(watchers_);
    }
    for (auto& watcher : watchers) {
        watcher.subscription->close();
        if (watcher.thread.joinable()) {
            watcher.thread.join();
        }
    }
}

void Server::scanLoop() {
    setThreadName("Scanner");
    LOG_DEBUG("Scanner loop started");

    while (!shutdown_.load()) {
        try {
            std::size_t handled = scanOnce();
            if (handled > 0) {
                LOG_DEBUG("Handled " + std::to_string(handled) + " inbox entries");
            }

            auto sleepEnd = std::chrono::steady_clock::now() + scanInterval_;
            while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }

        } catch (const std::exception& e) {
            LOG_ERROR("Scanner loop error: " + std::string(e.what()));
            std::this_thread::sleep_for(scanInterval_);
        } catch (...) {
            LOG_ERROR("Unknown scanner loop error");
            std::this_thread::sleep_for(scanInterval_);
        }
    }

    LOG_DEBUG("Scanner loop stopped");
}

}
