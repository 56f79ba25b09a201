/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "redraft/broadcaster.hpp"
#include "redraft/config.hpp"
#include "redraft/model.hpp"

namespace redraft {

class FileStore;
class Jobs;
class Scanner;

// Daemon loop: feeds inbox documents and control requests into Jobs, with
// job state kept in a FileStore under the same workspace.
class Server final {
public:
    Server(const std::filesystem::path& workspace, LanguageModel& model, const Settings& settings);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;

    // Print every event of newly submitted jobs to stdout.
    void setFollow(bool follow) noexcept { follow_ = follow; }
    void setScanInterval(std::chrono::milliseconds interval) noexcept { scanInterval_ = interval; }

    // One pass over the inbox. Returns the number of documents and control
    // requests handled.
    std::size_t scanOnce();

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] Jobs* jobs() noexcept { return jobs_.get(); }

    // Console watchers not yet reaped; finished ones go on the next scan.
    [[nodiscard]] std::size_t watcherCount() const;

private:
    [[nodiscard]] bool createWorkspace() noexcept;
    void scanLoop();
    void handleDocument(const JobId& id);
    void handleControl(const JobId& id, const std::string& action);
    void watch(JobId id, SubscriptionPtr subscription);
    void reapWatchers();
    void joinWatchers() noexcept;

    std::filesystem::path workspace_;
    LanguageModel& model_;
    Settings settings_;
    bool follow_ = false;
    std::chrono::milliseconds scanInterval_{1000};

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    std::unique_ptr<FileStore> store_;
    std::unique_ptr<Jobs> jobs_;
    std::unique_ptr<Scanner> scanner_;

    std::thread scannerThread_;
    struct Watcher {
        SubscriptionPtr subscription;
        std::thread thread;
        bool finished = false;
    };

    mutable std::mutex watchersMutex_;
    std::vector<Watcher> watchers_;
};

}
