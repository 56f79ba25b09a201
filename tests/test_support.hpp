/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "redraft/broadcaster.hpp"
#include "redraft/model.hpp"

namespace redraft::test {

// Scripted chat backend. By default echoes "R:" + the text it was asked to rewrite.
class FakeModel final : public LanguageModel {
public:
    using Handler = std::function<RunResult(const ChatRequest&)>;

    RunResult complete(const ChatRequest& request) noexcept override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(request);
            handler = handler_;
        }
        if (handler) {
            return handler(request);
        }
        if (isCompression(request)) {
            return RunResult::success("style summary");
        }
        return RunResult::success("R:" + inputOf(request));
    }

    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    [[nodiscard]] std::vector<ChatRequest> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    [[nodiscard]] std::size_t callCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    [[nodiscard]] std::vector<ChatRequest> rewriteCalls() const {
        std::vector<ChatRequest> rewrites;
        for (const auto& call : calls()) {
            if (!isCompression(call)) rewrites.push_back(call);
        }
        return rewrites;
    }

    // Segment text carried by a rewrite request.
    [[nodiscard]] static std::string inputOf(const ChatRequest& request) {
        const std::string& content = request.messages.back().content;
        return content.rfind("\n\n", 0) == 0 ? content.substr(2) : content;
    }

    [[nodiscard]] static bool isCompression(const ChatRequest& request) {
        return !request.messages.empty() &&
               request.messages.back().content.rfind("Compress the following", 0) == 0;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ChatRequest> calls_;
    Handler handler_;
};

// Blocks every rewrite until open() is called. Lets tests observe a job mid-run.
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        ++waiting_;
        cv_.notify_all();
        cv_.wait(lock, [&] { return open_; });
    }

    // True once some thread is blocked in wait().
    bool waitForWaiter(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return waiting_ > 0; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
    int waiting_ = 0;
};

// Reads events until a terminal one (or timeout) and returns everything seen.
inline std::vector<Event> collectUntilTerminal(Subscription& subscription,
                                               std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    std::vector<Event> events;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto event = subscription.next(std::chrono::milliseconds(50));
        if (!event) {
            if (subscription.closed()) break;
            continue;
        }
        events.push_back(*event);
        if (event->type == EventType::Completed || event->type == EventType::Failed ||
            event->type == EventType::Stopped) {
            break;
        }
    }
    return events;
}

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("redraft_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}
