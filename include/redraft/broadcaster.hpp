/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "redraft/types.hpp"

namespace redraft {

enum class EventType : std::uint8_t {
    StageStarted,
    Progress,
    Content,
    HistoryCompressed,
    Completed,
    Failed,
    Stopped
};

[[nodiscard]] const char* toString(EventType type) noexcept;

struct Event {
    EventType type = EventType::Progress;
    JobId jobId;
    std::optional<Stage> stage;
    std::optional<std::size_t> segmentIndex;
    double progress = 0.0;
    std::string content;
    std::string message;
    std::size_t measuredSize = 0;
};

// One-line human-readable rendering, used by console watchers and logs.
[[nodiscard]] std::string describe(const Event& event);

// A subscriber's private, bounded mailbox.
class Subscription {
public:
    explicit Subscription(std::size_t capacity) noexcept : capacity_(capacity) {}

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Never blocks. False when the queue is full or the subscription is closed.
    [[nodiscard]] bool push(const Event& event);

    // Waits up to timeout. An empty result means "nothing yet" (keep-alive tick)
    // or, once closed() is true, that no more events will arrive.
    [[nodiscard]] std::optional<Event> next(std::chrono::milliseconds timeout);

    void close();
    [[nodiscard]] bool closed() const;
    [[nodiscard]] std::size_t pending() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<Event> queue_;
    bool closed_ = false;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

class EventBroadcaster {
public:
    explicit EventBroadcaster(std::size_t queueCapacity = 256) noexcept;

    EventBroadcaster(const EventBroadcaster&) = delete;
    EventBroadcaster& operator=(const EventBroadcaster&) = delete;

    [[nodiscard]] SubscriptionPtr subscribe(const JobId& jobId);
    void unsubscribe(const JobId& jobId, const SubscriptionPtr& subscription);
    void publish(const JobId& jobId, const Event& event);

    [[nodiscard]] std::size_t subscriberCount(const JobId& jobId) const;

private:
    void dropLocked(const JobId& jobId, const SubscriptionPtr& subscription);

    std::size_t queueCapacity_;
    mutable std::mutex mutex_;
    std::unordered_map<JobId, std::vector<SubscriptionPtr>> subscribers_;
};

}
