/*
 * redraft - Segmented Rewrite Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "redraft/broadcaster.hpp"
#include "redraft/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace redraft {

const char* toString(EventType type) noexcept {
    switch (type) {
        case EventType::StageStarted: return "stage_started";
        case EventType::Progress: return "progress";
        case EventType::Content: return "content";
        case EventType::HistoryCompressed: return "history_compressed";
        case EventType::Completed: return "completed";
        case EventType::Failed: return "failed";
        case EventType::Stopped: return "stopped";
        default: return "unknown";
    }
}

std::string describe(const Event& event) {
    std::ostringstream oss;
    oss << toString(event.type);
    if (event.stage) {
        oss << " stage=" << toString(*event.stage);
    }
    if (event.segmentIndex) {
        oss << " segment=" << *event.segmentIndex;
    }
    switch (event.type) {
        case EventType::Progress:
            oss << " progress=" << std::fixed << std::setprecision(1) << event.progress << "%";
            break;
        case EventType::Content:
            oss << " chars=" << event.content.size();
            break;
        case EventType::HistoryCompressed:
            oss << " size=" << event.measuredSize;
            break;
        default:
            break;
    }
    if (!event.message.empty()) {
        oss << " - " << event.message;
    }
    return oss.str();
}

bool Subscription::push(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || queue_.size() >= capacity_) {
            return false;
        }
        queue_.push_back(event);
    }
    available_.notify_one();
    return true;
}

std::optional<Event> Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!available_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
        return std::nullopt;
    }
    if (queue_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    available_.notify_all();
}

bool Subscription::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t Subscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

EventBroadcaster::EventBroadcaster(std::size_t queueCapacity) noexcept
    : queueCapacity_(std::max<std::size_t>(1, queueCapacity)) {
}

SubscriptionPtr EventBroadcaster::subscribe(const JobId& jobId) {
    auto subscription = std::make_shared<Subscription>(queueCapacity_);
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_[jobId].push_back(subscription);
    LOG_DEBUG("Subscriber attached to " + jobId + " (" + std::to_string(subscribers_[jobId].size()) + " total)");
    return subscription;
}

void EventBroadcaster::unsubscribe(const JobId& jobId, const SubscriptionPtr& subscription) {
    if (!subscription) {
        return;
    }
    subscription->close();
    std::lock_guard<std::mutex> lock(mutex_);
    dropLocked(jobId, subscription);
}

void EventBroadcaster::publish(const JobId& jobId, const Event& event) {
    std::vector<SubscriptionPtr> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(jobId);
        if (it != subscribers_.end()) {
            targets = it->second;
        }
    }

    if (targets.empty()) {
        if (event.type != EventType::Content) {
            LOG_TRACE("No subscribers for " + jobId + ", dropping " + toString(event.type));
        }
        return;
    }

    std::vector<SubscriptionPtr> failed;
    for (const auto& subscription : targets) {
        if (!subscription->push(event)) {
            failed.push_back(subscription);
        }
    }

    if (!failed.empty()) {
        LOG_WARN("Dropping " + std::to_string(failed.size()) + " slow or closed subscriber(s) of " + jobId);
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& subscription : failed) {
            subscription->close();
            dropLocked(jobId, subscription);
        }
    }
}

std::size_t EventBroadcaster::subscriberCount(const JobId& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(jobId);
    return it == subscribers_.end() ? 0 : it->second.size();
}

void EventBroadcaster::dropLocked(const JobId& jobId, const SubscriptionPtr& subscription) {
    auto it = subscribers_.find(jobId);
    if (it == subscribers_.end()) {
        return;
    }
    auto& list = it->second;
    list.erase(std::remove(list.begin(), list.end(), subscription), list.end());
    if (list.empty()) {
        subscribers_.erase(it);
    }
}

}
