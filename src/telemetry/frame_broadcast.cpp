#include "telemetry/frame_broadcast.hpp"
#include <algorithm>

FrameSubscription::FrameSubscription(size_t capacity)
    : capacity_(capacity), dropped_(0), closed_(false) {}

std::optional<TelemetryEvent> FrameSubscription::recv(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return {};
    }
    TelemetryEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<TelemetryEvent> FrameSubscription::try_recv() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return {};
    }
    TelemetryEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

size_t FrameSubscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool FrameSubscription::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool FrameSubscription::push(const TelemetryEvent& event) {
    bool kept_all = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped_++;
            kept_all = false;
        }
        queue_.push_back(event);
    }
    cv_.notify_one();
    return kept_all;
}

void FrameSubscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

FrameBroadcast::FrameBroadcast(size_t capacity) : capacity_(capacity), closed_(false) {}

FrameBroadcast::~FrameBroadcast() {
    close();
}

std::shared_ptr<FrameSubscription> FrameBroadcast::subscribe() {
    auto sub = std::make_shared<FrameSubscription>(capacity_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        sub->close();
    } else {
        subscribers_.push_back(sub);
    }
    return sub;
}

size_t FrameBroadcast::publish(const TelemetryEvent& event) {
    // Subscriber queues are filled outside the channel mutex.
    std::vector<std::shared_ptr<FrameSubscription>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return 0;
        subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                          [](const std::weak_ptr<FrameSubscription>& w) { return w.expired(); }),
                           subscribers_.end());
        live.reserve(subscribers_.size());
        for (const auto& weak : subscribers_) {
            if (auto sub = weak.lock()) {
                live.push_back(std::move(sub));
            }
        }
    }

    for (const auto& sub : live) {
        sub->push(event);
    }
    return live.size();
}

void FrameBroadcast::close() {
    std::vector<std::weak_ptr<FrameSubscription>> subs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        subs.swap(subscribers_);
    }
    for (const auto& weak : subs) {
        if (auto sub = weak.lock()) {
            sub->close();
        }
    }
}

size_t FrameBroadcast::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
                                             [](const std::weak_ptr<FrameSubscription>& w) { return !w.expired(); }));
}

uint64_t FrameBroadcast::total_dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = 0;
    for (const auto& weak : subscribers_) {
        if (auto sub = weak.lock()) {
            total += sub->dropped();
        }
    }
    return total;
}
