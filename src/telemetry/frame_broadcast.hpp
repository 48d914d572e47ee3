#pragma once
#include "telemetry/telemetry_types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// One subscriber's view of the fan-out channel. Each subscriber has its own
// bounded queue; when it is full the oldest event is dropped, so a slow
// subscriber never stalls the publisher or the other subscribers.
class FrameSubscription {
public:
    explicit FrameSubscription(size_t capacity);

    // Blocks up to `timeout` for the next event.
    std::optional<TelemetryEvent> recv(std::chrono::milliseconds timeout);
    std::optional<TelemetryEvent> try_recv();

    size_t pending() const;
    uint64_t dropped() const { return dropped_.load(); }
    bool closed() const;

private:
    friend class FrameBroadcast;

    // Returns false if an older event had to be dropped.
    bool push(const TelemetryEvent& event);
    void close();

    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TelemetryEvent> queue_;
    std::atomic<uint64_t> dropped_;
    bool closed_;
};

class FrameBroadcast {
public:
    explicit FrameBroadcast(size_t capacity);
    ~FrameBroadcast();

    std::shared_ptr<FrameSubscription> subscribe();

    // Copies the event into every live subscriber queue and returns how many
    // received it. Never blocks on a subscriber.
    size_t publish(const TelemetryEvent& event);

    // Wakes blocked receivers; later recv() calls drain what is left and
    // then return empty immediately.
    void close();

    size_t subscriber_count() const;
    uint64_t total_dropped() const;
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<FrameSubscription>> subscribers_;
    bool closed_;
};
