// In-process publish/subscribe channel between the service components and
// whatever front end drives them.
#pragma once
#include "ServiceTypes.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace sftpdesk {

enum class EventKind {
    SessionStateChanged,
    TransferProgress,
    TransferStateChanged,  // paused / resumed / requeued
    TransferCompleted,
    TransferFailed,        // also emitted for cancellation (error.code Cancelled)
    DirectoryInvalidated,
    OverwriteDecisionRequested
};

const char* eventKindName(EventKind k);

struct Event {
    EventKind kind = EventKind::SessionStateChanged;
    std::uint64_t session_id = 0;
    SessionState session_state = SessionState::Disconnected;
    std::uint64_t job_id = 0;
    JobState job_state = JobState::Queued;
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;
    std::uint64_t delta = 0;   // bytes confirmed since the previous progress event
    std::string path;          // invalidated directory / conflicting destination
    Error error;
    std::string message;
};

// Listeners run synchronously on the publishing thread, outside the bus
// lock, so they may call back into the bus. Events of one job are published
// by one worker at a time and therefore arrive in order. A listener may run
// once more after unsubscribe() if a publish was already in flight.
class EventBus {
public:
    using Listener = std::function<void(const Event&)>;

    std::uint64_t subscribe(Listener listener);
    void unsubscribe(std::uint64_t id);
    void publish(const Event& e);

    std::size_t listenerCount() const;

private:
    mutable std::mutex mu_;
    std::vector<std::pair<std::uint64_t, std::shared_ptr<Listener>>> listeners_;
    std::uint64_t nextId_ = 1;
};

// Polling subscriber for front ends without their own event loop. Holds at
// most `capacity` events; when full the oldest event is dropped and counted.
class EventQueue {
public:
    static constexpr std::size_t kDefaultCapacity = 4096;

    explicit EventQueue(EventBus& bus, std::size_t capacity = kDefaultCapacity);
    ~EventQueue();

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    std::optional<Event> poll();
    bool waitNext(Event& out, std::chrono::milliseconds timeout);
    std::vector<Event> drain();

    // Events discarded because the queue was full.
    std::size_t dropped() const;

private:
    struct Inbox {
        std::mutex mu;
        std::condition_variable cv;
        std::deque<Event> events;
        std::size_t capacity = kDefaultCapacity;
        std::size_t dropped = 0;
    };

    EventBus& bus_;
    std::shared_ptr<Inbox> inbox_;
    std::uint64_t subscription_ = 0;
};

} // namespace sftpdesk
