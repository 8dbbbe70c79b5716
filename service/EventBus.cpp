#include "EventBus.hpp"

#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(sdEvents, "sftpdesk.events")

namespace sftpdesk {

const char* eventKindName(EventKind k) {
    switch (k) {
    case EventKind::SessionStateChanged:
        return "SessionStateChanged";
    case EventKind::TransferProgress:
        return "TransferProgress";
    case EventKind::TransferStateChanged:
        return "TransferStateChanged";
    case EventKind::TransferCompleted:
        return "TransferCompleted";
    case EventKind::TransferFailed:
        return "TransferFailed";
    case EventKind::DirectoryInvalidated:
        return "DirectoryInvalidated";
    case EventKind::OverwriteDecisionRequested:
        return "OverwriteDecisionRequested";
    }
    return "Unknown";
}

std::uint64_t EventBus::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::uint64_t id = nextId_++;
    listeners_.emplace_back(id, std::make_shared<Listener>(std::move(listener)));
    return id;
}

void EventBus::unsubscribe(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(mu_);
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const auto& p) { return p.first == id; }),
                     listeners_.end());
}

void EventBus::publish(const Event& e) {
    std::vector<std::shared_ptr<Listener>> targets;
    {
        std::lock_guard<std::mutex> lk(mu_);
        targets.reserve(listeners_.size());
        for (const auto& p : listeners_)
            targets.push_back(p.second);
    }
    for (const auto& l : targets)
        (*l)(e);
}

std::size_t EventBus::listenerCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return listeners_.size();
}

EventQueue::EventQueue(EventBus& bus, std::size_t capacity)
    : bus_(bus), inbox_(std::make_shared<Inbox>()) {
    inbox_->capacity = std::max<std::size_t>(capacity, 1);
    std::weak_ptr<Inbox> weak = inbox_;
    subscription_ = bus_.subscribe([weak](const Event& e) {
        auto inbox = weak.lock();
        if (!inbox)
            return;
        bool firstDrop = false;
        {
            std::lock_guard<std::mutex> lk(inbox->mu);
            if (inbox->events.size() >= inbox->capacity) {
                inbox->events.pop_front();
                firstDrop = inbox->dropped++ == 0;
            }
            inbox->events.push_back(e);
        }
        if (firstDrop)
            qCWarning(sdEvents) << "event queue full, dropping oldest events"
                                << "capacity=" << inbox->capacity;
        inbox->cv.notify_all();
    });
}

EventQueue::~EventQueue() {
    bus_.unsubscribe(subscription_);
}

std::optional<Event> EventQueue::poll() {
    std::lock_guard<std::mutex> lk(inbox_->mu);
    if (inbox_->events.empty())
        return std::nullopt;
    Event e = std::move(inbox_->events.front());
    inbox_->events.pop_front();
    return e;
}

bool EventQueue::waitNext(Event& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(inbox_->mu);
    if (!inbox_->cv.wait_for(lk, timeout, [this] { return !inbox_->events.empty(); }))
        return false;
    out = std::move(inbox_->events.front());
    inbox_->events.pop_front();
    return true;
}

std::vector<Event> EventQueue::drain() {
    std::lock_guard<std::mutex> lk(inbox_->mu);
    std::vector<Event> out(std::make_move_iterator(inbox_->events.begin()),
                           std::make_move_iterator(inbox_->events.end()));
    inbox_->events.clear();
    return out;
}

std::size_t EventQueue::dropped() const {
    std::lock_guard<std::mutex> lk(inbox_->mu);
    return inbox_->dropped;
}

} // namespace sftpdesk
