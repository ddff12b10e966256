#include "rewind/core/notifier.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rewindkit::core {

SubscriptionId EventNotifier::subscribe(Listener listener) {
    std::lock_guard lock(mutex_);
    SubscriptionId id = next_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool EventNotifier::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
        [id](const auto& entry) { return entry.first == id; });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

size_t EventNotifier::subscriber_count() const {
    std::lock_guard lock(mutex_);
    return listeners_.size();
}

void EventNotifier::post(Event event) {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(event));
}

void EventNotifier::flush() {
    {
        std::lock_guard lock(mutex_);
        if (draining_) {
            return;
        }
        draining_ = true;
    }

    // Clears the drain flag if a listener throws something that is not a
    // std::exception. The normal exit clears it under the same lock that saw
    // the queue empty, so a concurrent post() is never left undelivered.
    struct DrainGuard {
        EventNotifier& self;
        bool active = true;
        ~DrainGuard() {
            if (active) {
                std::lock_guard lock(self.mutex_);
                self.draining_ = false;
            }
        }
    } guard{*this};

    while (true) {
        Event event;
        std::vector<std::pair<SubscriptionId, Listener>> targets;
        {
            std::lock_guard lock(mutex_);
            if (queue_.empty()) {
                draining_ = false;
                guard.active = false;
                return;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
            targets = listeners_;
        }
        deliver(event, targets);
    }
}

void EventNotifier::deliver(const Event& event,
                            const std::vector<std::pair<SubscriptionId, Listener>>& targets) {
    for (const auto& [id, listener] : targets) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::error("Listener {} failed on {} ({}): {}",
                          id, event_kind_to_string(event.kind), event.snapshot_id, e.what());
        } catch (...) {
            spdlog::error("Listener {} failed on {} ({}) with a non-standard exception",
                          id, event_kind_to_string(event.kind), event.snapshot_id);
        }
    }
}

}  // namespace rewindkit::core
