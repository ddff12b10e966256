#pragma once

#include "types.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <string_view>
#include <utility>
#include <vector>

namespace rewindkit::core {

// Events the core reports to its host
enum class EventKind {
    StateReplaced,    // A rollback rewrote the current state
    SnapshotCreated,
    SnapshotEvicted   // Dropped by the retention limit
};

inline std::string_view event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::StateReplaced: return "state_replaced";
        case EventKind::SnapshotCreated: return "snapshot_created";
        case EventKind::SnapshotEvicted: return "snapshot_evicted";
    }
    return "unknown";
}

struct Event {
    EventKind kind;
    SnapshotId snapshot_id;
    Json state;  // New current state for StateReplaced, null otherwise

    static Event state_replaced(SnapshotId id, Json state) {
        return Event{EventKind::StateReplaced, std::move(id), std::move(state)};
    }

    static Event snapshot_created(SnapshotId id) {
        return Event{EventKind::SnapshotCreated, std::move(id), nullptr};
    }

    static Event snapshot_evicted(SnapshotId id) {
        return Event{EventKind::SnapshotEvicted, std::move(id), nullptr};
    }
};

using Listener = std::function<void(const Event&)>;

// Fan-out of core events to registered listeners.
//
// Events are queued by post() and delivered by flush(), in posting order,
// to every listener in registration order. Only one thread delivers at a
// time; a post() made while another flush() is running (including from
// inside a listener) is picked up by that running flush. A listener that
// throws is logged and skipped, the remaining listeners still run.
class EventNotifier {
public:
    EventNotifier() = default;

    EventNotifier(const EventNotifier&) = delete;
    EventNotifier& operator=(const EventNotifier&) = delete;

    SubscriptionId subscribe(Listener listener);
    bool unsubscribe(SubscriptionId id);
    size_t subscriber_count() const;

    // Queue an event without delivering it
    void post(Event event);

    // Deliver queued events
    void flush();

    void emit(Event event) {
        post(std::move(event));
        flush();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<SubscriptionId, Listener>> listeners_;
    std::deque<Event> queue_;
    bool draining_ = false;
    SubscriptionId next_id_ = 1;

    void deliver(const Event& event,
                 const std::vector<std::pair<SubscriptionId, Listener>>& targets);
};

}  // namespace rewindkit::core
