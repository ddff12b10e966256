#include <catch2/catch_test_macros.hpp>
#include "rewind/rollback/snapshot_manager.hpp"
#include "rewind/storage/memory_medium.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>

using namespace rewindkit::core;
using namespace rewindkit::rollback;
using rewindkit::storage::MemoryMedium;
using rewindkit::storage::StateStore;
using rewindkit::testing::FakeClock;
using rewindkit::testing::FaultyMedium;
using namespace std::chrono_literals;

namespace {

struct Fixture {
    MemoryMedium inner;
    FaultyMedium medium{inner};
    StateStore state{medium, "test.state"};
    StateStore snapshot_store{medium, "test.snapshots"};
    EventNotifier notifier;
    ManualScheduler scheduler;
    FakeClock clock;
    std::vector<Event> events;

    Fixture() {
        REQUIRE(state.open().is_ok());
        REQUIRE(snapshot_store.open().is_ok());
        notifier.subscribe([this](const Event& e) { events.push_back(e); });
    }

    std::unique_ptr<SnapshotManager> make(int max_snapshots = 10, int deadline_ms = 300000) {
        SnapshotConfig config;
        config.max_snapshots = max_snapshots;
        config.auto_rollback_deadline_ms = deadline_ms;
        return std::make_unique<SnapshotManager>(state, snapshot_store, notifier, scheduler,
                                                 config, clock.fn());
    }

    SnapshotId snapshot(SnapshotManager& manager, const std::string& description) {
        clock.advance(1ms);
        auto created = manager.create_snapshot(description);
        REQUIRE(created.is_ok());
        REQUIRE(created.value().has_value());
        return *created.value();
    }

    size_t count(EventKind kind) const {
        return static_cast<size_t>(std::count_if(events.begin(), events.end(),
            [kind](const Event& e) { return e.kind == kind; }));
    }
};

std::vector<std::string> descriptions(const SnapshotManager& manager) {
    std::vector<std::string> out;
    for (const auto& info : manager.list_snapshots()) {
        out.push_back(info.description);
    }
    return out;
}

}  // namespace

TEST_CASE("Snapshot without current state is skipped", "[snapshots]") {
    Fixture f;
    auto manager = f.make();

    auto created = manager->create_snapshot("nothing yet");
    REQUIRE(created.is_ok());
    REQUIRE_FALSE(created.value().has_value());
    REQUIRE(manager->list_snapshots().empty());
    REQUIRE(f.events.empty());
}

TEST_CASE("Retention keeps the newest snapshots", "[snapshots]") {
    Fixture f;
    auto manager = f.make(3);
    REQUIRE(f.state.save(Json{{"v", 0}}).is_ok());

    auto a = f.snapshot(*manager, "a");
    f.snapshot(*manager, "b");
    f.snapshot(*manager, "c");
    f.events.clear();

    auto d = f.snapshot(*manager, "d");

    REQUIRE(descriptions(*manager) == std::vector<std::string>{"b", "c", "d"});
    REQUIRE(manager->size() <= manager->max_snapshots());
    REQUIRE_FALSE(manager->get_snapshot(a).has_value());

    REQUIRE(f.events.size() == 2);
    REQUIRE(f.events[0].kind == EventKind::SnapshotEvicted);
    REQUIRE(f.events[0].snapshot_id == a);
    REQUIRE(f.events[1].kind == EventKind::SnapshotCreated);
    REQUIRE(f.events[1].snapshot_id == d);
}

TEST_CASE("Snapshots are deep copies and rollback restores them", "[snapshots]") {
    Fixture f;
    auto manager = f.make();

    Json before{{"settings", {{"theme", "dark"}}}, {"items", {1, 2}}};
    REQUIRE(f.state.save(before).is_ok());
    auto id = f.snapshot(*manager, "before edit");

    REQUIRE(f.state.save(Json{{"settings", {{"theme", "light"}}}}).is_ok());
    REQUIRE(manager->get_snapshot(id)->state == before);

    f.events.clear();
    REQUIRE(manager->rollback(id).is_ok());
    REQUIRE(f.state.load().value() == before);

    REQUIRE(f.events.size() == 1);
    REQUIRE(f.events[0].kind == EventKind::StateReplaced);
    REQUIRE(f.events[0].state == before);

    // Rollback does not consume the snapshot
    REQUIRE(manager->get_snapshot(id).has_value());
    REQUIRE(manager->size() == 1);
}

TEST_CASE("Rollback to an unknown snapshot", "[snapshots]") {
    Fixture f;
    auto manager = f.make();
    REQUIRE(f.state.save(Json{{"v", 1}}).is_ok());

    auto result = manager->rollback("snap-missing");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::SnapshotNotFound);
    REQUIRE(f.state.load().value() == Json{{"v", 1}});
}

TEST_CASE("Rollback write failure leaves the state untouched", "[snapshots]") {
    Fixture f;
    auto manager = f.make();
    REQUIRE(f.state.save(Json{{"v", 1}}).is_ok());
    auto id = f.snapshot(*manager, "v1");
    REQUIRE(f.state.save(Json{{"v", 2}}).is_ok());
    f.events.clear();

    f.medium.fail_next_sets(1, ErrorCode::QuotaExceeded, "test.state");
    auto result = manager->rollback(id);

    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::RollbackWriteFailed);
    REQUIRE(result.error().context == id);
    REQUIRE(f.state.load().value() == Json{{"v", 2}});
    REQUIRE(f.events.empty());
}

TEST_CASE("Failed snapshot persistence restores the list", "[snapshots]") {
    Fixture f;
    auto manager = f.make(2);
    REQUIRE(f.state.save(Json{{"v", 1}}).is_ok());
    auto a = f.snapshot(*manager, "a");
    auto b = f.snapshot(*manager, "b");
    f.events.clear();

    f.medium.fail_next_sets(1, ErrorCode::QuotaExceeded, "test.snapshots");
    auto result = manager->create_snapshot("c");

    REQUIRE(result.is_err());
    REQUIRE(result.error().is_quota_exceeded());
    REQUIRE(descriptions(*manager) == std::vector<std::string>{"a", "b"});
    REQUIRE(manager->get_snapshot(a).has_value());
    REQUIRE(manager->get_snapshot(b).has_value());
    REQUIRE(f.events.empty());
}

TEST_CASE("Snapshot list survives a new manager", "[snapshots]") {
    Fixture f;
    REQUIRE(f.state.save(Json{{"v", 1}}).is_ok());
    SnapshotId id;
    {
        auto manager = f.make();
        id = f.snapshot(*manager, "kept");
    }

    auto reopened = f.make();
    REQUIRE(reopened->size() == 1);
    auto snapshot = reopened->get_snapshot(id);
    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->description == "kept");
    REQUIRE(snapshot->timestamp == f.clock.now());
    REQUIRE(snapshot->state == Json{{"v", 1}});
}

TEST_CASE("Corrupt snapshot list loads as empty", "[snapshots]") {
    Fixture f;
    REQUIRE(f.inner.set("test.snapshots", "{\"format\":1,\"data\":{\"snapshots\":[{\"timestamp\":\"x\"}]}}").is_ok());

    auto manager = f.make();
    REQUIRE(manager->size() == 0);
}

TEST_CASE("Delete, latest and clear", "[snapshots]") {
    Fixture f;
    auto manager = f.make();
    REQUIRE_FALSE(manager->latest().has_value());

    REQUIRE(f.state.save(Json{{"v", 1}}).is_ok());
    auto a = f.snapshot(*manager, "a");
    auto b = f.snapshot(*manager, "b");
    REQUIRE(manager->latest()->id == b);

    REQUIRE(manager->delete_snapshot(a));
    REQUIRE_FALSE(manager->delete_snapshot(a));
    REQUIRE(descriptions(*manager) == std::vector<std::string>{"b"});
    REQUIRE(f.make()->size() == 1);

    REQUIRE(manager->clear_snapshots().is_ok());
    REQUIRE(manager->size() == 0);
    REQUIRE(f.make()->size() == 0);
}

TEST_CASE("Auto-rollback fires after the deadline", "[snapshots][watchdog]") {
    Fixture f;
    auto manager = f.make();
    Json pre{{"phase", "before"}};
    REQUIRE(f.state.save(pre).is_ok());

    auto guard = manager->prepare_auto_rollback("risky-op", 100ms);
    REQUIRE(guard.is_active());
    REQUIRE(manager->latest()->description == "Auto-snapshot before: risky-op");

    REQUIRE(f.state.save(Json{{"phase", "after"}}).is_ok());
    f.scheduler.advance(150ms);

    REQUIRE(guard.state() == GuardState::Fired);
    REQUIRE(f.state.load().value() == pre);
    REQUIRE(f.count(EventKind::StateReplaced) == 1);
}

TEST_CASE("Disarm before the deadline keeps the new state", "[snapshots][watchdog]") {
    Fixture f;
    auto manager = f.make();
    REQUIRE(f.state.save(Json{{"phase", "before"}}).is_ok());

    auto guard = manager->prepare_auto_rollback("risky-op", 100ms);
    REQUIRE(f.state.save(Json{{"phase", "after"}}).is_ok());

    f.scheduler.advance(50ms);
    REQUIRE(guard.disarm());
    f.scheduler.advance(100ms);

    REQUIRE(guard.state() == GuardState::Disarmed);
    REQUIRE(f.state.load().value() == Json{{"phase", "after"}});
    REQUIRE(f.scheduler.pending() == 0);
    REQUIRE(f.count(EventKind::StateReplaced) == 0);
}

TEST_CASE("Disarm is idempotent", "[snapshots][watchdog]") {
    Fixture f;
    auto manager = f.make();
    REQUIRE(f.state.save(Json{{"v", 1}}).is_ok());

    SECTION("twice before firing") {
        auto guard = manager->prepare_auto_rollback("op", 100ms);
        REQUIRE(guard.disarm());
        REQUIRE_FALSE(guard.disarm());
        REQUIRE(guard.state() == GuardState::Disarmed);
    }

    SECTION("after firing") {
        auto guard = manager->prepare_auto_rollback("op", 100ms);
        f.scheduler.advance(100ms);
        REQUIRE(guard.state() == GuardState::Fired);
        REQUIRE_FALSE(guard.disarm());
        REQUIRE_FALSE(guard.disarm());
        REQUIRE(guard.state() == GuardState::Fired);

        f.scheduler.advance(1000ms);
        REQUIRE(f.count(EventKind::StateReplaced) == 1);
    }
}

TEST_CASE("No current state gives an inactive guard", "[snapshots][watchdog]") {
    Fixture f;
    auto manager = f.make();

    auto guard = manager->prepare_auto_rollback("op", 100ms);
    REQUIRE(guard.state() == GuardState::Inactive);
    REQUIRE_FALSE(guard.snapshot_id().has_value());
    REQUIRE_FALSE(guard.disarm());
    REQUIRE(f.scheduler.pending() == 0);
    REQUIRE(manager->size() == 0);
}

TEST_CASE("Configured deadline applies by default", "[snapshots][watchdog]") {
    Fixture f;
    auto manager = f.make(10, 1000);
    REQUIRE(f.state.save(Json{{"v", 1}}).is_ok());

    auto guard = manager->prepare_auto_rollback("op");
    f.scheduler.advance(999ms);
    REQUIRE(guard.state() == GuardState::Armed);
    f.scheduler.advance(1ms);
    REQUIRE(guard.state() == GuardState::Fired);
}

TEST_CASE("Destroying the manager cancels armed watchdogs", "[snapshots][watchdog]") {
    Fixture f;
    auto manager = f.make();
    REQUIRE(f.state.save(Json{{"v", 1}}).is_ok());

    auto guard = manager->prepare_auto_rollback("op", 100ms);
    REQUIRE(manager->armed_watchdogs() == 1);
    manager.reset();

    REQUIRE(f.scheduler.pending() == 0);
    REQUIRE(guard.state() == GuardState::Disarmed);
    REQUIRE_FALSE(guard.disarm());
    REQUIRE(f.scheduler.advance(200ms) == 0);
}

TEST_CASE("Listeners may call back into the manager", "[snapshots]") {
    Fixture f;
    auto manager = f.make(2);
    REQUIRE(f.state.save(Json{{"v", 1}}).is_ok());

    size_t seen_size = 0;
    f.notifier.subscribe([&](const Event& e) {
        if (e.kind == EventKind::SnapshotCreated) {
            seen_size = manager->list_snapshots().size();
        }
    });

    f.snapshot(*manager, "a");
    REQUIRE(seen_size == 1);
}

TEST_CASE("Auto-rollback with a real-time scheduler", "[snapshots][watchdog][realtime]") {
    MemoryMedium medium;
    StateStore state(medium, "rt.state");
    StateStore snapshots(medium, "rt.snapshots");
    REQUIRE(state.open().is_ok());
    REQUIRE(snapshots.open().is_ok());
    EventNotifier notifier;
    ThreadScheduler scheduler;
    SnapshotManager manager(state, snapshots, notifier, scheduler, SnapshotConfig{});

    Json pre{{"phase", "before"}};
    Json post{{"phase", "after"}};
    REQUIRE(state.save(pre).is_ok());

    SECTION("deadline passes") {
        auto guard = manager.prepare_auto_rollback("risky-op", 100ms);
        REQUIRE(state.save(post).is_ok());

        std::this_thread::sleep_for(150ms);
        for (int i = 0; i < 200 && guard.state() != GuardState::Fired; ++i) {
            std::this_thread::sleep_for(10ms);
        }

        REQUIRE(guard.state() == GuardState::Fired);
        REQUIRE(state.load().value() == pre);
    }

    SECTION("disarmed in time") {
        auto guard = manager.prepare_auto_rollback("risky-op", 100ms);
        REQUIRE(state.save(post).is_ok());

        std::this_thread::sleep_for(50ms);
        REQUIRE(guard.disarm());
        std::this_thread::sleep_for(150ms);

        REQUIRE(guard.state() == GuardState::Disarmed);
        REQUIRE(state.load().value() == post);
    }
}

TEST_CASE("Settled watchdogs are not retained", "[snapshots][watchdog]") {
    Fixture f;
    auto manager = f.make(3);
    REQUIRE(f.state.save(Json{{"v", 1}}).is_ok());

    SECTION("disarmed") {
        for (int i = 0; i < 1000; ++i) {
            auto guard = manager->prepare_auto_rollback("op", 100ms);
            REQUIRE(guard.disarm());
        }
        REQUIRE(manager->tracked_watchdogs() <= 1);
        REQUIRE(manager->armed_watchdogs() == 0);
        REQUIRE(f.scheduler.pending() == 0);
    }

    SECTION("fired") {
        for (int i = 0; i < 100; ++i) {
            auto guard = manager->prepare_auto_rollback("op", 10ms);
            f.scheduler.advance(10ms);
            REQUIRE(guard.state() == GuardState::Fired);
        }
        REQUIRE(manager->tracked_watchdogs() == 0);
    }

    SECTION("armed guards stay tracked") {
        auto first = manager->prepare_auto_rollback("first", 100ms);
        auto second = manager->prepare_auto_rollback("second", 100ms);
        REQUIRE(first.disarm());
        auto third = manager->prepare_auto_rollback("third", 100ms);

        REQUIRE(manager->tracked_watchdogs() == 2);
        REQUIRE(manager->armed_watchdogs() == 2);
    }
}

TEST_CASE("A listener throwing a non-standard type does not abort the manager", "[snapshots]") {
    Fixture f;
    auto manager = f.make();
    REQUIRE(f.state.save(Json{{"phase", "before"}}).is_ok());

    f.notifier.subscribe([](const Event&) { throw 42; });
    size_t after_thrower = 0;
    f.notifier.subscribe([&](const Event&) { ++after_thrower; });

    auto created = manager->create_snapshot("x");
    REQUIRE(created.is_ok());
    REQUIRE(after_thrower == 1);

    auto guard = manager->prepare_auto_rollback("op", 100ms);
    REQUIRE(f.state.save(Json{{"phase", "after"}}).is_ok());
    REQUIRE_NOTHROW(f.scheduler.advance(100ms));

    REQUIRE(guard.state() == GuardState::Fired);
    REQUIRE(f.state.load().value() == Json{{"phase", "before"}});
    REQUIRE(after_thrower == 3);
    REQUIRE(f.count(EventKind::StateReplaced) == 1);
}
