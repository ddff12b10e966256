#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace rewindkit::core {

// JSON alias
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Source of "now" for components that stamp records; tests substitute their own
using NowFn = std::function<TimePoint()>;

// Common type aliases
using SnapshotId = std::string;
using DocumentId = std::string;
using SubscriptionId = std::uint64_t;

// Persisted timestamps are integer milliseconds since the epoch
inline std::int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(std::int64_t ms) {
    return TimePoint{std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds{ms})};
}

}  // namespace rewindkit::core
