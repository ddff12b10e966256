#pragma once

#include "rewind/core/result.hpp"

#include <optional>
#include <string>

namespace rewindkit::storage {

using namespace rewindkit::core;

// String key-value storage the state store writes through.
// Implementations report capacity exhaustion as ErrorCode::QuotaExceeded and
// any other write or read failure as ErrorCode::MediumUnavailable. A set()
// either fully replaces the previous value or leaves it untouched.
class StorageMedium {
public:
    virtual ~StorageMedium() = default;

    // Empty optional when the key was never written or has been removed
    virtual Result<std::optional<std::string>, Error> get(const std::string& key) const = 0;

    virtual Result<void, Error> set(const std::string& key, const std::string& value) = 0;

    // Removing an absent key succeeds
    virtual Result<void, Error> remove(const std::string& key) = 0;

    // Name for log lines
    virtual std::string describe() const = 0;
};

}  // namespace rewindkit::storage
