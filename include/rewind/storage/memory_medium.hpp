#pragma once

#include "medium.hpp"

#include <cstdint>
#include <map>
#include <mutex>

namespace rewindkit::storage {

// In-process medium with a byte quota over keys and values, the way a
// browser's local storage limits an origin. capacity_bytes == 0 means
// unlimited.
class MemoryMedium : public StorageMedium {
public:
    explicit MemoryMedium(std::uint64_t capacity_bytes = 0);

    Result<std::optional<std::string>, Error> get(const std::string& key) const override;
    Result<void, Error> set(const std::string& key, const std::string& value) override;
    Result<void, Error> remove(const std::string& key) override;
    std::string describe() const override;

    std::uint64_t used_bytes() const;
    std::uint64_t capacity_bytes() const { return capacity_bytes_; }
    void set_capacity_bytes(std::uint64_t capacity);
    size_t key_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> data_;
    std::uint64_t capacity_bytes_;
    std::uint64_t used_bytes_ = 0;
};

}  // namespace rewindkit::storage
