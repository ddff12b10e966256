#include "rewind/storage/memory_medium.hpp"

namespace rewindkit::storage {

MemoryMedium::MemoryMedium(std::uint64_t capacity_bytes)
    : capacity_bytes_(capacity_bytes)
{
}

Result<std::optional<std::string>, Error> MemoryMedium::get(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return Result<std::optional<std::string>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<std::string>, Error>::ok(it->second);
}

Result<void, Error> MemoryMedium::set(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);

    std::uint64_t previous = 0;
    auto it = data_.find(key);
    if (it != data_.end()) {
        previous = key.size() + it->second.size();
    }

    std::uint64_t projected = used_bytes_ - previous + key.size() + value.size();
    if (capacity_bytes_ > 0 && projected > capacity_bytes_) {
        return Result<void, Error>::err(
            ErrorCode::QuotaExceeded,
            "Writing " + std::to_string(value.size()) + " bytes would exceed the " +
                std::to_string(capacity_bytes_) + " byte quota",
            key
        );
    }

    data_[key] = value;
    used_bytes_ = projected;
    return Result<void, Error>::ok();
}

Result<void, Error> MemoryMedium::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = data_.find(key);
    if (it != data_.end()) {
        used_bytes_ -= key.size() + it->second.size();
        data_.erase(it);
    }
    return Result<void, Error>::ok();
}

std::string MemoryMedium::describe() const {
    return "memory";
}

std::uint64_t MemoryMedium::used_bytes() const {
    std::lock_guard lock(mutex_);
    return used_bytes_;
}

void MemoryMedium::set_capacity_bytes(std::uint64_t capacity) {
    std::lock_guard lock(mutex_);
    capacity_bytes_ = capacity;
}

size_t MemoryMedium::key_count() const {
    std::lock_guard lock(mutex_);
    return data_.size();
}

}  // namespace rewindkit::storage
