#pragma once

#include "medium.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>

namespace rewindkit::storage {

namespace fs = std::filesystem;

// Directory-backed medium: one file per key.
// Writes go to a temporary file that is renamed over the old value, so a
// reader sees either the previous value or the new one. The quota counts
// the bytes of every stored value; a full disk (ENOSPC) is reported as
// QuotaExceeded as well.
class FileMedium : public StorageMedium {
public:
    // Creates the directory when missing
    static Result<std::unique_ptr<FileMedium>, Error> open(const fs::path& directory,
                                                            std::uint64_t capacity_bytes = 0);

    // Does not touch the filesystem; open() prepares and checks the directory
    FileMedium(fs::path directory, std::uint64_t capacity_bytes);

    Result<std::optional<std::string>, Error> get(const std::string& key) const override;
    Result<void, Error> set(const std::string& key, const std::string& value) override;
    Result<void, Error> remove(const std::string& key) override;
    std::string describe() const override;

    const fs::path& directory() const { return directory_; }
    std::uint64_t used_bytes() const;

    // Percent-encodes anything outside [A-Za-z0-9._-]
    static std::string encode_key(const std::string& key);

private:
    fs::path value_path(const std::string& key) const;
    std::uint64_t used_bytes_locked() const;

    fs::path directory_;
    std::uint64_t capacity_bytes_;
    mutable std::mutex mutex_;
};

}  // namespace rewindkit::storage
