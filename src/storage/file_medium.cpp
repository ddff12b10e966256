#include "rewind/storage/file_medium.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

namespace rewindkit::storage {

namespace {

constexpr const char* kValueExtension = ".kv";
constexpr const char* kTempExtension = ".tmp";

bool is_out_of_space(const std::error_code& ec) {
    return ec == std::errc::no_space_on_device || ec == std::errc::file_too_large;
}

}  // namespace

Result<std::unique_ptr<FileMedium>, Error> FileMedium::open(const fs::path& directory,
                                                              std::uint64_t capacity_bytes) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return Result<std::unique_ptr<FileMedium>, Error>::err(
            ErrorCode::MediumUnavailable,
            "Failed to create storage directory: " + ec.message(),
            directory.string()
        );
    }

    if (!fs::is_directory(directory, ec)) {
        return Result<std::unique_ptr<FileMedium>, Error>::err(
            ErrorCode::MediumUnavailable,
            "Storage path is not a directory",
            directory.string()
        );
    }

    return Result<std::unique_ptr<FileMedium>, Error>::ok(
        std::make_unique<FileMedium>(directory, capacity_bytes));
}

FileMedium::FileMedium(fs::path directory, std::uint64_t capacity_bytes)
    : directory_(std::move(directory))
    , capacity_bytes_(capacity_bytes)
{
}

std::string FileMedium::encode_key(const std::string& key) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

fs::path FileMedium::value_path(const std::string& key) const {
    return directory_ / (encode_key(key) + kValueExtension);
}

Result<std::optional<std::string>, Error> FileMedium::get(const std::string& key) const {
    std::lock_guard lock(mutex_);
    fs::path path = value_path(key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return Result<std::optional<std::string>, Error>::err(
                ErrorCode::MediumUnavailable, ec.message(), path.string());
        }
        return Result<std::optional<std::string>, Error>::ok(std::nullopt);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::optional<std::string>, Error>::err(
            ErrorCode::MediumUnavailable,
            "Failed to open value for reading",
            path.string()
        );
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Result<std::optional<std::string>, Error>::err(
            ErrorCode::MediumUnavailable,
            "Failed to read value",
            path.string()
        );
    }

    return Result<std::optional<std::string>, Error>::ok(ss.str());
}

Result<void, Error> FileMedium::set(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    fs::path path = value_path(key);
    fs::path tmp = path;
    tmp += kTempExtension;

    if (capacity_bytes_ > 0) {
        std::uint64_t previous = 0;
        std::error_code ec;
        if (fs::exists(path, ec)) {
            previous = fs::file_size(path, ec);
            if (ec) {
                previous = 0;
            }
        }

        std::uint64_t projected = used_bytes_locked() - previous + value.size();
        if (projected > capacity_bytes_) {
            return Result<void, Error>::err(
                ErrorCode::QuotaExceeded,
                "Writing " + std::to_string(value.size()) + " bytes would exceed the " +
                    std::to_string(capacity_bytes_) + " byte quota",
                key
            );
        }
    }

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            std::error_code open_ec(errno, std::generic_category());
            return Result<void, Error>::err(
                is_out_of_space(open_ec) ? ErrorCode::QuotaExceeded : ErrorCode::MediumUnavailable,
                "Failed to open temporary file: " + open_ec.message(),
                tmp.string()
            );
        }

        file.write(value.data(), static_cast<std::streamsize>(value.size()));
        file.flush();
        if (!file) {
            std::error_code write_ec(errno, std::generic_category());
            file.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return Result<void, Error>::err(
                is_out_of_space(write_ec) ? ErrorCode::QuotaExceeded : ErrorCode::MediumUnavailable,
                "Failed to write value: " + write_ec.message(),
                key
            );
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Result<void, Error>::err(
            is_out_of_space(ec) ? ErrorCode::QuotaExceeded : ErrorCode::MediumUnavailable,
            "Failed to replace value: " + ec.message(),
            key
        );
    }

    return Result<void, Error>::ok();
}

Result<void, Error> FileMedium::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    fs::path path = value_path(key);

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Result<void, Error>::err(
            ErrorCode::MediumUnavailable,
            "Failed to remove value: " + ec.message(),
            path.string()
        );
    }
    return Result<void, Error>::ok();
}

std::string FileMedium::describe() const {
    return "file:" + directory_.string();
}

std::uint64_t FileMedium::used_bytes() const {
    std::lock_guard lock(mutex_);
    return used_bytes_locked();
}

std::uint64_t FileMedium::used_bytes_locked() const {
    std::uint64_t total = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (entry.path().extension() != kValueExtension) {
            continue;
        }
        std::error_code size_ec;
        auto size = entry.file_size(size_ec);
        if (!size_ec) {
            total += size;
        }
    }
    if (ec) {
        spdlog::warn("Could not scan {} for quota accounting: {}", directory_.string(), ec.message());
    }
    return total;
}

}  // namespace rewindkit::storage
