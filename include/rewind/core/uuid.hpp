#pragma once

#include "types.hpp"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace rewindkit::core {

// UUID v4 implementation
class UUID {
public:
    UUID() : bytes_{} {}

    // Generate a new random UUID (v4)
    static UUID generate() {
        UUID uuid;

        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        // Set version (4) and variant (RFC 4122)
        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        for (int i = 0; i < 8; ++i) {
            uuid.bytes_[i] = static_cast<uint8_t>((high >> (56 - i * 8)) & 0xFF);
            uuid.bytes_[i + 8] = static_cast<uint8_t>((low >> (56 - i * 8)) & 0xFF);
        }

        return uuid;
    }

    // Parse from string (format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx)
    static UUID from_string(const std::string& str) {
        UUID uuid;

        if (str.length() != 36) {
            return uuid;
        }

        size_t byte_idx = 0;
        for (size_t i = 0; i < str.length() && byte_idx < 16; i += 2) {
            if (str[i] == '-') {
                --i;
                continue;
            }

            char hex[3] = {str[i], str[i + 1], '\0'};
            uuid.bytes_[byte_idx++] = static_cast<uint8_t>(std::strtoul(hex, nullptr, 16));
        }

        return uuid;
    }

    std::string to_string() const {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');

        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes_[i]);
        }

        return ss.str();
    }

    // Non-zero
    bool is_valid() const {
        for (auto b : bytes_) {
            if (b != 0) return true;
        }
        return false;
    }

    bool operator==(const UUID& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const UUID& other) const { return bytes_ != other.bytes_; }
    bool operator<(const UUID& other) const { return bytes_ < other.bytes_; }

    const std::array<uint8_t, 16>& bytes() const { return bytes_; }

private:
    std::array<uint8_t, 16> bytes_;
};

inline std::string to_base36(uint64_t value) {
    static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.insert(out.begin(), digits[value % 36]);
        value /= 36;
    }
    return out;
}

// snap-<base36 ms>-<5 hex>; the time prefix keeps ids roughly ordered by creation
inline SnapshotId generate_snapshot_id(TimePoint now = Clock::now()) {
    auto ms = static_cast<uint64_t>(to_epoch_ms(now));
    return "snap-" + to_base36(ms) + "-" + UUID::generate().to_string().substr(0, 5);
}

inline DocumentId generate_document_id() {
    return "doc_" + UUID::generate().to_string().substr(0, 8);
}

}  // namespace rewindkit::core
