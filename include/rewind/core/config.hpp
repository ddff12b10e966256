#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace rewindkit::core {

namespace fs = std::filesystem;

// Storage medium configuration
struct StorageConfig {
    std::string backend = "file";  // file | memory
    fs::path path = "~/.rewind/storage";
    std::uint64_t capacity_bytes = 5 * 1024 * 1024;  // 0 = unlimited
    std::string key_prefix = "rewind";

    std::string state_key() const { return key_prefix + ".state"; }
    std::string snapshots_key() const { return key_prefix + ".snapshots"; }
    std::string documents_key() const { return key_prefix + ".documents"; }
};

// Snapshot retention and watchdog configuration
struct SnapshotConfig {
    int max_snapshots = 10;
    int auto_rollback_deadline_ms = 300000;  // 5 minutes
    int auto_save_interval_ms = 0;           // 0 = no periodic auto-save snapshots

    Duration auto_rollback_deadline() const { return Duration{auto_rollback_deadline_ms}; }
    Duration auto_save_interval() const { return Duration{auto_save_interval_ms}; }
};

// Document collection configuration
struct DocumentConfig {
    int max_documents = 100;
};

// Observability configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error, off
    fs::path log_path = "~/.rewind/logs";
};

// Main configuration
struct Config {
    StorageConfig storage;
    SnapshotConfig snapshots;
    DocumentConfig documents;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, Error> save(const fs::path& path) const;

    // Get default config path
    static fs::path default_path();

    // Expand environment variables in paths
    void expand_paths();

    // Apply REWIND_* environment overrides
    void apply_environment();

    // Validate configuration
    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);
fs::path expand_path(const fs::path& path);

}  // namespace rewindkit::core
