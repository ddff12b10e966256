#include <catch2/catch_test_macros.hpp>
#include "rewind/core/config.hpp"
#include "rewind/core/logging.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <fstream>

using namespace rewindkit::core;
using rewindkit::testing::TempDir;

namespace {

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

}  // namespace

TEST_CASE("Default config values", "[config]") {
    Config config;

    REQUIRE(config.storage.backend == "file");
    REQUIRE(config.storage.capacity_bytes == 5 * 1024 * 1024);
    REQUIRE(config.storage.key_prefix == "rewind");
    REQUIRE(config.snapshots.max_snapshots == 10);
    REQUIRE(config.snapshots.auto_rollback_deadline() == Duration{300000});
    REQUIRE(config.snapshots.auto_save_interval() == Duration{0});
    REQUIRE(config.documents.max_documents == 100);
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("Config storage keys", "[config]") {
    StorageConfig storage;
    storage.key_prefix = "app";

    REQUIRE(storage.state_key() == "app.state");
    REQUIRE(storage.snapshots_key() == "app.snapshots");
    REQUIRE(storage.documents_key() == "app.documents");
}

TEST_CASE("Config load from YAML", "[config]") {
    TempDir dir;
    auto path = dir.path() / "config.yaml";
    write_file(path,
        "storage:\n"
        "  backend: memory\n"
        "  capacity_bytes: 1024\n"
        "  key_prefix: test\n"
        "snapshots:\n"
        "  max_snapshots: 3\n"
        "  auto_rollback_deadline_ms: 100\n"
        "  auto_save_interval_ms: 60000\n"
        "documents:\n"
        "  max_documents: 10\n"
        "observability:\n"
        "  log_level: debug\n"
        "  log_path: \"\"\n");

    auto result = Config::load(path);
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.storage.backend == "memory");
    REQUIRE(config.storage.capacity_bytes == 1024);
    REQUIRE(config.storage.key_prefix == "test");
    REQUIRE(config.snapshots.max_snapshots == 3);
    REQUIRE(config.snapshots.auto_rollback_deadline_ms == 100);
    REQUIRE(config.snapshots.auto_save_interval_ms == 60000);
    REQUIRE(config.documents.max_documents == 10);
    REQUIRE(config.observability.log_level == "debug");
    REQUIRE(config.observability.log_path.empty());
}

TEST_CASE("Config partial file keeps defaults", "[config]") {
    TempDir dir;
    auto path = dir.path() / "config.yaml";
    write_file(path, "snapshots:\n  max_snapshots: 4\n");

    auto result = Config::load(path);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().snapshots.max_snapshots == 4);
    REQUIRE(result.value().documents.max_documents == 100);
    REQUIRE(result.value().storage.backend == "file");
}

TEST_CASE("Config load failures", "[config]") {
    TempDir dir;

    SECTION("missing file") {
        auto result = Config::load(dir.path() / "absent.yaml");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::ConfigNotFound);
    }

    SECTION("malformed YAML") {
        auto path = dir.path() / "bad.yaml";
        write_file(path, "storage: [unclosed\n");
        auto result = Config::load(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::ConfigParseFailed);
    }

    SECTION("invalid values") {
        auto path = dir.path() / "invalid.yaml";
        write_file(path, "documents:\n  max_documents: 1\n");
        auto result = Config::load(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::ConfigValidationFailed);
    }

    SECTION("load_or_default falls back") {
        auto config = Config::load_or_default(dir.path() / "absent.yaml");
        REQUIRE(config.snapshots.max_snapshots == 10);
    }
}

TEST_CASE("Config validation", "[config]") {
    Config config;

    SECTION("unknown backend") {
        config.storage.backend = "s3";
        REQUIRE(config.validate().error().code == ErrorCode::ConfigValidationFailed);
    }

    SECTION("empty key prefix") {
        config.storage.key_prefix.clear();
        REQUIRE(config.validate().is_err());
    }

    SECTION("zero snapshots") {
        config.snapshots.max_snapshots = 0;
        REQUIRE(config.validate().is_err());
    }

    SECTION("non-positive deadline") {
        config.snapshots.auto_rollback_deadline_ms = 0;
        REQUIRE(config.validate().is_err());
    }

    SECTION("negative auto-save interval") {
        config.snapshots.auto_save_interval_ms = -1;
        REQUIRE(config.validate().is_err());
    }
}

TEST_CASE("Config save and reload", "[config]") {
    TempDir dir;
    auto path = dir.path() / "nested" / "config.yaml";

    Config config;
    config.storage.backend = "memory";
    config.storage.path = dir.path() / "store";
    config.snapshots.max_snapshots = 5;
    config.snapshots.auto_save_interval_ms = 120000;
    config.documents.max_documents = 20;
    config.observability.log_path = dir.path() / "logs";

    REQUIRE(config.save(path).is_ok());

    auto loaded = Config::load(path);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().storage.backend == "memory");
    REQUIRE(loaded.value().storage.path == dir.path() / "store");
    REQUIRE(loaded.value().snapshots.max_snapshots == 5);
    REQUIRE(loaded.value().snapshots.auto_save_interval_ms == 120000);
    REQUIRE(loaded.value().documents.max_documents == 20);
}

TEST_CASE("Path expansion", "[config]") {
    setenv("REWIND_TEST_DIR", "/tmp/rewind-expansion", 1);

    REQUIRE(expand_path(std::string("${REWIND_TEST_DIR}/a")) == "/tmp/rewind-expansion/a");
    REQUIRE(expand_path(std::string("$REWIND_TEST_DIR/b")) == "/tmp/rewind-expansion/b");

    if (const char* home = std::getenv("HOME")) {
        REQUIRE(expand_path(std::string("~/x")) == std::string(home) + "/x");
    }

    unsetenv("REWIND_TEST_DIR");
}

TEST_CASE("Environment overrides", "[config]") {
    setenv("REWIND_STORAGE_PATH", "/tmp/rewind-env-store", 1);
    setenv("REWIND_LOG_LEVEL", "warn", 1);

    Config config;
    config.apply_environment();

    REQUIRE(config.storage.path == fs::path("/tmp/rewind-env-store"));
    REQUIRE(config.observability.log_level == "warn");

    unsetenv("REWIND_STORAGE_PATH");
    unsetenv("REWIND_LOG_LEVEL");
}

TEST_CASE("Log level parsing", "[config][logging]") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE(parse_log_level("nonsense") == spdlog::level::info);
}

TEST_CASE("Logging writes to the configured directory", "[config][logging]") {
    TempDir dir;
    ObservabilityConfig obs;
    obs.log_level = "info";
    obs.log_path = dir.path() / "logs";

    REQUIRE(init_logging(obs).is_ok());
    REQUIRE(fs::exists(dir.path() / "logs" / "rewind.log"));

    // Leave a stderr-only default logger behind for the other tests
    obs.log_path.clear();
    obs.log_level = "off";
    REQUIRE(init_logging(obs).is_ok());
}
