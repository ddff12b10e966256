#include "rewind/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace rewindkit::core {

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    // Expand $VAR patterns (without braces)
    std::regex env_regex2(R"(\$([A-Za-z_][A-Za-z0-9_]*))");
    while (std::regex_search(result, match, env_regex2)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path expand_path(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

fs::path Config::default_path() {
    return expand_path(fs::path("~/.rewind/config.yaml"));
}

void Config::expand_paths() {
    storage.path = expand_path(storage.path);
    if (!observability.log_path.empty()) {
        observability.log_path = expand_path(observability.log_path);
    }
}

void Config::apply_environment() {
    if (const char* path = std::getenv("REWIND_STORAGE_PATH")) {
        storage.path = path;
    }
    if (const char* level = std::getenv("REWIND_LOG_LEVEL")) {
        observability.log_level = level;
    }
}

Result<void, Error> Config::validate() const {
    if (storage.backend != "file" && storage.backend != "memory") {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "storage.backend must be 'file' or 'memory'",
            storage.backend
        );
    }

    if (storage.key_prefix.empty()) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "storage.key_prefix must not be empty"
        );
    }

    if (snapshots.max_snapshots < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "snapshots.max_snapshots must be at least 1"
        );
    }

    if (snapshots.auto_rollback_deadline_ms <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "snapshots.auto_rollback_deadline_ms must be positive"
        );
    }

    if (snapshots.auto_save_interval_ms < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "snapshots.auto_save_interval_ms must not be negative"
        );
    }

    // Eviction prunes to max_documents / 2, which must leave room for one
    if (documents.max_documents < 2) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "documents.max_documents must be at least 2"
        );
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto storage_node = root["storage"]) {
            config.storage.backend = storage_node["backend"].as<std::string>(config.storage.backend);
            config.storage.path = storage_node["path"].as<std::string>(config.storage.path.string());
            config.storage.capacity_bytes = storage_node["capacity_bytes"].as<std::uint64_t>(config.storage.capacity_bytes);
            config.storage.key_prefix = storage_node["key_prefix"].as<std::string>(config.storage.key_prefix);
        }

        if (auto snap_node = root["snapshots"]) {
            config.snapshots.max_snapshots = snap_node["max_snapshots"].as<int>(config.snapshots.max_snapshots);
            config.snapshots.auto_rollback_deadline_ms = snap_node["auto_rollback_deadline_ms"].as<int>(config.snapshots.auto_rollback_deadline_ms);
            config.snapshots.auto_save_interval_ms = snap_node["auto_save_interval_ms"].as<int>(config.snapshots.auto_save_interval_ms);
        }

        if (auto doc_node = root["documents"]) {
            config.documents.max_documents = doc_node["max_documents"].as<int>(config.documents.max_documents);
        }

        if (auto obs_node = root["observability"]) {
            config.observability.log_level = obs_node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_path = obs_node["log_path"].as<std::string>(config.observability.log_path.string());
        }

        config.apply_environment();
        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    config.apply_environment();
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    try {
        fs::path expanded = expand_path(path);

        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "backend" << YAML::Value << storage.backend;
        out << YAML::Key << "path" << YAML::Value << storage.path.string();
        out << YAML::Key << "capacity_bytes" << YAML::Value << storage.capacity_bytes;
        out << YAML::Key << "key_prefix" << YAML::Value << storage.key_prefix;
        out << YAML::EndMap;

        out << YAML::Key << "snapshots" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_snapshots" << YAML::Value << snapshots.max_snapshots;
        out << YAML::Key << "auto_rollback_deadline_ms" << YAML::Value << snapshots.auto_rollback_deadline_ms;
        out << YAML::Key << "auto_save_interval_ms" << YAML::Value << snapshots.auto_save_interval_ms;
        out << YAML::EndMap;

        out << YAML::Key << "documents" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_documents" << YAML::Value << documents.max_documents;
        out << YAML::EndMap;

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_path" << YAML::Value << observability.log_path.string();
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::MediumUnavailable,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::InternalError,
            e.what(),
            path.string()
        );
    }
}

}  // namespace rewindkit::core
