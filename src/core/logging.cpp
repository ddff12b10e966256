#include "rewind/core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>
#include <vector>

namespace rewindkit::core {

spdlog::level::level_enum parse_log_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

Result<void, Error> init_logging(const ObservabilityConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (!config.log_path.empty()) {
            fs::path dir = expand_path(config.log_path);
            fs::create_directories(dir);
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                (dir / "rewind.log").string()));
        }

        auto logger = std::make_shared<spdlog::logger>("rewind", sinks.begin(), sinks.end());
        logger->set_level(parse_log_level(config.log_level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(std::move(logger));

        return Result<void, Error>::ok();

    } catch (const spdlog::spdlog_ex& e) {
        return Result<void, Error>::err(
            ErrorCode::MediumUnavailable,
            std::string("Failed to initialize logging: ") + e.what(),
            config.log_path.string()
        );
    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::InternalError,
            e.what(),
            config.log_path.string()
        );
    }
}

}  // namespace rewindkit::core
