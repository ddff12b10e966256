#pragma once

#include "config.hpp"
#include "result.hpp"

#include <spdlog/common.h>

#include <string_view>

namespace rewindkit::core {

// Parse trace|debug|info|warn|error|critical|off; unknown names map to info
spdlog::level::level_enum parse_log_level(std::string_view name);

// Install the default spdlog logger: colored stderr, plus <log_path>/rewind.log
// when a log path is configured
Result<void, Error> init_logging(const ObservabilityConfig& config);

}  // namespace rewindkit::core
