#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace fleet::logging {

// Accepts trace, debug, info, warn/warning, error/err, critical/crit, off/none/silent
// (case-insensitive).
std::optional<spdlog::level::level_enum> parseLevel(std::string_view name);

// Apply the global spdlog level. Precedence: env FLEET_LOG_LEVEL > config
// `[logging] level` > warn. Returns the level applied.
spdlog::level::level_enum configure(const std::filesystem::path& configPath = {});

} // namespace fleet::logging
