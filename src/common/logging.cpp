#include <fleet/common/logging.h>
#include <fleet/config/config_helpers.h>

#include <cctype>
#include <cstdlib>
#include <string>

namespace fleet::logging {

std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) {
    std::string v;
    v.reserve(name.size());
    for (char c : name)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum configure(const std::filesystem::path& configPath) {
    auto level = spdlog::level::warn;

    const auto path = configPath.empty() ? config::get_config_path() : configPath;
    if (auto v = config::parse_config_value(path, "logging", "level"); !v.empty()) {
        if (auto lvl = parseLevel(v))
            level = *lvl;
    }
    if (const char* envLvl = std::getenv("FLEET_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl))
            level = *lvl;
    }

    spdlog::set_level(level);
    return level;
}

} // namespace fleet::logging
