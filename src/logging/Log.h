#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

namespace termrelay::logging {

// Installs a colour console logger called `name` as the spdlog default.
// The level comes from TERMRELAY_LOG_LEVEL, falling back to info.
std::shared_ptr<spdlog::logger> init(const std::string& name);

spdlog::level::level_enum level_from_env(spdlog::level::level_enum fallback = spdlog::level::info);

// Space separated hex dump, truncated after `limit` bytes.
std::string hex_dump(std::string_view bytes, std::size_t limit = 80);

} // namespace termrelay::logging
