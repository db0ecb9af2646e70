#include "logging/Log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cstdlib>

namespace termrelay::logging {

namespace {
constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e - %^%l%$ - [%n] %v";
}

spdlog::level::level_enum level_from_env(spdlog::level::level_enum fallback) {
    const char* raw = std::getenv("TERMRELAY_LOG_LEVEL");
    if (!raw || !*raw) return fallback;

    // spdlog maps unknown names to off; treat that as a typo unless asked for.
    auto level = spdlog::level::from_str(raw);
    if (level == spdlog::level::off && std::string_view(raw) != "off") return fallback;
    return level;
}

std::shared_ptr<spdlog::logger> init(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) logger = spdlog::stdout_color_mt(name);

    logger->set_pattern(kPattern);
    logger->set_level(level_from_env());
    spdlog::set_default_logger(logger);
    return logger;
}

std::string hex_dump(std::string_view bytes, std::size_t limit) {
    static constexpr char digits[] = "0123456789abcdef";

    std::string out;
    const std::size_t n = std::min(bytes.size(), limit);
    out.reserve(n * 3 + 4);
    for (std::size_t i = 0; i < n; ++i) {
        const auto b = static_cast<unsigned char>(bytes[i]);
        if (i) out.push_back(' ');
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    if (bytes.size() > n) out += " ...";
    return out;
}

} // namespace termrelay::logging
