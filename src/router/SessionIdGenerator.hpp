#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace termrelay::router {

// "session_<UTC yyyymmddHHMMSS>_<n>". The counter never repeats within a
// router process, so ids stay unique across restarts of the pool.
class SessionIdGenerator {
public:
    SessionIdGenerator() = default;
    explicit SessionIdGenerator(std::string prefix)
        : prefix_(std::move(prefix)) {}

    std::string next() {
        return prefix_ + "_" + timestamp_() + "_" + std::to_string(++counter_);
    }

    std::uint64_t issued() const noexcept { return counter_; }

private:
    static std::string timestamp_() {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        gmtime_r(&now, &tm);

        char buf[16];
        const std::size_t n = std::strftime(buf, sizeof buf, "%Y%m%d%H%M%S", &tm);
        return std::string(buf, n);
    }

    std::string prefix_ = "session";
    std::uint64_t counter_ = 0;
};

} // namespace termrelay::router
