#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace termrelay::pool {

// Serial-line pacing: ten bits per character, output released in chunks of
// roughly a tenth of a second of line time.
class BaudPacer {
public:
    static constexpr int kDefaultBaud = 9600;

    explicit BaudPacer(int baud = kDefaultBaud);

    // Throws std::invalid_argument unless baud > 0.
    void set_baud(int baud);
    int baud() const noexcept { return baud_; }

    double chars_per_second() const noexcept { return baud_ / 10.0; }

    // max(1, floor(cps / 10)); 96 at 9600 baud, 1 at 110 baud.
    std::size_t chunk_chars() const noexcept;

    // Line time for `chars` characters: chars / cps.
    std::chrono::microseconds delay_for(std::size_t chars) const noexcept;

    // Splits UTF-8 text into chunk_chars() code points per chunk.
    std::vector<std::string> split(std::string_view text) const;

private:
    int baud_;
};

} // namespace termrelay::pool
