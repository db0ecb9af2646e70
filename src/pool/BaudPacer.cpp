#include "pool/BaudPacer.h"

#include "protocol/Utf8.h"

#include <algorithm>
#include <stdexcept>

namespace termrelay::pool {

BaudPacer::BaudPacer(int baud) : baud_(kDefaultBaud) {
    set_baud(baud);
}

void BaudPacer::set_baud(int baud) {
    if (baud <= 0) throw std::invalid_argument("baud rate must be positive: " + std::to_string(baud));
    baud_ = baud;
}

std::size_t BaudPacer::chunk_chars() const noexcept {
    const auto n = static_cast<std::size_t>(chars_per_second() / 10.0);
    return std::max<std::size_t>(1, n);
}

std::chrono::microseconds BaudPacer::delay_for(std::size_t chars) const noexcept {
    // chars * 10 bits / baud seconds
    const long long us = static_cast<long long>(chars) * 10'000'000LL / baud_;
    return std::chrono::microseconds(us);
}

std::vector<std::string> BaudPacer::split(std::string_view text) const {
    std::vector<std::string> chunks;
    const std::size_t per_chunk = chunk_chars();
    while (!text.empty()) {
        const std::size_t n = protocol::utf8_advance(text, per_chunk);
        chunks.emplace_back(text.substr(0, n));
        text.remove_prefix(n);
    }
    return chunks;
}

} // namespace termrelay::pool
