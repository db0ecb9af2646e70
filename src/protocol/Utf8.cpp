#include "protocol/Utf8.h"

#include <algorithm>

namespace termrelay::protocol {

namespace {

constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

inline unsigned char byte_at(std::string_view s, std::size_t i) noexcept {
    return static_cast<unsigned char>(s[i]);
}

// Expected sequence length for a lead byte, 0 when it cannot start one.
std::size_t sequence_length(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

// Continuation byte at position `index` (1-based) of a sequence. The first
// continuation also rules out overlong forms, surrogates and > U+10FFFF.
bool valid_continuation(unsigned char lead, std::size_t index, unsigned char c) noexcept {
    if (c < 0x80 || c > 0xBF) return false;
    if (index != 1) return true;
    switch (lead) {
        case 0xE0: return c >= 0xA0;
        case 0xED: return c <= 0x9F;
        case 0xF0: return c >= 0x90;
        case 0xF4: return c <= 0x8F;
        default:   return true;
    }
}

} // namespace

std::string Utf8StreamDecoder::decode_append(std::string_view bytes) {
    pending_.append(bytes.data(), bytes.size());

    std::string out;
    out.reserve(pending_.size());

    const std::string_view in(pending_);
    std::size_t i = 0;
    while (i < in.size()) {
        const unsigned char lead = byte_at(in, i);
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        const std::size_t len = sequence_length(lead);
        if (len == 0) {
            out += kReplacement;
            ++i;
            continue;
        }

        const std::size_t avail = std::min(len, in.size() - i);
        bool ok = true;
        for (std::size_t k = 1; k < avail; ++k) {
            if (!valid_continuation(lead, k, byte_at(in, i + k))) {
                ok = false;
                break;
            }
        }
        if (!ok) {
            out += kReplacement;
            ++i;
            continue;
        }
        if (avail < len) break;  // valid prefix, wait for the rest

        out.append(in.substr(i, len));
        i += len;
    }

    pending_.erase(0, i);
    return out;
}

std::string Utf8StreamDecoder::finish() {
    std::string out;
    for (std::size_t i = 0; i < pending_.size(); ++i) out += kReplacement;
    pending_.clear();
    return out;
}

std::size_t utf8_length(std::string_view text) noexcept {
    std::size_t n = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::size_t utf8_advance(std::string_view text, std::size_t count) noexcept {
    std::size_t i = 0;
    while (i < text.size() && count > 0) {
        ++i;
        while (i < text.size() && (byte_at(text, i) & 0xC0) == 0x80) ++i;
        --count;
    }
    return i;
}

std::string latin1_to_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (char c : bytes) {
        const auto b = static_cast<unsigned char>(c);
        if (b < 0x80) {
            out.push_back(c);
        } else {
            out.push_back(static_cast<char>(0xC0 | (b >> 6)));
            out.push_back(static_cast<char>(0x80 | (b & 0x3F)));
        }
    }
    return out;
}

std::string utf8_to_latin1(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        const unsigned char lead = byte_at(text, i);
        std::size_t len = sequence_length(lead);
        if (len == 0) len = 1;
        len = std::min(len, text.size() - i);

        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
        } else if (len == 2 && (lead == 0xC2 || lead == 0xC3)) {
            const unsigned cp = ((lead & 0x1Fu) << 6) | (byte_at(text, i + 1) & 0x3Fu);
            out.push_back(static_cast<char>(cp));
        } else {
            out.push_back('?');
        }
        i += len;
    }
    return out;
}

} // namespace termrelay::protocol
