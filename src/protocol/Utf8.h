#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace termrelay::protocol {

// Streaming byte -> UTF-8 sanitizer for pty output.
//
// A pty read can end in the middle of a multi-byte sequence; the trailing
// prefix is held back until the next call. Malformed bytes become U+FFFD, one
// replacement per offending byte, so every call makes forward progress and the
// result is always valid UTF-8 (JSON strings must be).
class Utf8StreamDecoder {
public:
    std::string decode_append(std::string_view bytes);

    // Flushes a held-back prefix as replacement characters (end of stream).
    std::string finish();

    bool has_pending() const noexcept { return !pending_.empty(); }

private:
    std::string pending_;
};

// Number of code points in valid UTF-8 text.
std::size_t utf8_length(std::string_view text) noexcept;

// Byte offset just past the first `count` code points of valid UTF-8 text.
std::size_t utf8_advance(std::string_view text, std::size_t count) noexcept;

// Telnet carries raw bytes; the JSON transport carries text. Bytes map to
// code points 0..255 and back. Code points above 255 become '?'.
std::string latin1_to_utf8(std::string_view bytes);
std::string utf8_to_latin1(std::string_view text);

} // namespace termrelay::protocol
