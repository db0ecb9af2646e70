#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace termrelay::bridge {

namespace telnet {
constexpr std::uint8_t SE = 0xF0;
constexpr std::uint8_t AO = 0xED;
constexpr std::uint8_t BRK = 0xF3;
constexpr std::uint8_t IP = 0xF4;
constexpr std::uint8_t SB = 0xFA;
constexpr std::uint8_t WILL = 0xFB;
constexpr std::uint8_t WONT = 0xFC;
constexpr std::uint8_t DO = 0xFD;
constexpr std::uint8_t DONT = 0xFE;
constexpr std::uint8_t IAC = 0xFF;
} // namespace telnet

// Inbound side of a Telnet connection. Commands may be split across TCP
// reads, so the parser state survives between feed() calls.
//
// Every option is refused: DO/DONT are answered WONT, WILL/WONT are answered
// DONT. BRK and AO become Ctrl-Z, IP becomes Ctrl-C. Subnegotiations and all
// other commands are dropped.
class TelnetDecoder {
public:
    struct Result {
        std::string data;     // user bytes, commands removed
        std::string replies;  // negotiation answers to write back
    };

    Result feed(std::string_view bytes);

    bool idle() const noexcept { return state_ == State::Data; }

    // Counters for logging.
    std::uint64_t commands_seen() const noexcept { return commands_; }

private:
    enum class State { Data, Command, Option, Subneg, SubnegIac };

    void command(std::uint8_t cmd, Result& out);
    void option(std::uint8_t opt, Result& out);

    State state_ = State::Data;
    std::uint8_t verb_ = 0;
    std::uint64_t commands_ = 0;
};

// Outbound: doubles every 0xFF.
std::string telnet_escape(std::string_view bytes);

} // namespace termrelay::bridge
