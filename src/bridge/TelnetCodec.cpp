#include "bridge/TelnetCodec.h"

#include <spdlog/spdlog.h>

namespace termrelay::bridge {

using namespace telnet;

namespace {

const char* verb_name(std::uint8_t verb) {
    switch (verb) {
        case DO: return "DO";
        case DONT: return "DONT";
        case WILL: return "WILL";
        case WONT: return "WONT";
    }
    return "?";
}

} // namespace

TelnetDecoder::Result TelnetDecoder::feed(std::string_view bytes) {
    Result out;
    out.data.reserve(bytes.size());

    for (char ch : bytes) {
        const auto b = static_cast<std::uint8_t>(ch);
        switch (state_) {
            case State::Data:
                if (b == IAC) {
                    state_ = State::Command;
                } else {
                    out.data.push_back(ch);
                }
                break;

            case State::Command:
                command(b, out);
                break;

            case State::Option:
                option(b, out);
                state_ = State::Data;
                break;

            case State::Subneg:
                if (b == IAC) state_ = State::SubnegIac;
                break;

            case State::SubnegIac:
                if (b == SE) {
                    spdlog::debug("Telnet subnegotiation done");
                    state_ = State::Data;
                } else {
                    state_ = State::Subneg;
                }
                break;
        }
    }
    return out;
}

void TelnetDecoder::command(std::uint8_t cmd, Result& out) {
    state_ = State::Data;
    if (cmd == IAC) {
        out.data.push_back(static_cast<char>(IAC));
        return;
    }

    ++commands_;
    switch (cmd) {
        case BRK:
            spdlog::info("Telnet BRK -> Ctrl-Z");
            out.data.push_back('\x1A');
            break;
        case AO:
            spdlog::info("Telnet AO -> Ctrl-Z");
            out.data.push_back('\x1A');
            break;
        case IP:
            spdlog::info("Telnet IP -> Ctrl-C");
            out.data.push_back('\x03');
            break;
        case DO:
        case DONT:
        case WILL:
        case WONT:
            verb_ = cmd;
            state_ = State::Option;
            break;
        case SB:
            state_ = State::Subneg;
            break;
        default:
            spdlog::info("Telnet command {:02x} ignored", cmd);
            break;
    }
}

void TelnetDecoder::option(std::uint8_t opt, Result& out) {
    const std::uint8_t answer = (verb_ == DO || verb_ == DONT) ? WONT : DONT;
    out.replies.push_back(static_cast<char>(IAC));
    out.replies.push_back(static_cast<char>(answer));
    out.replies.push_back(static_cast<char>(opt));
    spdlog::info("Telnet: client {} {} -> {} {}", verb_name(verb_), opt, verb_name(answer), opt);
}

std::string telnet_escape(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (char ch : bytes) {
        out.push_back(ch);
        if (static_cast<std::uint8_t>(ch) == IAC) out.push_back(ch);
    }
    return out;
}

} // namespace termrelay::bridge
