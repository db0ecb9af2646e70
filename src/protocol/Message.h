#pragma once

#include <boost/json/object.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace termrelay::protocol {

// One JSON object per WebSocket text frame, discriminated by "type".
enum class MessageType {
    NewSession,
    CloseSession,
    Input,
    Resize,
    SetBaudRate,
    Output,
    Error,
    Exit,
    Unknown
};

std::string_view to_string(MessageType type) noexcept;
MessageType type_from_string(std::string_view name) noexcept;

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Message {
    static constexpr int kDefaultCols = 80;
    static constexpr int kDefaultRows = 24;
    static constexpr int kDefaultBaudRate = 9600;

    MessageType type = MessageType::Unknown;
    std::string type_name;  // as received, kept for logging unknown types
    std::string session;    // empty on browser-facing frames
    std::string data;
    int cols = kDefaultCols;
    int rows = kDefaultRows;
    int baud_rate = kDefaultBaudRate;
};

// Throws ProtocolError unless `text` is a JSON object with a string "type".
boost::json::object parse_frame(std::string_view text);

// Typed view of a frame. Fields absent from the frame keep their defaults;
// fields present with the wrong type or out of range throw ProtocolError.
Message decode(std::string_view text);
Message decode(const boost::json::object& frame);

// Serializes only the fields that belong to `msg.type`.
std::string encode(const Message& msg);

// Shorthand for the data-carrying frames (input, output, error, exit).
std::string make_frame(MessageType type, std::string_view session, std::string_view data);
std::string make_session_frame(MessageType type, std::string_view session);

// Router helpers: frames are forwarded verbatim apart from the session tag.
std::string stamp_session(boost::json::object frame, std::string_view session);
std::string strip_session(boost::json::object frame);

// Session id carried by a parsed frame, or empty.
std::string session_of(const boost::json::object& frame);

} // namespace termrelay::protocol
