#include "protocol/Message.h"

#include <boost/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>

namespace termrelay::protocol {

namespace json = boost::json;

namespace {

// json::string_view is not std::string_view on every Boost release.
json::string_view as_json(std::string_view s) {
    return json::string_view(s.data(), s.size());
}

struct TypeName {
    MessageType type;
    std::string_view name;
};

constexpr TypeName kTypeNames[] = {
    {MessageType::NewSession, "new_session"},
    {MessageType::CloseSession, "close_session"},
    {MessageType::Input, "input"},
    {MessageType::Resize, "resize"},
    {MessageType::SetBaudRate, "setBaudRate"},
    {MessageType::Output, "output"},
    {MessageType::Error, "error"},
    {MessageType::Exit, "exit"},
};

std::string string_field(const json::object& frame, std::string_view key) {
    const json::value* v = frame.if_contains(as_json(key));
    if (!v || v->is_null()) return {};
    if (!v->is_string()) {
        throw ProtocolError("field '" + std::string(key) + "' must be a string");
    }
    return json::value_to<std::string>(*v);
}

int int_field(const json::object& frame, std::string_view key, int fallback, int min, int max) {
    const json::value* v = frame.if_contains(as_json(key));
    if (!v || v->is_null()) return fallback;
    if (!v->is_number()) {
        throw ProtocolError("field '" + std::string(key) + "' must be a number");
    }

    std::int64_t n = 0;
    if (v->is_double()) {
        const double d = v->get_double();
        if (!std::isfinite(d) || d < min || d > max) {
            throw ProtocolError("field '" + std::string(key) + "' out of range");
        }
        if (d != std::trunc(d)) {
            throw ProtocolError("field '" + std::string(key) + "' must be an integer");
        }
        n = static_cast<std::int64_t>(d);
    } else {
        json::error_code ec;
        n = v->to_number<std::int64_t>(ec);
        if (ec) throw ProtocolError("field '" + std::string(key) + "' out of range");
    }

    if (n < min || n > max) {
        throw ProtocolError("field '" + std::string(key) + "' out of range: " + std::to_string(n));
    }
    return static_cast<int>(n);
}

} // namespace

std::string_view to_string(MessageType type) noexcept {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

MessageType type_from_string(std::string_view name) noexcept {
    for (const auto& entry : kTypeNames) {
        if (entry.name == name) return entry.type;
    }
    return MessageType::Unknown;
}

json::object parse_frame(std::string_view text) {
    json::error_code ec;
    json::value v = json::parse(as_json(text), ec);
    if (ec) throw ProtocolError("invalid json: " + ec.message());

    auto* obj = v.if_object();
    if (!obj) throw ProtocolError("frame is not a json object");

    const json::value* type = obj->if_contains("type");
    if (!type || !type->is_string()) throw ProtocolError("missing type");

    return std::move(*obj);
}

Message decode(std::string_view text) {
    return decode(parse_frame(text));
}

Message decode(const json::object& frame) {
    Message msg;
    msg.type_name = string_field(frame, "type");
    msg.type = type_from_string(msg.type_name);
    msg.session = string_field(frame, "session");

    switch (msg.type) {
        case MessageType::Input:
        case MessageType::Output:
        case MessageType::Error:
        case MessageType::Exit:
            msg.data = string_field(frame, "data");
            break;
        case MessageType::Resize:
            msg.cols = int_field(frame, "cols", Message::kDefaultCols, 1, std::numeric_limits<std::uint16_t>::max());
            msg.rows = int_field(frame, "rows", Message::kDefaultRows, 1, std::numeric_limits<std::uint16_t>::max());
            break;
        case MessageType::SetBaudRate:
            msg.baud_rate = int_field(frame, "baudRate", Message::kDefaultBaudRate, 1, std::numeric_limits<int>::max());
            break;
        default:
            break;
    }
    return msg;
}

std::string encode(const Message& msg) {
    json::object obj;
    obj["type"] = as_json(msg.type == MessageType::Unknown ? std::string_view(msg.type_name) : to_string(msg.type));
    if (!msg.session.empty()) obj["session"] = msg.session;

    switch (msg.type) {
        case MessageType::Input:
        case MessageType::Output:
        case MessageType::Error:
        case MessageType::Exit:
            obj["data"] = msg.data;
            break;
        case MessageType::Resize:
            obj["cols"] = msg.cols;
            obj["rows"] = msg.rows;
            break;
        case MessageType::SetBaudRate:
            obj["baudRate"] = msg.baud_rate;
            break;
        default:
            break;
    }
    return json::serialize(obj);
}

std::string make_frame(MessageType type, std::string_view session, std::string_view data) {
    Message msg;
    msg.type = type;
    msg.session = std::string(session);
    msg.data = std::string(data);
    return encode(msg);
}

std::string make_session_frame(MessageType type, std::string_view session) {
    Message msg;
    msg.type = type;
    msg.session = std::string(session);
    return encode(msg);
}

std::string stamp_session(json::object frame, std::string_view session) {
    frame["session"] = as_json(session);
    return json::serialize(frame);
}

std::string strip_session(json::object frame) {
    frame.erase("session");
    return json::serialize(frame);
}

std::string session_of(const json::object& frame) {
    const json::value* v = frame.if_contains("session");
    if (!v || !v->is_string()) return {};
    return json::value_to<std::string>(*v);
}

} // namespace termrelay::protocol
