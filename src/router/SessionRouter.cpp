#include "router/SessionRouter.h"

#include "protocol/Message.h"

#include <boost/json/object.hpp>
#include <boost/json/string.hpp>
#include <boost/json/value.hpp>

#include <spdlog/spdlog.h>

namespace termrelay::router {

namespace json = boost::json;
using protocol::MessageType;

namespace {

bool allowed_from_browser(MessageType type) {
    return type == MessageType::Input || type == MessageType::Resize || type == MessageType::SetBaudRate;
}

bool alive(const networking::ChannelPtr& ch) {
    return ch && ch->is_open();
}

void tell_browser(const networking::ChannelPtr& browser, MessageType type, std::string_view data) {
    if (alive(browser)) browser->send(protocol::make_frame(type, {}, data));
}

} // namespace

SessionRouter::SessionRouter(SessionIdGenerator ids)
    : ids_(std::move(ids)) {}

std::string SessionRouter::accept_downstream(networking::ChannelPtr browser) {
    std::string session = ids_.next();
    auto& route = routes_[session];
    route.browser = std::move(browser);

    spdlog::info("Browser {} connected as {}", route.browser->describe(), session);
    if (has_uplink()) {
        announce(session, route);
    } else {
        spdlog::warn("No pool manager connected, session {} pending", session);
    }
    return session;
}

void SessionRouter::downstream_message(const std::string& session, const std::string& text) {
    auto it = routes_.find(session);
    if (it == routes_.end()) {
        spdlog::debug("Frame from closed session {} dropped", session);
        return;
    }
    auto& route = it->second;

    json::object frame;
    try {
        frame = protocol::parse_frame(text);
    } catch (const protocol::ProtocolError& e) {
        spdlog::warn("Bad frame from browser ({}): {}", session, e.what());
        return;
    }

    const json::string& type_name = frame.at("type").as_string();
    const std::string_view type_view(type_name.data(), type_name.size());
    if (!allowed_from_browser(protocol::type_from_string(type_view))) {
        spdlog::warn("Browser ({}) sent disallowed type {}", session, type_view);
        return;
    }

    if (!alive(route.pool)) {
        tell_browser(route.browser, MessageType::Error, "Simulator pool not connected");
        return;
    }
    route.pool->send(protocol::stamp_session(std::move(frame), session));
}

void SessionRouter::downstream_closed(const std::string& session) {
    auto it = routes_.find(session);
    if (it == routes_.end()) return;

    if (alive(it->second.pool)) {
        it->second.pool->send(protocol::make_session_frame(MessageType::CloseSession, session));
    }
    routes_.erase(it);
    spdlog::info("Browser disconnected, closed {} ({} active)", session, routes_.size());
}

void SessionRouter::accept_uplink(networking::ChannelPtr pool) {
    if (alive(uplink_) && uplink_ != pool) {
        spdlog::warn("Pool manager {} replaces {}", pool->describe(), uplink_->describe());
    } else {
        spdlog::info("Pool manager {} connected", pool->describe());
    }
    uplink_ = std::move(pool);
    announce_pending();
}

void SessionRouter::uplink_message(const networking::ChannelPtr& from, const std::string& text) {
    json::object frame;
    try {
        frame = protocol::parse_frame(text);
    } catch (const protocol::ProtocolError& e) {
        spdlog::warn("Bad frame from pool manager: {}", e.what());
        return;
    }

    const std::string session = protocol::session_of(frame);
    if (session.empty()) {
        spdlog::warn("Pool frame without session dropped: {}", text.substr(0, 100));
        return;
    }

    auto it = routes_.find(session);
    if (it == routes_.end()) {
        spdlog::debug("Frame for closed session {} dropped", session);
        return;
    }
    if (it->second.pool != from) {
        spdlog::warn("Pool manager {} sent a frame for {}, which it does not serve", from->describe(), session);
        return;
    }

    if (alive(it->second.browser)) it->second.browser->send(protocol::strip_session(std::move(frame)));
}

void SessionRouter::uplink_closed(const networking::ChannelPtr& pool) {
    std::size_t orphaned = 0;
    for (auto& [session, route] : routes_) {
        if (route.pool != pool) continue;
        route.pool.reset();
        ++orphaned;
        tell_browser(route.browser, MessageType::Error, "Simulator pool connection lost");
    }

    if (uplink_ == pool) {
        uplink_.reset();
        spdlog::warn("Pool manager disconnected, {} session(s) waiting for a new one", orphaned);
    } else {
        spdlog::info("Former pool manager disconnected ({} session(s) orphaned)", orphaned);
        announce_pending();
    }
}

bool SessionRouter::has_uplink() const {
    return alive(uplink_);
}

bool SessionRouter::is_announced(const std::string& session) const {
    auto it = routes_.find(session);
    return it != routes_.end() && it->second.pool != nullptr;
}

void SessionRouter::announce(const std::string& session, Route& route) {
    uplink_->send(protocol::make_session_frame(MessageType::NewSession, session));
    route.pool = uplink_;
    spdlog::debug("Announced {} to {}", session, uplink_->describe());
}

void SessionRouter::announce_pending() {
    if (!has_uplink()) return;
    for (auto& [session, route] : routes_) {
        if (!route.pool) announce(session, route);
    }
}

} // namespace termrelay::router
