#pragma once

#include "networking/Channel.h"
#include "router/SessionIdGenerator.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace termrelay::router {

// Routing table between browser sockets and the pool manager. Browsers
// never see session ids: frames going up are stamped, frames coming down
// are stripped.
class SessionRouter {
public:
    explicit SessionRouter(SessionIdGenerator ids = {});

    // New browser. Announced to the pool right away when one is connected,
    // otherwise held pending until a pool arrives. Returns the session id.
    std::string accept_downstream(networking::ChannelPtr browser);
    void downstream_message(const std::string& session, const std::string& text);
    void downstream_closed(const std::string& session);

    // A pool manager connected. It replaces any previous one for new
    // sessions and picks up every pending session.
    void accept_uplink(networking::ChannelPtr pool);
    void uplink_message(const networking::ChannelPtr& from, const std::string& text);
    void uplink_closed(const networking::ChannelPtr& pool);

    bool has_uplink() const;
    std::size_t session_count() const noexcept { return routes_.size(); }
    bool has_session(const std::string& session) const { return routes_.count(session) != 0; }
    bool is_announced(const std::string& session) const;

private:
    struct Route {
        networking::ChannelPtr browser;
        networking::ChannelPtr pool;  // null while pending
    };

    void announce(const std::string& session, Route& route);
    void announce_pending();

    SessionIdGenerator ids_;
    std::unordered_map<std::string, Route> routes_;
    networking::ChannelPtr uplink_;
};

} // namespace termrelay::router
