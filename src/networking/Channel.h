#pragma once

#include <memory>
#include <string>

namespace termrelay::networking {

// A message-oriented link to one peer. Browser sockets, pool uplinks and
// bridge sockets are all different concrete types behind this interface.
class Channel {
public:
    virtual ~Channel() = default;

    // Queues one text frame. Frames sent on a closed channel are dropped.
    virtual void send(const std::string& frame) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // Short peer description for log lines.
    virtual std::string describe() const = 0;
};

using ChannelPtr = std::shared_ptr<Channel>;

} // namespace termrelay::networking
