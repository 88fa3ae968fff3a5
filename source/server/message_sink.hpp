#ifndef CTXBRIDGE_MESSAGE_SINK_HPP
#define CTXBRIDGE_MESSAGE_SINK_HPP

// Outbound half of the listening server, as seen by the primary hub and push relay.

#include <cstdint>
#include <string>

namespace message_sink {

// Server-assigned id of one accepted connection. Never reused within a process.
using ConnectionId = uint64_t;

class MessageSink {
public:
    virtual ~MessageSink() = default;

    // Queue one text frame for a connection. Returns false when the connection is unknown or gone.
    virtual bool send_text(ConnectionId connection_id, const std::string &text) = 0;
};

} // namespace message_sink

#endif // CTXBRIDGE_MESSAGE_SINK_HPP
