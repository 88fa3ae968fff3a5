#ifndef CTXBRIDGE_LISTENING_SERVER_HPP
#define CTXBRIDGE_LISTENING_SERVER_HPP

// Listening half of the peer transport, as driven by the multi-window coordinator.
// The libwebsockets implementation lives in transport/lws_server; tests provide an in-memory one.

#include <functional>
#include <string>
#include <vector>

#include "server/message_sink.hpp"

namespace listening_server {

using message_sink::ConnectionId;

class ListeningServer : public message_sink::MessageSink {
public:
    using ConnectionHandler = std::function<void(ConnectionId connection_id, const std::string &remote_address)>;
    using MessageHandler = std::function<void(ConnectionId connection_id, const std::string &text)>;
    using CloseHandler = std::function<void(ConnectionId connection_id)>;

    // Must be called before start().
    virtual void set_handlers(ConnectionHandler on_open, MessageHandler on_message, CloseHandler on_close) = 0;

    // Bind the first port in ports that accepts a listener on host. Returns the bound port, or -1
    // when every port is taken.
    virtual int start(const std::string &host, const std::vector<int> &ports) = 0;

    // Close every connection and release the port. No handler runs once this returns.
    virtual void stop() = 0;

    virtual int port() const = 0;
};

} // namespace listening_server

#endif // CTXBRIDGE_LISTENING_SERVER_HPP
