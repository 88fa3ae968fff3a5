#ifndef CTXBRIDGE_CLIENT_TRANSPORT_HPP
#define CTXBRIDGE_CLIENT_TRANSPORT_HPP

// Client socket abstraction used by the connection supervisor.
// The libwebsockets implementation lives in transport/lws_client_transport; tests script their own.

#include <functional>
#include <string>
#include <vector>

namespace client_transport {

class ClientTransport {
public:
    using MessageHandler = std::function<void(const std::string &text)>;
    using CloseHandler = std::function<void()>;

    virtual ~ClientTransport() = default;

    // Probe every port concurrently and adopt the first that accepts; every other probe is closed.
    // Blocks until a socket is adopted, every probe failed, or the probe timeout elapsed.
    // Returns the adopted port, or -1.
    virtual int discover(const std::string &host, const std::vector<int> &ports) = 0;

    // True while the adopted socket is open.
    virtual bool is_open() const = 0;

    // Queue one text frame on the adopted socket. Returns false when no socket is open.
    virtual bool send_text(const std::string &text) = 0;

    // Close the adopted socket and abort a discovery in progress.
    // The close handler still fires for the adopted socket.
    virtual void close() = 0;

    // on_message receives each complete text frame; on_close fires once when the adopted socket closes.
    virtual void set_handlers(MessageHandler on_message, CloseHandler on_close) = 0;
};

} // namespace client_transport

#endif // CTXBRIDGE_CLIENT_TRANSPORT_HPP
