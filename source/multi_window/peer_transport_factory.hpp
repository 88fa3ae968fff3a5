#ifndef CTXBRIDGE_PEER_TRANSPORT_FACTORY_HPP
#define CTXBRIDGE_PEER_TRANSPORT_FACTORY_HPP

// Creates the sockets a window needs for one election round: a listener to try as primary and a
// client transport to reach an existing primary.

#include <memory>

#include "client/client_transport.hpp"
#include "server/listening_server.hpp"

namespace peer_transport_factory {

class PeerTransportFactory {
public:
    virtual ~PeerTransportFactory() = default;

    virtual std::unique_ptr<listening_server::ListeningServer> create_server() = 0;
    virtual std::unique_ptr<client_transport::ClientTransport> create_client() = 0;
};

} // namespace peer_transport_factory

#endif // CTXBRIDGE_PEER_TRANSPORT_FACTORY_HPP
