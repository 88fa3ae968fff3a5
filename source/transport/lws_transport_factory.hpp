#ifndef CTXBRIDGE_LWS_TRANSPORT_FACTORY_HPP
#define CTXBRIDGE_LWS_TRANSPORT_FACTORY_HPP

// libwebsockets-backed peer transports, one lws_context per created object.

#include <cstddef>
#include <memory>

#include "config/bridge_config.hpp"
#include "multi_window/peer_transport_factory.hpp"

namespace lws_transport_factory {

class LwsTransportFactory : public peer_transport_factory::PeerTransportFactory {
public:
    LwsTransportFactory(int connect_timeout_milliseconds, size_t max_message_bytes);

    std::unique_ptr<listening_server::ListeningServer> create_server() override;
    std::unique_ptr<client_transport::ClientTransport> create_client() override;

private:
    int connect_timeout_milliseconds_;
    size_t max_message_bytes_;
};

// Timeout and message cap taken from config.
LwsTransportFactory factory_from_config(const config::BridgeConfig &config);

} // namespace lws_transport_factory

#endif // CTXBRIDGE_LWS_TRANSPORT_FACTORY_HPP
