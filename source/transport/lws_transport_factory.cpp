#include "transport/lws_transport_factory.hpp"
#include "transport/lws_client_transport.hpp"
#include "transport/lws_server.hpp"

namespace lws_transport_factory {

LwsTransportFactory::LwsTransportFactory(int connect_timeout_milliseconds, size_t max_message_bytes)
    : connect_timeout_milliseconds_(connect_timeout_milliseconds), max_message_bytes_(max_message_bytes) {}

std::unique_ptr<listening_server::ListeningServer> LwsTransportFactory::create_server() {
    return std::make_unique<lws_server::LwsServer>(max_message_bytes_);
}

std::unique_ptr<client_transport::ClientTransport> LwsTransportFactory::create_client() {
    return std::make_unique<lws_client_transport::LwsClientTransport>(connect_timeout_milliseconds_,
                                                                      max_message_bytes_);
}

LwsTransportFactory factory_from_config(const config::BridgeConfig &config) {
    return LwsTransportFactory(config.probe_timeout_milliseconds, static_cast<size_t>(config.max_message_bytes));
}

} // namespace lws_transport_factory
