#ifndef CTXBRIDGE_CLIENT_REGISTRY_HPP
#define CTXBRIDGE_CLIENT_REGISTRY_HPP

// Table of connections accepted by the primary, and which browser tab is the active push target.
// All access goes through one mutex; callers get copies, never references into the table.

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "server/message_sink.hpp"

namespace client_registry {

using message_sink::ConnectionId;

struct ClientRecord {
    ConnectionId connection_id = 0;
    bool is_authenticated = false;
    std::string remote_address;
    std::optional<int> active_tab_id;
    std::optional<std::string> active_llm_host;
    // Set once the connection registered as a secondary window.
    std::optional<std::string> window_id;
    // Increases with every register_active_target; the highest value is the current target.
    uint64_t active_target_sequence = 0;
};

// Where a snippet push should go.
struct PushTarget {
    ConnectionId connection_id = 0;
    int tab_id = -1;
    std::string llm_host;
};

// Collaborator consumed by the push relay.
class ActiveTabRegistry {
public:
    virtual ~ActiveTabRegistry() = default;
    virtual std::optional<PushTarget> current_target() const = 0;
};

class ClientRegistry : public ActiveTabRegistry {
public:
    void add(ConnectionId connection_id, const std::string &remote_address, bool is_authenticated);
    void remove(ConnectionId connection_id);
    std::optional<ClientRecord> find(ConnectionId connection_id) const;

    // Mark connection_id as the most recently registered active tab. False if the connection is unknown.
    bool set_active_target(ConnectionId connection_id, int tab_id, const std::string &llm_host);
    bool set_window_id(ConnectionId connection_id, const std::string &window_id);
    // The connection counts as a browser again.
    void clear_window_id(ConnectionId connection_id);

    size_t size() const;

    std::optional<PushTarget> current_target() const override;

private:
    mutable std::mutex mutex_;
    std::map<ConnectionId, ClientRecord> clients_;
    uint64_t next_target_sequence_ = 1;
};

} // namespace client_registry

#endif // CTXBRIDGE_CLIENT_REGISTRY_HPP
