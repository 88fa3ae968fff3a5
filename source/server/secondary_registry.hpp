#ifndef CTXBRIDGE_SECONDARY_REGISTRY_HPP
#define CTXBRIDGE_SECONDARY_REGISTRY_HPP

// Secondary windows registered with the primary, keyed by windowId.

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "server/message_sink.hpp"

namespace secondary_registry {

using message_sink::ConnectionId;

struct SecondaryRegistration {
    std::string window_id;
    // Secondaries do not listen; kept for the wire shape and reported as received.
    int listening_port = 0;
    ConnectionId connection_id = 0;
};

enum class UpsertOutcome {
    Added,
    Replaced,
    LimitReached
};

enum class RemoveOutcome {
    Removed,
    NotRegistered,
    // Registered, but over a different connection.
    NotOwner
};

class SecondaryRegistry {
public:
    explicit SecondaryRegistry(size_t max_secondaries);

    // Insert or replace the registration for registration.window_id. Replacing never counts
    // against the limit.
    UpsertOutcome upsert(const SecondaryRegistration &registration);

    // Remove window_id only when it was registered over connection_id.
    RemoveOutcome remove_owned(const std::string &window_id, ConnectionId connection_id);

    // Remove every registration made over connection_id. Returns the removed window ids.
    std::vector<std::string> remove_by_connection(ConnectionId connection_id);

    std::optional<SecondaryRegistration> find(const std::string &window_id) const;
    std::vector<SecondaryRegistration> snapshot() const;
    size_t size() const;

private:
    size_t max_secondaries_;
    mutable std::mutex mutex_;
    std::map<std::string, SecondaryRegistration> registrations_;
};

} // namespace secondary_registry

#endif // CTXBRIDGE_SECONDARY_REGISTRY_HPP
