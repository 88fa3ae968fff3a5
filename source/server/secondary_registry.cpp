#include "server/secondary_registry.hpp"

namespace secondary_registry {

SecondaryRegistry::SecondaryRegistry(size_t max_secondaries) : max_secondaries_(max_secondaries) {}

UpsertOutcome SecondaryRegistry::upsert(const SecondaryRegistration &registration) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto registration_iterator = registrations_.find(registration.window_id);
    if (registration_iterator != registrations_.end()) {
        registration_iterator->second = registration;
        return UpsertOutcome::Replaced;
    }
    if (registrations_.size() >= max_secondaries_) {
        return UpsertOutcome::LimitReached;
    }
    registrations_[registration.window_id] = registration;
    return UpsertOutcome::Added;
}

RemoveOutcome SecondaryRegistry::remove_owned(const std::string &window_id, ConnectionId connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto registration_iterator = registrations_.find(window_id);
    if (registration_iterator == registrations_.end()) {
        return RemoveOutcome::NotRegistered;
    }
    if (registration_iterator->second.connection_id != connection_id) {
        return RemoveOutcome::NotOwner;
    }
    registrations_.erase(registration_iterator);
    return RemoveOutcome::Removed;
}

std::vector<std::string> SecondaryRegistry::remove_by_connection(ConnectionId connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> removed_windows;
    for (auto registration_iterator = registrations_.begin(); registration_iterator != registrations_.end();) {
        if (registration_iterator->second.connection_id == connection_id) {
            removed_windows.push_back(registration_iterator->first);
            registration_iterator = registrations_.erase(registration_iterator);
        } else {
            ++registration_iterator;
        }
    }
    return removed_windows;
}

std::optional<SecondaryRegistration> SecondaryRegistry::find(const std::string &window_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto registration_iterator = registrations_.find(window_id);
    if (registration_iterator == registrations_.end()) {
        return std::nullopt;
    }
    return registration_iterator->second;
}

std::vector<SecondaryRegistration> SecondaryRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SecondaryRegistration> registrations;
    for (const auto &entry : registrations_) {
        registrations.push_back(entry.second);
    }
    return registrations;
}

size_t SecondaryRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.size();
}

} // namespace secondary_registry
