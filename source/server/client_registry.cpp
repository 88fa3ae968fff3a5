#include "server/client_registry.hpp"

namespace client_registry {

void ClientRegistry::add(ConnectionId connection_id, const std::string &remote_address, bool is_authenticated) {
    std::lock_guard<std::mutex> lock(mutex_);
    ClientRecord &record = clients_[connection_id];
    record.connection_id = connection_id;
    record.remote_address = remote_address;
    record.is_authenticated = is_authenticated;
}

void ClientRegistry::remove(ConnectionId connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    clients_.erase(connection_id);
}

std::optional<ClientRecord> ClientRegistry::find(ConnectionId connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record_iterator = clients_.find(connection_id);
    if (record_iterator == clients_.end()) {
        return std::nullopt;
    }
    return record_iterator->second;
}

bool ClientRegistry::set_active_target(ConnectionId connection_id, int tab_id, const std::string &llm_host) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record_iterator = clients_.find(connection_id);
    if (record_iterator == clients_.end()) {
        return false;
    }
    record_iterator->second.active_tab_id = tab_id;
    record_iterator->second.active_llm_host = llm_host;
    record_iterator->second.active_target_sequence = next_target_sequence_++;
    return true;
}

bool ClientRegistry::set_window_id(ConnectionId connection_id, const std::string &window_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record_iterator = clients_.find(connection_id);
    if (record_iterator == clients_.end()) {
        return false;
    }
    record_iterator->second.window_id = window_id;
    return true;
}

void ClientRegistry::clear_window_id(ConnectionId connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record_iterator = clients_.find(connection_id);
    if (record_iterator != clients_.end()) {
        record_iterator->second.window_id.reset();
    }
}

size_t ClientRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

std::optional<PushTarget> ClientRegistry::current_target() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ClientRecord *best_record = nullptr;
    for (const auto &entry : clients_) {
        const ClientRecord &record = entry.second;
        if (!record.is_authenticated || !record.active_tab_id) {
            continue;
        }
        if (best_record == nullptr || record.active_target_sequence > best_record->active_target_sequence) {
            best_record = &record;
        }
    }
    if (best_record == nullptr) {
        return std::nullopt;
    }
    PushTarget target;
    target.connection_id = best_record->connection_id;
    target.tab_id = *best_record->active_tab_id;
    target.llm_host = best_record->active_llm_host.value_or("");
    return target;
}

} // namespace client_registry
