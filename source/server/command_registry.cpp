#include "server/command_registry.hpp"

namespace command_registry {

void CommandRegistry::register_command(const CommandDefinition &definition) {
    definitions_[definition.name] = definition;
}

std::optional<CommandDefinition> CommandRegistry::find(const std::string &command) const {
    auto definition_iterator = definitions_.find(command);
    if (definition_iterator == definitions_.end()) {
        return std::nullopt;
    }
    return definition_iterator->second;
}

std::vector<std::string> CommandRegistry::command_names() const {
    std::vector<std::string> names;
    for (const auto &entry : definitions_) {
        names.push_back(entry.first);
    }
    return names;
}

bool CommandRegistry::is_workspace_wide(const std::string &command) const {
    auto definition_iterator = definitions_.find(command);
    return definition_iterator != definitions_.end() && definition_iterator->second.workspace_wide;
}

} // namespace command_registry
