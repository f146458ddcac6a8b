#include "execution/action_registry.hpp"

#include <algorithm>
#include <stdexcept>

namespace CIP {
namespace Execution {

void ActionRegistry::registerAction(const std::string& name, const std::vector<std::string>& versions,
                                    std::shared_ptr<ActionHandler> handler) {
    if (name.empty() || !handler) {
        throw std::invalid_argument("Action registration needs a name and a handler");
    }
    actions_[name] = Registration{versions, std::move(handler)};
}

ActionHandler* ActionRegistry::find(const ActionReference& reference) const {
    auto it = actions_.find(reference.name);
    if (it == actions_.end()) {
        return nullptr;
    }

    const auto& versions = it->second.versions;
    if (!versions.empty() && std::find(versions.begin(), versions.end(), reference.version) == versions.end()) {
        return nullptr;
    }
    return it->second.handler.get();
}

ActionHandler& ActionRegistry::resolve(const ActionReference& reference) const {
    ActionHandler* handler = find(reference);
    if (handler) {
        return *handler;
    }

    auto it = actions_.find(reference.name);
    if (it == actions_.end()) {
        throw UnknownActionError(reference.toString());
    }

    std::string supported;
    for (const auto& version : it->second.versions) {
        if (!supported.empty()) supported += ", ";
        supported += version;
    }
    throw UnknownActionError(reference.toString() + " (supported versions: " + supported + ")");
}

bool ActionRegistry::hasAction(const std::string& name) const {
    return actions_.find(name) != actions_.end();
}

std::vector<std::string> ActionRegistry::actionNames() const {
    std::vector<std::string> names;
    names.reserve(actions_.size());
    for (const auto& [name, registration] : actions_) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> ActionRegistry::supportedVersions(const std::string& name) const {
    auto it = actions_.find(name);
    return it == actions_.end() ? std::vector<std::string>{} : it->second.versions;
}

} // namespace Execution
} // namespace CIP
