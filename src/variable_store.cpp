#include "variable_store.hpp"

#include "operator_aliases.hpp"
#include "text_utils.hpp"

namespace linecalc {

VariableStore::VariableStore() {
    std::lock_guard<std::mutex> lock(mutex);
    seedOperators();
}

void VariableStore::seedOperators() {
    for (const auto& entry : operatorAliases()) {
        entries[entry.canonical] = {entry.canonical, VariableOrigin::Operator};
        for (const auto& alias : entry.aliases) {
            entries[alias] = {entry.canonical, VariableOrigin::Operator};
        }
    }
}

bool VariableStore::define(const std::string& name, const std::string& value) {
    if (!isValidIdentifier(name)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    entries[toLower(name)] = {value, VariableOrigin::User};
    return true;
}

std::optional<std::string> VariableStore::lookup(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(toLower(name));
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

void VariableStore::resetUserVariables() {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->second.origin == VariableOrigin::User) {
            it = entries.erase(it);
        } else {
            ++it;
        }
    }
    // Возвращаем синонимы, которые пользователь перекрыл своими значениями
    seedOperators();
}

bool VariableStore::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.count(toLower(name)) > 0;
}

std::size_t VariableStore::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}

std::optional<VariableOrigin> VariableStore::originOf(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(toLower(name));
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second.origin;
}

} // namespace linecalc
