/// @file config_manager.cpp
/// @brief ConfigManager implementation over yaml-cpp.

#include "csa/foundation/config_manager.hpp"

namespace csa::foundation {

AuthResult<void> ConfigManager::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    return loadRoot(root);
}

AuthResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    return loadRoot(root);
}

AuthResult<void> ConfigManager::loadRoot(const YAML::Node& root) {
    if (!root.IsMap() && !root.IsNull()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root.IsMap()) {
        flatten("", root);
    }
    return AuthResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace csa::foundation
