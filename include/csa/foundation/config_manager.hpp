#pragma once

/// @file config_manager.hpp
/// @brief YAML-backed configuration with dotted-key typed access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "csa/foundation/auth_result.hpp"

namespace csa::foundation {

/// YAML configuration manager providing typed access to config values.
///
/// The YAML tree is flattened into a key-value map on load so that
/// lookups use dotted keys ("auth.work_factor") and never touch yaml-cpp's
/// reference-semantic nodes after loading.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any earlier load.
    /// @return Success or ConfigLoadFailed.
    AuthResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    AuthResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch.
    template <typename T>
    AuthResult<T> get(std::string_view key) const;

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    AuthResult<void> loadRoot(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
AuthResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return AuthResult<T>::err(
            AuthError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key)));
    }
    try {
        return AuthResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return AuthResult<T>::err(
            AuthError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key)));
    }
}

} // namespace csa::foundation
