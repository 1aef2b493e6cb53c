#pragma once

/// @file config_manager.hpp
/// @brief YAML configuration with dotted-key typed access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "dad/foundation/game_result.hpp"

namespace dad::foundation {

/// YAML configuration flattened into dotted keys.
///
/// A document such as
/// @code
///   units:
///     acolyte:
///       cost: 40
/// @endcode
/// is exposed as the key "units.acolyte.cost".  The tree is flattened on
/// load so lookups never walk yaml-cpp's reference-semantic nodes.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load from a YAML file, replacing any previous content.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load from an in-memory YAML document, replacing any previous content.
    GameResult<void> loadFromString(std::string_view yaml);

    /// Typed lookup.  Fails with ConfigKeyNotFound or ConfigTypeMismatch.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    void replaceWith(const YAML::Node& root);
    void flatten(const std::string& path, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    const std::string name(key);
    std::lock_guard lock(mutex_);
    const auto found = entries_.find(name);
    if (found == entries_.end()) {
        return GameResult<T>::err(GameError(ErrorCode::ConfigKeyNotFound, "missing key " + name));
    }
    try {
        return GameResult<T>::ok(found->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(GameError(
            ErrorCode::ConfigTypeMismatch, name + " = '" + YAML::Dump(found->second) +
                                               "' has the wrong type"));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    YAML::Node node(value);
    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(std::string(key), node);
}

} // namespace dad::foundation
