/// @file config_manager.cpp
/// @brief YAML loading and key flattening.

#include "dad/foundation/config_manager.hpp"

#include <string>
#include <utility>

namespace dad::foundation {

namespace {

GameResult<void> loadFailure(std::string what) {
    return GameResult<void>::err(GameError(ErrorCode::ConfigLoadFailed, std::move(what)));
}

} // namespace

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return loadFailure("cannot open " + path.string());
    } catch (const YAML::ParserException& e) {
        return loadFailure(path.string() + ": " + e.what());
    }
    replaceWith(root);
    return GameResult<void>::ok();
}

GameResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return loadFailure(std::string("malformed YAML: ") + e.what());
    }
    replaceWith(root);
    return GameResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.find(std::string(key)) != entries_.end();
}

void ConfigManager::replaceWith(const YAML::Node& root) {
    std::lock_guard lock(mutex_);
    entries_.clear();
    flatten({}, root);
}

void ConfigManager::flatten(const std::string& path, const YAML::Node& node) {
    if (!node.IsMap()) {
        // Scalars and sequences are leaves; a bare document has no key.
        if (!path.empty()) {
            entries_.insert_or_assign(path, YAML::Clone(node));
        }
        return;
    }
    for (const auto& child : node) {
        const auto name = child.first.as<std::string>();
        flatten(path.empty() ? name : path + '.' + name, child.second);
    }
}

} // namespace dad::foundation
