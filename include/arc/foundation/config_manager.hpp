#pragma once

/// @file config_manager.hpp
/// @brief YAML configuration with dotted-key typed access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "arc/foundation/game_result.hpp"

namespace arc::foundation {

/// YAML-backed key/value configuration.
///
/// The YAML tree is flattened into dotted keys ("combo.window_seconds"),
/// sequences stay as leaf values and are read with get<std::vector<T>>().
/// Used to overlay balance tables on top of the built-in defaults.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load from a YAML file, replacing any previous content.
    /// @return Success or ConfigLoadFailed.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load from YAML text, replacing any previous content.
    /// @return Success or ConfigLoadFailed.
    GameResult<void> loadFromString(std::string_view yaml);

    /// Typed value for a dotted key.
    /// @return The value, ConfigKeyNotFound or ConfigTypeMismatch.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Distinct child names directly below a prefix, sorted.
    ///
    /// For keys "enemies.skeleton.health" and "enemies.zombie.health",
    /// childrenOf("enemies") yields {"skeleton", "zombie"}.
    [[nodiscard]] std::vector<std::string> childrenOf(std::string_view prefix) const;

    [[nodiscard]] std::size_t size() const;

private:
    GameResult<void> loadNode(const YAML::Node& root);

    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key),
                      std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key),
                      std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace arc::foundation
