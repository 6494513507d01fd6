#include "arc/foundation/config_manager.hpp"

#include <algorithm>
#include <string>

#include "arc/foundation/game_logger.hpp"

namespace arc::foundation {

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        auto root = YAML::LoadFile(path.string());
        auto result = loadNode(root);
        if (result) {
            ARC_LOG_INFO(LogCategory::Config, "loaded config " + path.string());
        }
        return result;
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GameResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        return loadNode(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GameResult<void> ConfigManager::loadNode(const YAML::Node& root) {
    if (root.IsDefined() && !root.IsNull() && !root.IsMap()) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root.IsMap()) {
        flatten("", root);
    }
    return GameResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childrenOf(std::string_view prefix) const {
    std::lock_guard lock(mutex_);
    std::string lead = std::string(prefix) + ".";
    std::vector<std::string> names;
    for (const auto& [key, node] : entries_) {
        if (key.rfind(lead, 0) != 0) {
            continue;
        }
        auto rest = key.substr(lead.size());
        auto name = rest.substr(0, rest.find('.'));
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(std::move(name));
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::size_t ConfigManager::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Scalars, sequences and nulls are leaves.
        entries_[prefix] = YAML::Clone(node);
    }
}

} // namespace arc::foundation
