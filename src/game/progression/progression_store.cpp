/// @file progression_store.cpp
/// @brief PlayerProgressionStore implementation.

#include "arc/game/progression_store.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::GameSerializer;
using foundation::LogCategory;
using foundation::SkillId;

namespace {

/// Decode a stored record. Missing keys yield nullopt silently; corrupt
/// records yield nullopt with a warning.
template <typename Record>
std::optional<Record> readRecord(const IPersistenceCollaborator& persistence,
                                 std::string_view key) {
    auto raw = persistence.Load(key);
    if (!raw) {
        ARC_LOG_DEBUG(LogCategory::Progression,
                      "no saved " + std::string(key) + ", using defaults");
        return std::nullopt;
    }
    auto decoded = GameSerializer::instance().deserializeJson<Record>(*raw);
    if (decoded.hasError()) {
        ARC_LOG_WARN(LogCategory::Progression,
                     "corrupt " + std::string(key) + " record (" +
                         std::string(decoded.error().message()) + "), using defaults");
        return std::nullopt;
    }
    return std::move(decoded).value();
}

} // namespace

PlayerProgressionStore::PlayerProgressionStore(const SkillCatalog& catalog,
                                               const BalanceConfig& balance,
                                               IPersistenceCollaborator& persistence)
    : catalog_(catalog), balance_(balance), persistence_(persistence) {
    ResetSelection();
}

// ── Load / save ─────────────────────────────────────────────────────────

void PlayerProgressionStore::Load() {
    // Settings first: the custom-skill toggle filters the selection.
    loadSettings();
    loadSelection();
    loadTree();
}

void PlayerProgressionStore::loadSettings() {
    auto record = readRecord<ProgressionSettingsRecord>(persistence_,
                                                        progression_keys::kSettings);
    if (!record) {
        return;
    }

    customSkillsEnabled_ = record->customSkillsEnabled;

    if (auto difficulty = parseDifficulty(record->difficulty)) {
        difficulty_ = *difficulty;
    } else {
        ARC_LOG_WARN(LogCategory::Progression,
                     "unknown difficulty '" + record->difficulty + "', using medium");
        difficulty_ = Difficulty::Medium;
    }

    if (balance_.GetWorldTier(record->worldTier) != nullptr) {
        worldTier_ = record->worldTier;
    } else {
        ARC_LOG_WARN(LogCategory::Progression,
                     "unknown world tier " + std::to_string(record->worldTier) +
                         ", using tier 1");
        worldTier_ = 1;
    }
}

void PlayerProgressionStore::loadSelection() {
    auto record = readRecord<SkillLoadoutRecord>(persistence_,
                                                 progression_keys::kSelectedSkills);
    if (!record) {
        ResetSelection();
        return;
    }

    std::vector<SkillId> ids;
    for (const auto& name : record->skills) {
        const auto* def = catalog_.FindByName(name);
        if (def == nullptr) {
            ARC_LOG_WARN(LogCategory::Progression, "dropping unknown saved skill: " + name);
            continue;
        }
        if (isAllowed(*def) &&
            std::find(ids.begin(), ids.end(), def->id) == ids.end()) {
            ids.push_back(def->id);
        }
    }

    if (ids.empty()) {
        ResetSelection();
    } else {
        selected_ = std::move(ids);
    }
}

void PlayerProgressionStore::loadTree() {
    tree_.clear();

    auto record = readRecord<SkillTreeRecord>(persistence_, progression_keys::kSkillTree);
    if (!record) {
        return;
    }
    if (record->skills.size() != record->variants.size() ||
        record->buffSkills.size() != record->buffNames.size() ||
        record->buffSkills.size() != record->buffLevels.size()) {
        ARC_LOG_WARN(LogCategory::Progression,
                     "skill tree record lists differ in length, using defaults");
        return;
    }

    for (std::size_t i = 0; i < record->skills.size(); ++i) {
        if (const auto* def = catalog_.FindByName(record->skills[i])) {
            tree_[def->id].variant = record->variants[i];
        }
    }
    for (std::size_t i = 0; i < record->buffSkills.size(); ++i) {
        const auto* def = catalog_.FindByName(record->buffSkills[i]);
        if (def != nullptr && record->buffLevels[i] > 0) {
            tree_[def->id].buffs[record->buffNames[i]] = record->buffLevels[i];
        }
    }
}

void PlayerProgressionStore::Save() {
    auto& serializer = GameSerializer::instance();

    SkillLoadoutRecord loadout;
    for (auto id : selected_) {
        if (const auto* def = catalog_.Find(id)) {
            loadout.skills.push_back(def->name);
        }
    }

    SkillTreeRecord tree;
    for (const auto& [id, entry] : tree_) {
        const auto* def = catalog_.Find(id);
        if (def == nullptr) {
            continue;
        }
        if (!entry.variant.empty()) {
            tree.skills.push_back(def->name);
            tree.variants.push_back(entry.variant);
        }
        for (const auto& [buff, level] : entry.buffs) {
            tree.buffSkills.push_back(def->name);
            tree.buffNames.push_back(buff);
            tree.buffLevels.push_back(level);
        }
    }

    ProgressionSettingsRecord settings;
    settings.customSkillsEnabled = customSkillsEnabled_;
    settings.difficulty = std::string(difficultyName(difficulty_));
    settings.worldTier = worldTier_;

    persistence_.Save(progression_keys::kSelectedSkills, serializer.serializeJson(loadout));
    persistence_.Save(progression_keys::kSkillTree, serializer.serializeJson(tree));
    persistence_.Save(progression_keys::kSettings, serializer.serializeJson(settings));
}

// ── Battle skills ───────────────────────────────────────────────────────

bool PlayerProgressionStore::isAllowed(const SkillDefinition& def) const {
    return customSkillsEnabled_ || !def.IsCustom();
}

bool PlayerProgressionStore::IsSelected(SkillId id) const {
    return std::find(selected_.begin(), selected_.end(), id) != selected_.end();
}

GameResult<void> PlayerProgressionStore::SelectSkills(std::vector<SkillId> ids) {
    for (auto id : ids) {
        const auto* def = catalog_.Find(id);
        if (def == nullptr || !isAllowed(*def)) {
            return GameResult<void>::err(GameError(
                ErrorCode::InvalidSkillId,
                "skill cannot be selected: " + std::to_string(id.value())));
        }
    }

    selected_.clear();
    for (auto id : ids) {
        if (!IsSelected(id)) {
            selected_.push_back(id);
        }
    }
    return GameResult<void>::ok();
}

void PlayerProgressionStore::ResetSelection() {
    selected_.clear();

    std::size_t normals = 0;
    for (const auto* def : catalog_.ByCategory(SkillCategory::Normal)) {
        if (normals == kDefaultNormalSkillCount) {
            break;
        }
        selected_.push_back(def->id);
        ++normals;
    }

    auto primaries = catalog_.ByCategory(SkillCategory::Primary);
    if (!primaries.empty()) {
        selected_.push_back(primaries.front()->id);
    }
}

void PlayerProgressionStore::dropDisallowed() {
    std::erase_if(selected_, [this](SkillId id) {
        const auto* def = catalog_.Find(id);
        return def == nullptr || !isAllowed(*def);
    });
    if (selected_.empty()) {
        ResetSelection();
    }
}

// ── Skill tree ──────────────────────────────────────────────────────────

std::string_view PlayerProgressionStore::Variant(SkillId id) const {
    auto it = tree_.find(id);
    return it != tree_.end() ? std::string_view(it->second.variant) : std::string_view();
}

GameResult<void> PlayerProgressionStore::SetVariant(SkillId id, std::string variant) {
    if (catalog_.Find(id) == nullptr) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidSkillId, "unknown skill"));
    }
    tree_[id].variant = std::move(variant);
    return GameResult<void>::ok();
}

int32_t PlayerProgressionStore::BuffLevel(SkillId id, std::string_view buff) const {
    auto it = tree_.find(id);
    if (it == tree_.end()) {
        return 0;
    }
    auto buffIt = it->second.buffs.find(buff);
    return buffIt != it->second.buffs.end() ? buffIt->second : 0;
}

GameResult<void> PlayerProgressionStore::SetBuffLevel(SkillId id, std::string buff,
                                                      int32_t level) {
    if (catalog_.Find(id) == nullptr) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidSkillId, "unknown skill"));
    }
    if (level < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "buff level must not be negative", level));
    }

    auto& buffs = tree_[id].buffs;
    if (level == 0) {
        buffs.erase(buff);
    } else {
        buffs[std::move(buff)] = level;
    }
    return GameResult<void>::ok();
}

// ── Settings ────────────────────────────────────────────────────────────

void PlayerProgressionStore::SetCustomSkillsEnabled(bool enabled) {
    customSkillsEnabled_ = enabled;
    if (!enabled) {
        dropDisallowed();
    }
}

GameResult<void> PlayerProgressionStore::SetWorldTier(int32_t tier, int32_t playerLevel) {
    if (balance_.GetWorldTier(tier) == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::RecordNotFound, "unknown world tier", tier));
    }
    if (tier > 1 && playerLevel < balance_.worldTierUnlockLevel) {
        return GameResult<void>::err(GameError(
            ErrorCode::TierLocked,
            "world tiers above I unlock at level " +
                std::to_string(balance_.worldTierUnlockLevel)));
    }
    worldTier_ = tier;
    ARC_LOG_INFO(LogCategory::Progression, "world tier set to " + std::to_string(tier));
    return GameResult<void>::ok();
}

// ── Character stats ─────────────────────────────────────────────────────

void PlayerProgressionStore::SaveStats(const StatBlock& stats) {
    SaveStats(stats.Snapshot());
}

void PlayerProgressionStore::SaveStats(const StatSnapshot& snapshot) {
    persistence_.Save(progression_keys::kPlayerStats,
                      GameSerializer::instance().serializeJson(snapshot));
}

GameResult<void> PlayerProgressionStore::LoadStats(StatBlock& stats) const {
    auto raw = persistence_.Load(progression_keys::kPlayerStats);
    if (!raw) {
        return GameResult<void>::err(
            GameError(ErrorCode::RecordNotFound, "no saved player stats"));
    }
    auto snapshot = GameSerializer::instance().deserializeJson<StatSnapshot>(*raw);
    if (snapshot.hasError()) {
        ARC_LOG_WARN(LogCategory::Progression,
                     "corrupt player stats: " + std::string(snapshot.error().message()));
        return GameResult<void>::err(snapshot.error());
    }
    stats.Restore(snapshot.value());
    return GameResult<void>::ok();
}

} // namespace arc::game
