#pragma once

/// @file progression_store.hpp
/// @brief PlayerProgressionStore: battle-skill selection, skill-tree choices
///        and progression settings, saved through the persistence
///        collaborator.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "arc/foundation/game_result.hpp"
#include "arc/foundation/game_serializer.hpp"
#include "arc/foundation/types.hpp"
#include "arc/game/balance_config.hpp"
#include "arc/game/collaborators.hpp"
#include "arc/game/skill_catalog.hpp"
#include "arc/game/stat_block.hpp"

namespace arc::game {

// ── Persisted records ──────────────────────────────────────────────────────

/// Selected battle skills, by name.
struct SkillLoadoutRecord {
    std::vector<std::string> skills;
};

/// Skill-tree selections. Entries are stored as parallel lists: the i-th
/// variant belongs to the i-th skill, the i-th buff level to the i-th
/// (buffSkill, buffName) pair.
struct SkillTreeRecord {
    std::vector<std::string> skills;
    std::vector<std::string> variants;
    std::vector<std::string> buffSkills;
    std::vector<std::string> buffNames;
    std::vector<int32_t> buffLevels;
};

struct ProgressionSettingsRecord {
    bool customSkillsEnabled = false;
    std::string difficulty = "medium";
    int32_t worldTier = 1;
};

/// Storage keys.
namespace progression_keys {
inline constexpr std::string_view kSelectedSkills = "selected_skills";
inline constexpr std::string_view kSkillTree = "skill_tree_data";
inline constexpr std::string_view kSettings = "progression_settings";
inline constexpr std::string_view kPlayerStats = "player_stats";
} // namespace progression_keys

// ── PlayerProgressionStore ─────────────────────────────────────────────────

/// Per-player progression choices.
///
/// Passed by reference to whatever needs it; nothing here is global. Load()
/// never fails: a missing record leaves the defaults in place and a corrupt
/// one is replaced by defaults with a warning.
///
/// Example:
/// @code
///   PlayerProgressionStore store(catalog, balance, persistence);
///   store.Load();
///   store.SetVariant(skill_ids::kWaveOfLight, "Wall of Light");
///   store.Save();
/// @endcode
class PlayerProgressionStore {
public:
    /// Battle-skill slots filled by default from the normal skills.
    static constexpr std::size_t kDefaultNormalSkillCount = 7;

    PlayerProgressionStore(const SkillCatalog& catalog, const BalanceConfig& balance,
                           IPersistenceCollaborator& persistence);

    /// Read every progression record.
    void Load();

    /// Write every progression record.
    void Save();

    // ── Battle skills ───────────────────────────────────────────────────

    [[nodiscard]] const std::vector<foundation::SkillId>& SelectedSkills() const noexcept {
        return selected_;
    }

    [[nodiscard]] bool IsSelected(foundation::SkillId id) const;

    /// Replace the selection.
    /// @return InvalidSkillId for an unknown id or for a custom skill while
    ///         custom skills are disabled (selection unchanged).
    foundation::GameResult<void> SelectSkills(std::vector<foundation::SkillId> ids);

    /// First seven normal skills plus the first primary attack.
    void ResetSelection();

    // ── Skill tree ──────────────────────────────────────────────────────

    /// Active variant of a skill; empty when none is chosen.
    [[nodiscard]] std::string_view Variant(foundation::SkillId id) const;

    /// Choose a variant. An empty name clears it.
    foundation::GameResult<void> SetVariant(foundation::SkillId id, std::string variant);

    [[nodiscard]] int32_t BuffLevel(foundation::SkillId id, std::string_view buff) const;

    /// Set a buff level. Level 0 removes the buff.
    foundation::GameResult<void> SetBuffLevel(foundation::SkillId id, std::string buff,
                                              int32_t level);

    // ── Settings ────────────────────────────────────────────────────────

    [[nodiscard]] bool CustomSkillsEnabled() const noexcept { return customSkillsEnabled_; }

    /// Toggle custom skills. Disabling removes them from the selection.
    void SetCustomSkillsEnabled(bool enabled);

    [[nodiscard]] Difficulty GetDifficulty() const noexcept { return difficulty_; }
    void SetDifficulty(Difficulty difficulty) noexcept { difficulty_ = difficulty; }

    [[nodiscard]] int32_t WorldTier() const noexcept { return worldTier_; }

    /// Select a world tier.
    /// @return RecordNotFound for a tier not in the balance tables,
    ///         TierLocked for tiers above I before the unlock level.
    foundation::GameResult<void> SetWorldTier(int32_t tier, int32_t playerLevel);

    // ── Character stats ─────────────────────────────────────────────────

    void SaveStats(const StatBlock& stats);
    void SaveStats(const StatSnapshot& snapshot);

    /// Restore stats saved by SaveStats().
    /// @return RecordNotFound when nothing was saved, or the decode error
    ///         (stats untouched).
    foundation::GameResult<void> LoadStats(StatBlock& stats) const;

private:
    struct TreeEntry {
        std::string variant;
        std::map<std::string, int32_t, std::less<>> buffs;
    };

    [[nodiscard]] bool isAllowed(const SkillDefinition& def) const;
    void loadSelection();
    void loadTree();
    void loadSettings();
    void dropDisallowed();

    const SkillCatalog& catalog_;
    const BalanceConfig& balance_;
    IPersistenceCollaborator& persistence_;

    std::vector<foundation::SkillId> selected_;
    std::map<foundation::SkillId, TreeEntry> tree_;
    bool customSkillsEnabled_ = false;
    Difficulty difficulty_ = Difficulty::Medium;
    int32_t worldTier_ = 1;
};

} // namespace arc::game

ARC_SERIALIZABLE(arc::game::SkillLoadoutRecord, 1,
    field("skills", &arc::game::SkillLoadoutRecord::skills)
);

ARC_SERIALIZABLE(arc::game::SkillTreeRecord, 1,
    field("skills", &arc::game::SkillTreeRecord::skills),
    field("variants", &arc::game::SkillTreeRecord::variants),
    field("buffSkills", &arc::game::SkillTreeRecord::buffSkills),
    field("buffNames", &arc::game::SkillTreeRecord::buffNames),
    field("buffLevels", &arc::game::SkillTreeRecord::buffLevels)
);

ARC_SERIALIZABLE(arc::game::ProgressionSettingsRecord, 1,
    field("customSkillsEnabled", &arc::game::ProgressionSettingsRecord::customSkillsEnabled),
    field("difficulty", &arc::game::ProgressionSettingsRecord::difficulty),
    field("worldTier", &arc::game::ProgressionSettingsRecord::worldTier)
);
