/// @file skill_catalog.cpp
/// @brief SkillCatalog implementation and the shipped skill set.

#include "arc/game/skill_catalog.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "arc/foundation/game_logger.hpp"
#include "arc/foundation/numeric_guard.hpp"

namespace arc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::SkillId;

GameError toGameError(CastError error) {
    switch (error) {
        case CastError::OnCooldown:
            return GameError(ErrorCode::SkillOnCooldown, "skill is on cooldown");
        case CastError::InsufficientMana:
            return GameError(ErrorCode::InsufficientMana, "not enough mana");
        case CastError::InvalidSkillId:
            return GameError(ErrorCode::InvalidSkillId, "unknown skill");
        case CastError::NoTargetFound:
            return GameError(ErrorCode::NoTargetFound, "no enemy in range");
        case CastError::CasterDead:
            return GameError(ErrorCode::CharacterDead, "caster is dead");
    }
    return GameError(ErrorCode::Unknown, "unknown cast error");
}

// ── Registration ────────────────────────────────────────────────────────

GameResult<void> SkillCatalog::Register(SkillDefinition definition) {
    if (!definition.id.isValid()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "skill id must be non-zero", definition.name));
    }
    for (float value : {definition.damage, definition.manaCost, definition.cooldown,
                        definition.range, definition.radius, definition.duration,
                        definition.healing}) {
        if (!foundation::isFiniteNumber(value) || value < 0.0f) {
            return GameResult<void>::err(GameError(
                ErrorCode::InvalidArgument,
                "skill has a negative or non-finite value: " + definition.name,
                definition.name));
        }
    }
    if (index_.count(definition.id) != 0 || FindByName(definition.name) != nullptr) {
        return GameResult<void>::err(GameError(
            ErrorCode::DuplicateSkill, "skill already registered: " + definition.name,
            definition.id));
    }

    index_.emplace(definition.id, entries_.size());
    entries_.push_back({std::move(definition), 0.0f});
    return GameResult<void>::ok();
}

const SkillDefinition* SkillCatalog::Find(SkillId id) const {
    const auto* entry = entryFor(id);
    return entry != nullptr ? &entry->definition : nullptr;
}

const SkillDefinition* SkillCatalog::FindByName(std::string_view name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
        return entry.definition.name == name;
    });
    return it != entries_.end() ? &it->definition : nullptr;
}

// ── Cooldowns ───────────────────────────────────────────────────────────

float SkillCatalog::CooldownRemaining(SkillId id) const {
    const auto* entry = entryFor(id);
    return entry != nullptr ? entry->cooldownRemaining : 0.0f;
}

bool SkillCatalog::IsReady(SkillId id) const {
    return CooldownRemaining(id) <= 0.0f;
}

void SkillCatalog::StartCooldown(SkillId id) {
    if (auto* entry = entryFor(id)) {
        entry->cooldownRemaining = entry->definition.cooldown;
    }
}

void SkillCatalog::ResetCooldown(SkillId id) {
    if (auto* entry = entryFor(id)) {
        entry->cooldownRemaining = 0.0f;
    }
}

void SkillCatalog::UpdateCooldowns(float deltaTime) {
    deltaTime = foundation::sanitizeNonNegative(deltaTime, 0.0f, "cooldown delta");
    for (auto& entry : entries_) {
        if (entry.cooldownRemaining > 0.0f) {
            entry.cooldownRemaining = std::max(0.0f, entry.cooldownRemaining - deltaTime);
        }
    }
}

// ── Queries ─────────────────────────────────────────────────────────────

std::vector<const SkillDefinition*> SkillCatalog::ByCategory(SkillCategory category) const {
    std::vector<const SkillDefinition*> result;
    for (const auto& entry : entries_) {
        if (entry.definition.category == category) {
            result.push_back(&entry.definition);
        }
    }
    return result;
}

std::vector<const SkillDefinition*> SkillCatalog::All() const {
    std::vector<const SkillDefinition*> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(&entry.definition);
    }
    return result;
}

SkillCatalog::Entry* SkillCatalog::entryFor(SkillId id) {
    auto it = index_.find(id);
    return it != index_.end() ? &entries_[it->second] : nullptr;
}

const SkillCatalog::Entry* SkillCatalog::entryFor(SkillId id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &entries_[it->second] : nullptr;
}

// ── Default catalog ─────────────────────────────────────────────────────

namespace {

struct SkillStats {
    float damage;
    float manaCost;
    float range;
    float radius;
    float duration;
};

constexpr float kStandardCooldown = 0.2f;

SkillDefinition makeSkill(SkillId id, std::string name, std::string description,
                          SkillType type, SkillCategory category, SkillStats stats,
                          std::string color) {
    SkillDefinition def;
    def.id = id;
    def.name = std::move(name);
    def.description = std::move(description);
    def.type = type;
    def.category = category;
    def.damage = stats.damage;
    def.manaCost = stats.manaCost;
    def.cooldown = kStandardCooldown;
    def.range = stats.range;
    def.radius = stats.radius;
    def.duration = stats.duration;
    def.color = std::move(color);
    return def;
}

} // namespace

SkillCatalog SkillCatalog::DefaultCatalog() {
    namespace ids = skill_ids;
    using C = SkillCategory;
    using T = SkillType;

    std::vector<SkillDefinition> defs;

    // Primary attacks
    defs.push_back(makeSkill(ids::kFistOfThunder, "Fist of Thunder",
                             "Teleport to the nearest enemy and strike them with lightning",
                             T::Teleport, C::Primary, {15, 0, 13, 3, 0.5f}, "#4169e1"));

    auto deadlyReach = makeSkill(ids::kDeadlyReach, "Deadly Reach",
                                 "Extend your reach to strike enemies from a distance",
                                 T::Projectile, C::Primary, {10, 0, 25, 1, 1.5f}, "#4682b4");
    deadlyReach.stationary = true;
    defs.push_back(std::move(deadlyReach));

    // Normal skills
    defs.push_back(makeSkill(ids::kWaveOfLight, "Wave of Light",
                             "Summon a massive bell that crashes down on enemies",
                             T::Wave, C::Normal, {35, 25, 25, 5, 3.0f}, "#ffdd22"));

    auto shield = makeSkill(ids::kShieldOfZen, "Shield of Zen",
                            "Envelop yourself in a golden aura that absorbs damage",
                            T::Buff, C::Normal, {2, 25, 0, 3, 8.0f}, "#ffdd00");
    shield.boost = SkillBoost{StatKind::AttackPower, 0.2f, 8.0f};
    defs.push_back(std::move(shield));

    auto breath = makeSkill(ids::kBreathOfHeaven, "Breath of Heaven",
                            "A healing skill that restores health to the Monk and nearby allies",
                            T::Heal, C::Normal, {5, 25, 0, 8, 5.0f}, "#ffdd99");
    breath.healing = 15.0f;
    breath.boost = SkillBoost{StatKind::MovementSpeed, 0.4f, 5.0f};
    defs.push_back(std::move(breath));

    defs.push_back(makeSkill(ids::kWaveStrike, "Wave Strike",
                             "Send a wave of energy towards enemies",
                             T::Ranged, C::Normal, {25, 20, 25, 3, 3.5f}, "#00ffff"));

    // Lifetime grows with the vortex radius.
    defs.push_back(makeSkill(ids::kCycloneStrike, "Cyclone Strike",
                             "Generate a vortex of wind that pulls in enemies and deals damage",
                             T::Aoe, C::Normal, {30, 35, 0, 4, 1.5f + std::log(4.0f)},
                             "#ffcc00"));

    auto sevenSided = makeSkill(ids::kSevenSidedStrike, "Seven-Sided Strike",
                                "Rapidly attack multiple enemies",
                                T::Multi, C::Normal, {40, 35, 0, 5, 2.5f}, "#ff0000");
    sevenSided.hits = 7;
    defs.push_back(std::move(sevenSided));

    auto sanctuary = makeSkill(ids::kInnerSanctuary, "Inner Sanctuary",
                               "Create a protective zone that reduces damage",
                               T::Buff, C::Normal, {5, 25, 0, 5, 10.0f}, "#ffffff");
    sanctuary.boost = SkillBoost{StatKind::AttackPower, 0.2f, 10.0f};
    defs.push_back(std::move(sanctuary));

    auto allies = makeSkill(ids::kMysticAllies, "Mystic Allies",
                            "Summon spirit allies to fight alongside you",
                            T::Summon, C::Normal, {30, 40, 0, 10, 8.0f}, "#00ffff");
    allies.allyCount = 2;
    defs.push_back(std::move(allies));

    defs.push_back(makeSkill(ids::kExplodingPalm, "Exploding Palm",
                             "Mark an enemy for death; it explodes when it dies",
                             T::Mark, C::Normal, {45, 45, 30, 3, 3.0f}, "#ff3333"));

    auto dragon = makeSkill(ids::kFlyingDragon, "Flying Dragon",
                            "Launch into the air, striking enemies with a flurry of kicks",
                            T::Dash, C::Normal, {100, 60, 30, 5, 3.0f}, "#66ff66");
    dragon.hits = 5;
    defs.push_back(std::move(dragon));

    defs.push_back(makeSkill(ids::kFlyingKick, "Flying Kick",
                             "A swift kick that propels the Monk forward",
                             T::Dash, C::Normal, {30, 25, 30, 2, 5.0f}, "#ff9933"));

    // Lock time plus travel time over the range at 30 units/s.
    defs.push_back(makeSkill(ids::kImprisonedFists, "Imprisoned Fists",
                             "A strike that locks enemies in place",
                             T::Control, C::Normal, {15, 30, 10, 5, 5.0f + 10.0f / 30.0f},
                             "#00ffff"));

    // Custom skills
    defs.push_back(makeSkill(ids::kBulPalm, "Bul Palm",
                             "Giant palm moving, damaging all enemies on the path",
                             T::Projectile, C::Custom, {200, 50, 40, 3, 5.0f}, "#1e90ff"));

    auto bulBreath = makeSkill(ids::kBulBreathOfHeaven, "Bul Breath Of Heaven",
                               "Breath of Heaven with a much stronger speed boost",
                               T::Buff, C::Custom, {5, 35, 0, 5, 5.0f}, "#33ff00");
    bulBreath.healing = 20.0f;
    bulBreath.boost = SkillBoost{StatKind::MovementSpeed, 0.6f, 5.0f};
    defs.push_back(std::move(bulBreath));

    auto clones = makeSkill(ids::kBulShadowClone, "Bul Shadow Clone",
                            "Shadow clones that seek out enemies and absorb damage",
                            T::Summon, C::Custom, {25, 45, 0, 5, 20.0f}, "#2f4f4f");
    clones.allyCount = 5;
    defs.push_back(std::move(clones));

    SkillCatalog catalog;
    for (auto& def : defs) {
        auto registered = catalog.Register(std::move(def));
        if (!registered) {
            ARC_LOG_ERROR(LogCategory::Skill,
                          "default skill rejected: " +
                              std::string(registered.error().message()));
        }
    }
    return catalog;
}

} // namespace arc::game
