#pragma once

/// @file collaborators.hpp
/// @brief Interfaces the combat core calls out through.
///
/// Rendering, targeting, persistence and player notification live outside
/// the core. Each is reached through one of the abstract classes below so the
/// host game (or a test) supplies the implementation.

#include <optional>
#include <string>
#include <string_view>

#include "arc/foundation/types.hpp"
#include "arc/game/math_types.hpp"
#include "arc/game/status_effect_types.hpp"

namespace arc::game {

struct SkillInstance;

/// Owner of every visual effect. The core only holds handles.
class IRenderingCollaborator {
public:
    virtual ~IRenderingCollaborator() = default;

    /// Spawn the visual for a live skill cast.
    virtual foundation::EffectHandle CreateVisualEffect(const SkillInstance& instance,
                                                        const Vector3& position,
                                                        const Vector3& direction) = 0;

    /// Release a handle. Called before the core forgets it.
    virtual void DisposeVisualEffect(foundation::EffectHandle handle) = 0;

    virtual void UpdateVisualEffect(foundation::EffectHandle handle, float deltaTime) = 0;

    /// Spawn the visual for a status effect. Hosts without status visuals
    /// keep the default.
    virtual std::optional<foundation::EffectHandle> CreateStatusVisual(StatusKind /*kind*/,
                                                                       float /*duration*/) {
        return std::nullopt;
    }
};

/// Spatial queries against the host's enemy set.
class ITargetingCollaborator {
public:
    virtual ~ITargetingCollaborator() = default;

    /// Nearest live target within maxRange of position.
    [[nodiscard]] virtual std::optional<foundation::TargetHandle> FindNearestTarget(
        const Vector3& position, float maxRange) const = 0;

    [[nodiscard]] virtual Vector3 GetPosition(foundation::TargetHandle target) const = 0;

    [[nodiscard]] virtual bool IsDead(foundation::TargetHandle target) const = 0;
};

/// Opaque key-value store holding JSON text.
class IPersistenceCollaborator {
public:
    virtual ~IPersistenceCollaborator() = default;

    /// @return The stored text, or std::nullopt when the key is absent.
    [[nodiscard]] virtual std::optional<std::string> Load(std::string_view key) const = 0;

    virtual void Save(std::string_view key, const std::string& json) = 0;
};

/// Fire-and-forget messages shown to the player.
class INotificationCollaborator {
public:
    virtual ~INotificationCollaborator() = default;

    virtual void Notify(std::string_view message) = 0;
};

} // namespace arc::game
