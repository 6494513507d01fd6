#pragma once

/// @file types.hpp
/// @brief Strong ID types shared across the combat core.

#include <cstdint>
#include <functional>

namespace arc::foundation {

/// Tag-based strong typedef for ID values.
///
/// Keeps skill ids, item ids and collaborator handles from being mixed up at
/// compile time while sharing one integral representation. Zero is the null
/// value for every ID type.
///
/// @tparam Tag Unique tag type.
/// @tparam T   Underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct CharacterIdTag {};
struct SkillIdTag {};
struct SkillInstanceIdTag {};
struct ItemIdTag {};
struct TargetHandleTag {};
struct EffectHandleTag {};

/// Identifies one character (player or enemy) in log context.
using CharacterId = StrongId<CharacterIdTag>;

/// Stable catalog key of a skill definition.
using SkillId = StrongId<SkillIdTag, uint32_t>;

/// Identifies one live cast of a skill.
using SkillInstanceId = StrongId<SkillInstanceIdTag>;

/// Identifies one item definition.
using ItemId = StrongId<ItemIdTag, uint32_t>;

/// Opaque handle to a target owned by the targeting collaborator.
using TargetHandle = StrongId<TargetHandleTag>;

/// Opaque handle to a visual effect owned by the rendering collaborator.
using EffectHandle = StrongId<EffectHandleTag>;

} // namespace arc::foundation

template <typename Tag, typename T>
struct std::hash<arc::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const arc::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
