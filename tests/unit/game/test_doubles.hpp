#pragma once

/// @file test_doubles.hpp
/// @brief In-memory collaborators and scripted randomness for game tests.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "arc/game/collaborators.hpp"
#include "arc/game/random_source.hpp"
#include "arc/game/skill_types.hpp"

namespace arc::test {

using arc::foundation::EffectHandle;
using arc::foundation::TargetHandle;
using arc::game::Vector3;

/// Enemies at fixed positions.
class FakeTargeting : public game::ITargetingCollaborator {
public:
    TargetHandle Add(const Vector3& position) {
        TargetHandle handle(nextId_++);
        targets_[handle.value()] = {position, false};
        return handle;
    }

    void Kill(TargetHandle handle) { targets_[handle.value()].dead = true; }

    std::optional<TargetHandle> FindNearestTarget(const Vector3& position,
                                                  float maxRange) const override {
        std::optional<TargetHandle> best;
        float bestDistance = maxRange;
        for (const auto& [id, target] : targets_) {
            if (target.dead) {
                continue;
            }
            float distance = position.DistanceTo(target.position);
            if (distance <= bestDistance) {
                bestDistance = distance;
                best = TargetHandle(id);
            }
        }
        return best;
    }

    Vector3 GetPosition(TargetHandle target) const override {
        auto it = targets_.find(target.value());
        return it != targets_.end() ? it->second.position : Vector3::Zero();
    }

    bool IsDead(TargetHandle target) const override {
        auto it = targets_.find(target.value());
        return it == targets_.end() || it->second.dead;
    }

private:
    struct Target {
        Vector3 position;
        bool dead = false;
    };

    std::map<uint64_t, Target> targets_;
    uint64_t nextId_ = 1;
};

/// Records every handle it hands out and every disposal.
class FakeRendering : public game::IRenderingCollaborator {
public:
    EffectHandle CreateVisualEffect(const game::SkillInstance& /*instance*/,
                                    const Vector3& /*position*/,
                                    const Vector3& /*direction*/) override {
        EffectHandle handle(nextId_++);
        live.push_back(handle);
        return handle;
    }

    void DisposeVisualEffect(EffectHandle handle) override {
        disposed.push_back(handle);
        std::erase(live, handle);
    }

    void UpdateVisualEffect(EffectHandle /*handle*/, float /*deltaTime*/) override {
        ++updates;
    }

    std::optional<EffectHandle> CreateStatusVisual(game::StatusKind /*kind*/,
                                                   float /*duration*/) override {
        EffectHandle handle(nextId_++);
        live.push_back(handle);
        return handle;
    }

    std::vector<EffectHandle> live;
    std::vector<EffectHandle> disposed;
    std::size_t updates = 0;

private:
    uint64_t nextId_ = 1;
};

class MemoryPersistence : public game::IPersistenceCollaborator {
public:
    std::optional<std::string> Load(std::string_view key) const override {
        auto it = store.find(std::string(key));
        if (it == store.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void Save(std::string_view key, const std::string& json) override {
        store[std::string(key)] = json;
    }

    std::map<std::string, std::string> store;
};

class RecordingNotifier : public game::INotificationCollaborator {
public:
    void Notify(std::string_view message) override { messages.emplace_back(message); }

    std::vector<std::string> messages;
};

/// Always returns the same value.
inline game::RandomSource fixedRandom(float value) {
    return [value] { return value; };
}

/// Returns the scripted values in order, then repeats the last one.
inline game::RandomSource scriptedRandom(std::vector<float> values) {
    auto state = std::make_shared<std::pair<std::vector<float>, std::size_t>>(
        std::move(values), 0);
    return [state] {
        auto& [seq, index] = *state;
        if (seq.empty()) {
            return 0.0f;
        }
        float v = seq[std::min(index, seq.size() - 1)];
        ++index;
        return v;
    };
}

} // namespace arc::test
