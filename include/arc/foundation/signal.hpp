#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> for in-process event dispatch (observer pattern).
///
/// The combat core runs on a single simulation thread, so Signal does no
/// locking. Slots fire in connection order, which keeps notification order
/// deterministic across runs.

#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace arc::foundation {

/// Dispatches an event to every connected slot.
///
/// Example:
/// @code
///   Signal<int32_t> onLevelUp;
///   auto id = onLevelUp.connect([](int32_t level) { ... });
///   onLevelUp.emit(2);
///   onLevelUp.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) noexcept = default;
    Signal& operator=(Signal&&) noexcept = default;

    /// Register a slot. The returned id is only meaningful for disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_++;
        slots_.emplace(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) { slots_.erase(id); }

    void disconnectAll() { slots_.clear(); }

    /// Invoke every slot. Slots may connect or disconnect during dispatch;
    /// changes take effect on the next emit().
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        snapshot.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            snapshot.push_back(slot);
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const noexcept { return slots_.size(); }

private:
    std::map<SlotId, Slot> slots_;
    SlotId nextId_ = 1;
};

} // namespace arc::foundation
