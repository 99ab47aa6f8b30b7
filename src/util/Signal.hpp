#pragma once
// Signal.hpp - Minimal observer used to decouple logic from Qt widgets
// Slots run synchronously on the emitting thread

#include <functional>
#include <vector>

namespace lrc {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using Connection = std::size_t;

    Connection connect(Slot slot) {
        slots_.push_back({nextId_, std::move(slot)});
        return nextId_++;
    }

    void emitSignal(Args... args) const {
        // Copy so a slot may connect further slots while being called
        auto slots = slots_;
        for (const auto& s : slots)
            s.fn(args...);
    }

private:
    struct Entry {
        Connection id;
        Slot fn;
    };

    std::vector<Entry> slots_;
    Connection nextId_{1};
};

} // namespace lrc
