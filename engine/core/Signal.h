// Typed publish/subscribe list of listener closures.
#pragma once

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace Engine {

using SignalHandle = std::uint32_t;
constexpr SignalHandle kInvalidSignalHandle = 0;

template <typename... Args>
class Signal {
public:
    using Listener = std::function<void(Args...)>;

    SignalHandle connect(Listener fn) {
        if (!fn) return kInvalidSignalHandle;
        const SignalHandle h = nextHandle_++;
        slots_.push_back(Slot{h, std::move(fn)});
        return h;
    }

    bool disconnect(SignalHandle handle) {
        for (auto it = slots_.begin(); it != slots_.end(); ++it) {
            if (it->handle == handle) {
                slots_.erase(it);
                return true;
            }
        }
        return false;
    }

    void clear() { slots_.clear(); }
    std::size_t listenerCount() const { return slots_.size(); }

    // Listeners may connect or disconnect while the signal is being emitted.
    void emit(Args... args) const {
        const auto snapshot = slots_;
        for (const auto& slot : snapshot) {
            slot.fn(args...);
        }
    }

private:
    struct Slot {
        SignalHandle handle{kInvalidSignalHandle};
        Listener fn;
    };

    std::vector<Slot> slots_;
    SignalHandle nextHandle_{1};
};

}  // namespace Engine
