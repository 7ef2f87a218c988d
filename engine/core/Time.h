// Time step handed to every tick of the battle loop.
#pragma once

namespace Engine {

struct TimeStep {
    double deltaSeconds{0.0};
    double elapsedSeconds{0.0};
};

inline TimeStep advance(const TimeStep& prev, double deltaSeconds) {
    return TimeStep{deltaSeconds, prev.elapsedSeconds + deltaSeconds};
}

}  // namespace Engine
