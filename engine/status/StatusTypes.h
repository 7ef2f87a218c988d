#pragma once

#include <string_view>

namespace Engine::Status {

// Turn-counted buffs carried by battle units.
enum class EStatusId {
    GateBoost,
    AttackBoost,
    DefenseBoost
};

inline std::string_view toString(EStatusId id) {
    switch (id) {
        case EStatusId::GateBoost:
            return "GateBoost";
        case EStatusId::AttackBoost:
            return "AttackBoost";
        case EStatusId::DefenseBoost:
        default:
            return "DefenseBoost";
    }
}

// Multipliers default to neutral (1.0).
struct StatusMagnitude {
    double attackMultiplier{1.0};
    double defenseMultiplier{1.0};
};

struct StatusSpec {
    EStatusId id{EStatusId::AttackBoost};
    int durationTurns{-1};  // < 0 means permanent.
    bool refreshOnReapply{true};
    StatusMagnitude magnitude{};
};

struct StatusInstance {
    StatusSpec spec;
    int sourceId{-1};
    int remainingTurns{0};

    bool infinite() const { return spec.durationTurns < 0; }
};

}  // namespace Engine::Status
