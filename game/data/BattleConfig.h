// Tunables for one battle session; every field has a working default.
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Tactics {

struct PlayerConfig {
    int maxHp{15000};
    int baseAttackPower{100};
    // Weapon names resolved against the weapon catalogue, at most four.
    std::vector<std::string> weapons;
};

struct BattleConfig {
    int gateCount{3};  // one gate per grid column
    int maxTurns{50};  // 0 disables the turn limit
    double turnTimeLimitSeconds{30.0};  // 0 disables the turn timer
    int handSize{5};
    int baseActionsPerTurn{1};
    bool autoEndTurnWhenExhausted{true};
    double autoEndTurnDelaySeconds{0.5};
    int maxActiveCombos{5};
    bool randomizeCardColumns{true};
    std::uint32_t seed{1337};
    PlayerConfig player{};
};

}  // namespace Tactics
