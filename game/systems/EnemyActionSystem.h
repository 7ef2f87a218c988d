// Enemy-phase behaviour: each living enemy performs its primary action.
#pragma once

#include "../battle/GridField.h"
#include "../data/PlayerState.h"

namespace Tactics {

struct EnemyPhaseReport {
    int actionsTaken{0};
    int damageToPlayer{0};
    int alliesBuffed{0};
    int hpHealed{0};
};

class EnemyActionSystem {
public:
    static constexpr double kAllyBuffMultiplier = 1.2;
    static constexpr int kAllyBuffTurns = 2;
    static constexpr double kHealFraction = 0.1;

    EnemyPhaseReport run(GridField& field, PlayerState& player);
};

}  // namespace Tactics
