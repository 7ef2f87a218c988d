// Running battle statistics and the record published when a battle ends.
#pragma once

#include <nlohmann/json.hpp>

#include "BattleTypes.h"

namespace Tactics {

struct BattleStats {
    int damageDealt{0};
    int damageTaken{0};
    int enemiesDefeated{0};
    int enemiesSpawned{0};
    int gatesDestroyed{0};
    int cardsPlayed{0};
    int combosCompleted{0};
};

struct BattleSummary {
    bool victory{false};
    BattleEndCondition condition{BattleEndCondition::None};
    int turnsUsed{0};
    BattleStats stats{};
    int playerHpRemaining{0};

    nlohmann::json toJson() const;
};

}  // namespace Tactics
