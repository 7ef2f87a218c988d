// Everything a battle session needs from the data layer.
#pragma once

#include <vector>

#include "BattleConfig.h"
#include "ComboData.h"
#include "EnemyData.h"
#include "GateTypes.h"
#include "WeaponData.h"

namespace Tactics {

struct BattleSetup {
    BattleConfig config{};
    // Equipped weapons in slot order (at most four are used).
    std::vector<WeaponData> loadout;
    std::vector<ComboDefinition> combos;
    GateTypeTable gateTypes{GateTypeTable::defaults()};
    EnemyCatalog enemies{};
};

}  // namespace Tactics
