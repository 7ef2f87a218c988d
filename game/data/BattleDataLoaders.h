// JSON loaders for battle design tables; each falls back to built-in defaults.
#pragma once

#include <string>
#include <vector>

#include "BattleSetup.h"

namespace Tactics {

std::vector<WeaponData> defaultWeapons();

std::vector<WeaponData> loadWeapons(const std::string& path);
EnemyCatalog loadEnemyCatalog(const std::string& path);
std::vector<ComboDefinition> loadComboDefinitions(const std::string& path);
GateTypeTable loadGateTypeTable(const std::string& path);
BattleConfig loadBattleConfig(const std::string& path);

// Resolves config.player.weapons by name; unknown names are skipped.
std::vector<WeaponData> resolveLoadout(const PlayerConfig& player, const std::vector<WeaponData>& catalogue);

// Reads weapons/enemies/combos/gates/battle .json from dataDir.
BattleSetup loadBattleSetup(const std::string& dataDir);

}  // namespace Tactics
