// JSON table loading, per-table fallbacks and the shipped data set.
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include "../game/data/BattleDataLoaders.h"

using namespace Tactics;

namespace {

namespace fs = std::filesystem;

fs::path scratchDir() {
    const fs::path dir = fs::temp_directory_path() / "gate_tactics_data_tests";
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string writeFile(const fs::path& dir, const char* name, const std::string& text) {
    const fs::path p = dir / name;
    std::ofstream out(p);
    out << text;
    return p.string();
}

}  // namespace

int main() {
    const fs::path dir = scratchDir();
    {
        // Missing files fall back to built-in tables.
        const std::string missing = (dir / "absent.json").string();
        assert(loadWeapons(missing).size() == defaultWeapons().size());
        assert(loadComboDefinitions(missing).size() == defaultComboDefinitions().size());
        assert(loadEnemyCatalog(missing).find(100).has_value());
        assert(loadGateTypeTable(missing).get(GateType::Fortress).baseHp == 50000);
        const BattleConfig cfg = loadBattleConfig(missing);
        assert(cfg.gateCount == 3);
        assert(cfg.maxTurns == 50);
        assert(cfg.player.maxHp == 15000);
    }
    {
        // Malformed JSON and wrongly-typed values also fall back.
        const std::string broken = writeFile(dir, "broken.json", "{ \"weapons\": [ ");
        assert(loadWeapons(broken).size() == defaultWeapons().size());
        const std::string typed = writeFile(dir, "typed.json", R"({ "gateCount": "three" })");
        assert(loadBattleConfig(typed).gateCount == 3);
        // Zero is a valid turn limit (disabled); negatives clamp to it.
        assert(loadBattleConfig(writeFile(dir, "unlimited.json", R"({ "maxTurns": 0 })")).maxTurns == 0);
        assert(loadBattleConfig(writeFile(dir, "negative.json", R"({ "maxTurns": -4 })")).maxTurns == 0);
    }
    {
        const std::string path = writeFile(dir, "weapons.json", R"({
            "weapons": [
                { "name": "Pike", "type": "Spear", "attribute": "Ice", "range": "Column", "power": 999, "cooldown": 2,
                  "consecutive": false },
                { "name": "Sling" }
            ]
        })");
        const auto weapons = loadWeapons(path);
        assert(weapons.size() == 2);
        assert(weapons[0].type == WeaponType::Spear);
        assert(weapons[0].attribute == AttackAttribute::Ice);
        assert(weapons[0].range == AttackRange::Column);
        assert(weapons[0].basePower == kMaxWeaponPower);
        assert(weapons[0].cooldownTurns == 2);
        assert(!weapons[0].canUseConsecutively);
        assert(weapons[1].range == AttackRange::SingleFront);

        PlayerConfig player;
        player.weapons = {"Sling", "Missing", "Pike"};
        const auto loadout = resolveLoadout(player, weapons);
        assert(loadout.size() == 2);
        assert(loadout[0].name == "Sling" && loadout[1].name == "Pike");
    }
    {
        // Combos shorter than two steps or without a name are rejected.
        const std::string path = writeFile(dir, "combos.json", R"({
            "combos": [
                { "name": "Solo", "requiredWeaponCount": 1 },
                { "requiredWeaponCount": 2 },
                { "name": "Pair", "weaponTypes": ["Bow", "Nonsense"], "weaponIndices": [0, 2],
                  "steps": [ { "weaponType": "Bow" }, { "attribute": "Fire", "weaponIndex": 2 } ],
                  "effects": [ { "type": "DamageMultiplier", "multiplier": 1.25 },
                               { "type": "AdditionalAction", "actions": 2 } ] }
            ]
        })");
        const auto combos = loadComboDefinitions(path);
        assert(combos.size() == 1);
        const ComboDefinition& pair = combos[0];
        assert(pair.name == "Pair");
        assert(pair.condition.requiredWeaponTypes.size() == 1);
        assert(pair.condition.requiredWeaponIndices.size() == 2);
        assert(pair.stepCount() == 2);
        assert(pair.steps[1].attribute == AttackAttribute::Fire);
        assert(pair.steps[1].weaponIndex == 2);
        assert(!pair.steps[1].weaponType.has_value());
        assert(pair.damageMultiplier() == 1.25);
        assert(pair.effects[1].additionalActions == 2);
    }
    {
        const std::string enemies = writeFile(dir, "enemies.json", R"({
            "enemies": [ { "id": 9, "name": "Wisp", "hp": 300, "action": "Heal", "category": "Support" },
                         { "name": "No id" } ]
        })");
        const EnemyCatalog catalog = loadEnemyCatalog(enemies);
        const auto wisp = catalog.find(9);
        assert(wisp.has_value());
        assert(wisp->baseHp == 300);
        assert(wisp->primaryAction == EnemyActionType::Heal);
        assert(wisp->category == EnemyCategory::Support);
        // Type-keyed defaults remain available.
        assert(catalog.find(103).has_value());

        const std::string gates = writeFile(dir, "gates.json", R"({
            "gateTypes": [ { "type": "Standard", "hp": 1000, "pattern": "Periodic", "allowedEnemyIds": [9] },
                           { "type": "Castle", "hp": 1 } ]
        })");
        const GateTypeTable table = loadGateTypeTable(gates);
        const GateTypeConfig& standard = table.get(GateType::Standard);
        assert(standard.baseHp == 1000);
        assert(standard.pattern == SpawnPattern::Periodic);
        assert(standard.summonInterval == 3);
        assert(standard.allowedEnemyIds.size() == 1 && standard.allowedEnemyIds[0] == 9);
        assert(table.get(GateType::Elite).baseHp == 35000);
    }
    {
        // A directory with only some tables keeps defaults for the others.
        writeFile(dir, "battle.json", R"({ "gateCount": 4, "turnTimeLimitSeconds": 0,
                                           "player": { "maxHp": 900, "weapons": ["Pike"] } })");
        const BattleSetup setup = loadBattleSetup(dir.string());
        assert(setup.config.gateCount == 4);
        assert(setup.config.turnTimeLimitSeconds == 0.0);
        assert(setup.config.player.maxHp == 900);
        assert(setup.config.handSize == 5);
        assert(setup.loadout.size() == 1 && setup.loadout[0].name == "Pike");
        assert(setup.enemies.find(9).has_value());
    }
    {
        // The shipped data set loads cleanly.
        const BattleSetup setup = loadBattleSetup(GATE_DATA_DIR);
        assert(setup.loadout.size() == 4);
        assert(setup.loadout[0].name == "Flame Sword");
        assert(setup.combos.size() == 4);
        assert(setup.enemies.find(1).has_value());
        assert(setup.gateTypes.get(GateType::Standard).allowedEnemyIds.size() == 2);
        assert(setup.config.baseActionsPerTurn == 2);
    }
    fs::remove_all(dir);
    return 0;
}
