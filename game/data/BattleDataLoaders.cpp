// Loaders for the battle JSON tables.
#include "BattleDataLoaders.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Tactics {

using nlohmann::json;

namespace {

std::optional<json> readJson(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Engine::logDebug("No data file at " + path + ", using defaults");
        return std::nullopt;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        Engine::logWarn("Could not open " + path + ", using defaults");
        return std::nullopt;
    }
    try {
        json j;
        f >> j;
        return j;
    } catch (const json::exception& e) {
        Engine::logWarn("Failed to parse " + path + ": " + e.what());
        return std::nullopt;
    }
}

template <typename E, typename Parser>
std::vector<E> readEnumList(const json& j, const char* key, Parser parse) {
    std::vector<E> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& v : j[key]) {
        if (!v.is_string()) continue;
        if (auto e = parse(v.get<std::string>())) out.push_back(*e);
    }
    return out;
}

WeaponData parseWeapon(const json& w) {
    WeaponData out;
    out.name = w.value("name", out.name);
    if (auto a = parseAttackAttribute(w.value("attribute", std::string("None")))) out.attribute = *a;
    if (auto t = parseWeaponType(w.value("type", std::string("Sword")))) out.type = *t;
    if (auto r = parseAttackRange(w.value("range", std::string("SingleFront")))) out.range = *r;
    out.basePower = std::clamp(w.value("power", out.basePower), 0, kMaxWeaponPower);
    out.criticalRate = std::clamp(w.value("critRate", out.criticalRate), 0, 100);
    out.cooldownTurns = std::max(0, w.value("cooldown", out.cooldownTurns));
    out.canUseConsecutively = w.value("consecutive", out.canUseConsecutively);
    out.description = w.value("description", std::string());
    return out;
}

ComboEffect parseComboEffect(const json& e) {
    ComboEffect out;
    const std::string type = e.value("type", std::string("DamageMultiplier"));
    if (auto t = parseComboEffectType(type)) {
        out.type = *t;
    } else {
        Engine::logWarn("Unknown combo effect type '" + type + "', treated as DamageMultiplier");
    }
    out.damageMultiplier = e.value("multiplier", out.damageMultiplier);
    out.additionalActions = e.value("actions", out.additionalActions);
    out.healingAmount = e.value("healing", out.healingAmount);
    if (auto a = parseAttackAttribute(e.value("statusAttribute", std::string("None")))) out.statusAttribute = *a;
    out.statusDuration = e.value("statusDuration", out.statusDuration);
    out.buffValue = e.value("buffValue", out.buffValue);
    out.effectDuration = e.value("duration", out.effectDuration);
    out.description = e.value("description", std::string());
    return out;
}

std::optional<ComboDefinition> parseCombo(const json& c) {
    ComboDefinition out;
    out.name = c.value("name", std::string());
    if (auto t = parseComboType(c.value("type", std::string("Attribute")))) out.condition.type = *t;
    out.condition.requiredAttributes = readEnumList<AttackAttribute>(c, "attributes", parseAttackAttribute);
    out.condition.requiredWeaponTypes = readEnumList<WeaponType>(c, "weaponTypes", parseWeaponType);
    if (c.contains("weaponIndices") && c["weaponIndices"].is_array()) {
        for (const auto& v : c["weaponIndices"]) {
            if (v.is_number_integer()) out.condition.requiredWeaponIndices.push_back(v.get<int>());
        }
    }
    out.condition.minAttackPower = c.value("minAttackPower", 0);
    out.condition.requiresSequence = c.value("requiresSequence", false);
    out.condition.maxTurnInterval = std::max(0, c.value("maxTurnInterval", 0));
    out.requiredWeaponCount = c.value("requiredWeaponCount", out.requiredWeaponCount);
    if (c.contains("steps") && c["steps"].is_array()) {
        for (const auto& s : c["steps"]) {
            ComboStep step;
            if (s.contains("weaponType")) step.weaponType = parseWeaponType(s.value("weaponType", std::string()));
            if (s.contains("attribute")) step.attribute = parseAttackAttribute(s.value("attribute", std::string()));
            if (s.contains("weaponIndex")) step.weaponIndex = s.value("weaponIndex", 0);
            out.steps.push_back(step);
        }
    }
    if (c.contains("effects") && c["effects"].is_array()) {
        for (const auto& e : c["effects"]) out.effects.push_back(parseComboEffect(e));
    }
    out.priority = c.value("priority", 0);
    out.description = c.value("description", std::string());

    if (out.name.empty() || out.stepCount() < 2) {
        Engine::logWarn("Combo '" + out.name + "' rejected: needs a name and at least two steps");
        return std::nullopt;
    }
    return out;
}

}  // namespace

std::vector<WeaponData> defaultWeapons() {
    auto make = [](const char* name, AttackAttribute attr, WeaponType type, int power, AttackRange range,
                   int cooldown, bool consecutive) {
        WeaponData w;
        w.name = name;
        w.attribute = attr;
        w.type = type;
        w.basePower = power;
        w.range = range;
        w.cooldownTurns = cooldown;
        w.canUseConsecutively = consecutive;
        return w;
    };
    return {
        make("Flame Sword", AttackAttribute::Fire, WeaponType::Sword, 100, AttackRange::SingleFront, 0, true),
        make("Frost Spear", AttackAttribute::Ice, WeaponType::Spear, 90, AttackRange::Column, 1, false),
        make("Thunder Bow", AttackAttribute::Thunder, WeaponType::Bow, 80, AttackRange::Row1, 0, true),
        make("Storm Axe", AttackAttribute::Wind, WeaponType::Axe, 120, AttackRange::SingleTarget, 2, false),
        make("Earthshaker", AttackAttribute::Earth, WeaponType::Magic, 60, AttackRange::All, 3, false),
        make("Longbow", AttackAttribute::None, WeaponType::Bow, 90, AttackRange::Row2, 0, true),
    };
}

std::vector<WeaponData> loadWeapons(const std::string& path) {
    auto j = readJson(path);
    if (!j) return defaultWeapons();
    try {
        std::vector<WeaponData> out;
        if (j->contains("weapons") && (*j)["weapons"].is_array()) {
            for (const auto& w : (*j)["weapons"]) {
                if (w.is_object()) out.push_back(parseWeapon(w));
            }
        }
        if (out.empty()) {
            Engine::logWarn(path + " lists no weapons, using defaults");
            return defaultWeapons();
        }
        return out;
    } catch (const json::exception& e) {
        Engine::logWarn("Invalid weapon table " + path + ": " + e.what());
        return defaultWeapons();
    }
}

EnemyCatalog loadEnemyCatalog(const std::string& path) {
    EnemyCatalog catalog;
    auto j = readJson(path);
    if (!j) return catalog;
    try {
        if (!j->contains("enemies") || !(*j)["enemies"].is_array()) return catalog;
        for (const auto& e : (*j)["enemies"]) {
            if (!e.is_object() || !e.contains("id")) continue;
            EnemyData d;
            d.id = e.value("id", 0);
            d.name = e.value("name", d.name);
            if (auto c = parseEnemyCategory(e.value("category", std::string("Attacker")))) d.category = *c;
            d.baseHp = std::max(1, e.value("hp", d.baseHp));
            d.attackPower = std::max(0, e.value("attack", d.attackPower));
            d.defense = std::max(0, e.value("defense", d.defense));
            if (auto a = parseEnemyAction(e.value("action", std::string("Attack")))) d.primaryAction = *a;
            d.actionCooldown = std::max(0, e.value("cooldown", d.actionCooldown));
            catalog.add(d);
        }
    } catch (const json::exception& e) {
        Engine::logWarn("Invalid enemy table " + path + ": " + e.what());
        return EnemyCatalog{};
    }
    return catalog;
}

std::vector<ComboDefinition> loadComboDefinitions(const std::string& path) {
    auto j = readJson(path);
    if (!j) return defaultComboDefinitions();
    try {
        std::vector<ComboDefinition> out;
        if (j->contains("combos") && (*j)["combos"].is_array()) {
            for (const auto& c : (*j)["combos"]) {
                if (!c.is_object()) continue;
                if (auto def = parseCombo(c)) out.push_back(std::move(*def));
            }
        }
        return out;
    } catch (const json::exception& e) {
        Engine::logWarn("Invalid combo table " + path + ": " + e.what());
        return defaultComboDefinitions();
    }
}

GateTypeTable loadGateTypeTable(const std::string& path) {
    GateTypeTable table = GateTypeTable::defaults();
    auto j = readJson(path);
    if (!j) return table;
    try {
        if (!j->contains("gateTypes") || !(*j)["gateTypes"].is_array()) return table;
        for (const auto& g : (*j)["gateTypes"]) {
            if (!g.is_object()) continue;
            const std::string typeKey = g.value("type", std::string());
            auto type = parseGateType(typeKey);
            if (!type) {
                Engine::logWarn("Unknown gate type '" + typeKey + "' in " + path);
                continue;
            }
            GateTypeConfig cfg = table.get(*type);
            cfg.baseHp = std::max(1, g.value("hp", cfg.baseHp));
            if (auto p = parseSpawnPattern(g.value("pattern", std::string(toString(cfg.pattern))))) cfg.pattern = *p;
            cfg.summonInterval = std::max(0, g.value("interval", cfg.summonInterval));
            cfg.summonCount = std::max(1, g.value("count", cfg.summonCount));
            if (auto e = parseGateEffect(g.value("effect", std::string(toString(cfg.effect))))) cfg.effect = *e;
            cfg.effectStrength = g.value("strength", cfg.effectStrength);
            cfg.destructionBonus = std::max(0, g.value("destructionBonus", cfg.destructionBonus));
            if (g.contains("allowedEnemyIds") && g["allowedEnemyIds"].is_array()) {
                cfg.allowedEnemyIds = g["allowedEnemyIds"].get<std::vector<int>>();
            }
            table.set(cfg);
        }
    } catch (const json::exception& e) {
        Engine::logWarn("Invalid gate table " + path + ": " + e.what());
        return GateTypeTable::defaults();
    }
    return table;
}

BattleConfig loadBattleConfig(const std::string& path) {
    BattleConfig cfg;
    auto j = readJson(path);
    if (!j) return cfg;
    try {
        cfg.gateCount = std::max(1, j->value("gateCount", cfg.gateCount));
        cfg.maxTurns = std::max(0, j->value("maxTurns", cfg.maxTurns));
        cfg.turnTimeLimitSeconds = std::max(0.0, j->value("turnTimeLimitSeconds", cfg.turnTimeLimitSeconds));
        cfg.handSize = std::max(1, j->value("handSize", cfg.handSize));
        cfg.baseActionsPerTurn = std::max(1, j->value("baseActionsPerTurn", cfg.baseActionsPerTurn));
        cfg.autoEndTurnWhenExhausted = j->value("autoEndTurnWhenExhausted", cfg.autoEndTurnWhenExhausted);
        cfg.autoEndTurnDelaySeconds = std::max(0.0, j->value("autoEndTurnDelaySeconds", cfg.autoEndTurnDelaySeconds));
        cfg.maxActiveCombos = std::max(1, j->value("maxActiveCombos", cfg.maxActiveCombos));
        cfg.randomizeCardColumns = j->value("randomizeCardColumns", cfg.randomizeCardColumns);
        cfg.seed = j->value("seed", cfg.seed);
        if (j->contains("player") && (*j)["player"].is_object()) {
            const auto& p = (*j)["player"];
            cfg.player.maxHp = std::max(1, p.value("maxHp", cfg.player.maxHp));
            cfg.player.baseAttackPower = std::max(0, p.value("baseAttackPower", cfg.player.baseAttackPower));
            if (p.contains("weapons") && p["weapons"].is_array()) {
                cfg.player.weapons = p["weapons"].get<std::vector<std::string>>();
            }
        }
    } catch (const json::exception& e) {
        Engine::logWarn("Invalid battle config " + path + ": " + e.what());
        return BattleConfig{};
    }
    return cfg;
}

std::vector<WeaponData> resolveLoadout(const PlayerConfig& player, const std::vector<WeaponData>& catalogue) {
    std::vector<WeaponData> out;
    if (player.weapons.empty()) {
        for (const auto& w : catalogue) {
            if (static_cast<int>(out.size()) >= kMaxEquippedWeapons) break;
            out.push_back(w);
        }
        return out;
    }
    for (const auto& name : player.weapons) {
        if (static_cast<int>(out.size()) >= kMaxEquippedWeapons) break;
        auto it = std::find_if(catalogue.begin(), catalogue.end(), [&](const WeaponData& w) { return w.name == name; });
        if (it == catalogue.end()) {
            Engine::logWarn("Unknown weapon '" + name + "' in loadout, slot skipped");
            continue;
        }
        out.push_back(*it);
    }
    return out;
}

BattleSetup loadBattleSetup(const std::string& dataDir) {
    const std::filesystem::path dir(dataDir);
    BattleSetup setup;
    setup.config = loadBattleConfig((dir / "battle.json").string());
    const auto weapons = loadWeapons((dir / "weapons.json").string());
    setup.loadout = resolveLoadout(setup.config.player, weapons);
    setup.enemies = loadEnemyCatalog((dir / "enemies.json").string());
    setup.combos = loadComboDefinitions((dir / "combos.json").string());
    setup.gateTypes = loadGateTypeTable((dir / "gates.json").string());
    Engine::logInfo("Loaded battle data from " + dataDir + ": " + std::to_string(weapons.size()) + " weapons, " +
                    std::to_string(setup.enemies.size()) + " enemies, " + std::to_string(setup.combos.size()) +
                    " combos");
    return setup;
}

}  // namespace Tactics
