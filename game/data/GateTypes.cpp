#include "GateTypes.h"

namespace Tactics {

GateTypeTable GateTypeTable::defaults() {
    GateTypeTable t;
    t.set(GateTypeConfig{GateType::Standard, 25000, SpawnPattern::PatternA, 3, 1, GateEffect::None, 1.0, 0, {}});
    t.set(GateTypeConfig{GateType::Elite, 35000, SpawnPattern::OnDamage, 2, 1, GateEffect::AttackBoost, 1.5, 0, {}});
    t.set(GateTypeConfig{GateType::Support, 20000, SpawnPattern::PatternB, 4, 2, GateEffect::BuffAllEnemies, 1.2, 0, {}});
    t.set(GateTypeConfig{GateType::Summoner, 15000, SpawnPattern::PatternC, 2, 3, GateEffect::IncreaseSpawnRate, 2.0, 0,
                         {}});
    t.set(GateTypeConfig{GateType::Fortress, 50000, SpawnPattern::Defensive, 5, 1, GateEffect::DefenseBoost, 2.0, 500,
                         {}});
    return t;
}

std::string_view toString(GateType type) {
    switch (type) {
        case GateType::Standard: return "Standard";
        case GateType::Elite: return "Elite";
        case GateType::Support: return "Support";
        case GateType::Summoner: return "Summoner";
        case GateType::Fortress: return "Fortress";
    }
    return "Unknown";
}

std::string_view toString(SpawnPattern pattern) {
    switch (pattern) {
        case SpawnPattern::PatternA: return "PatternA";
        case SpawnPattern::PatternB: return "PatternB";
        case SpawnPattern::PatternC: return "PatternC";
        case SpawnPattern::Periodic: return "Periodic";
        case SpawnPattern::OnDamage: return "OnDamage";
        case SpawnPattern::Defensive: return "Defensive";
        case SpawnPattern::Continuous: return "Continuous";
    }
    return "Unknown";
}

std::string_view toString(GateEffect effect) {
    switch (effect) {
        case GateEffect::None: return "None";
        case GateEffect::BuffAllEnemies: return "BuffAllEnemies";
        case GateEffect::AttackBoost: return "AttackBoost";
        case GateEffect::DefenseBoost: return "DefenseBoost";
        case GateEffect::Regeneration: return "Regeneration";
        case GateEffect::IncreaseSpawnRate: return "IncreaseSpawnRate";
    }
    return "Unknown";
}

std::optional<GateType> parseGateType(std::string_view key) {
    for (int i = 0; i < kGateTypeCount; ++i) {
        const auto type = static_cast<GateType>(i);
        if (toString(type) == key) return type;
    }
    return std::nullopt;
}

std::optional<SpawnPattern> parseSpawnPattern(std::string_view key) {
    for (int i = 0; i <= static_cast<int>(SpawnPattern::Continuous); ++i) {
        const auto p = static_cast<SpawnPattern>(i);
        if (toString(p) == key) return p;
    }
    return std::nullopt;
}

std::optional<GateEffect> parseGateEffect(std::string_view key) {
    for (int i = 0; i <= static_cast<int>(GateEffect::IncreaseSpawnRate); ++i) {
        const auto e = static_cast<GateEffect>(i);
        if (toString(e) == key) return e;
    }
    return std::nullopt;
}

}  // namespace Tactics
