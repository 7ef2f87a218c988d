// Gate-type base configuration table (static design data).
#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace Tactics {

enum class GateType { Standard, Elite, Support, Summoner, Fortress };

enum class SpawnPattern { PatternA, PatternB, PatternC, Periodic, OnDamage, Defensive, Continuous };

enum class GateEffect { None, BuffAllEnemies, AttackBoost, DefenseBoost, Regeneration, IncreaseSpawnRate };

constexpr int kGateTypeCount = 5;

struct GateTypeConfig {
    GateType type{GateType::Standard};
    int baseHp{25000};
    SpawnPattern pattern{SpawnPattern::PatternA};
    int summonInterval{3};
    int summonCount{1};
    GateEffect effect{GateEffect::None};
    double effectStrength{1.0};
    int destructionBonus{0};
    // Empty means the type-keyed default enemy.
    std::vector<int> allowedEnemyIds;
};

class GateTypeTable {
public:
    static GateTypeTable defaults();

    const GateTypeConfig& get(GateType type) const { return configs_[static_cast<std::size_t>(type)]; }
    void set(const GateTypeConfig& cfg) { configs_[static_cast<std::size_t>(cfg.type)] = cfg; }

private:
    std::array<GateTypeConfig, kGateTypeCount> configs_{};
};

std::string_view toString(GateType type);
std::string_view toString(SpawnPattern pattern);
std::string_view toString(GateEffect effect);
std::optional<GateType> parseGateType(std::string_view key);
std::optional<SpawnPattern> parseSpawnPattern(std::string_view key);
std::optional<GateEffect> parseGateEffect(std::string_view key);

}  // namespace Tactics
