// Enemy definitions and the catalogue the spawn scheduler resolves ids against.
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "GateTypes.h"

namespace Tactics {

enum class EnemyCategory { Vanguard, Attacker, Support, Special };

enum class EnemyActionType {
    Attack,
    DefendAlly,
    BuffAlly,
    DebuffPlayer,
    Heal,
    Summon,
    SelfDestruct,
    Counter,
    NoAction
};

struct EnemyData {
    int id{0};
    std::string name{"Enemy"};
    EnemyCategory category{EnemyCategory::Attacker};
    int baseHp{1000};
    int attackPower{100};
    int defense{0};
    EnemyActionType primaryAction{EnemyActionType::Attack};
    int actionCooldown{0};
};

// Fallback enemy used when a gate has no allowed-enemy pool.
EnemyData defaultEnemyForGate(GateType type);

class EnemyCatalog {
public:
    // Seeded with the type-keyed defaults.
    EnemyCatalog();

    void add(const EnemyData& data) { byId_[data.id] = data; }
    std::optional<EnemyData> find(int id) const;
    std::size_t size() const { return byId_.size(); }
    std::vector<int> ids() const;

private:
    std::unordered_map<int, EnemyData> byId_;
};

std::string_view toString(EnemyCategory category);
std::string_view toString(EnemyActionType action);
std::optional<EnemyCategory> parseEnemyCategory(std::string_view key);
std::optional<EnemyActionType> parseEnemyAction(std::string_view key);

}  // namespace Tactics
