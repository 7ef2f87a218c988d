#include "EnemyData.h"

#include <algorithm>

namespace Tactics {

EnemyData defaultEnemyForGate(GateType type) {
    switch (type) {
        case GateType::Elite:
            return EnemyData{101, "Elite Guard", EnemyCategory::Attacker, 8000, 2500, 0, EnemyActionType::Attack, 0};
        case GateType::Support:
            return EnemyData{102, "Gate Acolyte", EnemyCategory::Support, 4000, 1000, 0, EnemyActionType::BuffAlly, 0};
        case GateType::Summoner:
            return EnemyData{103, "Summoned Imp", EnemyCategory::Special, 3000, 800, 0, EnemyActionType::Summon, 0};
        case GateType::Fortress:
            return EnemyData{104, "Bulwark", EnemyCategory::Vanguard, 12000, 2000, 0, EnemyActionType::Attack, 0};
        case GateType::Standard:
        default:
            return EnemyData{100, "Gate Soldier", EnemyCategory::Attacker, 5000, 1500, 0, EnemyActionType::Attack, 0};
    }
}

EnemyCatalog::EnemyCatalog() {
    for (int i = 0; i < kGateTypeCount; ++i) {
        add(defaultEnemyForGate(static_cast<GateType>(i)));
    }
}

std::optional<EnemyData> EnemyCatalog::find(int id) const {
    auto it = byId_.find(id);
    if (it == byId_.end()) return std::nullopt;
    return it->second;
}

std::vector<int> EnemyCatalog::ids() const {
    std::vector<int> out;
    out.reserve(byId_.size());
    for (const auto& [id, data] : byId_) out.push_back(id);
    std::sort(out.begin(), out.end());
    return out;
}

std::string_view toString(EnemyCategory category) {
    switch (category) {
        case EnemyCategory::Vanguard: return "Vanguard";
        case EnemyCategory::Attacker: return "Attacker";
        case EnemyCategory::Support: return "Support";
        case EnemyCategory::Special: return "Special";
    }
    return "Unknown";
}

std::string_view toString(EnemyActionType action) {
    switch (action) {
        case EnemyActionType::Attack: return "Attack";
        case EnemyActionType::DefendAlly: return "DefendAlly";
        case EnemyActionType::BuffAlly: return "BuffAlly";
        case EnemyActionType::DebuffPlayer: return "DebuffPlayer";
        case EnemyActionType::Heal: return "Heal";
        case EnemyActionType::Summon: return "Summon";
        case EnemyActionType::SelfDestruct: return "SelfDestruct";
        case EnemyActionType::Counter: return "Counter";
        case EnemyActionType::NoAction: return "NoAction";
    }
    return "Unknown";
}

std::optional<EnemyCategory> parseEnemyCategory(std::string_view key) {
    for (int i = 0; i <= static_cast<int>(EnemyCategory::Special); ++i) {
        const auto c = static_cast<EnemyCategory>(i);
        if (toString(c) == key) return c;
    }
    return std::nullopt;
}

std::optional<EnemyActionType> parseEnemyAction(std::string_view key) {
    for (int i = 0; i <= static_cast<int>(EnemyActionType::NoAction); ++i) {
        const auto a = static_cast<EnemyActionType>(i);
        if (toString(a) == key) return a;
    }
    return std::nullopt;
}

}  // namespace Tactics
