// Base + combo + modifier damage calculation, target resolution and application.
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "../battle/CardData.h"
#include "../battle/GridField.h"
#include "../data/PlayerState.h"
#include "ComboEngine.h"

namespace Tactics {

using DebugSink = std::function<void(const std::string&)>;
// Extra multiplicative effects (equipment, buffs); 1.0 is neutral.
using DamageModifier = std::function<double(const WeaponData&, const PlayerState&)>;

struct DamageBreakdown {
    int baseDamage{0};
    double comboMultiplier{1.0};
    int comboDamage{0};
    double otherMultiplier{1.0};
    int otherDamage{0};
    int finalDamage{0};
    ComboOutcome combo{};
    std::string description;
};

struct DamageTargets {
    std::vector<int> enemyIds;
    std::vector<int> gateIds;

    bool empty() const { return enemyIds.empty() && gateIds.empty(); }
    bool operator==(const DamageTargets& o) const { return enemyIds == o.enemyIds && gateIds == o.gateIds; }
};

struct DamageApplication {
    int totalDealt{0};
    std::vector<int> defeatedEnemyIds;
    std::vector<int> destroyedGateIds;
};

class DamagePipeline {
public:
    DamagePipeline(PlayerState& player, ComboEngine& combos);

    void addModifier(DamageModifier modifier) { modifiers_.push_back(std::move(modifier)); }
    void clearModifiers() { modifiers_.clear(); }
    void setDebugSink(DebugSink sink) { debugSink_ = std::move(sink); }

    // simulateCombo=true leaves combo progress untouched; both modes agree for the same state.
    DamageBreakdown computeDamage(const CardData& card, bool simulateCombo, int turn);

    // Round half away from zero.
    static int roundDamage(double value);
    static std::string describe(const std::string& name, const DamageBreakdown& b);

    // focus pins an enemy cell for the single-target class.
    static DamageTargets resolveTargets(const GridField& field, const WeaponData& weapon, int column,
                                        std::optional<GridPosition> focus = std::nullopt);
    // Dead enemies are removed from the grid before returning.
    static DamageApplication applyDamage(GridField& field, const DamageTargets& targets, int damage);

private:
    double otherMultiplier(const WeaponData& weapon) const;

    PlayerState& player_;
    ComboEngine& combos_;
    std::vector<DamageModifier> modifiers_;
    DebugSink debugSink_;
};

}  // namespace Tactics
