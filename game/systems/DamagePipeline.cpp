#include "DamagePipeline.h"

#include <cmath>
#include <iomanip>
#include <sstream>

#include "../../engine/core/Logger.h"

namespace Tactics {

DamagePipeline::DamagePipeline(PlayerState& player, ComboEngine& combos) : player_(player), combos_(combos) {}

int DamagePipeline::roundDamage(double value) { return static_cast<int>(std::lround(value)); }

double DamagePipeline::otherMultiplier(const WeaponData& weapon) const {
    double mul = 1.0;
    for (const auto& mod : modifiers_) {
        if (mod) mul *= mod(weapon, player_);
    }
    return mul;
}

std::string DamagePipeline::describe(const std::string& name, const DamageBreakdown& b) {
    std::ostringstream oss;
    oss << name << ": base " << b.baseDamage;
    oss << std::fixed << std::setprecision(2);
    if (b.comboMultiplier != 1.0) {
        oss << ", combo " << (b.comboDamage >= 0 ? "+" : "") << b.comboDamage << " (x" << b.comboMultiplier << ")";
    }
    if (b.otherMultiplier != 1.0) {
        oss << ", other " << (b.otherDamage >= 0 ? "+" : "") << b.otherDamage << " (x" << b.otherMultiplier << ")";
    }
    oss << " = " << b.finalDamage << " damage";
    return oss.str();
}

DamageBreakdown DamagePipeline::computeDamage(const CardData& card, bool simulateCombo, int turn) {
    DamageBreakdown b;
    b.baseDamage = player_.baseAttackPower() + card.weapon.basePower;

    ComboUse use;
    use.weaponIndex = card.weaponIndex;
    use.weapon = &card.weapon;
    use.playerBaseAttack = player_.baseAttackPower();
    use.turn = turn;
    b.combo = combos_.processWeaponUse(use, simulateCombo);
    b.comboMultiplier = b.combo.completed ? b.combo.damageMultiplier : 1.0;
    b.otherMultiplier = otherMultiplier(card.weapon);

    const int afterCombo = roundDamage(b.baseDamage * b.comboMultiplier);
    b.finalDamage = roundDamage(b.baseDamage * b.comboMultiplier * b.otherMultiplier);
    b.comboDamage = afterCombo - b.baseDamage;
    b.otherDamage = b.finalDamage - afterCombo;
    b.description = describe(card.weapon.name, b);

    if (debugSink_) {
        debugSink_(std::string(simulateCombo ? "[preview] " : "[commit] ") + b.description);
    }
    return b;
}

DamageTargets DamagePipeline::resolveTargets(const GridField& field, const WeaponData& weapon, int column,
                                             std::optional<GridPosition> focus) {
    DamageTargets t;
    auto addEnemy = [&t](const EnemyInstance* e) {
        if (e && e->isAlive()) t.enemyIds.push_back(e->instanceId());
    };

    switch (weapon.range) {
        case AttackRange::All:
            for (const auto* e : field.allEnemies()) addEnemy(e);
            break;
        case AttackRange::Column:
            for (int row = kFrontRow; row < kRowCount; ++row) {
                addEnemy(field.enemyAt(GridPosition{column, row}));
            }
            // Column weapons pierce: the gate takes the hit even behind enemies.
            if (const Gate* gate = field.gateInColumn(column); gate && !gate->isDestroyed()) {
                t.gateIds.push_back(gate->id());
            }
            break;
        case AttackRange::Row1:
        case AttackRange::Row2: {
            const int row = weapon.range == AttackRange::Row1 ? kFrontRow : kBackRow;
            for (int col = 0; col < field.columns(); ++col) {
                addEnemy(field.enemyAt(GridPosition{col, row}));
            }
            break;
        }
        default: {
            const EnemyInstance* target = nullptr;
            if (weapon.range == AttackRange::SingleTarget && focus) {
                const EnemyInstance* chosen = field.enemyAt(*focus);
                if (chosen && chosen->isAlive()) target = chosen;
            }
            if (!target) target = field.frontEnemyInColumn(column);
            if (target) {
                addEnemy(target);
            } else if (field.canAttackGate(column)) {
                t.gateIds.push_back(field.gateInColumn(column)->id());
            }
            break;
        }
    }
    return t;
}

DamageApplication DamagePipeline::applyDamage(GridField& field, const DamageTargets& targets, int damage) {
    DamageApplication out;
    for (int id : targets.enemyIds) {
        EnemyInstance* enemy = field.findEnemy(id);
        if (!enemy || !enemy->isAlive()) continue;
        out.totalDealt += enemy->takeDamage(damage);
        if (!enemy->isAlive()) {
            out.defeatedEnemyIds.push_back(id);
            const GridPosition pos = enemy->position();
            Engine::logInfo(enemy->data().name + " defeated at " + pos.toString());
            field.removeEnemy(pos);
        }
    }
    for (int id : targets.gateIds) {
        Gate* gate = field.gate(id);
        if (!gate || gate->isDestroyed()) continue;
        out.totalDealt += gate->takeDamage(damage);
        if (gate->isDestroyed()) out.destroyedGateIds.push_back(id);
    }
    return out;
}

}  // namespace Tactics
