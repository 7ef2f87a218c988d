#include "EnemyActionSystem.h"

#include <cmath>
#include <string>

#include "../../engine/core/Logger.h"

namespace Tactics {

EnemyPhaseReport EnemyActionSystem::run(GridField& field, PlayerState& player) {
    using Engine::Status::EStatusId;
    EnemyPhaseReport report;

    for (EnemyInstance* enemy : field.allEnemies()) {
        if (!player.isAlive()) break;
        if (!enemy->canAct()) continue;

        switch (enemy->data().primaryAction) {
            case EnemyActionType::BuffAlly:
                for (EnemyInstance* ally : field.allEnemies()) {
                    if (ally == enemy) continue;
                    ally->applyBuff(EStatusId::AttackBoost, kAllyBuffMultiplier, kAllyBuffTurns, enemy->instanceId());
                    ++report.alliesBuffed;
                }
                break;
            case EnemyActionType::Heal: {
                EnemyInstance* weakest = nullptr;
                for (EnemyInstance* ally : field.allEnemies()) {
                    if (ally->currentHp() >= ally->maxHp()) continue;
                    if (!weakest || ally->maxHp() - ally->currentHp() > weakest->maxHp() - weakest->currentHp()) {
                        weakest = ally;
                    }
                }
                if (weakest) {
                    report.hpHealed += weakest->heal(static_cast<int>(std::lround(weakest->maxHp() * kHealFraction)));
                }
                break;
            }
            case EnemyActionType::NoAction:
                break;
            default: {
                const int dealt = player.takeDamage(enemy->effectiveAttack());
                report.damageToPlayer += dealt;
                Engine::logDebug(enemy->data().name + " hits player for " + std::to_string(dealt));
                break;
            }
        }
        enemy->onActed();
        ++report.actionsTaken;
    }

    for (EnemyInstance* enemy : field.allEnemies()) {
        enemy->onTurnEnd();
    }
    return report;
}

}  // namespace Tactics
