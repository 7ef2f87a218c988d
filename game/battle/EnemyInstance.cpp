#include "EnemyInstance.h"

#include <algorithm>
#include <cmath>

namespace Tactics {

EnemyInstance::EnemyInstance(int instanceId, const EnemyData& data)
    : instanceId_(instanceId), data_(data), currentHp_(std::max(1, data.baseHp)) {
    data_.baseHp = currentHp_;
}

int EnemyInstance::takeDamage(int amount) {
    if (!isAlive() || amount <= 0) return 0;
    const int mitigated = std::max(1, amount - effectiveDefense());
    const int dealt = std::min(mitigated, currentHp_);
    currentHp_ -= dealt;
    return dealt;
}

int EnemyInstance::heal(int amount) {
    if (!isAlive() || amount <= 0) return 0;
    const int restored = std::min(amount, data_.baseHp - currentHp_);
    currentHp_ += restored;
    return restored;
}

int EnemyInstance::effectiveAttack() const {
    return static_cast<int>(std::lround(data_.attackPower * status_.attackMultiplier()));
}

int EnemyInstance::effectiveDefense() const {
    return static_cast<int>(std::lround(data_.defense * status_.defenseMultiplier()));
}

void EnemyInstance::applyBuff(Engine::Status::EStatusId id, double multiplier, int durationTurns, int sourceId) {
    using Engine::Status::EStatusId;
    Engine::Status::StatusSpec spec;
    spec.id = id;
    spec.durationTurns = durationTurns;
    // GateBoost scales both stats; the dedicated boosts scale one.
    if (id == EStatusId::GateBoost || id == EStatusId::AttackBoost) spec.magnitude.attackMultiplier = multiplier;
    if (id == EStatusId::GateBoost || id == EStatusId::DefenseBoost) spec.magnitude.defenseMultiplier = multiplier;
    status_.apply(spec, sourceId);
}

void EnemyInstance::onTurnEnd() {
    if (cooldownRemaining_ > 0) --cooldownRemaining_;
    ++turnsSinceSpawned_;
    status_.tickTurn();
}

}  // namespace Tactics
