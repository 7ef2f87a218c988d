#include "PlayerState.h"

#include <algorithm>

namespace Tactics {

PlayerState::PlayerState(int maxHp, int baseAttackPower, std::vector<WeaponData> weapons)
    : maxHp_(std::max(1, maxHp)), currentHp_(std::max(1, maxHp)), baseAttackPower_(baseAttackPower),
      weapons_(std::move(weapons)) {
    if (weapons_.size() > static_cast<std::size_t>(kMaxEquippedWeapons)) {
        weapons_.resize(kMaxEquippedWeapons);
    }
    cooldowns_.assign(weapons_.size(), 0);
}

int PlayerState::takeDamage(int amount) {
    if (amount <= 0) return 0;
    const int dealt = std::min(amount, currentHp_);
    currentHp_ -= dealt;
    return dealt;
}

int PlayerState::heal(int amount) {
    if (amount <= 0 || !isAlive()) return 0;
    const int restored = std::min(amount, maxHp_ - currentHp_);
    currentHp_ += restored;
    return restored;
}

const WeaponData* PlayerState::weapon(int index) const {
    if (index < 0 || index >= weaponCount()) return nullptr;
    return &weapons_[static_cast<std::size_t>(index)];
}

bool PlayerState::equip(int slot, const WeaponData& weapon) {
    if (slot < 0 || slot >= kMaxEquippedWeapons) return false;
    if (slot >= weaponCount()) {
        weapons_.resize(static_cast<std::size_t>(slot) + 1);
        cooldowns_.resize(weapons_.size(), 0);
    }
    weapons_[static_cast<std::size_t>(slot)] = weapon;
    cooldowns_[static_cast<std::size_t>(slot)] = 0;
    return true;
}

int PlayerState::weaponCooldown(int index) const {
    if (index < 0 || index >= weaponCount()) return 0;
    return cooldowns_[static_cast<std::size_t>(index)];
}

bool PlayerState::canUseWeapon(int index) const {
    const WeaponData* w = weapon(index);
    if (!w) return false;
    if (w->cooldownTurns <= 0 || w->canUseConsecutively) return true;
    return cooldowns_[static_cast<std::size_t>(index)] <= 0;
}

void PlayerState::startWeaponCooldown(int index) {
    const WeaponData* w = weapon(index);
    if (!w) return;
    cooldowns_[static_cast<std::size_t>(index)] = std::max(0, w->cooldownTurns);
}

void PlayerState::decrementCooldowns() {
    for (auto& c : cooldowns_) {
        if (c > 0) --c;
    }
}

void PlayerState::resetForBattle() {
    currentHp_ = maxHp_;
    std::fill(cooldowns_.begin(), cooldowns_.end(), 0);
}

}  // namespace Tactics
