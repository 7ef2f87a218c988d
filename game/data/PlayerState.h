// Player health, attack power and equipped weapon slots for one battle.
#pragma once

#include <vector>

#include "WeaponData.h"

namespace Tactics {

class PlayerState {
public:
    PlayerState() = default;
    PlayerState(int maxHp, int baseAttackPower, std::vector<WeaponData> weapons);

    int maxHp() const { return maxHp_; }
    int currentHp() const { return currentHp_; }
    int baseAttackPower() const { return baseAttackPower_; }
    bool isAlive() const { return currentHp_ > 0; }

    // Returns the amount actually removed / restored.
    int takeDamage(int amount);
    int heal(int amount);
    void setBaseAttackPower(int value) { baseAttackPower_ = value; }

    const std::vector<WeaponData>& weapons() const { return weapons_; }
    const WeaponData* weapon(int index) const;
    bool equip(int slot, const WeaponData& weapon);
    int weaponCount() const { return static_cast<int>(weapons_.size()); }

    int weaponCooldown(int index) const;
    bool canUseWeapon(int index) const;
    void startWeaponCooldown(int index);
    void decrementCooldowns();

    // Full HP and cleared cooldowns.
    void resetForBattle();

private:
    int maxHp_{15000};
    int currentHp_{15000};
    int baseAttackPower_{100};
    std::vector<WeaponData> weapons_;
    std::vector<int> cooldowns_;
};

}  // namespace Tactics
