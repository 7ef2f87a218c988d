// Static weapon definitions consumed by the hand and damage pipeline.
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace Tactics {

enum class AttackAttribute { Fire, Ice, Thunder, Wind, Earth, Light, Dark, None };

enum class WeaponType { Sword, Axe, Spear, Bow, Gun, Shield, Magic, Tool };

// Row1 is the front row, Row2 the back row.
enum class AttackRange { SingleFront, SingleTarget, Row1, Row2, Column, All, Self };

constexpr int kMaxWeaponPower = 200;
constexpr int kMaxEquippedWeapons = 4;

struct WeaponData {
    std::string name{"Weapon"};
    AttackAttribute attribute{AttackAttribute::None};
    WeaponType type{WeaponType::Sword};
    int basePower{100};
    AttackRange range{AttackRange::SingleFront};
    int criticalRate{5};
    int cooldownTurns{0};
    bool canUseConsecutively{true};
    std::string description;
};

std::string_view toString(AttackAttribute attr);
std::string_view toString(WeaponType type);
std::string_view toString(AttackRange range);
std::optional<AttackAttribute> parseAttackAttribute(std::string_view key);
std::optional<WeaponType> parseWeaponType(std::string_view key);
std::optional<AttackRange> parseAttackRange(std::string_view key);

}  // namespace Tactics
