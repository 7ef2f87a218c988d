// Declarative combo definitions.
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "WeaponData.h"

namespace Tactics {

enum class ComboType { Attribute, Weapon, Mixed, Sequence, Power };

enum class ComboEffectType { DamageMultiplier, AdditionalAction, StatusEffect, Healing, BuffPlayer, DebuffEnemy, SpecialAttack };

// Empty filters accept any weapon.
struct ComboCondition {
    ComboType type{ComboType::Attribute};
    std::vector<AttackAttribute> requiredAttributes;
    std::vector<WeaponType> requiredWeaponTypes;
    std::vector<int> requiredWeaponIndices;
    int minAttackPower{0};  // player base + weapon power
    bool requiresSequence{false};
    int maxTurnInterval{0};  // 0 = no expiry
};

// Optional pinned fields for one explicit step.
struct ComboStep {
    std::optional<WeaponType> weaponType;
    std::optional<AttackAttribute> attribute;
    std::optional<int> weaponIndex;
};

struct ComboEffect {
    ComboEffectType type{ComboEffectType::DamageMultiplier};
    double damageMultiplier{1.0};
    int additionalActions{0};
    int healingAmount{0};
    AttackAttribute statusAttribute{AttackAttribute::None};
    int statusDuration{0};
    int buffValue{0};
    int effectDuration{0};
    std::string description;
};

struct ComboDefinition {
    std::string name;
    ComboCondition condition;
    std::vector<ComboEffect> effects;
    int requiredWeaponCount{2};
    std::vector<ComboStep> steps;
    int priority{0};
    std::string description;

    int stepCount() const { return steps.empty() ? requiredWeaponCount : static_cast<int>(steps.size()); }
    double damageMultiplier() const {
        double mul = 1.0;
        for (const auto& e : effects) {
            if (e.type == ComboEffectType::DamageMultiplier) mul *= e.damageMultiplier;
        }
        return mul;
    }
};

std::vector<ComboDefinition> defaultComboDefinitions();

std::string_view toString(ComboType type);
std::string_view toString(ComboEffectType type);
std::optional<ComboType> parseComboType(std::string_view key);
std::optional<ComboEffectType> parseComboEffectType(std::string_view key);

}  // namespace Tactics
