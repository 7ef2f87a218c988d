#include "ComboData.h"

namespace Tactics {

namespace {
ComboEffect multiplier(double m) {
    ComboEffect e;
    e.type = ComboEffectType::DamageMultiplier;
    e.damageMultiplier = m;
    return e;
}

ComboEffect extraAction(int n) {
    ComboEffect e;
    e.type = ComboEffectType::AdditionalAction;
    e.additionalActions = n;
    return e;
}
}  // namespace

std::vector<ComboDefinition> defaultComboDefinitions() {
    std::vector<ComboDefinition> out;
    {
        ComboDefinition c;
        c.name = "Elemental Burst";
        c.condition.type = ComboType::Attribute;
        c.condition.requiredAttributes = {AttackAttribute::Fire, AttackAttribute::Ice, AttackAttribute::Thunder};
        c.condition.maxTurnInterval = 2;
        c.requiredWeaponCount = 2;
        c.effects = {multiplier(1.5)};
        c.priority = 1;
        c.description = "Chain two elemental weapons.";
        out.push_back(c);
    }
    {
        ComboDefinition c;
        c.name = "Blade Flurry";
        c.condition.type = ComboType::Weapon;
        c.condition.requiredWeaponTypes = {WeaponType::Sword, WeaponType::Axe};
        c.condition.maxTurnInterval = 1;
        c.requiredWeaponCount = 3;
        c.effects = {multiplier(1.3), extraAction(1)};
        c.priority = 2;
        c.description = "Three blade strikes grant an extra action.";
        out.push_back(c);
    }
    {
        ComboDefinition c;
        c.name = "Volley";
        c.condition.type = ComboType::Sequence;
        c.condition.requiresSequence = true;
        c.condition.maxTurnInterval = 3;
        c.steps = {ComboStep{WeaponType::Bow, std::nullopt, std::nullopt},
                   ComboStep{WeaponType::Spear, std::nullopt, std::nullopt}};
        c.requiredWeaponCount = 2;
        c.effects = {multiplier(2.0)};
        c.priority = 3;
        c.description = "Bow then spear.";
        out.push_back(c);
    }
    return out;
}

std::string_view toString(ComboType type) {
    switch (type) {
        case ComboType::Attribute: return "Attribute";
        case ComboType::Weapon: return "Weapon";
        case ComboType::Mixed: return "Mixed";
        case ComboType::Sequence: return "Sequence";
        case ComboType::Power: return "Power";
    }
    return "Unknown";
}

std::string_view toString(ComboEffectType type) {
    switch (type) {
        case ComboEffectType::DamageMultiplier: return "DamageMultiplier";
        case ComboEffectType::AdditionalAction: return "AdditionalAction";
        case ComboEffectType::StatusEffect: return "StatusEffect";
        case ComboEffectType::Healing: return "Healing";
        case ComboEffectType::BuffPlayer: return "BuffPlayer";
        case ComboEffectType::DebuffEnemy: return "DebuffEnemy";
        case ComboEffectType::SpecialAttack: return "SpecialAttack";
    }
    return "Unknown";
}

std::optional<ComboType> parseComboType(std::string_view key) {
    for (int i = 0; i <= static_cast<int>(ComboType::Power); ++i) {
        const auto t = static_cast<ComboType>(i);
        if (toString(t) == key) return t;
    }
    return std::nullopt;
}

std::optional<ComboEffectType> parseComboEffectType(std::string_view key) {
    for (int i = 0; i <= static_cast<int>(ComboEffectType::SpecialAttack); ++i) {
        const auto t = static_cast<ComboEffectType>(i);
        if (toString(t) == key) return t;
    }
    return std::nullopt;
}

}  // namespace Tactics
