#include "WeaponData.h"

#include <array>
#include <utility>

namespace Tactics {

namespace {
constexpr std::array<std::pair<AttackAttribute, std::string_view>, 8> kAttributes{{
    {AttackAttribute::Fire, "Fire"},
    {AttackAttribute::Ice, "Ice"},
    {AttackAttribute::Thunder, "Thunder"},
    {AttackAttribute::Wind, "Wind"},
    {AttackAttribute::Earth, "Earth"},
    {AttackAttribute::Light, "Light"},
    {AttackAttribute::Dark, "Dark"},
    {AttackAttribute::None, "None"},
}};

constexpr std::array<std::pair<WeaponType, std::string_view>, 8> kTypes{{
    {WeaponType::Sword, "Sword"},
    {WeaponType::Axe, "Axe"},
    {WeaponType::Spear, "Spear"},
    {WeaponType::Bow, "Bow"},
    {WeaponType::Gun, "Gun"},
    {WeaponType::Shield, "Shield"},
    {WeaponType::Magic, "Magic"},
    {WeaponType::Tool, "Tool"},
}};

constexpr std::array<std::pair<AttackRange, std::string_view>, 7> kRanges{{
    {AttackRange::SingleFront, "SingleFront"},
    {AttackRange::SingleTarget, "SingleTarget"},
    {AttackRange::Row1, "Row1"},
    {AttackRange::Row2, "Row2"},
    {AttackRange::Column, "Column"},
    {AttackRange::All, "All"},
    {AttackRange::Self, "Self"},
}};

template <typename E, std::size_t N>
std::string_view nameOf(const std::array<std::pair<E, std::string_view>, N>& table, E value) {
    for (const auto& [e, name] : table) {
        if (e == value) return name;
    }
    return "Unknown";
}

template <typename E, std::size_t N>
std::optional<E> lookup(const std::array<std::pair<E, std::string_view>, N>& table, std::string_view key) {
    for (const auto& [e, name] : table) {
        if (name == key) return e;
    }
    return std::nullopt;
}
}  // namespace

std::string_view toString(AttackAttribute attr) { return nameOf(kAttributes, attr); }
std::string_view toString(WeaponType type) { return nameOf(kTypes, type); }
std::string_view toString(AttackRange range) { return nameOf(kRanges, range); }

std::optional<AttackAttribute> parseAttackAttribute(std::string_view key) { return lookup(kAttributes, key); }
std::optional<WeaponType> parseWeaponType(std::string_view key) { return lookup(kTypes, key); }
std::optional<AttackRange> parseAttackRange(std::string_view key) { return lookup(kRanges, key); }

}  // namespace Tactics
