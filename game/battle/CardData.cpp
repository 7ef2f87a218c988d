#include "CardData.h"

#include <algorithm>

namespace Tactics {

std::string columnDisplayName(int column, int totalColumns) {
    if (totalColumns <= 1) return {};
    if (totalColumns == 2) return column == 0 ? "Left" : "Right";
    if (totalColumns == 3) {
        static const char* names[] = {"Left", "Middle", "Right"};
        return names[std::clamp(column, 0, 2)];
    }
    return "Column " + std::to_string(column + 1);
}

CardData CardData::make(const WeaponData& weapon, int weaponIndex, int column, int totalColumns) {
    CardData card;
    card.weapon = weapon;
    card.weaponIndex = weaponIndex;
    card.targetColumn = std::clamp(column, 0, std::max(0, totalColumns - 1));
    card.columnName = columnDisplayName(card.targetColumn, totalColumns);
    card.cardId = weapon.name + "#" + std::to_string(weaponIndex) + "@" + std::to_string(card.targetColumn);
    card.displayName = card.columnName.empty() ? weapon.name : weapon.name + " (" + card.columnName + ")";
    return card;
}

}  // namespace Tactics
