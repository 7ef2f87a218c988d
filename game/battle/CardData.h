// One playable hand slot: a weapon plus the column it aims at.
#pragma once

#include <string>

#include "../data/WeaponData.h"

namespace Tactics {

struct CardData {
    std::string cardId;
    std::string displayName;
    std::string columnName;
    int weaponIndex{-1};
    WeaponData weapon{};
    int targetColumn{0};

    static CardData make(const WeaponData& weapon, int weaponIndex, int column, int totalColumns);
};

std::string columnDisplayName(int column, int totalColumns);

}  // namespace Tactics
