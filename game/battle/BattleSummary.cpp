#include "BattleSummary.h"

#include <string>

namespace Tactics {

nlohmann::json BattleSummary::toJson() const {
    nlohmann::json j;
    j["victory"] = victory;
    j["condition"] = std::string(toString(condition));
    j["turnsUsed"] = turnsUsed;
    j["playerHpRemaining"] = playerHpRemaining;

    nlohmann::json s;
    s["damageDealt"] = stats.damageDealt;
    s["damageTaken"] = stats.damageTaken;
    s["enemiesDefeated"] = stats.enemiesDefeated;
    s["enemiesSpawned"] = stats.enemiesSpawned;
    s["gatesDestroyed"] = stats.gatesDestroyed;
    s["cardsPlayed"] = stats.cardsPlayed;
    s["combosCompleted"] = stats.combosCompleted;
    j["stats"] = s;
    return j;
}

}  // namespace Tactics
