// Outbound notifications for presentation, audio and persistence layers.
#pragma once

#include "../../engine/core/Signal.h"
#include "../data/PlayerState.h"
#include "../systems/ComboEngine.h"
#include "../systems/GateSpawnScheduler.h"
#include "BattleSummary.h"
#include "BattleTypes.h"
#include "Gate.h"
#include "HandController.h"
#include "TargetSelection.h"

namespace Tactics {

struct BattleEvents {
    Engine::Signal<int> turnChanged;
    Engine::Signal<BattlePhase> phaseChanged;
    Engine::Signal<const PlayerState&> playerChanged;
    Engine::Signal<const std::vector<std::optional<CardData>>&> handGenerated;
    Engine::Signal<> handCleared;
    Engine::Signal<const CardPlayResult&> cardPlayed;
    Engine::Signal<const PendingDamageInfo&> pendingDamageCalculated;
    Engine::Signal<const PendingDamageInfo&, const DamageApplication&> pendingDamageApplied;
    Engine::Signal<> pendingDamageCleared;
    Engine::Signal<int, int> actionsChanged;  // remaining, max
    Engine::Signal<> actionsExhausted;
    Engine::Signal<> autoTurnEnd;
    Engine::Signal<const ComboOutcome&> comboCompleted;
    Engine::Signal<const SpawnRecord&> enemySpawned;
    Engine::Signal<const Gate&> gateDestroyed;
    Engine::Signal<const TargetSelection&> targetSelectionChanged;
    Engine::Signal<const BattleSummary&> battleEnded;
};

}  // namespace Tactics
