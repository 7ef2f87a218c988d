#include "TurnStateMachine.h"

#include <algorithm>
#include <string>

#include "../../engine/core/Logger.h"

namespace Tactics {

BattleEndCondition evaluateOutcome(const OutcomeSnapshot& s) {
    if (s.allGatesDestroyed) return BattleEndCondition::AllGatesDestroyed;
    // An empty opening grid is not a win.
    if (s.aliveEnemies == 0 && s.enemiesDefeated > 0) return BattleEndCondition::AllEnemiesDefeated;
    if (!s.playerAlive) return BattleEndCondition::PlayerDefeated;
    if (s.maxTurns > 0 && s.turn >= s.maxTurns) return BattleEndCondition::TurnLimitReached;
    return BattleEndCondition::None;
}

TurnStateMachine::TurnStateMachine(TurnPhaseHandler& handler, int maxTurns)
    : handler_(handler), maxTurns_(std::max(0, maxTurns)) {}

void TurnStateMachine::setPhase(BattlePhase phase) {
    if (phase_ == phase) return;
    phase_ = phase;
    Engine::logDebug("Phase -> " + std::string(toString(phase)));
    phaseChanged.emit(phase);
}

bool TurnStateMachine::start() {
    if (phase_ != BattlePhase::Initializing) return false;
    Engine::logInfo(maxTurns_ > 0 ? "Battle start (max turns " + std::to_string(maxTurns_) + ")"
                                  : std::string("Battle start (no turn limit)"));
    enterPlayerTurn();
    return true;
}

void TurnStateMachine::enterPlayerTurn() {
    ++turn_;
    turnChanged.emit(turn_);
    // The turn that reaches the limit is never opened.
    if (maxTurns_ > 0 && turn_ >= maxTurns_) {
        finish(BattleEndCondition::TurnLimitReached);
        return;
    }
    setPhase(BattlePhase::PlayerTurn);
    handler_.onPlayerTurnBegin(turn_);
}

bool TurnStateMachine::endPlayerTurn(TurnEndReason reason) {
    if (phase_ != BattlePhase::PlayerTurn) return false;
    Engine::logInfo("Turn " + std::to_string(turn_) + " ended (" + std::string(toString(reason)) + ")");
    handler_.onPlayerTurnEnd(turn_, reason);

    setPhase(BattlePhase::EnemyTurn);
    handler_.onEnemyTurn(turn_);
    if (tick()) return true;

    enterPlayerTurn();
    return true;
}

bool TurnStateMachine::tick() {
    if (phase_ == BattlePhase::Initializing || isTerminal()) return false;

    const BattleEndCondition condition = evaluateOutcome(handler_.snapshotOutcome());
    if (condition == BattleEndCondition::None) return false;

    finish(condition);
    return true;
}

void TurnStateMachine::finish(BattleEndCondition condition) {
    endCondition_ = condition;
    const bool won =
        condition == BattleEndCondition::AllGatesDestroyed || condition == BattleEndCondition::AllEnemiesDefeated;
    setPhase(won ? BattlePhase::Victory : BattlePhase::Defeat);
    Engine::logInfo(std::string(won ? "Victory: " : "Defeat: ") + std::string(toString(condition)) + " on turn " +
                    std::to_string(turn_));
    handler_.onBattleEnd(phase_, condition);
}

void TurnStateMachine::reset() {
    turn_ = 0;
    endCondition_ = BattleEndCondition::None;
    setPhase(BattlePhase::Initializing);
    turnChanged.emit(turn_);
}

}  // namespace Tactics
