// Top-level battle flow: Initializing -> PlayerTurn <-> EnemyTurn -> Victory | Defeat.
#pragma once

#include "../../engine/core/Signal.h"
#include "BattleTypes.h"

namespace Tactics {

// Facts the win/lose evaluation reads each tick.
struct OutcomeSnapshot {
    bool playerAlive{true};
    bool allGatesDestroyed{false};
    int aliveEnemies{0};
    int enemiesDefeated{0};
    int turn{0};
    int maxTurns{50};
};

// Victory conditions are checked before defeat; gates before enemies.
BattleEndCondition evaluateOutcome(const OutcomeSnapshot& s);

class TurnPhaseHandler {
public:
    virtual ~TurnPhaseHandler() = default;

    virtual void onPlayerTurnBegin(int turn) = 0;
    virtual void onPlayerTurnEnd(int turn, TurnEndReason reason) = 0;
    // Enemy actions then gate spawns, synchronously.
    virtual void onEnemyTurn(int turn) = 0;
    virtual OutcomeSnapshot snapshotOutcome() const = 0;
    virtual void onBattleEnd(BattlePhase finalPhase, BattleEndCondition condition) = 0;
};

class TurnStateMachine {
public:
    // maxTurns 0 disables the turn limit.
    TurnStateMachine(TurnPhaseHandler& handler, int maxTurns);

    bool start();
    bool endPlayerTurn(TurnEndReason reason);
    // Evaluates win/lose; returns true if the battle ended on this call.
    bool tick();
    void reset();

    BattlePhase phase() const { return phase_; }
    int turn() const { return turn_; }
    int maxTurns() const { return maxTurns_; }
    bool isTerminal() const { return Tactics::isTerminal(phase_); }
    BattleEndCondition endCondition() const { return endCondition_; }

    Engine::Signal<BattlePhase> phaseChanged;
    Engine::Signal<int> turnChanged;

private:
    void setPhase(BattlePhase phase);
    void enterPlayerTurn();
    void finish(BattleEndCondition condition);

    TurnPhaseHandler& handler_;
    int maxTurns_{50};
    BattlePhase phase_{BattlePhase::Initializing};
    int turn_{0};
    BattleEndCondition endCondition_{BattleEndCondition::None};
};

}  // namespace Tactics
