// Owns one battle's state and exposes the commands accepted from outside.
#pragma once

#include <optional>
#include <random>

#include "../../engine/core/DeferredTasks.h"
#include "../../engine/core/Time.h"
#include "../data/BattleSetup.h"
#include "../data/PlayerState.h"
#include "../systems/ActionEconomy.h"
#include "../systems/ComboEngine.h"
#include "../systems/DamagePipeline.h"
#include "../systems/EnemyActionSystem.h"
#include "../systems/GateSpawnScheduler.h"
#include "BattleEvents.h"
#include "BattleSummary.h"
#include "GridField.h"
#include "HandController.h"
#include "TargetSelection.h"
#include "TurnStateMachine.h"

namespace Tactics {

class BattleSession : public TurnPhaseHandler {
public:
    explicit BattleSession(BattleSetup setup);
    ~BattleSession() override = default;

    BattleSession(const BattleSession&) = delete;
    BattleSession& operator=(const BattleSession&) = delete;

    bool start();
    // Advances deferred tasks and the turn timer, then evaluates win/lose.
    void update(const Engine::TimeStep& step);

    CommandResult selectColumnTarget(int column);
    CommandResult selectEnemyTarget(const GridPosition& pos);
    CommandResult reselectLastTarget();
    CommandResult clearTargetSelection();
    CardPlayResult playCard(int slotIndex);
    CommandResult endPlayerTurn(TurnEndReason reason = TurnEndReason::Manual);
    CommandResult addActionBonus(int amount);
    CommandResult resetBattle();

    BattlePhase phase() const { return turns_.phase(); }
    int turn() const { return turns_.turn(); }
    double turnTimeElapsed() const { return turnTimer_; }
    const BattleConfig& config() const { return config_; }
    const BattleStats& stats() const { return stats_; }
    const std::optional<BattleSummary>& summary() const { return summary_; }

    BattleEvents& events() { return events_; }
    GridField& field() { return field_; }
    const GridField& field() const { return field_; }
    PlayerState& player() { return player_; }
    const PlayerState& player() const { return player_; }
    HandController& hand() { return hand_; }
    const HandController& hand() const { return hand_; }
    ActionEconomy& economy() { return economy_; }
    const ActionEconomy& economy() const { return economy_; }
    ComboEngine& combos() { return combos_; }
    DamagePipeline& damage() { return damage_; }
    const TargetSelector& targetSelector() const { return selector_; }
    TurnStateMachine& turns() { return turns_; }
    Engine::DeferredTaskQueue& tasks() { return tasks_; }
    std::mt19937& rng() { return rng_; }

    // TurnPhaseHandler
    void onPlayerTurnBegin(int turn) override;
    void onPlayerTurnEnd(int turn, TurnEndReason reason) override;
    void onEnemyTurn(int turn) override;
    OutcomeSnapshot snapshotOutcome() const override;
    void onBattleEnd(BattlePhase finalPhase, BattleEndCondition condition) override;

private:
    void wireEvents();
    void recordApplication(const DamageApplication& applied);

    BattleEvents events_;
    BattleConfig config_;
    EnemyCatalog enemyCatalog_;
    std::mt19937 rng_;
    Engine::DeferredTaskQueue tasks_;
    PlayerState player_;
    GridField field_;
    ComboEngine combos_;
    DamagePipeline damage_;
    ActionEconomy economy_;
    GateSpawnScheduler spawner_;
    EnemyActionSystem enemyActions_;
    TargetSelector selector_;
    TurnStateMachine turns_;
    HandController hand_;

    BattleStats stats_{};
    std::optional<BattleSummary> summary_;
    double turnTimer_{0.0};
};

}  // namespace Tactics
