#include "BattleSession.h"

#include <algorithm>
#include <string>

#include "../../engine/core/Logger.h"

namespace Tactics {

namespace {
BattleConfig sanitize(BattleConfig cfg) {
    cfg.gateCount = std::max(1, cfg.gateCount);
    cfg.maxTurns = std::max(0, cfg.maxTurns);
    cfg.turnTimeLimitSeconds = std::max(0.0, cfg.turnTimeLimitSeconds);
    cfg.handSize = std::max(1, cfg.handSize);
    cfg.baseActionsPerTurn = std::max(1, cfg.baseActionsPerTurn);
    cfg.autoEndTurnDelaySeconds = std::max(0.0, cfg.autoEndTurnDelaySeconds);
    cfg.maxActiveCombos = std::max(1, cfg.maxActiveCombos);
    return cfg;
}

template <typename... Args>
void relay(Engine::Signal<Args...>& from, Engine::Signal<Args...>& to) {
    from.connect([&to](Args... args) { to.emit(args...); });
}
}  // namespace

BattleSession::BattleSession(BattleSetup setup)
    : config_(sanitize(setup.config)),
      enemyCatalog_(std::move(setup.enemies)),
      rng_(config_.seed),
      player_(config_.player.maxHp, config_.player.baseAttackPower, std::move(setup.loadout)),
      field_(config_.gateCount, setup.gateTypes),
      combos_(std::move(setup.combos), config_.maxActiveCombos),
      damage_(player_, combos_),
      economy_(tasks_, ActionEconomySettings{config_.baseActionsPerTurn, config_.autoEndTurnWhenExhausted,
                                             config_.autoEndTurnDelaySeconds}),
      spawner_(rng_, [this](int id) { return enemyCatalog_.find(id); }),
      turns_(*this, config_.maxTurns),
      hand_(HandSettings{config_.handSize, config_.randomizeCardColumns}, player_, field_, damage_, economy_, turns_,
            selector_, rng_) {
    wireEvents();
}

void BattleSession::wireEvents() {
    relay(turns_.turnChanged, events_.turnChanged);
    relay(turns_.phaseChanged, events_.phaseChanged);
    relay(hand_.handGenerated, events_.handGenerated);
    relay(hand_.handCleared, events_.handCleared);
    relay(hand_.pendingDamageCalculated, events_.pendingDamageCalculated);
    relay(hand_.pendingDamageApplied, events_.pendingDamageApplied);
    relay(hand_.pendingDamageCleared, events_.pendingDamageCleared);
    relay(economy_.actionsChanged, events_.actionsChanged);
    relay(economy_.actionsExhausted, events_.actionsExhausted);
    combos_.comboCompleted.connect([this](const ComboOutcome& outcome) {
        ++stats_.combosCompleted;
        events_.comboCompleted.emit(outcome);
    });
    economy_.autoTurnEnd.connect([this]() {
        events_.autoTurnEnd.emit();
        endPlayerTurn(TurnEndReason::ActionsExhausted);
    });
}

bool BattleSession::start() {
    if (turns_.phase() != BattlePhase::Initializing) return false;
    Engine::logInfo("Battle session: " + std::to_string(field_.gates().size()) + " gates, " +
                    std::to_string(player_.weaponCount()) + " weapons, " + std::to_string(player_.maxHp()) + " HP");
    return turns_.start();
}

void BattleSession::update(const Engine::TimeStep& step) {
    tasks_.update(step);

    if (turns_.phase() == BattlePhase::PlayerTurn && config_.turnTimeLimitSeconds > 0.0) {
        turnTimer_ += step.deltaSeconds;
        if (turnTimer_ >= config_.turnTimeLimitSeconds) {
            Engine::logInfo("Turn time limit reached");
            endPlayerTurn(TurnEndReason::TimeOut);
        }
    }
    turns_.tick();
}

void BattleSession::recordApplication(const DamageApplication& applied) {
    stats_.damageDealt += applied.totalDealt;
    stats_.enemiesDefeated += static_cast<int>(applied.defeatedEnemyIds.size());
    stats_.gatesDestroyed += static_cast<int>(applied.destroyedGateIds.size());
    for (int id : applied.destroyedGateIds) {
        if (const Gate* gate = field_.gate(id)) events_.gateDestroyed.emit(*gate);
    }
}

CardPlayResult BattleSession::playCard(int slotIndex) {
    const int hpBefore = player_.currentHp();
    CardPlayResult result = hand_.playCard(slotIndex);
    if (result.committed) {
        ++stats_.cardsPlayed;
        recordApplication(result.applied);
        if (player_.currentHp() != hpBefore) events_.playerChanged.emit(player_);
    }
    if (result.ok) events_.cardPlayed.emit(result);
    if (result.committed) turns_.tick();
    return result;
}

CommandResult BattleSession::selectColumnTarget(int column) {
    if (turns_.phase() != BattlePhase::PlayerTurn) {
        return CommandResult::reject(Rejection::WrongPhase, "Targets can only be chosen on the player turn");
    }
    if (column < 0 || column >= field_.columns()) {
        return CommandResult::reject(Rejection::InvalidInput, "Column out of range");
    }
    hand_.cancelSelection();
    selector_.selectColumn(column);
    events_.targetSelectionChanged.emit(selector_.current());
    return CommandResult::success("Column " + std::to_string(column) + " targeted");
}

CommandResult BattleSession::selectEnemyTarget(const GridPosition& pos) {
    if (turns_.phase() != BattlePhase::PlayerTurn) {
        return CommandResult::reject(Rejection::WrongPhase, "Targets can only be chosen on the player turn");
    }
    if (!field_.isValidPosition(pos)) {
        return CommandResult::reject(Rejection::InvalidInput, "Position " + pos.toString() + " is off the grid");
    }
    const EnemyInstance* enemy = field_.enemyAt(pos);
    if (!enemy || !enemy->isAlive()) {
        return CommandResult::reject(Rejection::NoValidTarget, "No enemy at " + pos.toString());
    }
    hand_.cancelSelection();
    selector_.selectEnemy(pos);
    events_.targetSelectionChanged.emit(selector_.current());
    return CommandResult::success(enemy->data().name + " targeted");
}

CommandResult BattleSession::reselectLastTarget() {
    if (turns_.phase() != BattlePhase::PlayerTurn) {
        return CommandResult::reject(Rejection::WrongPhase, "Targets can only be chosen on the player turn");
    }
    const TargetSelection& prev = selector_.previous();
    if (!prev.active()) {
        return CommandResult::reject(Rejection::InvalidInput, "No previous target");
    }
    if (prev.mode == TargetSelectionMode::EnemyPosition) {
        const EnemyInstance* enemy = field_.enemyAt(prev.enemyPosition);
        if (!enemy || !enemy->isAlive()) {
            return CommandResult::reject(Rejection::NoValidTarget, "Previous target is gone");
        }
    }
    hand_.cancelSelection();
    selector_.reselectLast();
    events_.targetSelectionChanged.emit(selector_.current());
    return CommandResult::success("Previous target restored");
}

CommandResult BattleSession::clearTargetSelection() {
    if (!selector_.current().active()) return CommandResult::success();
    hand_.cancelSelection();
    selector_.clear();
    events_.targetSelectionChanged.emit(selector_.current());
    return CommandResult::success("Target cleared");
}

CommandResult BattleSession::endPlayerTurn(TurnEndReason reason) {
    if (turns_.phase() != BattlePhase::PlayerTurn) {
        return CommandResult::reject(Rejection::WrongPhase, "Not the player turn");
    }
    turns_.endPlayerTurn(reason);
    return CommandResult::success(std::string("Turn ended: ") + std::string(toString(reason)));
}

CommandResult BattleSession::addActionBonus(int amount) {
    if (amount <= 0) {
        return CommandResult::reject(Rejection::InvalidInput, "Bonus must be positive");
    }
    economy_.addActionBonus(amount);
    // A grant after exhaustion reopens the hand while the turn is still running.
    if (turns_.phase() == BattlePhase::PlayerTurn && economy_.hasActions()) hand_.reopenHand();
    return CommandResult::success("Action bonus +" + std::to_string(amount));
}

CommandResult BattleSession::resetBattle() {
    tasks_.clear();
    rng_.seed(config_.seed);
    field_.resetField();
    player_.resetForBattle();
    combos_.reset();
    economy_.reset();
    hand_.clearHand();
    hand_.resetStatistics();
    selector_ = TargetSelector{};
    stats_ = BattleStats{};
    summary_.reset();
    turnTimer_ = 0.0;
    turns_.reset();
    events_.playerChanged.emit(player_);
    Engine::logInfo("Battle reset");
    return CommandResult::success("Battle reset");
}

void BattleSession::onPlayerTurnBegin(int turn) {
    turnTimer_ = 0.0;
    if (selector_.current().active()) {
        selector_.clear();
        events_.targetSelectionChanged.emit(selector_.current());
    }
    player_.decrementCooldowns();
    combos_.expireStale(turn);
    economy_.beginTurn();
    hand_.generateHand();
}

void BattleSession::onPlayerTurnEnd(int /*turn*/, TurnEndReason /*reason*/) {
    economy_.endTurn();
    hand_.lockHand();
}

void BattleSession::onEnemyTurn(int turn) {
    field_.applyGateEffects();
    const EnemyPhaseReport report = enemyActions_.run(field_, player_);
    stats_.damageTaken += report.damageToPlayer;
    if (report.damageToPlayer > 0) {
        Engine::logInfo("Enemies dealt " + std::to_string(report.damageToPlayer) + " damage (player HP " +
                        std::to_string(player_.currentHp()) + "/" + std::to_string(player_.maxHp()) + ")");
        events_.playerChanged.emit(player_);
    }
    if (!player_.isAlive()) return;

    for (const auto& spawned : spawner_.update(field_, turn)) {
        ++stats_.enemiesSpawned;
        events_.enemySpawned.emit(spawned);
    }
}

OutcomeSnapshot BattleSession::snapshotOutcome() const {
    OutcomeSnapshot s;
    s.playerAlive = player_.isAlive();
    s.allGatesDestroyed = field_.allGatesDestroyed();
    s.aliveEnemies = field_.aliveEnemyCount();
    s.enemiesDefeated = stats_.enemiesDefeated;
    s.turn = turns_.turn();
    s.maxTurns = config_.maxTurns;
    return s;
}

void BattleSession::onBattleEnd(BattlePhase finalPhase, BattleEndCondition condition) {
    // Mop-up plays may still spend actions, but never schedule another turn end.
    economy_.endTurn();
    if (finalPhase == BattlePhase::Defeat) hand_.lockHand();

    BattleSummary summary;
    summary.victory = finalPhase == BattlePhase::Victory;
    summary.condition = condition;
    summary.turnsUsed = turns_.turn();
    summary.stats = stats_;
    summary.playerHpRemaining = player_.currentHp();
    summary_ = summary;
    events_.battleEnded.emit(summary);
}

}  // namespace Tactics
