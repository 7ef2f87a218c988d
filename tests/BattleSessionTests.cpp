// End-to-end battle scenarios driven through the session commands.
#include <cassert>

#include "../game/battle/BattleSession.h"

using namespace Tactics;

namespace {

WeaponData saber() {
    WeaponData w;
    w.name = "Saber";
    w.basePower = 100;
    w.range = AttackRange::SingleFront;
    return w;
}

BattleSetup makeSetup(int actions, int gates = 3) {
    BattleSetup s;
    s.config.gateCount = gates;
    s.config.baseActionsPerTurn = actions;
    s.config.randomizeCardColumns = false;
    s.config.turnTimeLimitSeconds = 0.0;
    s.loadout = {saber()};
    return s;
}

EnemyData brute(int hp, int attack) {
    EnemyData d;
    d.id = 1;
    d.name = "Brute";
    d.baseHp = hp;
    d.attackPower = attack;
    return d;
}

}  // namespace

int main() {
    {
        // Simple kill: the only enemy dies, which wins the battle; mop-up plays stay open.
        BattleSession session(makeSetup(2));
        int ended = 0;
        session.events().battleEnded.connect([&](const BattleSummary&) { ++ended; });
        assert(session.start());
        session.field().spawnEnemy(brute(80, 100), GridPosition{0, kFrontRow}, 0);

        assert(!session.playCard(0).committed);
        const CardPlayResult commit = session.playCard(0);
        assert(commit.committed);
        assert(commit.damage.finalDamage == 200);
        assert(session.stats().enemiesDefeated == 1);
        assert(session.stats().damageDealt == 80);
        assert(session.stats().cardsPlayed == 1);
        assert(session.field().aliveEnemyCount() == 0);

        assert(session.phase() == BattlePhase::Victory);
        assert(ended == 1);
        assert(session.summary().has_value());
        assert(session.summary()->victory);
        assert(session.summary()->condition == BattleEndCondition::AllEnemiesDefeated);
        const auto json = session.summary()->toJson();
        assert(json["victory"].get<bool>());
        assert(json["condition"].get<std::string>() == "AllEnemiesDefeated");
        assert(json["stats"]["enemiesDefeated"].get<int>() == 1);

        assert(session.playCard(1).ok);
        assert(!session.endPlayerTurn().ok);

        // A mop-up play spending the last action schedules no turn end.
        int autoEnds = 0;
        session.events().autoTurnEnd.connect([&]() { ++autoEnds; });
        const CardPlayResult mopUp = session.playCard(1);
        assert(mopUp.committed);
        assert(mopUp.actionsExhausted);
        assert(!session.economy().autoEndPending());
        assert(session.tasks().pendingCount() == 0);
        session.update(Engine::TimeStep{1.0, 1.0});
        assert(autoEnds == 0);
        assert(session.phase() == BattlePhase::Victory);
        assert(ended == 1);
    }
    {
        // The final turn end reaches the limit: no new hand, no further plays.
        BattleSetup setup = makeSetup(1);
        setup.config.maxTurns = 2;
        BattleSession session(std::move(setup));
        int hands = 0;
        session.events().handGenerated.connect([&](const std::vector<std::optional<CardData>>&) { ++hands; });
        session.start();
        assert(hands == 1);
        session.update(Engine::TimeStep{0.1, 0.1});
        assert(session.phase() == BattlePhase::PlayerTurn);

        assert(session.endPlayerTurn().ok);
        assert(session.phase() == BattlePhase::Defeat);
        assert(hands == 1);
        assert(session.playCard(0).reason == Rejection::WrongPhase);
        assert(session.summary()->condition == BattleEndCondition::TurnLimitReached);
        assert(session.summary()->turnsUsed == 2);
    }
    {
        // Without a turn limit the battle keeps going.
        BattleSetup setup = makeSetup(1);
        setup.config.maxTurns = 0;
        setup.config.player.maxHp = 1000000000;
        BattleSession session(std::move(setup));
        session.start();
        for (int i = 0; i < 60; ++i) {
            session.update(Engine::TimeStep{0.1, 0.1});
            session.endPlayerTurn();
        }
        assert(session.turn() == 61);
        assert(session.phase() == BattlePhase::PlayerTurn);
        assert(!session.summary().has_value());
    }
    {
        // One action per turn: exhaustion fires once and the turn ends after the delay.
        BattleSession session(makeSetup(1));
        int exhausted = 0;
        int autoEnds = 0;
        session.events().actionsExhausted.connect([&]() { ++exhausted; });
        session.events().autoTurnEnd.connect([&]() { ++autoEnds; });
        session.start();

        session.playCard(0);
        const CardPlayResult commit = session.playCard(0);
        assert(commit.committed);
        assert(commit.actionsExhausted);
        assert(session.economy().remainingActions() == 0);
        assert(exhausted == 1);
        assert(session.playCard(1).reason == Rejection::HandNotReady);

        Engine::TimeStep step{};
        step = Engine::advance(step, 0.3);
        session.update(step);
        assert(session.turn() == 1);
        step = Engine::advance(step, 0.3);
        session.update(step);
        assert(autoEnds == 1);
        assert(exhausted == 1);
        assert(session.turn() == 2);
        assert(session.phase() == BattlePhase::PlayerTurn);
        assert(session.economy().remainingActions() == 1);
        assert(session.hand().state() == HandState::Generated);
        assert(session.hand().cardCount() == 5);
    }
    {
        // Four gates: Support, Summoner, Standard, Elite. The Summoner opens with five spawns.
        BattleSession session(makeSetup(1, 4));
        const auto& gates = session.field().gates();
        assert(gates.size() == 4);
        assert(gates[0].type() == GateType::Support);
        assert(gates[1].type() == GateType::Summoner);
        assert(gates[2].type() == GateType::Standard);
        assert(gates[3].type() == GateType::Elite);

        int spawnEvents = 0;
        session.events().enemySpawned.connect([&](const SpawnRecord&) { ++spawnEvents; });
        session.start();
        assert(session.endPlayerTurn().ok);
        assert(session.turn() == 2);
        assert(session.field().aliveEnemyCount() == 5);
        assert(spawnEvents == 5);
        assert(session.player().currentHp() == 15000);

        // Turn 2: Support buffs the imps (800 x 1.2), then Standard adds two more.
        session.endPlayerTurn();
        assert(session.stats().damageTaken == 5 * 960);
        assert(session.player().currentHp() == 15000 - 4800);
        assert(session.field().aliveEnemyCount() == 7);
        assert(session.stats().enemiesSpawned == 7);
    }
    {
        // Destroying the last gate wins immediately.
        BattleSetup setup = makeSetup(1, 1);
        GateTypeConfig fortress = setup.gateTypes.get(GateType::Fortress);
        fortress.baseHp = 150;
        setup.gateTypes.set(fortress);
        BattleSession session(std::move(setup));
        int gateEvents = 0;
        session.events().gateDestroyed.connect([&](const Gate&) { ++gateEvents; });
        session.start();
        session.playCard(0);
        const CardPlayResult commit = session.playCard(0);
        assert(commit.applied.destroyedGateIds.size() == 1);
        assert(gateEvents == 1);
        assert(session.stats().gatesDestroyed == 1);
        assert(session.phase() == BattlePhase::Victory);
        assert(session.summary()->condition == BattleEndCondition::AllGatesDestroyed);
    }
    {
        // Player defeat during the enemy phase locks the hand.
        BattleSetup setup = makeSetup(1);
        setup.config.player.maxHp = 1000;
        BattleSession session(std::move(setup));
        session.start();
        session.field().spawnEnemy(brute(5000, 5000), GridPosition{1, kFrontRow}, 1);
        session.endPlayerTurn();
        assert(session.phase() == BattlePhase::Defeat);
        assert(!session.player().isAlive());
        assert(session.summary()->condition == BattleEndCondition::PlayerDefeated);
        assert(!session.summary()->victory);
        assert(session.summary()->turnsUsed == 1);
        assert(session.hand().state() == HandState::TurnEnded);
        assert(session.playCard(0).reason == Rejection::WrongPhase);
    }
    {
        // Target commands.
        BattleSession session(makeSetup(2));
        assert(session.selectColumnTarget(0).reason == Rejection::WrongPhase);
        session.start();
        EnemyInstance* enemy = session.field().spawnEnemy(brute(5000, 10), GridPosition{1, kBackRow}, 1);
        const int enemyId = enemy->instanceId();

        assert(session.selectEnemyTarget(GridPosition{1, kFrontRow}).reason == Rejection::NoValidTarget);
        assert(session.selectEnemyTarget(GridPosition{4, kFrontRow}).reason == Rejection::InvalidInput);
        assert(session.selectEnemyTarget(GridPosition{1, kBackRow}).ok);
        assert(session.selectColumnTarget(3).reason == Rejection::InvalidInput);
        assert(session.selectColumnTarget(2).ok);
        assert(session.targetSelector().current().mode == TargetSelectionMode::Column);
        assert(session.reselectLastTarget().ok);
        assert(session.targetSelector().current().mode == TargetSelectionMode::EnemyPosition);

        // The selection redirects the card from column 0 to the chosen enemy.
        const CardPlayResult preview = session.playCard(0);
        assert(preview.targets.enemyIds.size() == 1 && preview.targets.enemyIds[0] == enemyId);
        assert(session.hand().pendingDamage().has_value());

        // Changing target drops the outstanding preview.
        assert(session.selectColumnTarget(0).ok);
        assert(!session.hand().pendingDamage().has_value());
        assert(session.hand().selectedSlot() == -1);

        assert(session.clearTargetSelection().ok);
        assert(!session.targetSelector().current().active());
        session.selectColumnTarget(1);
        session.endPlayerTurn();
        assert(!session.targetSelector().current().active());
    }
    {
        // A bonus granted after exhaustion reopens the hand within the same turn.
        BattleSetup setup = makeSetup(1);
        setup.config.autoEndTurnWhenExhausted = false;
        BattleSession session(std::move(setup));
        session.start();
        session.playCard(0);
        session.playCard(0);
        assert(session.hand().state() == HandState::TurnEnded);
        assert(session.addActionBonus(0).reason == Rejection::InvalidInput);
        assert(session.addActionBonus(1).ok);
        assert(session.hand().state() == HandState::Generated);
        assert(session.economy().remainingActions() == 1);
        session.playCard(1);
        assert(session.playCard(1).committed);
        assert(session.stats().cardsPlayed == 2);
    }
    {
        // Turn timer ends the turn with TimeOut.
        BattleSetup setup = makeSetup(1);
        setup.config.turnTimeLimitSeconds = 10.0;
        BattleSession session(std::move(setup));
        session.start();
        Engine::TimeStep step{};
        step = Engine::advance(step, 6.0);
        session.update(step);
        assert(session.turn() == 1);
        assert(session.turnTimeElapsed() == 6.0);
        step = Engine::advance(step, 6.0);
        session.update(step);
        assert(session.turn() == 2);
        assert(session.turnTimeElapsed() == 0.0);
    }
    {
        // Reset returns everything to the pre-start state.
        BattleSession session(makeSetup(1));
        session.start();
        session.playCard(0);
        session.playCard(0);
        session.endPlayerTurn();
        assert(session.stats().cardsPlayed == 1);
        assert(session.field().gateInColumn(0)->currentHp() < session.field().gateInColumn(0)->maxHp());

        assert(session.resetBattle().ok);
        assert(session.phase() == BattlePhase::Initializing);
        assert(session.turn() == 0);
        assert(session.stats().cardsPlayed == 0);
        assert(session.hand().state() == HandState::Empty);
        assert(session.hand().totalCardsPlayed() == 0);
        assert(session.economy().remainingActions() == 0);
        assert(!session.summary().has_value());
        assert(session.field().gateInColumn(0)->currentHp() == session.field().gateInColumn(0)->maxHp());
        assert(session.tasks().pendingCount() == 0);

        assert(session.start());
        assert(session.turn() == 1);
        assert(session.hand().state() == HandState::Generated);
    }
    return 0;
}
