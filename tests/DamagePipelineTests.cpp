// Damage calculation, target resolution by range class and application.
#include <cassert>
#include <string>

#include "../game/systems/DamagePipeline.h"

using namespace Tactics;

namespace {

WeaponData makeWeapon(AttackRange range, int power = 100) {
    WeaponData w;
    w.name = "Test Blade";
    w.range = range;
    w.basePower = power;
    return w;
}

EnemyData sturdy(int hp) {
    EnemyData d;
    d.id = 1;
    d.name = "Dummy";
    d.baseHp = hp;
    d.defense = 0;
    return d;
}

}  // namespace

int main() {
    const GateTypeTable table = GateTypeTable::defaults();
    {
        // Simple kill: base + player attack, enemy removed from the grid.
        PlayerState player(15000, 100, {makeWeapon(AttackRange::SingleFront)});
        ComboEngine combos;
        DamagePipeline pipeline(player, combos);
        GridField field(3, table);
        field.spawnEnemy(sturdy(80), GridPosition{0, kFrontRow}, 0);

        const CardData card = CardData::make(*player.weapon(0), 0, 0, 3);
        const DamageBreakdown b = pipeline.computeDamage(card, false, 1);
        assert(b.baseDamage == 200);
        assert(b.finalDamage == 200);
        assert(b.comboDamage == 0 && b.otherDamage == 0);
        assert(b.description == "Test Blade: base 200 = 200 damage");

        const DamageTargets targets = DamagePipeline::resolveTargets(field, card.weapon, 0);
        assert(targets.enemyIds.size() == 1);
        assert(targets.gateIds.empty());
        const DamageApplication applied = DamagePipeline::applyDamage(field, targets, b.finalDamage);
        assert(applied.defeatedEnemyIds.size() == 1);
        assert(applied.totalDealt == 80);
        assert(field.aliveEnemyCount() == 0);
        assert(field.enemyAt(GridPosition{0, kFrontRow}) == nullptr);
    }
    {
        // Column weapons hit both occupants and the gate behind them for the same amount.
        GridField field(3, table);
        EnemyInstance* front = field.spawnEnemy(sturdy(5000), GridPosition{1, kFrontRow}, 1);
        EnemyInstance* back = field.spawnEnemy(sturdy(5000), GridPosition{1, kBackRow}, 1);
        const WeaponData lance = makeWeapon(AttackRange::Column);
        const DamageTargets targets = DamagePipeline::resolveTargets(field, lance, 1);
        assert(targets.enemyIds.size() == 2);
        assert(targets.gateIds.size() == 1 && targets.gateIds[0] == 1);

        const Gate* gate = field.gateInColumn(1);
        const int gateBefore = gate->currentHp();
        const DamageApplication applied = DamagePipeline::applyDamage(field, targets, 300);
        assert(front->currentHp() == 4700);
        assert(back->currentHp() == 4700);
        assert(gate->currentHp() == gateBefore - 300);
        assert(applied.totalDealt == 900);
        assert(applied.defeatedEnemyIds.empty());
    }
    {
        // Single-front classes go through to the gate only when the column is clear.
        GridField field(3, table);
        const WeaponData blade = makeWeapon(AttackRange::SingleFront);
        DamageTargets t = DamagePipeline::resolveTargets(field, blade, 2);
        assert(t.enemyIds.empty());
        assert(t.gateIds.size() == 1 && t.gateIds[0] == 2);

        EnemyInstance* back = field.spawnEnemy(sturdy(1000), GridPosition{2, kBackRow}, 2);
        t = DamagePipeline::resolveTargets(field, blade, 2);
        assert(t.enemyIds.size() == 1 && t.enemyIds[0] == back->instanceId());
        assert(t.gateIds.empty());

        // Self resolves like the single-target classes.
        assert(DamagePipeline::resolveTargets(field, makeWeapon(AttackRange::Self), 2) == t);

        // SingleTarget honours a focused cell, otherwise the front enemy.
        EnemyInstance* other = field.spawnEnemy(sturdy(1000), GridPosition{0, kBackRow}, 0);
        const WeaponData rifle = makeWeapon(AttackRange::SingleTarget);
        t = DamagePipeline::resolveTargets(field, rifle, 2, GridPosition{0, kBackRow});
        assert(t.enemyIds.size() == 1 && t.enemyIds[0] == other->instanceId());
        t = DamagePipeline::resolveTargets(field, rifle, 2, GridPosition{1, kFrontRow});
        assert(t.enemyIds.size() == 1 && t.enemyIds[0] == back->instanceId());
    }
    {
        // Destroyed gate with an empty column leaves no target.
        GridField field(1, table);
        field.gateInColumn(0)->takeDamage(1000000);
        assert(DamagePipeline::resolveTargets(field, makeWeapon(AttackRange::SingleFront), 0).empty());
        assert(DamagePipeline::resolveTargets(field, makeWeapon(AttackRange::Column), 0).empty());
    }
    {
        // Row and All classes ignore the card's column and never touch gates.
        GridField field(3, table);
        field.spawnEnemy(sturdy(1000), GridPosition{0, kFrontRow}, 0);
        field.spawnEnemy(sturdy(1000), GridPosition{2, kFrontRow}, 2);
        field.spawnEnemy(sturdy(1000), GridPosition{1, kBackRow}, 1);
        auto row1 = DamagePipeline::resolveTargets(field, makeWeapon(AttackRange::Row1), 1);
        assert(row1.enemyIds.size() == 2 && row1.gateIds.empty());
        auto row2 = DamagePipeline::resolveTargets(field, makeWeapon(AttackRange::Row2), 0);
        assert(row2.enemyIds.size() == 1);
        auto all = DamagePipeline::resolveTargets(field, makeWeapon(AttackRange::All), 0);
        assert(all.enemyIds.size() == 3 && all.gateIds.empty());

        const DamageApplication applied = DamagePipeline::applyDamage(field, all, 1000);
        assert(applied.defeatedEnemyIds.size() == 3);
        assert(field.aliveEnemyCount() == 0);
    }
    {
        // Rounding is half away from zero, applied once on the full product.
        assert(DamagePipeline::roundDamage(2.5) == 3);
        assert(DamagePipeline::roundDamage(2.4) == 2);
        assert(DamagePipeline::roundDamage(-2.5) == -3);

        PlayerState player(15000, 0, {makeWeapon(AttackRange::SingleFront, 5)});
        ComboEngine combos;
        DamagePipeline pipeline(player, combos);
        pipeline.addModifier([](const WeaponData&, const PlayerState&) { return 0.5; });
        std::string traced;
        pipeline.setDebugSink([&](const std::string& line) { traced = line; });
        const CardData card = CardData::make(*player.weapon(0), 0, 0, 1);
        const DamageBreakdown b = pipeline.computeDamage(card, true, 1);
        assert(b.baseDamage == 5);
        assert(b.finalDamage == 3);
        assert(b.otherDamage == -2);
        assert(traced.find("[preview] ") == 0);
        pipeline.clearModifiers();
        assert(pipeline.computeDamage(card, true, 1).finalDamage == 5);
    }
    {
        // Preview and commit agree when the use completes a combo.
        WeaponData fire = makeWeapon(AttackRange::SingleFront);
        fire.attribute = AttackAttribute::Fire;
        PlayerState player(15000, 100, {fire, fire});
        ComboEngine combos(defaultComboDefinitions());
        DamagePipeline pipeline(player, combos);
        const CardData first = CardData::make(*player.weapon(0), 0, 0, 3);
        const CardData second = CardData::make(*player.weapon(1), 1, 0, 3);
        pipeline.computeDamage(first, false, 1);

        const DamageBreakdown preview = pipeline.computeDamage(second, true, 1);
        const DamageBreakdown commit = pipeline.computeDamage(second, false, 1);
        assert(preview.combo.completed);
        assert(preview.comboMultiplier == 1.5);
        assert(preview.finalDamage == 300);
        assert(commit.finalDamage == preview.finalDamage);
        assert(commit.comboDamage == 100);
        assert(combos.activeCount() == 0);
    }
    return 0;
}
