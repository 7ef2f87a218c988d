// Gate spawn patterns, pools and grid-capacity handling.
#include <cassert>
#include <optional>
#include <random>

#include "../game/systems/GateSpawnScheduler.h"

using namespace Tactics;

namespace {

EnemyResolver catalogResolver(const EnemyCatalog& catalog) {
    return [&catalog](int id) { return catalog.find(id); };
}

GateTypeTable singleType(GateType type, SpawnPattern pattern, int interval, int count) {
    GateTypeTable table = GateTypeTable::defaults();
    GateTypeConfig cfg = table.get(type);
    cfg.pattern = pattern;
    cfg.summonInterval = interval;
    cfg.summonCount = count;
    table.set(cfg);
    return table;
}

}  // namespace

int main() {
    const EnemyCatalog catalog;
    {
        // Summoner opens with a burst of 5, then 1 every other turn.
        GridField field(4, GateTypeTable::defaults());
        std::mt19937 rng(11);
        GateSpawnScheduler spawner(rng, catalogResolver(catalog));
        Gate& summoner = *field.gateInColumn(1);
        assert(summoner.type() == GateType::Summoner);

        auto first = spawner.runGate(field, summoner, 1);
        assert(first.size() == 5);
        assert(summoner.firstSummonDone());
        assert(summoner.lastSummonTurn() == 1);
        for (const auto& rec : first) {
            assert(rec.gateId == 1);
            assert(rec.enemyId == 103);
            assert(field.enemyAt(rec.position)->assignedGateId() == 1);
        }
        assert(spawner.runGate(field, summoner, 2).empty());
        auto third = spawner.runGate(field, summoner, 3);
        assert(third.size() == 1);
        assert(field.aliveEnemyCount() == 6);
    }
    {
        // Default 3-gate layout: nothing on turn 1, Standard spawns 2 on turn 2, Support 3 on turn 3.
        GridField field(3, GateTypeTable::defaults());
        std::mt19937 rng(3);
        GateSpawnScheduler spawner(rng, catalogResolver(catalog));
        assert(spawner.update(field, 1).empty());
        auto second = spawner.update(field, 2);
        assert(second.size() == 2);
        assert(second[0].gateId == 1 && second[1].gateId == 1);
        assert(second[0].enemyId == 100);
        auto third = spawner.update(field, 3);
        assert(third.size() == 3);
        assert(third[0].gateId == 0);
        // The grid has 6 cells: one stays free after the two waves.
        assert(field.aliveEnemyCount() == 5);
    }
    {
        // Spawning stops early when the grid fills up; the gate still records the summon.
        GridField field(1, singleType(GateType::Fortress, SpawnPattern::Continuous, 0, 5));
        std::mt19937 rng(5);
        GateSpawnScheduler spawner(rng, catalogResolver(catalog));
        auto recs = spawner.update(field, 1);
        assert(recs.size() == 2);
        assert(field.emptyPositions().empty());
        assert(field.gateInColumn(0)->lastSummonTurn() == 1);
        assert(spawner.update(field, 2).empty());
    }
    {
        // Unknown pool ids are skipped, but the schedule advances.
        GateTypeTable table = singleType(GateType::Fortress, SpawnPattern::Continuous, 0, 2);
        GateTypeConfig cfg = table.get(GateType::Fortress);
        cfg.allowedEnemyIds = {999};
        table.set(cfg);
        GridField field(1, table);
        std::mt19937 rng(5);
        GateSpawnScheduler spawner(rng, catalogResolver(catalog));
        assert(spawner.update(field, 4).empty());
        assert(spawner.skippedSpawns() == 2);
        assert(field.gateInColumn(0)->lastSummonTurn() == 4);
    }
    {
        // Pool ids resolve through the catalogue.
        EnemyCatalog custom;
        EnemyData bat;
        bat.id = 7;
        bat.name = "Bat";
        custom.add(bat);
        GateTypeTable table = singleType(GateType::Fortress, SpawnPattern::Continuous, 0, 1);
        GateTypeConfig cfg = table.get(GateType::Fortress);
        cfg.allowedEnemyIds = {7};
        table.set(cfg);
        GridField field(1, table);
        std::mt19937 rng(9);
        GateSpawnScheduler spawner(rng, catalogResolver(custom));
        auto recs = spawner.update(field, 1);
        assert(recs.size() == 1);
        assert(recs[0].enemyId == 7);
        assert(field.enemyAt(recs[0].position)->data().name == "Bat");
    }
    {
        // Periodic fires on multiples of the interval once the interval has elapsed.
        GridField field(1, singleType(GateType::Fortress, SpawnPattern::Periodic, 3, 1));
        Gate& gate = *field.gateInColumn(0);
        assert(!gate.canSummon(1));
        assert(!gate.canSummon(2));
        assert(gate.canSummon(3));
        gate.onSummonExecuted(3);
        assert(!gate.canSummon(4));
        assert(gate.canSummon(6));
    }
    {
        // OnDamage needs the gate below 80% health, Defensive below 50%.
        GridField field(1, singleType(GateType::Fortress, SpawnPattern::OnDamage, 0, 1));
        Gate& gate = *field.gateInColumn(0);
        assert(!gate.canSummon(1));
        gate.takeDamage(gate.maxHp() / 4);
        assert(gate.canSummon(1));

        GridField def(1, singleType(GateType::Fortress, SpawnPattern::Defensive, 0, 1));
        Gate& fort = *def.gateInColumn(0);
        fort.takeDamage(fort.maxHp() / 4);
        assert(!fort.canSummon(1));
        fort.takeDamage(fort.maxHp() / 2);
        assert(fort.canSummon(1));

        fort.takeDamage(fort.maxHp());
        assert(!fort.canSummon(10));
    }
    {
        // PatternB waits at least 3 turns even with a shorter interval.
        GridField field(1, singleType(GateType::Fortress, SpawnPattern::PatternB, 1, 1));
        Gate& gate = *field.gateInColumn(0);
        assert(gate.spawnCount() == 3);
        gate.onSummonExecuted(5);
        assert(!gate.canSummon(7));
        assert(gate.canSummon(8));
        gate.reset();
        assert(gate.lastSummonTurn() == -1);
    }
    return 0;
}
