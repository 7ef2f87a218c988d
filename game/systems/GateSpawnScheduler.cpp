#include "GateSpawnScheduler.h"

#include "../../engine/core/Logger.h"

namespace Tactics {

GateSpawnScheduler::GateSpawnScheduler(std::mt19937& rng, EnemyResolver resolver)
    : rng_(rng), resolver_(std::move(resolver)) {}

std::optional<EnemyData> GateSpawnScheduler::pickEnemy(const Gate& gate) {
    const auto& pool = gate.config().allowedEnemyIds;
    if (pool.empty()) {
        const EnemyData fallback = defaultEnemyForGate(gate.type());
        if (resolver_) {
            if (auto data = resolver_(fallback.id)) return data;
        }
        return fallback;
    }
    std::uniform_int_distribution<std::size_t> dist(0, pool.size() - 1);
    const int id = pool[dist(rng_)];
    if (!resolver_) return std::nullopt;
    return resolver_(id);
}

std::vector<SpawnRecord> GateSpawnScheduler::runGate(GridField& field, Gate& gate, int currentTurn) {
    std::vector<SpawnRecord> out;
    if (!gate.canSummon(currentTurn)) return out;

    const int count = gate.spawnCount();
    for (int i = 0; i < count; ++i) {
        const GridPosition pos = field.randomEmptyPosition(rng_);
        if (pos.isNone()) {
            Engine::logDebug(gate.name() + ": grid full, spawn stopped early");
            break;
        }
        auto data = pickEnemy(gate);
        if (!data) {
            ++skippedSpawns_;
            Engine::logWarn(gate.name() + ": enemy data could not be resolved, spawn skipped");
            continue;
        }
        EnemyInstance* enemy = field.spawnEnemy(*data, pos, gate.id());
        if (!enemy) continue;
        out.push_back(SpawnRecord{gate.id(), enemy->instanceId(), data->id, pos});
        Engine::logInfo(gate.name() + " spawned " + data->name + " at " + pos.toString());
    }

    // Advances even when nothing was placed so the next turn is evaluated normally.
    gate.onSummonExecuted(currentTurn);
    return out;
}

std::vector<SpawnRecord> GateSpawnScheduler::update(GridField& field, int currentTurn) {
    std::vector<SpawnRecord> out;
    for (auto& gate : field.gates()) {
        auto spawned = runGate(field, gate, currentTurn);
        out.insert(out.end(), spawned.begin(), spawned.end());
    }
    return out;
}

}  // namespace Tactics
