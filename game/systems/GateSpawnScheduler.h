// Runs each gate's spawn pattern against the field during the enemy phase.
#pragma once

#include <functional>
#include <optional>
#include <random>
#include <vector>

#include "../battle/GridField.h"
#include "../data/EnemyData.h"

namespace Tactics {

// Returns nothing when the id is unknown; the spawn is then skipped.
using EnemyResolver = std::function<std::optional<EnemyData>(int enemyId)>;

struct SpawnRecord {
    int gateId{-1};
    int instanceId{-1};
    int enemyId{-1};
    GridPosition position{GridPosition::none()};
};

class GateSpawnScheduler {
public:
    GateSpawnScheduler(std::mt19937& rng, EnemyResolver resolver);

    // Processes every gate in column order; returns the placements made.
    std::vector<SpawnRecord> update(GridField& field, int currentTurn);
    std::vector<SpawnRecord> runGate(GridField& field, Gate& gate, int currentTurn);

    int skippedSpawns() const { return skippedSpawns_; }

private:
    std::optional<EnemyData> pickEnemy(const Gate& gate);

    std::mt19937& rng_;
    EnemyResolver resolver_;
    int skippedSpawns_{0};
};

}  // namespace Tactics
