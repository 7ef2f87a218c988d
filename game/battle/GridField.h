// Owns the 2 x N enemy grid and the column-aligned gate row.
#pragma once

#include <memory>
#include <random>
#include <vector>

#include "../data/GateTypes.h"
#include "EnemyInstance.h"
#include "Gate.h"
#include "GridPosition.h"

namespace Tactics {

class GridField {
public:
    GridField(int gateCount, const GateTypeTable& gateTypes);

    // Fixed design table keyed by total gate count.
    static std::vector<GateType> layoutFor(int gateCount);

    int columns() const { return columns_; }
    int rows() const { return kRowCount; }
    bool isValidPosition(const GridPosition& pos) const;
    bool isOccupied(const GridPosition& pos) const;

    // Fails without mutation when out of bounds or occupied.
    bool placeEnemy(EnemyInstance enemy, const GridPosition& pos);
    // Builds an instance with a fresh id and places it; nullptr on failure.
    EnemyInstance* spawnEnemy(const EnemyData& data, const GridPosition& pos, int gateId);
    bool removeEnemy(const GridPosition& pos);
    // Removes every dead occupant and returns how many were cleared.
    int removeDeadEnemies();

    EnemyInstance* enemyAt(const GridPosition& pos);
    const EnemyInstance* enemyAt(const GridPosition& pos) const;
    EnemyInstance* findEnemy(int instanceId);
    EnemyInstance* frontEnemyInColumn(int column);
    const EnemyInstance* frontEnemyInColumn(int column) const;

    // Living occupants only, in row-major order.
    std::vector<EnemyInstance*> enemiesInRow(int row);
    std::vector<EnemyInstance*> enemiesInColumn(int column);
    std::vector<EnemyInstance*> allEnemies();
    std::vector<const EnemyInstance*> allEnemies() const;
    int aliveEnemyCount() const;

    std::vector<GridPosition> emptyPositions() const;
    GridPosition randomEmptyPosition(std::mt19937& rng) const;

    std::vector<Gate>& gates() { return gates_; }
    const std::vector<Gate>& gates() const { return gates_; }
    Gate* gateInColumn(int column);
    const Gate* gateInColumn(int column) const;
    // Gate ids equal their column index.
    Gate* gate(int id) { return gateInColumn(id); }
    const Gate* gate(int id) const { return gateInColumn(id); }
    bool canAttackGate(int column) const;
    int aliveGateCount() const;
    bool allGatesDestroyed() const;

    // Once per enemy turn: every standing gate applies its strategic effect.
    void applyGateEffects();

    void resetField();

private:
    std::size_t cellIndex(const GridPosition& pos) const {
        return static_cast<std::size_t>(pos.row * columns_ + pos.column);
    }

    int columns_{0};
    std::vector<Gate> gates_;
    std::vector<std::unique_ptr<EnemyInstance>> cells_;
    int nextInstanceId_{1};
};

}  // namespace Tactics
