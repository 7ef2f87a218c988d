#include "GridField.h"

#include <algorithm>
#include <cmath>

#include "../../engine/core/Logger.h"

namespace Tactics {

GridField::GridField(int gateCount, const GateTypeTable& gateTypes) : columns_(std::max(1, gateCount)) {
    const auto layout = layoutFor(columns_);
    gates_.reserve(layout.size());
    for (std::size_t i = 0; i < layout.size(); ++i) {
        gates_.emplace_back(static_cast<int>(i), gateTypes.get(layout[i]));
    }
    cells_.resize(static_cast<std::size_t>(columns_ * kRowCount));
}

std::vector<GateType> GridField::layoutFor(int gateCount) {
    using G = GateType;
    switch (gateCount) {
        case 0:
            return {};
        case 1:
            return {G::Fortress};
        case 2:
            return {G::Support, G::Standard};
        case 3:
            return {G::Support, G::Standard, G::Elite};
        case 4:
            return {G::Support, G::Summoner, G::Standard, G::Elite};
        case 5:
            return {G::Support, G::Summoner, G::Standard, G::Elite, G::Fortress};
        case 6:
            return {G::Support, G::Summoner, G::Standard, G::Standard, G::Elite, G::Fortress};
        default:
            break;
    }
    std::vector<GateType> out;
    if (gateCount < 0) return out;
    const G cycle[] = {G::Support, G::Standard, G::Elite};
    for (int i = 0; i < gateCount; ++i) {
        out.push_back(cycle[i % 3]);
    }
    return out;
}

bool GridField::isValidPosition(const GridPosition& pos) const {
    return pos.column >= 0 && pos.column < columns_ && pos.row >= 0 && pos.row < kRowCount;
}

bool GridField::isOccupied(const GridPosition& pos) const {
    return isValidPosition(pos) && cells_[cellIndex(pos)] != nullptr;
}

bool GridField::placeEnemy(EnemyInstance enemy, const GridPosition& pos) {
    if (!isValidPosition(pos) || isOccupied(pos)) return false;
    enemy.setPosition(pos);
    nextInstanceId_ = std::max(nextInstanceId_, enemy.instanceId() + 1);
    cells_[cellIndex(pos)] = std::make_unique<EnemyInstance>(std::move(enemy));
    return true;
}

EnemyInstance* GridField::spawnEnemy(const EnemyData& data, const GridPosition& pos, int gateId) {
    if (!isValidPosition(pos) || isOccupied(pos)) return nullptr;
    EnemyInstance inst(nextInstanceId_, data);
    inst.setAssignedGate(gateId);
    if (!placeEnemy(std::move(inst), pos)) return nullptr;
    return enemyAt(pos);
}

bool GridField::removeEnemy(const GridPosition& pos) {
    if (!isOccupied(pos)) return false;
    cells_[cellIndex(pos)].reset();
    return true;
}

int GridField::removeDeadEnemies() {
    int removed = 0;
    for (auto& cell : cells_) {
        if (cell && !cell->isAlive()) {
            cell.reset();
            ++removed;
        }
    }
    return removed;
}

EnemyInstance* GridField::enemyAt(const GridPosition& pos) {
    if (!isValidPosition(pos)) return nullptr;
    return cells_[cellIndex(pos)].get();
}

const EnemyInstance* GridField::enemyAt(const GridPosition& pos) const {
    if (!isValidPosition(pos)) return nullptr;
    return cells_[cellIndex(pos)].get();
}

EnemyInstance* GridField::findEnemy(int instanceId) {
    for (auto& cell : cells_) {
        if (cell && cell->instanceId() == instanceId) return cell.get();
    }
    return nullptr;
}

EnemyInstance* GridField::frontEnemyInColumn(int column) {
    for (int row = kFrontRow; row < kRowCount; ++row) {
        EnemyInstance* e = enemyAt(GridPosition{column, row});
        if (e && e->isAlive()) return e;
    }
    return nullptr;
}

const EnemyInstance* GridField::frontEnemyInColumn(int column) const {
    for (int row = kFrontRow; row < kRowCount; ++row) {
        const EnemyInstance* e = enemyAt(GridPosition{column, row});
        if (e && e->isAlive()) return e;
    }
    return nullptr;
}

std::vector<EnemyInstance*> GridField::enemiesInRow(int row) {
    std::vector<EnemyInstance*> out;
    if (row < 0 || row >= kRowCount) return out;
    for (int col = 0; col < columns_; ++col) {
        EnemyInstance* e = enemyAt(GridPosition{col, row});
        if (e && e->isAlive()) out.push_back(e);
    }
    return out;
}

std::vector<EnemyInstance*> GridField::enemiesInColumn(int column) {
    std::vector<EnemyInstance*> out;
    if (column < 0 || column >= columns_) return out;
    for (int row = kFrontRow; row < kRowCount; ++row) {
        EnemyInstance* e = enemyAt(GridPosition{column, row});
        if (e && e->isAlive()) out.push_back(e);
    }
    return out;
}

std::vector<EnemyInstance*> GridField::allEnemies() {
    std::vector<EnemyInstance*> out;
    for (auto& cell : cells_) {
        if (cell && cell->isAlive()) out.push_back(cell.get());
    }
    return out;
}

std::vector<const EnemyInstance*> GridField::allEnemies() const {
    std::vector<const EnemyInstance*> out;
    for (const auto& cell : cells_) {
        if (cell && cell->isAlive()) out.push_back(cell.get());
    }
    return out;
}

int GridField::aliveEnemyCount() const {
    return static_cast<int>(std::count_if(cells_.begin(), cells_.end(),
                                          [](const auto& cell) { return cell && cell->isAlive(); }));
}

std::vector<GridPosition> GridField::emptyPositions() const {
    std::vector<GridPosition> out;
    for (int row = kFrontRow; row < kRowCount; ++row) {
        for (int col = 0; col < columns_; ++col) {
            GridPosition pos{col, row};
            if (!isOccupied(pos)) out.push_back(pos);
        }
    }
    return out;
}

GridPosition GridField::randomEmptyPosition(std::mt19937& rng) const {
    const auto empty = emptyPositions();
    if (empty.empty()) return GridPosition::none();
    std::uniform_int_distribution<std::size_t> dist(0, empty.size() - 1);
    return empty[dist(rng)];
}

Gate* GridField::gateInColumn(int column) {
    if (column < 0 || column >= static_cast<int>(gates_.size())) return nullptr;
    return &gates_[static_cast<std::size_t>(column)];
}

const Gate* GridField::gateInColumn(int column) const {
    if (column < 0 || column >= static_cast<int>(gates_.size())) return nullptr;
    return &gates_[static_cast<std::size_t>(column)];
}

bool GridField::canAttackGate(int column) const {
    const Gate* gate = gateInColumn(column);
    if (!gate || gate->isDestroyed()) return false;
    return frontEnemyInColumn(column) == nullptr;
}

int GridField::aliveGateCount() const {
    return static_cast<int>(
        std::count_if(gates_.begin(), gates_.end(), [](const Gate& g) { return !g.isDestroyed(); }));
}

bool GridField::allGatesDestroyed() const { return aliveGateCount() == 0; }

void GridField::applyGateEffects() {
    using Engine::Status::EStatusId;
    for (const auto& gate : gates_) {
        if (gate.isDestroyed() || !gate.effectActive()) continue;
        const double strength = gate.effectStrength();
        for (auto* enemy : allEnemies()) {
            const bool own = enemy->assignedGateId() == gate.id();
            switch (gate.effect()) {
                case GateEffect::BuffAllEnemies:
                    enemy->applyBuff(EStatusId::GateBoost, strength, -1, gate.id());
                    break;
                case GateEffect::AttackBoost:
                    if (own) enemy->applyBuff(EStatusId::AttackBoost, strength, -1, gate.id());
                    break;
                case GateEffect::DefenseBoost:
                    if (own) enemy->applyBuff(EStatusId::DefenseBoost, strength, -1, gate.id());
                    break;
                case GateEffect::Regeneration:
                    if (own) enemy->heal(static_cast<int>(std::lround(enemy->maxHp() * 0.1)));
                    break;
                case GateEffect::IncreaseSpawnRate:
                case GateEffect::None:
                    break;
            }
        }
    }
}

void GridField::resetField() {
    for (auto& cell : cells_) cell.reset();
    for (auto& gate : gates_) gate.reset();
    nextInstanceId_ = 1;
    Engine::logDebug("Field reset: " + std::to_string(columns_) + " columns, " + std::to_string(gates_.size()) +
                     " gates");
}

}  // namespace Tactics
