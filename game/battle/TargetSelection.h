// Player-chosen attack focus that overrides a card's own column.
#pragma once

#include <optional>

#include "GridPosition.h"

namespace Tactics {

enum class TargetSelectionMode { None, Column, EnemyPosition };

struct TargetSelection {
    TargetSelectionMode mode{TargetSelectionMode::None};
    int column{-1};
    GridPosition enemyPosition{GridPosition::none()};

    bool active() const { return mode != TargetSelectionMode::None; }
    // Enemy focus only pins a cell; its column still drives column-based resolution.
    std::optional<GridPosition> focus() const {
        if (mode == TargetSelectionMode::EnemyPosition) return enemyPosition;
        return std::nullopt;
    }
};

class TargetSelector {
public:
    void selectColumn(int column);
    void selectEnemy(const GridPosition& pos);
    // Restores the selection that was active before the last change; false if none.
    bool reselectLast();
    void clear();

    const TargetSelection& current() const { return current_; }
    const TargetSelection& previous() const { return previous_; }
    // Column a card should aim at under the current selection.
    int effectiveColumn(int cardColumn) const { return current_.active() ? current_.column : cardColumn; }

private:
    void replace(const TargetSelection& next);

    TargetSelection current_{};
    TargetSelection previous_{};
};

}  // namespace Tactics
