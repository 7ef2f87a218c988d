#include "TargetSelection.h"

namespace Tactics {

void TargetSelector::replace(const TargetSelection& next) {
    if (current_.active()) previous_ = current_;
    current_ = next;
}

void TargetSelector::selectColumn(int column) {
    TargetSelection s;
    s.mode = TargetSelectionMode::Column;
    s.column = column;
    replace(s);
}

void TargetSelector::selectEnemy(const GridPosition& pos) {
    TargetSelection s;
    s.mode = TargetSelectionMode::EnemyPosition;
    s.column = pos.column;
    s.enemyPosition = pos;
    replace(s);
}

bool TargetSelector::reselectLast() {
    if (!previous_.active()) return false;
    const TargetSelection restored = previous_;
    replace(restored);
    return true;
}

void TargetSelector::clear() { replace(TargetSelection{}); }

}  // namespace Tactics
