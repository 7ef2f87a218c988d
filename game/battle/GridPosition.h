// Cell coordinates on the 2-row battle grid.
#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace Tactics {

constexpr int kFrontRow = 0;
constexpr int kBackRow = 1;
constexpr int kRowCount = 2;
// Gates sit behind the grid at a virtual row.
constexpr int kGateRow = -1;

struct GridPosition {
    int column{-1};
    int row{-1};

    static constexpr GridPosition none() { return GridPosition{-1, -1}; }
    bool isNone() const { return column == -1 && row == -1; }

    bool operator==(const GridPosition& o) const { return column == o.column && row == o.row; }
    bool operator!=(const GridPosition& o) const { return !(*this == o); }

    std::string toString() const { return "(" + std::to_string(column) + "," + std::to_string(row) + ")"; }
};

}  // namespace Tactics
