#include "grid.hpp"

#include <algorithm>

const char* cellStateName(CellState s) {
    switch (s) {
        case CellState::Empty:    return "empty";
        case CellState::Room:     return "room";
        case CellState::Corridor: return "corridor";
        case CellState::Stair:    return "stair";
    }
    return "unknown";
}

Grid::Grid(Vec3i size) {
    if (size.x <= 0 || size.y <= 0 || size.z <= 0) return;
    size_ = size;
    cells_.assign(static_cast<std::size_t>(size.x) * static_cast<std::size_t>(size.y) * static_cast<std::size_t>(size.z),
                  CellState::Empty);
}

Vec3i Grid::coordOf(std::size_t i) const {
    const std::size_t sx = static_cast<std::size_t>(size_.x);
    const std::size_t sxy = sx * static_cast<std::size_t>(size_.y);
    Vec3i p;
    p.z = static_cast<int>(i / sxy);
    const std::size_t rem = i % sxy;
    p.y = static_cast<int>(rem / sx);
    p.x = static_cast<int>(rem % sx);
    return p;
}

int Grid::count(CellState s) const {
    return static_cast<int>(std::count(cells_.begin(), cells_.end(), s));
}
