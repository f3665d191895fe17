#pragma once
#include "common.hpp"

#include <cstdint>
#include <vector>

enum class CellState : uint8_t {
    Empty = 0,
    Room,
    Corridor,
    Stair,
};

const char* cellStateName(CellState s);

// Dense cell-state array over a fixed box [0,size). Linear index is
// x + sizeX*y + sizeX*sizeY*z, so a flat dungeon (sizeY == 1) is stored as a
// plain 2D array over (x, z).
class Grid {
public:
    Grid() = default;
    explicit Grid(Vec3i size);

    const Vec3i& size() const { return size_; }
    std::size_t cellCount() const { return cells_.size(); }

    bool inBounds(const Vec3i& p) const {
        return p.x >= 0 && p.y >= 0 && p.z >= 0 && p.x < size_.x && p.y < size_.y && p.z < size_.z;
    }

    // Callers check inBounds() first.
    std::size_t index(const Vec3i& p) const {
        return static_cast<std::size_t>(p.x) +
               static_cast<std::size_t>(size_.x) * static_cast<std::size_t>(p.y) +
               static_cast<std::size_t>(size_.x) * static_cast<std::size_t>(size_.y) * static_cast<std::size_t>(p.z);
    }

    // Inverse of index().
    Vec3i coordOf(std::size_t i) const;

    CellState at(const Vec3i& p) const { return cells_[index(p)]; }
    void set(const Vec3i& p, CellState s) { cells_[index(p)] = s; }

    // Out-of-bounds reads as `fallback`; handy for neighborhood scans.
    CellState stateOr(const Vec3i& p, CellState fallback) const {
        return inBounds(p) ? at(p) : fallback;
    }

    int count(CellState s) const;

    const std::vector<CellState>& cells() const { return cells_; }

private:
    Vec3i size_{0, 0, 0};
    std::vector<CellState> cells_;
};
