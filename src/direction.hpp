#pragma once

#include "common.hpp"

#include <array>
#include <cstdint>

enum class Direction : uint8_t {
    XPlus = 0,
    XMinus,
    YPlus,
    YMinus,
    ZPlus,
    ZMinus,
};

constexpr int DIRECTION_COUNT = 6;

constexpr std::array<Direction, DIRECTION_COUNT> ALL_DIRECTIONS = {
    Direction::XPlus, Direction::XMinus,
    Direction::YPlus, Direction::YMinus,
    Direction::ZPlus, Direction::ZMinus,
};

inline Vec3i directionOffset(Direction d) {
    switch (d) {
        case Direction::XPlus:  return {1, 0, 0};
        case Direction::XMinus: return {-1, 0, 0};
        case Direction::YPlus:  return {0, 1, 0};
        case Direction::YMinus: return {0, -1, 0};
        case Direction::ZPlus:  return {0, 0, 1};
        case Direction::ZMinus: return {0, 0, -1};
    }
    return {};
}

inline Direction opposite(Direction d) {
    switch (d) {
        case Direction::XPlus:  return Direction::XMinus;
        case Direction::XMinus: return Direction::XPlus;
        case Direction::YPlus:  return Direction::YMinus;
        case Direction::YMinus: return Direction::YPlus;
        case Direction::ZPlus:  return Direction::ZMinus;
        case Direction::ZMinus: return Direction::ZPlus;
    }
    return d;
}

inline const char* directionName(Direction d) {
    switch (d) {
        case Direction::XPlus:  return "x+";
        case Direction::XMinus: return "x-";
        case Direction::YPlus:  return "y+";
        case Direction::YMinus: return "y-";
        case Direction::ZPlus:  return "z+";
        case Direction::ZMinus: return "z-";
    }
    return "?";
}

// Direction of travel from one path cell to the next. Horizontal axes win over
// the vertical one, so a staircase step reports the way it faces.
// Returns false for identical coordinates.
inline bool stepDirection(const Vec3i& from, const Vec3i& to, Direction& out) {
    const Vec3i d = to - from;
    if (d.x > 0) { out = Direction::XPlus; return true; }
    if (d.x < 0) { out = Direction::XMinus; return true; }
    if (d.z > 0) { out = Direction::ZPlus; return true; }
    if (d.z < 0) { out = Direction::ZMinus; return true; }
    if (d.y > 0) { out = Direction::YPlus; return true; }
    if (d.y < 0) { out = Direction::YMinus; return true; }
    return false;
}

// Small bit set over the six directions.
struct DirectionSet {
    uint8_t bits = 0;

    bool has(Direction d) const { return (bits & bit(d)) != 0; }
    void add(Direction d) { bits = static_cast<uint8_t>(bits | bit(d)); }
    bool empty() const { return bits == 0; }

    static uint8_t bit(Direction d) { return static_cast<uint8_t>(1u << static_cast<unsigned>(d)); }
};

inline bool operator==(const DirectionSet& a, const DirectionSet& b) { return a.bits == b.bits; }
inline bool operator!=(const DirectionSet& a, const DirectionSet& b) { return a.bits != b.bits; }
