#pragma once
#include "common.hpp"
#include "direction.hpp"

#include <cstdint>
#include <vector>

// Axis-aligned integer box covering [origin, origin + extent) on every axis.
struct Box {
    Vec3i origin;
    Vec3i extent;

    Vec3i max() const { return origin + extent; } // exclusive

    bool contains(const Vec3i& p) const {
        return p.x >= origin.x && p.x < origin.x + extent.x &&
               p.y >= origin.y && p.y < origin.y + extent.y &&
               p.z >= origin.z && p.z < origin.z + extent.z;
    }

    Vec3f center() const {
        return {origin.x + extent.x * 0.5f, origin.y + extent.y * 0.5f, origin.z + extent.z * 0.5f};
    }

    Box inflated(const Vec3i& margin) const {
        return {origin - margin, extent + margin * 2};
    }

    int volume() const { return extent.x * extent.y * extent.z; }
};

// Overlap on every axis at once (half-open intervals, so touching faces do not count).
inline bool intersects(const Box& a, const Box& b) {
    return !(a.origin.x >= b.max().x || a.max().x <= b.origin.x ||
             a.origin.y >= b.max().y || a.max().y <= b.origin.y ||
             a.origin.z >= b.max().z || a.max().z <= b.origin.z);
}

enum class RoomType : uint8_t {
    Normal = 0,
    Start,
    Exit,
};

const char* roomTypeName(RoomType t);

struct RoomProperties {
    RoomType type = RoomType::Normal;
    bool hasEnemies = false;
    bool hasItemChest = false;
    bool hasMerchant = false;
    bool hasBoss = false;
};

// Per-cell metadata filled by the entrance sweep.
struct RoomCell {
    // Faces that border something outside the room (or the domain edge).
    DirectionSet outer;
    // Subset of outer faces that open onto a mutually confirmed corridor/stair cell.
    DirectionSet entrances;

    bool isEntrance() const { return !entrances.empty(); }
};

struct Room {
    Box box;
    RoomProperties props;
    // Dense, indexed like the box: lx + ex*ly + ex*ey*lz.
    std::vector<RoomCell> cells;

    Room() = default;
    explicit Room(const Box& b) : box(b) {
        cells.resize(static_cast<size_t>(b.volume() > 0 ? b.volume() : 0));
    }

    // p must lie inside box.
    RoomCell& cellAt(const Vec3i& p) { return cells[localIndex(p)]; }
    const RoomCell& cellAt(const Vec3i& p) const { return cells[localIndex(p)]; }

    int entranceCount() const {
        int n = 0;
        for (const auto& c : cells) if (c.isEntrance()) ++n;
        return n;
    }

private:
    size_t localIndex(const Vec3i& p) const {
        const Vec3i l = p - box.origin;
        return static_cast<size_t>(l.x + box.extent.x * l.y + box.extent.x * box.extent.y * l.z);
    }
};
