#include "room_placer.hpp"

#include <algorithm>

const char* roomTypeName(RoomType t) {
    switch (t) {
        case RoomType::Normal: return "normal";
        case RoomType::Start:  return "start";
        case RoomType::Exit:   return "exit";
    }
    return "unknown";
}

namespace {

bool fitsDomain(const Box& b, const Vec3i& size) {
    if (b.origin.x < 0 || b.origin.y < 0 || b.origin.z < 0) return false;
    const Vec3i hi = b.max();
    return hi.x <= size.x && hi.y <= size.y && hi.z <= size.z;
}

} // namespace

void stampRoom(Grid& grid, const Box& box) {
    const Vec3i hi = box.max();
    for (int z = box.origin.z; z < hi.z; ++z) {
        for (int y = box.origin.y; y < hi.y; ++y) {
            for (int x = box.origin.x; x < hi.x; ++x) {
                const Vec3i p{x, y, z};
                if (!grid.inBounds(p)) continue;
                grid.set(p, CellState::Room);
            }
        }
    }
}

RoomPlacementResult placeRooms(Grid& grid, std::vector<Room>& rooms, RNG& rng, const RoomPlacementParams& params) {
    RoomPlacementResult out;
    out.requested = std::max(0, params.roomCount);

    const Vec3i size = grid.size();
    if (grid.cellCount() == 0) return out;

    for (int i = 0; i < params.maxAttempts && out.placed < out.requested; ++i) {
        ++out.attempts;

        // Draw order is part of the seed contract: origin x,y,z then extent x,y,z.
        Vec3i origin;
        origin.x = rng.below(0, size.x);
        origin.y = rng.below(0, size.y);
        origin.z = rng.below(0, size.z);

        Vec3i extent;
        extent.x = rng.range(params.minSize.x, params.maxSize.x);
        extent.y = rng.range(params.minSize.y, params.maxSize.y);
        extent.z = rng.range(params.minSize.z, params.maxSize.z);

        const Box candidate{origin, extent};
        const Box buffer = candidate.inflated(params.margin);

        bool overlap = false;
        for (const Room& r : rooms) {
            if (intersects(r.box, buffer)) {
                overlap = true;
                break;
            }
        }
        if (overlap) {
            ++out.rejectedOverlap;
            continue;
        }

        if (!fitsDomain(candidate, size)) {
            ++out.rejectedBounds;
            continue;
        }

        rooms.emplace_back(candidate);
        stampRoom(grid, candidate);
        ++out.placed;
    }

    return out;
}
