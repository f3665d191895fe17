#pragma once

#include "grid.hpp"
#include "rng.hpp"
#include "room.hpp"

#include <vector>

// Rejection-sampling room placement
//
// Each attempt samples an origin uniformly inside the domain and an extent in
// [minSize, maxSize] per axis. The candidate is rejected when its buffer box
// (inflated by `margin`) touches any accepted room, or when it does not fit
// inside the domain. Accepted rooms are stamped into the grid as Room cells.

struct RoomPlacementParams {
    int roomCount = 0;
    int maxAttempts = 0;
    Vec3i minSize{1, 1, 1};
    Vec3i maxSize{1, 1, 1};
    Vec3i margin{1, 0, 1};
};

struct RoomPlacementResult {
    int requested = 0;
    int placed = 0;
    int attempts = 0;
    int rejectedOverlap = 0;
    int rejectedBounds = 0;

    bool shortfall() const { return placed < requested; }
};

RoomPlacementResult placeRooms(Grid& grid, std::vector<Room>& rooms, RNG& rng, const RoomPlacementParams& params);

// Stamps every cell of `box` as Room. Cells outside the grid are skipped.
void stampRoom(Grid& grid, const Box& box);
