#pragma once

#include "rng.hpp"
#include "room.hpp"

#include <vector>

// Gameplay-facing room roles, assigned after the layout is final.
struct RoomTagOptions {
    int enemyChance = 50; // percent, 0..100
    int chestChance = 30; // percent, 0..100
    bool spawnMerchant = false;
    bool spawnBoss = false;
};

struct RoomTagResult {
    int startRoom = -1;
    int exitRoom = -1;
    int merchantRoom = -1;
};

// Start = room whose center is nearest the domain origin.
// Exit  = room farthest from Start (only with two or more rooms).
// Then, in room order, one enemy roll and one chest roll per room; the boss
// (and guaranteed enemies) go into Exit; the merchant goes into a uniformly
// chosen room. Ties on distance keep the lower index.
RoomTagResult tagRooms(std::vector<Room>& rooms, const RoomTagOptions& opt, RNG& rng);
