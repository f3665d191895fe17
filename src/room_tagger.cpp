#include "room_tagger.hpp"

RoomTagResult tagRooms(std::vector<Room>& rooms, const RoomTagOptions& opt, RNG& rng) {
    RoomTagResult out;
    for (Room& r : rooms) r.props = RoomProperties{};
    if (rooms.empty()) return out;

    const int n = static_cast<int>(rooms.size());

    float best = 0.0f;
    for (int i = 0; i < n; ++i) {
        const float d = length(rooms[static_cast<size_t>(i)].box.center());
        if (out.startRoom < 0 || d < best) {
            best = d;
            out.startRoom = i;
        }
    }

    if (n >= 2) {
        const Vec3f s = rooms[static_cast<size_t>(out.startRoom)].box.center();
        float farthest = -1.0f;
        for (int i = 0; i < n; ++i) {
            if (i == out.startRoom) continue;
            const float d = distance(s, rooms[static_cast<size_t>(i)].box.center());
            if (d > farthest) {
                farthest = d;
                out.exitRoom = i;
            }
        }
    }

    rooms[static_cast<size_t>(out.startRoom)].props.type = RoomType::Start;
    if (out.exitRoom >= 0) rooms[static_cast<size_t>(out.exitRoom)].props.type = RoomType::Exit;

    for (Room& r : rooms) {
        r.props.hasEnemies = rng.percent(opt.enemyChance);
        r.props.hasItemChest = rng.percent(opt.chestChance);
    }

    if (opt.spawnBoss && out.exitRoom >= 0) {
        RoomProperties& p = rooms[static_cast<size_t>(out.exitRoom)].props;
        p.hasBoss = true;
        p.hasEnemies = true;
    }

    if (opt.spawnMerchant) {
        out.merchantRoom = rng.below(0, n);
        rooms[static_cast<size_t>(out.merchantRoom)].props.hasMerchant = true;
    }

    return out;
}
