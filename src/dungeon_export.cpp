#include "dungeon_export.hpp"

#include <fstream>
#include <sstream>

namespace {

std::string jsonVec(const Vec3i& p) {
    return "[" + std::to_string(p.x) + "," + std::to_string(p.y) + "," + std::to_string(p.z) + "]";
}

std::string jsonDirections(const DirectionSet& s) {
    std::string out = "[";
    bool first = true;
    for (Direction d : ALL_DIRECTIONS) {
        if (!s.has(d)) continue;
        if (!first) out += ",";
        out += "\"";
        out += directionName(d);
        out += "\"";
        first = false;
    }
    out += "]";
    return out;
}

void hashVec(Fnv1a64& h, const Vec3i& p) {
    h.addI32(p.x);
    h.addI32(p.y);
    h.addI32(p.z);
}

} // namespace

char cellGlyph(CellState s) {
    switch (s) {
        case CellState::Empty:    return ' ';
        case CellState::Room:     return '.';
        case CellState::Corridor: return '#';
        case CellState::Stair:    return '=';
    }
    return '?';
}

std::string renderAsciiLevel(const Dungeon& d, int level, bool markEntrances) {
    const Vec3i size = d.grid.size();
    if (level < 0 || level >= size.y) return {};

    std::string out;
    out.reserve(static_cast<size_t>((size.x + 1) * size.z));
    for (int z = 0; z < size.z; ++z) {
        for (int x = 0; x < size.x; ++x) {
            const Vec3i p{x, level, z};
            char c = cellGlyph(d.grid.at(p));
            if (markEntrances && d.grid.at(p) == CellState::Room) {
                const int r = d.roomAt(p);
                if (r >= 0 && d.rooms[static_cast<size_t>(r)].cellAt(p).isEntrance()) c = '+';
            }
            out.push_back(c);
        }
        out.push_back('\n');
    }
    return out;
}

std::string renderAscii(const Dungeon& d, bool markEntrances) {
    std::string out;
    for (int y = d.grid.size().y - 1; y >= 0; --y) {
        out += "level " + std::to_string(y) + "\n";
        out += renderAsciiLevel(d, y, markEntrances);
    }
    return out;
}

std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

std::string hex64(uint64_t v) {
    std::ostringstream ss;
    ss << "0x" << std::hex << v;
    return ss.str();
}

std::string dungeonToJson(const Dungeon& d) {
    const GenerationReport& r = d.report;
    std::ostringstream f;

    f << "{\n";
    f << "  \"mode\": \"" << dungeonModeName(d.mode) << "\",\n";
    f << "  \"seed\": " << d.seed << ",\n";
    f << "  \"size\": " << jsonVec(d.grid.size()) << ",\n";
    f << "  \"hash\": \"" << hex64(dungeonHash(d)) << "\",\n";
    f << "  \"startRoom\": " << d.startRoom << ",\n";
    f << "  \"exitRoom\": " << d.exitRoom << ",\n";
    f << "  \"merchantRoom\": " << d.merchantRoom << ",\n";

    f << "  \"rooms\": [\n";
    for (size_t i = 0; i < d.rooms.size(); ++i) {
        const Room& room = d.rooms[i];
        f << "    {\"origin\": " << jsonVec(room.box.origin)
          << ", \"extent\": " << jsonVec(room.box.extent)
          << ", \"type\": \"" << roomTypeName(room.props.type) << "\""
          << ", \"enemies\": " << (room.props.hasEnemies ? "true" : "false")
          << ", \"chest\": " << (room.props.hasItemChest ? "true" : "false")
          << ", \"merchant\": " << (room.props.hasMerchant ? "true" : "false")
          << ", \"boss\": " << (room.props.hasBoss ? "true" : "false")
          << ", \"entrances\": [";
        bool first = true;
        const Vec3i hi = room.box.max();
        for (int z = room.box.origin.z; z < hi.z; ++z) {
            for (int y = room.box.origin.y; y < hi.y; ++y) {
                for (int x = room.box.origin.x; x < hi.x; ++x) {
                    const Vec3i p{x, y, z};
                    const RoomCell& c = room.cellAt(p);
                    if (!c.isEntrance()) continue;
                    if (!first) f << ", ";
                    f << "{\"cell\": " << jsonVec(p) << ", \"dirs\": " << jsonDirections(c.entrances) << "}";
                    first = false;
                }
            }
        }
        f << "]}";
        if (i + 1 < d.rooms.size()) f << ",";
        f << "\n";
    }
    f << "  ],\n";

    f << "  \"edges\": [";
    for (size_t i = 0; i < d.selectedEdges.size(); ++i) {
        const Edge& e = d.selectedEdges[i];
        if (i > 0) f << ", ";
        f << "[" << e.u << "," << e.v << "]";
    }
    f << "],\n";

    f << "  \"corridors\": [\n";
    for (size_t i = 0; i < d.corridors.size(); ++i) {
        const Corridor& c = d.corridors[i];
        f << "    {\"edge\": [" << c.edge.u << "," << c.edge.v << "], \"path\": [";
        for (size_t k = 0; k < c.path.size(); ++k) {
            if (k > 0) f << ",";
            f << jsonVec(c.path[k]);
        }
        f << "]}";
        if (i + 1 < d.corridors.size()) f << ",";
        f << "\n";
    }
    f << "  ],\n";

    f << "  \"stairs\": [\n";
    for (size_t i = 0; i < d.stairs.size(); ++i) {
        const StairStructure& s = d.stairs[i];
        f << "    {\"corridor\": " << s.corridor << ", \"cells\": [";
        for (size_t k = 0; k < s.cells.size(); ++k) {
            if (k > 0) f << ",";
            f << jsonVec(s.cells[k]);
        }
        f << "]}";
        if (i + 1 < d.stairs.size()) f << ",";
        f << "\n";
    }
    f << "  ],\n";

    f << "  \"report\": {\n";
    f << "    \"ok\": " << (r.ok ? "true" : "false") << ",\n";
    f << "    \"error\": \"" << jsonEscape(r.error) << "\",\n";
    f << "    \"roomsRequested\": " << r.roomsRequested << ",\n";
    f << "    \"roomsPlaced\": " << r.roomsPlaced << ",\n";
    f << "    \"candidateEdges\": " << r.candidateEdges << ",\n";
    f << "    \"mstEdges\": " << r.mstEdges << ",\n";
    f << "    \"repairEdges\": " << r.repairEdges << ",\n";
    f << "    \"cycleEdges\": " << r.cycleEdges << ",\n";
    f << "    \"corridorsCarved\": " << r.corridorsCarved << ",\n";
    f << "    \"stairsPlaced\": " << r.stairsPlaced << ",\n";
    f << "    \"nodesExpanded\": " << r.nodesExpanded << ",\n";
    f << "    \"unreachableEdges\": [";
    for (size_t i = 0; i < r.unreachableEdges.size(); ++i) {
        if (i > 0) f << ", ";
        f << "[" << r.unreachableEdges[i].u << "," << r.unreachableEdges[i].v << "]";
    }
    f << "],\n";
    f << "    \"log\": [\n";
    for (size_t i = 0; i < r.log.size(); ++i) {
        f << "      {\"level\": \"" << logLevelName(r.log[i].level) << "\", \"text\": \"" << jsonEscape(r.log[i].text) << "\"}";
        if (i + 1 < r.log.size()) f << ",";
        f << "\n";
    }
    f << "    ]\n";
    f << "  }\n";
    f << "}\n";
    return f.str();
}

bool writeDungeonJson(const Dungeon& d, const std::string& path, std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Failed to open JSON output for writing: " + path;
        return false;
    }
    f << dungeonToJson(d);
    if (!f) {
        if (err) *err = "Failed to write JSON output: " + path;
        return false;
    }
    return true;
}

uint64_t dungeonHash(const Dungeon& d) {
    Fnv1a64 h;
    hashVec(h, d.grid.size());
    for (CellState s : d.grid.cells()) h.addByte(static_cast<uint8_t>(s));

    h.addU32(static_cast<uint32_t>(d.rooms.size()));
    for (const Room& r : d.rooms) {
        hashVec(h, r.box.origin);
        hashVec(h, r.box.extent);
        h.addByte(static_cast<uint8_t>(r.props.type));
        for (const RoomCell& c : r.cells) {
            h.addByte(c.outer.bits);
            h.addByte(c.entrances.bits);
        }
    }

    h.addU32(static_cast<uint32_t>(d.corridors.size()));
    for (const Corridor& c : d.corridors) {
        h.addI32(c.edge.u);
        h.addI32(c.edge.v);
        h.addU32(static_cast<uint32_t>(c.path.size()));
        for (const Vec3i& p : c.path) hashVec(h, p);
    }

    h.addU32(static_cast<uint32_t>(d.stairs.size()));
    for (const StairStructure& s : d.stairs) {
        h.addI32(s.corridor);
        for (const Vec3i& p : s.cells) hashVec(h, p);
    }

    return h.h;
}
