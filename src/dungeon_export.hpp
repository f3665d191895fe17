#pragma once

#include "dungeon.hpp"

#include <cstdint>
#include <string>

// Text views and fingerprints of a generated dungeon.

// Cell glyphs used by the ASCII dump.
//   ' ' empty   '.' room   '#' corridor   '=' stair   '+' room entrance
char cellGlyph(CellState s);

// One horizontal slice (fixed y), rows are z, columns are x.
// With markEntrances, room cells with a confirmed entrance print as '+'.
std::string renderAsciiLevel(const Dungeon& d, int level, bool markEntrances = true);

// Every level, top to bottom, each preceded by a "level N" header.
std::string renderAscii(const Dungeon& d, bool markEntrances = true);

std::string jsonEscape(const std::string& s);

// Full artifact as JSON: config summary, rooms, edges, corridors, stairs, report.
std::string dungeonToJson(const Dungeon& d);
bool writeDungeonJson(const Dungeon& d, const std::string& path, std::string* err);

// Stable FNV-1a 64 over the grid, rooms, corridors and staircases.
// Equal seeds and configs give equal hashes on every platform.
uint64_t dungeonHash(const Dungeon& d);

std::string hex64(uint64_t v);
