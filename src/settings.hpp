#pragma once

#include <cstdint>
#include <string>

#include "dungeon.hpp"

// User-editable generator settings (INI-ish: key = value).
//
// Keys are case-insensitive; comments start with # or ;. The `mode` key is
// applied first (it selects the defaults), every other key overrides one
// field of those defaults. Unknown keys and unparsable values are reported
// through `warns` (one line each) and leave the default in place.

// Decimal unsigned 32-bit value, surrounding whitespace allowed. Rejects signs,
// other bases and anything above 4294967295. Shared by both front ends for --seed.
bool parseU32(const std::string& v, uint32_t& out);

// Parses settings text. Always succeeds; problems only produce warnings.
DungeonConfig parseDungeonConfig(const std::string& text, std::string* warns);

// Loads settings from disk. Returns false (cfg untouched) if the file cannot be read.
bool loadDungeonConfig(const std::string& path, DungeonConfig& cfg, std::string* warns);

// Writes a commented default settings file for the given mode. Returns true on success.
bool writeDefaultConfig(const std::string& path, DungeonMode mode = DungeonMode::Flat);
