#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

// Whole-string parses only: "12abc" is rejected.
bool parseInt(const std::string& v, int& out) {
    const std::string s = trim(v);
    try {
        size_t used = 0;
        const int n = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = n;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parseDouble(const std::string& v, double& out) {
    const std::string s = trim(v);
    try {
        size_t used = 0;
        const double d = std::stod(s, &used);
        if (used != s.size()) return false;
        out = d;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

struct KeyValue {
    int line = 0;
    std::string key;
    std::string value;
};

std::vector<KeyValue> splitIni(const std::string& text) {
    std::vector<KeyValue> out;
    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = trim(line.substr(0, cut));
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            out.push_back({lineNo, "", line});
            continue;
        }
        out.push_back({lineNo, toLower(trim(line.substr(0, eq))), trim(line.substr(eq + 1))});
    }
    return out;
}

void warn(std::string* warns, const KeyValue& kv, const std::string& msg) {
    if (!warns) return;
    *warns += "line " + std::to_string(kv.line) + ": " + msg + "\n";
}

bool applyInt(const KeyValue& kv, int& field, std::string* warns) {
    int v = 0;
    if (!parseInt(kv.value, v)) {
        warn(warns, kv, "invalid integer for " + kv.key + ": '" + kv.value + "'");
        return false;
    }
    field = v;
    return true;
}

bool applyFloat(const KeyValue& kv, float& field, std::string* warns) {
    double v = 0.0;
    if (!parseDouble(kv.value, v)) {
        warn(warns, kv, "invalid number for " + kv.key + ": '" + kv.value + "'");
        return false;
    }
    field = static_cast<float>(v);
    return true;
}

bool applyBool(const KeyValue& kv, bool& field, std::string* warns) {
    bool v = false;
    if (!parseBool(kv.value, v)) {
        warn(warns, kv, "invalid boolean for " + kv.key + ": '" + kv.value + "'");
        return false;
    }
    field = v;
    return true;
}

} // namespace

bool parseU32(const std::string& v, uint32_t& out) {
    const std::string s = trim(v);
    if (s.empty()) return false;
    uint64_t n = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        n = n * 10 + static_cast<uint64_t>(c - '0');
        if (n > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(n);
    return true;
}

DungeonConfig parseDungeonConfig(const std::string& text, std::string* warns) {
    const std::vector<KeyValue> entries = splitIni(text);

    // Mode picks the defaults everything else overrides.
    DungeonMode mode = DungeonMode::Flat;
    for (const auto& kv : entries) {
        if (kv.key != "mode") continue;
        DungeonMode m;
        if (parseDungeonMode(toLower(kv.value), m)) mode = m;
        else warn(warns, kv, "invalid mode '" + kv.value + "' (expected flat or layered)");
    }

    DungeonConfig cfg = defaultDungeonConfig(mode);

    for (const auto& kv : entries) {
        const std::string& key = kv.key;
        if (key.empty()) {
            warn(warns, kv, "expected key = value, got '" + kv.value + "'");
        } else if (key == "mode") {
            // handled above
        } else if (key == "size_x") {
            applyInt(kv, cfg.size.x, warns);
        } else if (key == "size_y") {
            applyInt(kv, cfg.size.y, warns);
        } else if (key == "size_z") {
            applyInt(kv, cfg.size.z, warns);
        } else if (key == "room_count") {
            applyInt(kv, cfg.roomCount, warns);
        } else if (key == "max_attempts") {
            applyInt(kv, cfg.maxAttempts, warns);
        } else if (key == "room_min_x") {
            applyInt(kv, cfg.roomMin.x, warns);
        } else if (key == "room_min_y") {
            applyInt(kv, cfg.roomMin.y, warns);
        } else if (key == "room_min_z") {
            applyInt(kv, cfg.roomMin.z, warns);
        } else if (key == "room_max_x") {
            applyInt(kv, cfg.roomMax.x, warns);
        } else if (key == "room_max_y") {
            applyInt(kv, cfg.roomMax.y, warns);
        } else if (key == "room_max_z") {
            applyInt(kv, cfg.roomMax.z, warns);
        } else if (key == "margin_x") {
            applyInt(kv, cfg.margin.x, warns);
        } else if (key == "margin_y") {
            applyInt(kv, cfg.margin.y, warns);
        } else if (key == "margin_z") {
            applyInt(kv, cfg.margin.z, warns);
        } else if (key == "seed") {
            uint32_t s = 0;
            if (parseU32(kv.value, s)) cfg.seed = s;
            else warn(warns, kv, "invalid seed '" + kv.value + "'");
        } else if (key == "extra_edge_chance") {
            double p = 0.0;
            if (parseDouble(kv.value, p) && p >= 0.0 && p <= 1.0) cfg.extraEdgeChance = p;
            else warn(warns, kv, "extra_edge_chance must be a number in [0,1], got '" + kv.value + "'");
        } else if (key == "candidate_graph") {
            CandidateGraphKind k;
            if (parseCandidateGraphKind(toLower(kv.value), k)) cfg.candidateGraph = k;
            else warn(warns, kv, "invalid candidate_graph '" + kv.value + "' (expected delaunay or complete)");
        } else if (key == "cost_room") {
            applyFloat(kv, cfg.costs.room, warns);
        } else if (key == "cost_empty") {
            applyFloat(kv, cfg.costs.empty, warns);
        } else if (key == "cost_corridor") {
            applyFloat(kv, cfg.costs.corridor, warns);
        } else if (key == "cost_stair") {
            applyFloat(kv, cfg.costs.stair, warns);
        } else if (key == "cost_goal_distance") {
            applyFloat(kv, cfg.costs.goalDistance, warns);
        } else if (key == "enemy_chance") {
            int v = 0;
            if (parseInt(kv.value, v) && v >= 0 && v <= 100) cfg.tags.enemyChance = v;
            else warn(warns, kv, "enemy_chance must be 0..100, got '" + kv.value + "'");
        } else if (key == "chest_chance") {
            int v = 0;
            if (parseInt(kv.value, v) && v >= 0 && v <= 100) cfg.tags.chestChance = v;
            else warn(warns, kv, "chest_chance must be 0..100, got '" + kv.value + "'");
        } else if (key == "spawn_merchant") {
            applyBool(kv, cfg.tags.spawnMerchant, warns);
        } else if (key == "spawn_boss") {
            applyBool(kv, cfg.tags.spawnBoss, warns);
        } else {
            warn(warns, kv, "unknown key '" + key + "'");
        }
    }

    return cfg;
}

bool loadDungeonConfig(const std::string& path, DungeonConfig& cfg, std::string* warns) {
    std::ifstream f(path);
    if (!f) return false;

    std::ostringstream ss;
    ss << f.rdbuf();
    cfg = parseDungeonConfig(ss.str(), warns);
    return true;
}

bool writeDefaultConfig(const std::string& path, DungeonMode mode) {
    std::ofstream f(path);
    if (!f) return false;

    const DungeonConfig d = defaultDungeonConfig(mode);

    f << "# DelveGen settings\n"
      << "#\n"
      << "# Lines are: key = value\n"
      << "# Comments start with # or ;\n"
      << "#\n"
      << "# Command-line flags override values from this file.\n\n";

    f << "# Layout\n"
      << "# mode: flat | layered  (selects the defaults for every other key)\n"
      << "mode = " << dungeonModeName(d.mode) << "\n"
      << "size_x = " << d.size.x << "\n"
      << "size_y = " << d.size.y << "\n"
      << "size_z = " << d.size.z << "\n\n";

    f << "# Rooms\n"
      << "room_count = " << d.roomCount << "\n"
      << "max_attempts = " << d.maxAttempts << "\n"
      << "room_min_x = " << d.roomMin.x << "\n"
      << "room_min_y = " << d.roomMin.y << "\n"
      << "room_min_z = " << d.roomMin.z << "\n"
      << "room_max_x = " << d.roomMax.x << "\n"
      << "room_max_y = " << d.roomMax.y << "\n"
      << "room_max_z = " << d.roomMax.z << "\n"
      << "# margin: free cells kept around each room on every side\n"
      << "margin_x = " << d.margin.x << "\n"
      << "margin_y = " << d.margin.y << "\n"
      << "margin_z = " << d.margin.z << "\n\n";

    f << "# Connectivity\n"
      << "seed = " << d.seed << "\n"
      << "# extra_edge_chance: 0..1, chance to keep each non-tree candidate edge as a loop\n"
      << "extra_edge_chance = " << d.extraEdgeChance << "\n"
      << "# candidate_graph: delaunay | complete\n"
      << "candidate_graph = " << candidateGraphKindName(d.candidateGraph) << "\n\n";

    f << "# Corridor costs (lower = preferred)\n"
      << "cost_room = " << d.costs.room << "\n"
      << "cost_empty = " << d.costs.empty << "\n"
      << "cost_corridor = " << d.costs.corridor << "\n"
      << "cost_stair = " << d.costs.stair << "\n"
      << "cost_goal_distance = " << d.costs.goalDistance << "\n\n";

    f << "# Room contents (percent chances 0..100)\n"
      << "enemy_chance = " << d.tags.enemyChance << "\n"
      << "chest_chance = " << d.tags.chestChance << "\n"
      << "spawn_merchant = " << (d.tags.spawnMerchant ? "true" : "false") << "\n"
      << "spawn_boss = " << (d.tags.spawnBoss ? "true" : "false") << "\n";

    return static_cast<bool>(f);
}
