#include "dungeon.hpp"
#include "dungeon_export.hpp"
#include "settings.hpp"
#include "version.hpp"

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>                    RNG seed (overrides the config file).\n"
        << "  --config <path>               Settings INI to load.\n"
        << "  --write-default-config <path> Write a commented default INI (for --mode) and exit.\n"
        << "  --mode <flat|layered>         Generator mode. Default: flat.\n"
        << "  --size <WxHxD>                Domain size, e.g. 40x1x40 or 24x5x24.\n"
        << "  --rooms <n>                   Target room count.\n"
        << "  --ascii                       Print every level as ASCII.\n"
        << "  --json <path>                 Write the generated dungeon as JSON.\n"
        << "  --hash                        Print the artifact hash.\n"
        << "  --version                     Print version.\n"
        << "  --help                        Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseSize(const std::string& s, Vec3i& out) {
    std::vector<uint32_t> parts;
    std::string cur;
    for (char c : s + "x") {
        if (c == 'x' || c == 'X') {
            uint32_t n = 0;
            if (!parseU32(cur, n) || n == 0 || n > 4096) return false;
            parts.push_back(n);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (parts.size() != 3) return false;
    if (static_cast<long long>(parts[0]) * parts[1] * parts[2] > MAX_DUNGEON_CELLS) return false;
    out = {static_cast<int>(parts[0]), static_cast<int>(parts[1]), static_cast<int>(parts[2])};
    return true;
}

static void printLog(const GenerationReport& report) {
    for (const auto& line : report.log) {
        switch (line.level) {
            case LogLevel::Info:  std::cout << line.text << "\n"; break;
            case LogLevel::Warn:  std::cerr << "[warn] " << line.text << "\n"; break;
            case LogLevel::Error: std::cerr << "[error] " << line.text << "\n"; break;
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath;
    std::string defaultConfigPath;
    std::string jsonPath;
    bool haveSeed = false;
    uint32_t seed = 0;
    bool haveMode = false;
    DungeonMode mode = DungeonMode::Flat;
    bool haveSize = false;
    Vec3i size;
    bool haveRooms = false;
    uint32_t rooms = 0;
    bool ascii = false;
    bool printHash = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << DELVEGEN_APPNAME << " " << DELVEGEN_VERSION << "\n";
            return 0;
        } else if (a == "--seed") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--seed requires a value\n";
                return 2;
            }
            if (!parseU32(v, seed)) {
                std::cerr << "Invalid --seed: " << v << "\n";
                return 2;
            }
            haveSeed = true;
        } else if (a == "--config") {
            if (!argValue(i, argc, argv, configPath)) {
                std::cerr << "--config requires a path\n";
                return 2;
            }
        } else if (a == "--write-default-config") {
            if (!argValue(i, argc, argv, defaultConfigPath)) {
                std::cerr << "--write-default-config requires a path\n";
                return 2;
            }
        } else if (a == "--mode") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--mode requires a value\n";
                return 2;
            }
            if (!parseDungeonMode(v, mode)) {
                std::cerr << "Invalid --mode: " << v << " (expected flat or layered)\n";
                return 2;
            }
            haveMode = true;
        } else if (a == "--size") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--size requires a value\n";
                return 2;
            }
            if (!parseSize(v, size)) {
                std::cerr << "Invalid --size: " << v << " (expected WxHxD, at most " << MAX_DUNGEON_CELLS << " cells)\n";
                return 2;
            }
            haveSize = true;
        } else if (a == "--rooms") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--rooms requires a value\n";
                return 2;
            }
            if (!parseU32(v, rooms) || rooms > 10000) {
                std::cerr << "Invalid --rooms: " << v << "\n";
                return 2;
            }
            haveRooms = true;
        } else if (a == "--ascii") {
            ascii = true;
        } else if (a == "--json") {
            if (!argValue(i, argc, argv, jsonPath)) {
                std::cerr << "--json requires a path\n";
                return 2;
            }
        } else if (a == "--hash") {
            printHash = true;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (!defaultConfigPath.empty()) {
        if (!writeDefaultConfig(defaultConfigPath, mode)) {
            std::cerr << "Failed to write default config: " << defaultConfigPath << "\n";
            return 1;
        }
        std::cout << "Wrote " << defaultConfigPath << "\n";
        return 0;
    }

    DungeonConfig cfg = defaultDungeonConfig(mode);
    if (!configPath.empty()) {
        std::string warns;
        if (!loadDungeonConfig(configPath, cfg, &warns)) {
            std::cerr << "Failed to load config: " << configPath << "\n";
            return 2;
        }
        if (!warns.empty()) {
            std::istringstream ws(warns);
            std::string line;
            while (std::getline(ws, line)) std::cerr << "[warn] " << configPath << ": " << line << "\n";
        }
        // The file's mode picked its defaults; switching now would mix both.
        if (haveMode && cfg.mode != mode) {
            std::cerr << "--mode " << dungeonModeName(mode) << " conflicts with mode "
                      << dungeonModeName(cfg.mode) << " in " << configPath << "\n";
            return 2;
        }
    }

    if (haveSeed) cfg.seed = seed;
    if (haveSize) cfg.size = size;
    if (haveRooms) cfg.roomCount = static_cast<int>(rooms);

    const Dungeon d = generateDungeon(cfg);
    printLog(d.report);

    if (ascii) std::cout << renderAscii(d);

    if (printHash) std::cout << "hash " << hex64(dungeonHash(d)) << "\n";

    if (!jsonPath.empty()) {
        std::string err;
        if (!writeDungeonJson(d, jsonPath, &err)) {
            std::cerr << err << "\n";
            return 1;
        }
    }

    return d.ok() ? 0 : 1;
}
