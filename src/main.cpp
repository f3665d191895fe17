#include "sdl.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "dungeon.hpp"
#include "render.hpp"
#include "settings.hpp"
#include "version.hpp"

static std::optional<uint32_t> parseSeedArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" && i + 1 < argc) {
            uint32_t v = 0;
            if (parseU32(argv[i + 1], v)) return v;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage(const char* exe) {
    std::cout
        << DELVEGEN_APPNAME << " " << DELVEGEN_VERSION << "\n"
        << "Usage: " << (exe ? exe : "delvegen") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>             Generate with a specific seed\n"
        << "  --config <path>        Settings INI to load\n"
        << "  --mode <flat|layered>  Generator mode (default: flat)\n"
        << "  --no-vsync             Disable vsync\n"
        << "  --version              Print version\n"
        << "  --help                 Show this help\n\n"
        << "Keys:\n"
        << "  PageUp / PageDown      Change level\n"
        << "  R                      Regenerate with the next seed\n"
        << "  E                      Toggle entrance markers\n"
        << "  Esc                    Quit\n";
}

static void printReport(const GenerationReport& report) {
    for (const auto& line : report.log) {
        if (line.level == LogLevel::Info) std::cout << line.text << "\n";
        else std::cerr << "[" << logLevelName(line.level) << "] " << line.text << "\n";
    }
}

static std::string windowTitle(const Dungeon& d, int level) {
    std::string t = std::string(DELVEGEN_APPNAME) + " - " + dungeonModeName(d.mode)
        + " seed " + std::to_string(d.seed)
        + " - level " + std::to_string(level + 1) + "/" + std::to_string(d.grid.size().y)
        + " - rooms " + std::to_string(d.rooms.size());
    if (!d.ok()) t += " - FAILED";
    return t;
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : nullptr);
        return 0;
    }
    if (hasFlag(argc, argv, "--version")) {
        std::cout << DELVEGEN_APPNAME << " " << DELVEGEN_VERSION << "\n";
        return 0;
    }

    DungeonMode mode = DungeonMode::Flat;
    if (const auto m = parseStringArg(argc, argv, "--mode")) {
        if (!parseDungeonMode(*m, mode)) {
            std::cerr << "Invalid --mode: " << *m << "\n";
            return 2;
        }
    }

    DungeonConfig cfg = defaultDungeonConfig(mode);
    if (const auto path = parseStringArg(argc, argv, "--config")) {
        std::string warns;
        if (!loadDungeonConfig(*path, cfg, &warns)) {
            std::cerr << "Failed to load config: " << *path << "\n";
            return 2;
        }
        if (!warns.empty()) std::cerr << warns;
        if (hasFlag(argc, argv, "--mode") && cfg.mode != mode) {
            std::cerr << "--mode conflicts with mode " << dungeonModeName(cfg.mode) << " in " << *path << "\n";
            return 2;
        }
    }

    if (hasFlag(argc, argv, "--seed")) {
        const auto seed = parseSeedArg(argc, argv);
        if (!seed) {
            std::cerr << "Invalid --seed\n";
            return 2;
        }
        cfg.seed = *seed;
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    Renderer renderer(960, 960, !hasFlag(argc, argv, "--no-vsync"));
    if (!renderer.init()) {
        SDL_Quit();
        return 1;
    }

    Dungeon dungeon = generateDungeon(cfg);
    printReport(dungeon.report);

    int level = 0;
    bool showEntrances = true;
    bool running = true;
    renderer.setTitle(windowTitle(dungeon, level));

    while (running) {
        SDL_Event ev;
        while (SDL_PollEvent(&ev)) {
            if (ev.type == SDL_QUIT) {
                running = false;
            } else if (ev.type == SDL_KEYDOWN) {
                switch (ev.key.keysym.sym) {
                    case SDLK_ESCAPE:
                        running = false;
                        break;
                    case SDLK_PAGEUP:
                        if (level + 1 < dungeon.grid.size().y) ++level;
                        break;
                    case SDLK_PAGEDOWN:
                        if (level > 0) --level;
                        break;
                    case SDLK_e:
                        showEntrances = !showEntrances;
                        break;
                    case SDLK_r:
                        cfg.seed += 1;
                        dungeon = generateDungeon(cfg);
                        printReport(dungeon.report);
                        if (level >= dungeon.grid.size().y) level = 0;
                        break;
                    default:
                        break;
                }
                renderer.setTitle(windowTitle(dungeon, level));
            }
        }

        renderer.render(dungeon, level, showEntrances);
        SDL_Delay(16);
    }

    renderer.shutdown();
    SDL_Quit();
    return 0;
}
