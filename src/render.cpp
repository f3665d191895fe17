#include "render.hpp"
#include "version.hpp"

#include <algorithm>
#include <iostream>

namespace {

const Color BG{18, 18, 24, 255};
const Color ROOM{90, 90, 110, 255};
const Color ROOM_START{60, 140, 80, 255};
const Color ROOM_EXIT{160, 60, 60, 255};
const Color ROOM_MERCHANT{170, 150, 60, 255};
const Color CORRIDOR{70, 110, 170, 255};
const Color STAIR{80, 190, 190, 255};
const Color ENTRANCE{240, 220, 120, 255};
const Color GRID_LINE{30, 30, 40, 255};

} // namespace

Renderer::Renderer(int windowW, int windowH, bool vsync)
    : winW(windowW), winH(windowH), vsyncEnabled(vsync) {}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init() {
    if (initialized) return true;

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0"); // nearest-neighbor

    const std::string title = std::string(DELVEGEN_APPNAME) + " v" + DELVEGEN_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window); window = nullptr;
        return false;
    }

    // Fixed logical resolution; SDL scales to the actual window.
    SDL_RenderSetLogicalSize(renderer, winW, winH);

    initialized = true;
    return true;
}

void Renderer::shutdown() {
    if (renderer) { SDL_DestroyRenderer(renderer); renderer = nullptr; }
    if (window) { SDL_DestroyWindow(window); window = nullptr; }
    initialized = false;
}

void Renderer::setTitle(const std::string& title) {
    if (window) SDL_SetWindowTitle(window, title.c_str());
}

void Renderer::fillCell(int x, int z, int cell, int inset, const Color& c) {
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    SDL_Rect r{x * cell + inset, z * cell + inset, cell - inset * 2, cell - inset * 2};
    SDL_RenderFillRect(renderer, &r);
}

Color Renderer::roomColor(const Room& r) const {
    if (r.props.type == RoomType::Start) return ROOM_START;
    if (r.props.type == RoomType::Exit) return ROOM_EXIT;
    if (r.props.hasMerchant) return ROOM_MERCHANT;
    return ROOM;
}

void Renderer::render(const Dungeon& d, int level, bool showEntrances) {
    if (!initialized) return;

    SDL_SetRenderDrawColor(renderer, BG.r, BG.g, BG.b, BG.a);
    SDL_RenderClear(renderer);

    const Vec3i size = d.grid.size();
    if (size.x > 0 && size.z > 0 && level >= 0 && level < size.y) {
        const int cell = std::max(1, std::min(winW / size.x, winH / size.z));
        const int inset = cell >= 6 ? 1 : 0;

        for (int z = 0; z < size.z; ++z) {
            for (int x = 0; x < size.x; ++x) {
                const Vec3i p{x, level, z};
                switch (d.grid.at(p)) {
                    case CellState::Empty:
                        if (inset > 0) fillCell(x, z, cell, inset, GRID_LINE);
                        break;
                    case CellState::Room: {
                        const int r = d.roomAt(p);
                        const Room* room = (r >= 0) ? &d.rooms[static_cast<size_t>(r)] : nullptr;
                        fillCell(x, z, cell, 0, room ? roomColor(*room) : ROOM);
                        if (showEntrances && room && room->cellAt(p).isEntrance()) {
                            fillCell(x, z, cell, std::max(1, cell / 4), ENTRANCE);
                        }
                        break;
                    }
                    case CellState::Corridor:
                        fillCell(x, z, cell, inset, CORRIDOR);
                        break;
                    case CellState::Stair:
                        fillCell(x, z, cell, inset, STAIR);
                        break;
                }
            }
        }
    }

    SDL_RenderPresent(renderer);
}
