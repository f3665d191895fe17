#pragma once
#include "sdl.hpp"

#include "common.hpp"
#include "dungeon.hpp"

#include <string>

// Top-down preview of one dungeon level.
class Renderer {
public:
    Renderer(int windowW, int windowH, bool vsync);
    ~Renderer();

    bool init();
    void shutdown();

    void render(const Dungeon& d, int level, bool showEntrances);
    void setTitle(const std::string& title);

private:
    int winW = 0;
    int winH = 0;
    bool vsyncEnabled = false;
    bool initialized = false;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;

    void fillCell(int x, int z, int cell, int inset, const Color& c);
    Color roomColor(const Room& r) const;
};
