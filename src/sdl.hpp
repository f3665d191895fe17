#pragma once

// Single SDL include for the viewer.
// SDL_MAIN_HANDLED keeps main() ours (no SDLmain link); main.cpp calls
// SDL_SetMainReady() before SDL_Init().
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
