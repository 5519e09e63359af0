#pragma once

#include <SDL.h>

namespace ui_draw {

SDL_Color DarkenColor(const SDL_Color& color, float amount);

void DrawRoundedSolidRect(SDL_Renderer* renderer, const SDL_Rect& rect, int corner_radius, const SDL_Color& color);

// Border of the given thickness drawn inside rect.
void DrawRoundedOutline(SDL_Renderer* renderer, const SDL_Rect& rect, int corner_radius, int thickness, const SDL_Color& color);

// Fill, then border. Transparent colours are skipped.
void DrawPanel(SDL_Renderer* renderer, const SDL_Rect& rect, int corner_radius, const SDL_Color& fill, const SDL_Color& border, int border_width);

}
