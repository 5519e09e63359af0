#pragma once

#include <SDL.h>

#include "styles.hpp"

// Plain rectangular panel. Also the layout target a Character is placed in.
class Frame {

	public:
    Frame() = default;
    Frame(const SDL_Rect& rect, const FrameStyle& style);

    void set_position(SDL_Point p);
    void set_rect(const SDL_Rect& r);
    const SDL_Rect& rect() const;

    void set_style(const FrameStyle& style);
    const FrameStyle& style() const;

    SDL_Point top_left() const { return SDL_Point{rect_.x, rect_.y}; }

    void render(SDL_Renderer* r) const;

	private:
    SDL_Rect   rect_{0, 0, 0, 0};
    FrameStyle style_{};
};
