#pragma once

#include <SDL.h>
#include <string>

#include "styles.hpp"

// Single line of text laid out around a centre point.
class Label {

	public:
    Label() = default;
    Label(const std::string& text, const TextStyle& style);

    void set_text(const std::string& text);
    const std::string& text() const;

    void set_color(SDL_Color color);
    SDL_Color color() const;
    const TextStyle& style() const;

    void set_center(SDL_Point p);

    // Measured text size; {0, 0} when the font is unavailable.
    SDL_Point size() const;
    // Line height used for layout even when the text is empty.
    int line_height() const;
    SDL_Rect bounds() const;

    void render(SDL_Renderer* r) const;

	private:
    std::string text_;
    TextStyle   style_{};
    SDL_Point   center_{0, 0};
};
