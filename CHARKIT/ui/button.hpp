#pragma once

#include <SDL.h>
#include <functional>
#include <string>

#include "styles.hpp"

class Button {
public:
    using ClickHandler = std::function<void()>;

    Button(const std::string& text, const ButtonStyle& style, int w, int h);

    void set_rect(const SDL_Rect& r);
    const SDL_Rect& rect() const;

    const std::string& text() const;

    void set_on_click(ClickHandler handler);

    // True when the event completed a click. The click handler has already
    // run by the time this returns.
    bool handle_event(const SDL_Event& e);
    void render(SDL_Renderer* renderer) const;

    bool is_hovered() const;

private:
    SDL_Color current_fill() const;

private:
    SDL_Rect     rect_{0,0,140,28};
    std::string  label_;
    ButtonStyle  style_{};
    ClickHandler on_click_{};
    bool         hovered_ = false;
    bool         pressed_ = false;
};
