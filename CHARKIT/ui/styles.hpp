#pragma once

#include <SDL.h>
#include <string>

struct TextStyle {
    std::string font_path;
    int         font_size = 13;
    SDL_Color   color{255, 255, 255, 255};
};

struct FrameStyle {
    SDL_Color fill{0, 0, 0, 0};
    int       corner_radius = 0;
    SDL_Color border{0, 0, 0, 0};
    int       border_width = 0;
};

struct ButtonStyle {
    TextStyle label;
    SDL_Color fill{0, 0, 0, 0};
    SDL_Color fill_hover{0, 0, 0, 0};
    SDL_Color border{0, 0, 0, 0};
    int       border_width = 0;
    int       corner_radius = 0;
};

// Dark appearance palette shared by the demo windows.
class Styles {

	public:
    static const SDL_Color& WindowBackground();

    static TextStyle Text(int size, SDL_Color color);
    static TextStyle BoldText(int size, SDL_Color color);

    static const FrameStyle& DefaultFrame();
};
