#include "styles.hpp"
#include "font_paths.hpp"

static inline SDL_Color make_color(Uint8 r, Uint8 g, Uint8 b, Uint8 a = 255) {
    return SDL_Color{ r, g, b, a };
}

static const SDL_Color kWindowBackground = make_color( 36, 36, 36);
static const SDL_Color kFrameBackground  = make_color( 43, 43, 43);

static const FrameStyle kDefaultFrame{
    kFrameBackground, 6, make_color(0, 0, 0, 0), 0 };

const SDL_Color& Styles::WindowBackground() { return kWindowBackground; }

TextStyle Styles::Text(int size, SDL_Color color) {
    return TextStyle{ ui_fonts::sans_regular(), size, color };
}

TextStyle Styles::BoldText(int size, SDL_Color color) {
    return TextStyle{ ui_fonts::sans_bold(), size, color };
}

const FrameStyle& Styles::DefaultFrame()   { return kDefaultFrame; }
