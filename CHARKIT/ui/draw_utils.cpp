#include "draw_utils.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace ui_draw {
namespace {

struct Span {
    int start;
    int end;
};

int clamp_radius(const SDL_Rect& rect, int corner_radius) {
    if (rect.w <= 0 || rect.h <= 0) {
        return 0;
    }
    return std::clamp(corner_radius, 0, std::min(rect.w, rect.h) / 2);
}

SDL_Rect inset_rect(const SDL_Rect& rect, int inset) {
    return SDL_Rect{rect.x + inset, rect.y + inset, rect.w - inset * 2, rect.h - inset * 2};
}

// Horizontal extent of a rounded rect on scanline y, measured at pixel centres.
std::optional<Span> row_span(const SDL_Rect& rect, int radius, int y) {
    if (rect.w <= 0 || rect.h <= 0 || y < rect.y || y >= rect.y + rect.h) {
        return std::nullopt;
    }
    const int row = y - rect.y;
    const int from_edge = std::min(row, rect.h - 1 - row);
    int indent = 0;
    if (from_edge < radius) {
        const float dy = static_cast<float>(radius) - static_cast<float>(from_edge) - 0.5f;
        const float dx = std::sqrt(std::max(0.0f, static_cast<float>(radius * radius) - dy * dy));
        indent = std::min(static_cast<int>(std::ceil(static_cast<float>(radius) - dx)), rect.w / 2);
    }
    return Span{rect.x + indent, rect.x + rect.w - 1 - indent};
}

void draw_span(SDL_Renderer* renderer, int y, int start, int end) {
    if (start <= end) {
        SDL_RenderDrawLine(renderer, start, y, end, y);
    }
}

void use_color(SDL_Renderer* renderer, const SDL_Color& color) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
}

}

SDL_Color DarkenColor(const SDL_Color& color, float amount) {
    const float keep = 1.0f - std::clamp(amount, 0.0f, 1.0f);
    auto scale = [keep](Uint8 c) { return static_cast<Uint8>(std::lround(static_cast<float>(c) * keep)); };
    return SDL_Color{scale(color.r), scale(color.g), scale(color.b), color.a};
}

void DrawRoundedSolidRect(SDL_Renderer* renderer, const SDL_Rect& rect, int corner_radius, const SDL_Color& color) {
    if (!renderer || rect.w <= 0 || rect.h <= 0) {
        return;
    }
    use_color(renderer, color);
    const int radius = clamp_radius(rect, corner_radius);
    if (radius == 0) {
        SDL_RenderFillRect(renderer, &rect);
        return;
    }
    for (int y = rect.y; y < rect.y + rect.h; ++y) {
        if (auto span = row_span(rect, radius, y)) {
            draw_span(renderer, y, span->start, span->end);
        }
    }
}

void DrawRoundedOutline(SDL_Renderer* renderer, const SDL_Rect& rect, int corner_radius, int thickness, const SDL_Color& color) {
    if (!renderer || rect.w <= 0 || rect.h <= 0 || thickness <= 0) {
        return;
    }
    use_color(renderer, color);
    const int radius = clamp_radius(rect, corner_radius);
    const SDL_Rect inner = inset_rect(rect, thickness);
    const int inner_radius = clamp_radius(inner, radius - thickness);

    for (int y = rect.y; y < rect.y + rect.h; ++y) {
        const auto outer = row_span(rect, radius, y);
        if (!outer) {
            continue;
        }
        const auto hole = row_span(inner, inner_radius, y);
        if (!hole) {
            draw_span(renderer, y, outer->start, outer->end);
            continue;
        }
        draw_span(renderer, y, outer->start, hole->start - 1);
        draw_span(renderer, y, hole->end + 1, outer->end);
    }
}

void DrawPanel(SDL_Renderer* renderer,
               const SDL_Rect& rect,
               int corner_radius,
               const SDL_Color& fill,
               const SDL_Color& border,
               int border_width) {
    if (fill.a > 0) {
        DrawRoundedSolidRect(renderer, rect, corner_radius, fill);
    }
    if (border.a > 0 && border_width > 0) {
        DrawRoundedOutline(renderer, rect, corner_radius, border_width, border);
    }
}

}
