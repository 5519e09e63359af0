#include "button.hpp"

#include <utility>

#include "draw_utils.hpp"
#include "font_cache.hpp"

Button::Button(const std::string& text, const ButtonStyle& style, int w, int h)
: rect_{0, 0, w, h}, label_(text), style_(style) {}

void Button::set_rect(const SDL_Rect& r) { rect_ = r; }
const SDL_Rect& Button::rect() const { return rect_; }

const std::string& Button::text() const { return label_; }


void Button::set_on_click(ClickHandler handler) { on_click_ = std::move(handler); }

bool Button::is_hovered() const { return hovered_; }

bool Button::handle_event(const SDL_Event& e) {
    if (e.type == SDL_MOUSEMOTION) {
        SDL_Point p{ e.motion.x, e.motion.y };
        hovered_ = SDL_PointInRect(&p, &rect_);
        return false;
    }
    if (e.type == SDL_MOUSEBUTTONDOWN && e.button.button == SDL_BUTTON_LEFT) {
        SDL_Point p{ e.button.x, e.button.y };
        pressed_ = SDL_PointInRect(&p, &rect_);
        return false;
    }
    if (e.type == SDL_MOUSEBUTTONUP && e.button.button == SDL_BUTTON_LEFT) {
        SDL_Point p{ e.button.x, e.button.y };
        const bool inside = SDL_PointInRect(&p, &rect_);
        const bool clicked = pressed_ && inside;
        pressed_ = false;
        if (clicked && on_click_) {
            on_click_();
        }
        return clicked;
    }
    return false;
}

SDL_Color Button::current_fill() const {
    if (pressed_ && hovered_) {
        return ui_draw::DarkenColor(style_.fill_hover, 0.15f);
    }
    return hovered_ ? style_.fill_hover : style_.fill;
}

void Button::render(SDL_Renderer* renderer) const {
    if (!renderer) return;
    ui_draw::DrawPanel(renderer, rect_, style_.corner_radius, current_fill(), style_.border, style_.border_width);

    if (label_.empty()) return;
    const SDL_Point text_size = FontCache::instance().measure_text(style_.label, label_);
    const int tx = rect_.x + (rect_.w - text_size.x) / 2;
    const int ty = rect_.y + (rect_.h - text_size.y) / 2;
    FontCache::instance().draw_text(renderer, style_.label, label_, tx, ty);
}
