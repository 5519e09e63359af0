#include "frame.hpp"
#include "draw_utils.hpp"

Frame::Frame(const SDL_Rect& rect, const FrameStyle& style)
: rect_(rect), style_(style) {}

void Frame::set_position(SDL_Point p) { rect_.x = p.x; rect_.y = p.y; }
void Frame::set_rect(const SDL_Rect& r) { rect_ = r; }
const SDL_Rect& Frame::rect() const { return rect_; }

void Frame::set_style(const FrameStyle& style) { style_ = style; }
const FrameStyle& Frame::style() const { return style_; }

void Frame::render(SDL_Renderer* r) const {
	if (!r) return;
	ui_draw::DrawPanel(r, rect_, style_.corner_radius, style_.fill, style_.border, style_.border_width);
}
