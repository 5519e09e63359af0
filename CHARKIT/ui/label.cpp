#include "label.hpp"

#include <algorithm>

#include "font_cache.hpp"

Label::Label(const std::string& text, const TextStyle& style)
: text_(text), style_(style) {}

void Label::set_text(const std::string& text) { text_ = text; }
const std::string& Label::text() const { return text_; }

void Label::set_color(SDL_Color color) { style_.color = color; }
SDL_Color Label::color() const { return style_.color; }
const TextStyle& Label::style() const { return style_; }

void Label::set_center(SDL_Point p) { center_ = p; }

SDL_Point Label::size() const {
	return FontCache::instance().measure_text(style_, text_);
}

int Label::line_height() const {
	if (TTF_Font* font = FontCache::instance().get_font(style_.font_path, style_.font_size)) {
		return TTF_FontLineSkip(font);
	}
	// Rough estimate so layout stays sane without a font.
	return std::max(1, style_.font_size * 4 / 3);
}

SDL_Rect Label::bounds() const {
	const SDL_Point sz = size();
	return SDL_Rect{ center_.x - sz.x / 2, center_.y - sz.y / 2, sz.x, sz.y };
}

void Label::render(SDL_Renderer* r) const {
	if (text_.empty()) return;
	const SDL_Rect b = bounds();
	FontCache::instance().draw_text(r, style_, text_, b.x, b.y);
}
