#include "position_label.hpp"

#include "ui/styles.hpp"
#include "utils/string_utils.hpp"

PositionLabel::PositionLabel(charkit::TimerQueue& timers, SDL_Color color, SDL_Color flash_color)
: timers_(timers),
  label_(format({0, 0}), Styles::Text(13, color)),
  color_(color),
  flash_color_(flash_color) {}

PositionLabel::~PositionLabel() {
	if (restore_timer_ != 0) {
		timers_.cancel(restore_timer_);
	}
}

std::string PositionLabel::format(std::pair<int, int> position) {
	return "Position: " + charkit::strings::format_pair(position.first, position.second);
}

void PositionLabel::show(std::pair<int, int> position) {
	label_.set_text(format(position));
}

void PositionLabel::flash() {
	label_.set_color(flash_color_);
	if (restore_timer_ != 0) {
		timers_.cancel(restore_timer_);
	}
	restore_timer_ = timers_.after(kFlashMs, [this]() {
		restore_timer_ = 0;
		label_.set_color(color_);
	});
}
