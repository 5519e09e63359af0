#pragma once

#include <SDL.h>

#include <string>
#include <utility>

#include "ui/label.hpp"
#include "utils/timer_queue.hpp"

// "Position: (a, b)" readout that can flash a warning colour after a
// rejected move.
class PositionLabel {

	public:
    static constexpr Uint32 kFlashMs = 200;

    PositionLabel(charkit::TimerQueue& timers, SDL_Color color, SDL_Color flash_color);
    ~PositionLabel();

    PositionLabel(const PositionLabel&) = delete;
    PositionLabel& operator=(const PositionLabel&) = delete;

    void show(std::pair<int, int> position);
    // Switches to the flash colour and back after kFlashMs.
    void flash();
    bool is_flashing() const { return restore_timer_ != 0; }

    Label& label() { return label_; }
    const Label& label() const { return label_; }

    static std::string format(std::pair<int, int> position);

	private:
    charkit::TimerQueue& timers_;
    Label                label_;
    SDL_Color            color_;
    SDL_Color            flash_color_;
    charkit::TimerId     restore_timer_ = 0;
};
