#pragma once

#include <memory>

#include "app/position_label.hpp"
#include "app/window_app.hpp"
#include "apps/free_movement/free_movement_character.hpp"
#include "ui/frame.hpp"
#include "ui/label.hpp"

// Arrow keys or W/A/S/D move a sprite freely inside a play area.
class FreeMovementApp : public WindowApp {

        public:
    static constexpr int kWindowWidth = 640;
    static constexpr int kWindowHeight = 640;
    static constexpr int kPlayAreaWidth = 560;
    static constexpr int kPlayAreaHeight = 500;
    static constexpr int kStepPixels = 15;
    static constexpr const char* kTitle = "Free Movement Demo";

    FreeMovementApp(SDL_Renderer* renderer, AppConfig config, charkit::TimerQueue::Clock clock = {});

    void setup() override;

    const FreeMovementCharacter* player() const { return player_.get(); }
    const Frame& play_area() const { return play_area_; }
    const PositionLabel& position_label() const { return position_label_; }

        protected:
    void on_key_press(SDL_Keycode key) override;
    void render() override;

        private:
    void layout();

    Label                                  header_;
    Frame                                  play_area_;
    PositionLabel                          position_label_;
    std::unique_ptr<FreeMovementCharacter> player_;
};
