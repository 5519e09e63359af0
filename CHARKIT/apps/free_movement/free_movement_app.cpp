#include "free_movement_app.hpp"

#include "app/movement_keys.hpp"
#include "ui/styles.hpp"
#include "utils/color.hpp"
#include "utils/log.hpp"

namespace {

const charkit::log::Channel kLog("FreeMovementApp");

constexpr Character::Position kInitialPosition{20, 20};

}

FreeMovementApp::FreeMovementApp(SDL_Renderer* renderer, AppConfig config, charkit::TimerQueue::Clock clock)
: WindowApp(renderer, kWindowWidth, kWindowHeight, std::move(config), std::move(clock)),
  header_("Use ← ↑ → ↓ or W A S D to move freely", Styles::BoldText(15, charkit::color::hex("#A0C4FF"))),
  play_area_(SDL_Rect{0, 0, kPlayAreaWidth, kPlayAreaHeight},
             FrameStyle{charkit::color::hex("#1E2A3A"), 0, charkit::color::kTransparent, 0}),
  position_label_(timers_, charkit::color::hex("#7FBADC"), charkit::color::hex("#FF6B6B")) {}

void FreeMovementApp::setup() {
        layout();
        position_label_.show(kInitialPosition);

        player_ = std::make_unique<FreeMovementCharacter>(timers_, textures_, play_area_, config_.images_path);
        player_->set_position(kInitialPosition);
        player_->play_animation("idle");
        kLog.info("Player spawned at " + PositionLabel::format(kInitialPosition) + ".");
}

void FreeMovementApp::layout() {
        const int header_h = header_.line_height();
        header_.set_center(SDL_Point{screen_w_ / 2, 20 + header_h / 2});

        const int label_h = position_label_.label().line_height();
        const int area_top = 20 + header_h + 4;
        const int area_bottom = screen_h_ - 16 - label_h - 4;

        play_area_.set_position(SDL_Point{(screen_w_ - kPlayAreaWidth) / 2,
                                          area_top + (area_bottom - area_top - kPlayAreaHeight) / 2});

        position_label_.label().set_center(SDL_Point{screen_w_ / 2, area_bottom + 4 + label_h / 2});
}

void FreeMovementApp::on_key_press(SDL_Keycode key) {
        const auto offset = charkit::keys::pixel_offset(key, kStepPixels);
        if (!offset || !player_) {
                return;
        }

        if (!player_->move(*offset)) {
                position_label_.flash();
                return;
        }
        position_label_.show(player_->current_position());
}

void FreeMovementApp::render() {
        header_.render(renderer_);
        play_area_.render(renderer_);
        if (player_) {
                player_->render(renderer_);
        }
        position_label_.label().render(renderer_);
}
