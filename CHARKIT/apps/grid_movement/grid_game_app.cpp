#include "grid_game_app.hpp"

#include "app/movement_keys.hpp"
#include "ui/styles.hpp"
#include "utils/color.hpp"
#include "utils/log.hpp"

namespace {

const charkit::log::Channel kLog("GridGameApp");

constexpr Character::Position kInitialPosition{1, 0};

}

GridGameApp::GridGameApp(SDL_Renderer* renderer, AppConfig config, charkit::TimerQueue::Clock clock)
: WindowApp(renderer, kWindowWidth, kWindowHeight, std::move(config), std::move(clock)),
  header_("Use ← ↑ → ↓ or W A S D to move", Styles::BoldText(15, charkit::color::hex("#A0C4FF"))),
  grid_(kGridDimension * (kCellSize + kCellGap), kGridDimension * (kCellSize + kCellGap), 20, 10),
  position_label_(timers_, charkit::color::hex("#7FBADC"), charkit::color::hex("#FF6B6B")) {}

void GridGameApp::setup() {
        CellsStyle cells;
        cells.size = kCellSize;
        cells.spacing = kCellGap;
        cells.corner_radius = 10;
        cells.fill = charkit::color::hex("#1E2A3A");
        cells.border = charkit::color::hex("#2E4A6A");
        cells.border_width = 2;
        grid_.set_panel_style(Styles::DefaultFrame());
        grid_.load_cells(kGridDimension, cells);
        layout();

        position_label_.show(kInitialPosition);

        player_ = std::make_unique<GridCharacter>(timers_, textures_, grid_.get_cells_grid(), config_.images_path);
        player_->set_position(kInitialPosition);
        player_->play_animation("idle");
        kLog.info("Player spawned at " + PositionLabel::format(kInitialPosition) + ".");
}

void GridGameApp::layout() {
        // Header and label hug the edges; the grid is centred in the space between.
        const int header_h = header_.line_height();
        header_.set_center(SDL_Point{screen_w_ / 2, 20 + header_h / 2});

        const int label_h = position_label_.label().line_height();
        const int area_top = 20 + header_h + 4;
        const int area_bottom = screen_h_ - 16 - label_h - 4;

        const SDL_Point outer = grid_.outer_size();
        grid_.set_position(SDL_Point{(screen_w_ - outer.x) / 2, area_top + (area_bottom - area_top - outer.y) / 2});

        position_label_.label().set_center(SDL_Point{screen_w_ / 2, area_bottom + 4 + label_h / 2});
}

void GridGameApp::on_key_press(SDL_Keycode key) {
        const auto offset = charkit::keys::grid_offset(key);
        if (!offset || !player_) {
                return;
        }

        const Character::Position previous = player_->current_position();
        player_->move(*offset);

        timers_.after(kLabelRefreshMs, [this]() { refresh_position_label(); });

        if (player_->current_position() == previous) {
                position_label_.flash();
        }
}

void GridGameApp::refresh_position_label() {
        if (player_) {
                position_label_.show(player_->current_position());
        }
}

void GridGameApp::render() {
        header_.render(renderer_);
        grid_.render(renderer_);
        if (player_) {
                player_->render(renderer_);
        }
        position_label_.label().render(renderer_);
}
