#pragma once

#include <memory>

#include "app/position_label.hpp"
#include "app/window_app.hpp"
#include "apps/grid_movement/grid_character.hpp"
#include "ui/cells_grid.hpp"
#include "ui/label.hpp"

// Arrow keys or W/A/S/D move a sprite across a 6x6 grid of cells.
class GridGameApp : public WindowApp {

        public:
    static constexpr int    kWindowWidth = 640;
    static constexpr int    kWindowHeight = 720;
    static constexpr int    kGridDimension = 6;
    static constexpr int    kCellSize = 80;
    static constexpr int    kCellGap = 8;
    static constexpr Uint32 kLabelRefreshMs = 200;
    static constexpr const char* kTitle = "Grid Movement Demo";

    GridGameApp(SDL_Renderer* renderer, AppConfig config, charkit::TimerQueue::Clock clock = {});

    void setup() override;

    const GridCharacter* player() const { return player_.get(); }
    const CellsGrid& cells_grid() const { return grid_; }
    const PositionLabel& position_label() const { return position_label_; }

        protected:
    void on_key_press(SDL_Keycode key) override;
    void render() override;

        private:
    void layout();
    void refresh_position_label();

    Label                          header_;
    CellsGrid                      grid_;
    PositionLabel                  position_label_;
    std::unique_ptr<GridCharacter> player_;
};
