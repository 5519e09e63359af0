#pragma once

#include <SDL.h>
#include <vector>

#include "frame.hpp"

struct CellsStyle {
    int       size = 80;
    int       spacing = 8;
    int       corner_radius = 0;
    SDL_Color fill{43, 43, 43, 255};
    SDL_Color border{0, 0, 0, 0};
    int       border_width = 0;
};

// Panel holding a row-major matrix of cell frames.
//
// The panel is at least width x height and grows to fit the cell block plus
// padding on each side; the block is centred inside it. Margin is empty space
// around the panel and counts towards outer_size().
class CellsGrid {
public:
    using Row    = std::vector<Frame>;
    using Matrix = std::vector<Row>;

    CellsGrid(int width, int height, int margin = 0, int padding = 0);

    void set_panel_style(const FrameStyle& style);

    void load_cells(int dimension, const CellsStyle& style);
    void load_cells(int rows, int cols, const CellsStyle& style);

    // Top-left of the margin box.
    void set_position(SDL_Point p);
    SDL_Point position() const { return position_; }

    SDL_Point outer_size() const;
    const SDL_Rect& rect() const { return panel_.rect(); }

    int rows() const { return static_cast<int>(cells_.size()); }
    int cols() const { return cells_.empty() ? 0 : static_cast<int>(cells_.front().size()); }

    const Matrix& get_cells_grid() const { return cells_; }

    void render(SDL_Renderer* r) const;

private:
    void layout();

    int        width_ = 0;
    int        height_ = 0;
    int        margin_ = 0;
    int        padding_ = 0;
    SDL_Point  position_{0, 0};
    CellsStyle cell_style_{};
    Frame      panel_{};
    Matrix     cells_;
};
