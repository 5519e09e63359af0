#include "cells_grid.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "utils/log.hpp"

namespace {

const charkit::log::Channel kLog("CellsGrid");

}

CellsGrid::CellsGrid(int width, int height, int margin, int padding)
: width_(std::max(0, width)),
  height_(std::max(0, height)),
  margin_(std::max(0, margin)),
  padding_(std::max(0, padding)),
  panel_(SDL_Rect{0, 0, 0, 0}, FrameStyle{SDL_Color{0, 0, 0, 0}, 0, SDL_Color{0, 0, 0, 0}, 0}) {
    layout();
}

void CellsGrid::set_panel_style(const FrameStyle& style) {
    panel_.set_style(style);
}

void CellsGrid::load_cells(int dimension, const CellsStyle& style) {
    load_cells(dimension, dimension, style);
}

void CellsGrid::load_cells(int rows, int cols, const CellsStyle& style) {
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("CellsGrid needs at least one row and one column (got " +
                                    std::to_string(rows) + "x" + std::to_string(cols) + ").");
    }
    if (style.size <= 0) {
        throw std::invalid_argument("CellsGrid cell size must be positive.");
    }
    if (style.spacing < 0) {
        throw std::invalid_argument("CellsGrid cell spacing cannot be negative.");
    }

    cell_style_ = style;
    const FrameStyle frame_style{style.fill, style.corner_radius, style.border, style.border_width};
    cells_.assign(static_cast<std::size_t>(rows),
                  Row(static_cast<std::size_t>(cols), Frame(SDL_Rect{0, 0, style.size, style.size}, frame_style)));
    layout();
    kLog.debug("Loaded " + std::to_string(rows) + "x" + std::to_string(cols) + " cells.");
}

void CellsGrid::set_position(SDL_Point p) {
    position_ = p;
    layout();
}

SDL_Point CellsGrid::outer_size() const {
    const SDL_Rect& r = panel_.rect();
    return SDL_Point{r.w + margin_ * 2, r.h + margin_ * 2};
}

void CellsGrid::layout() {
    const int step = cell_style_.size + cell_style_.spacing;
    const int block_w = cols() > 0 ? cols() * step - cell_style_.spacing : 0;
    const int block_h = rows() > 0 ? rows() * step - cell_style_.spacing : 0;

    const int panel_w = std::max(width_, block_w + padding_ * 2);
    const int panel_h = std::max(height_, block_h + padding_ * 2);
    const SDL_Rect panel_rect{position_.x + margin_, position_.y + margin_, panel_w, panel_h};
    panel_.set_rect(panel_rect);

    const int origin_x = panel_rect.x + (panel_w - block_w) / 2;
    const int origin_y = panel_rect.y + (panel_h - block_h) / 2;
    for (std::size_t row = 0; row < cells_.size(); ++row) {
        for (std::size_t col = 0; col < cells_[row].size(); ++col) {
            cells_[row][col].set_rect(SDL_Rect{
                origin_x + static_cast<int>(col) * step,
                origin_y + static_cast<int>(row) * step,
                cell_style_.size,
                cell_style_.size });
        }
    }
}

void CellsGrid::render(SDL_Renderer* r) const {
    panel_.render(r);
    for (const Row& row : cells_) {
        for (const Frame& cell : row) {
            cell.render(r);
        }
    }
}
