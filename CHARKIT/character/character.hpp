#pragma once

#include <SDL.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "asset/animation.hpp"
#include "ui/cells_grid.hpp"
#include "ui/frame.hpp"
#include "utils/color.hpp"
#include "utils/timer_queue.hpp"

class TextureCache;

struct CharacterOptions {
    std::vector<Animation> animations;
    // (row, col) with grid_cells, (x, y) with frame.
    std::pair<int, int> position{0, 0};
    std::string images_path = "./assets/images/";
    int size = 100;
    SDL_Color bg_color = charkit::color::kTransparent;

    // Exactly one of these must be set.
    const Frame* frame = nullptr;
    const CellsGrid::Matrix* grid_cells = nullptr;
};

/*
 * Character
 * ---------------------------------------------------------
 * Square animated sprite placed either
 *  - at a pixel offset inside a frame, or
 *  - centred in a cell of a grid of frames.
 *
 * Frames are swapped through the TimerQueue, so playback only advances while
 * the owning loop calls run_due(). The timer queue, the texture cache and the
 * layout target must outlive the character.
 */
class Character {
public:
    using Position = std::pair<int, int>;

    enum class LayoutMode { Frame, Grid };

    // Throws std::invalid_argument when the layout target is missing or
    // ambiguous, the size is not positive, or two animations share a name.
    Character(charkit::TimerQueue& timers, TextureCache& textures, CharacterOptions options);
    virtual ~Character();

    Character(const Character&) = delete;
    Character& operator=(const Character&) = delete;

    // Throws std::out_of_range for an unregistered name. Restarts playback
    // when called again; the previous sequence is cancelled.
    void play_animation(const std::string& name);
    void stop_animation();
    bool is_playing() const { return pending_timer_ != 0; }
    const std::optional<std::string>& active_animation() const { return active_animation_; }
    std::size_t current_frame_index() const { return current_frame_index_; }
    // Frame currently on screen, null before the first one is shown.
    const AnimationFrame* displayed_frame() const { return displayed_frame_; }

    // Places the wrapper at a window position, outside the layout target.
    void show(SDL_Point top_left);
    bool is_visible() const { return visible_; }

    // False (and no change) when a grid position falls outside the grid, or
    // when a position or offset would overflow the window coordinate range.
    bool set_position(Position position);
    bool move(Position offset);
    Position current_position() const { return position_; }

    const std::vector<AnimationFrame>& get_animation_frames(const std::string& name) const;
    bool has_animation(const std::string& name) const;
    const std::vector<std::string>& animation_names() const { return animation_order_; }

    LayoutMode layout_mode() const { return grid_cells_ ? LayoutMode::Grid : LayoutMode::Frame; }
    int size() const { return size_; }
    const std::string& images_path() const { return images_path_; }
    SDL_Color background() const { return bg_color_; }
    const SDL_Rect& wrapper_rect() const { return wrapper_rect_; }

    void render(SDL_Renderer* renderer) const;

private:
    void register_animations(const std::vector<Animation>& animations);
    void update_position();
    void schedule_frame(std::size_t index, Uint32 delay_ms);
    void show_frame(std::size_t index);
    std::string resolve_image_path(const std::string& filename) const;

    charkit::TimerQueue& timers_;
    TextureCache&        textures_;

    std::unordered_map<std::string, std::vector<AnimationFrame>> animations_;
    std::vector<std::string> animation_order_;

    Position    position_{0, 0};
    std::string images_path_;
    int         size_ = 100;
    SDL_Color   bg_color_ = charkit::color::kTransparent;

    const Frame*             frame_ = nullptr;
    const CellsGrid::Matrix* grid_cells_ = nullptr;

    std::optional<std::string>         active_animation_;
    const std::vector<AnimationFrame>* active_frames_ = nullptr;
    std::size_t                        current_frame_index_ = 0;
    const AnimationFrame*              displayed_frame_ = nullptr;
    SDL_Texture*                       active_image_ = nullptr;
    charkit::TimerId                   pending_timer_ = 0;

    SDL_Rect wrapper_rect_{0, 0, 0, 0};
    bool     visible_ = false;
};
