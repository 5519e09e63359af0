#include "character.hpp"

#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>

#include "asset/texture_cache.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace {

const charkit::log::Channel kLog("Character");

// Rounds toward negative infinity so a cell smaller than the sprite still
// centres consistently.
int floor_div(int value, int divisor) {
    int q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}

std::optional<int> checked_sum(int a, int b) {
    const long long sum = static_cast<long long>(a) + static_cast<long long>(b);
    if (sum < std::numeric_limits<int>::min() || sum > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(sum);
}

}

Character::Character(charkit::TimerQueue& timers, TextureCache& textures, CharacterOptions options)
: timers_(timers),
  textures_(textures),
  position_(options.position),
  images_path_(std::move(options.images_path)),
  size_(options.size),
  bg_color_(options.bg_color),
  frame_(options.frame),
  grid_cells_(options.grid_cells),
  wrapper_rect_{0, 0, options.size, options.size} {
    if ((frame_ == nullptr) == (grid_cells_ == nullptr)) {
        throw std::invalid_argument("A character needs exactly one of frame or grid_cells to resolve its position.");
    }
    if (size_ <= 0) {
        throw std::invalid_argument("Character size must be positive (got " + std::to_string(size_) + ").");
    }
    register_animations(options.animations);
}

Character::~Character() {
    stop_animation();
}

void Character::register_animations(const std::vector<Animation>& animations) {
    for (const Animation& animation : animations) {
        if (animations_.find(animation.name()) != animations_.end()) {
            throw std::invalid_argument("Duplicate animation '" + animation.name() + "'.");
        }
        animations_.emplace(animation.name(), animation.frames());
        animation_order_.push_back(animation.name());
    }
}

const std::vector<AnimationFrame>& Character::get_animation_frames(const std::string& name) const {
    auto it = animations_.find(name);
    if (it == animations_.end()) {
        throw std::out_of_range("Unknown animation '" + name + "'.");
    }
    return it->second;
}

bool Character::has_animation(const std::string& name) const {
    return animations_.find(name) != animations_.end();
}

void Character::play_animation(const std::string& name) {
    const std::vector<AnimationFrame>& frames = get_animation_frames(name);
    stop_animation();
    active_animation_ = name;
    active_frames_ = &frames;
    kLog.debug("Playing '" + name + "' (" + std::to_string(frames.size()) + " frame(s)).");
    schedule_frame(0, frames.front().duration());
}

void Character::stop_animation() {
    if (pending_timer_ != 0) {
        timers_.cancel(pending_timer_);
        pending_timer_ = 0;
    }
}

void Character::schedule_frame(std::size_t index, Uint32 delay_ms) {
    pending_timer_ = timers_.after(delay_ms, [this, index]() {
        pending_timer_ = 0;
        show_frame(index);
    });
}

void Character::show_frame(std::size_t index) {
    if (!active_frames_ || index >= active_frames_->size()) {
        return;
    }
    const AnimationFrame& frame = (*active_frames_)[index];
    current_frame_index_ = index;
    displayed_frame_ = &frame;
    active_image_ = textures_.get(resolve_image_path(frame.filename()));

    if (index + 1 < active_frames_->size()) {
        schedule_frame(index + 1, frame.duration());
    }
}

std::string Character::resolve_image_path(const std::string& filename) const {
    if (images_path_.empty()) {
        return filename;
    }
    return (std::filesystem::path(images_path_) / filename).string();
}

void Character::show(SDL_Point top_left) {
    wrapper_rect_ = SDL_Rect{top_left.x, top_left.y, size_, size_};
    visible_ = true;
}

bool Character::set_position(Position position) {
    if (grid_cells_) {
        const int rows = static_cast<int>(grid_cells_->size());
        const int cols = rows > 0 ? static_cast<int>(grid_cells_->front().size()) : 0;
        const auto [row, col] = position;
        if (row < 0 || row >= rows || col < 0 || col >= cols) {
            kLog.debug("Rejected position " + charkit::strings::format_pair(row, col) +
                       ": outside " + std::to_string(rows) + "x" + std::to_string(cols) + " grid.");
            return false;
        }
    } else {
        const SDL_Point origin = frame_->top_left();
        if (!checked_sum(origin.x, position.first) || !checked_sum(origin.y, position.second)) {
            kLog.debug("Rejected position " + charkit::strings::format_pair(position.first, position.second) +
                       ": outside the addressable area of the frame.");
            return false;
        }
    }

    position_ = position;
    update_position();
    return true;
}

bool Character::move(Position offset) {
    const std::optional<int> first = checked_sum(position_.first, offset.first);
    const std::optional<int> second = checked_sum(position_.second, offset.second);
    if (!first || !second) {
        return false;
    }
    return set_position(Position{*first, *second});
}

void Character::update_position() {
    if (grid_cells_) {
        const auto [row, col] = position_;
        if (row < 0 || col < 0 || row >= static_cast<int>(grid_cells_->size()) ||
            col >= static_cast<int>((*grid_cells_)[static_cast<std::size_t>(row)].size())) {
            return;
        }
        const SDL_Rect& cell = (*grid_cells_)[static_cast<std::size_t>(row)][static_cast<std::size_t>(col)].rect();
        const int offset_x = floor_div(cell.w - size_, 2);
        const int offset_y = floor_div(cell.h - size_, 2);
        wrapper_rect_ = SDL_Rect{cell.x + offset_x, cell.y + offset_y, size_, size_};
        visible_ = true;
        return;
    }

    const SDL_Point origin = frame_->top_left();
    wrapper_rect_ = SDL_Rect{origin.x + position_.first, origin.y + position_.second, size_, size_};
    visible_ = true;
}

void Character::render(SDL_Renderer* renderer) const {
    if (!renderer || !visible_) {
        return;
    }
    if (!charkit::color::is_transparent(bg_color_)) {
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, bg_color_.r, bg_color_.g, bg_color_.b, bg_color_.a);
        SDL_RenderFillRect(renderer, &wrapper_rect_);
    }
    if (active_image_) {
        SDL_RenderCopy(renderer, active_image_, nullptr, &wrapper_rect_);
    }
}
