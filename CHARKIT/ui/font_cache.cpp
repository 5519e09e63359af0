#include "font_cache.hpp"

#include <functional>
#include <memory>

#include "styles.hpp"
#include "utils/log.hpp"

namespace {

const charkit::log::Channel kLog("FontCache");

constexpr SDL_Point kZeroPoint{0, 0};

struct SurfaceDeleter { void operator()(SDL_Surface* s) const { if (s) SDL_FreeSurface(s); } };
struct TextureDeleter { void operator()(SDL_Texture* t) const { if (t) SDL_DestroyTexture(t); } };
using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;
using TexturePtr = std::unique_ptr<SDL_Texture, TextureDeleter>;

}

FontCache& FontCache::instance() {
    static FontCache cache;
    return cache;
}

bool FontCache::FontKey::operator==(const FontKey& other) const {
    return size == other.size && path == other.path;
}

std::size_t FontCache::FontKeyHash::operator()(const FontKey& key) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(key.path);
    std::size_t h2 = std::hash<int>{}(key.size);
    return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
}

FontCache::~FontCache() {
    clear();
}

TTF_Font* FontCache::load_font(const std::string& path, int size) const {
    if (path.empty() || size <= 0) {
        return nullptr;
    }
    TTF_Font* font = TTF_OpenFont(path.c_str(), size);
    if (!font) {
        kLog.warn(std::string("Failed to open '") + path + "': " + TTF_GetError());
    }
    return font;
}

TTF_Font* FontCache::get_font(const std::string& path, int size) const {
    if (TTF_WasInit() == 0) {
        return nullptr;
    }
    FontKey key{path, size};
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fonts_.find(key);
    if (it != fonts_.end()) {
        return it->second;
    }
    // Failures are cached as null so a missing font is reported once.
    TTF_Font* font = load_font(path, size);
    fonts_.emplace(std::move(key), font);
    return font;
}

SDL_Point FontCache::measure_text(const TextStyle& style, const std::string& text) const {
    if (text.empty()) {
        return kZeroPoint;
    }
    TTF_Font* font = get_font(style.font_path, style.font_size);
    if (!font) {
        return kZeroPoint;
    }
    int w = 0;
    int h = 0;
    if (TTF_SizeUTF8(font, text.c_str(), &w, &h) != 0) {
        return kZeroPoint;
    }
    return SDL_Point{w, h};
}

bool FontCache::draw_text(SDL_Renderer* renderer,
                          const TextStyle& style,
                          const std::string& text,
                          int x,
                          int y,
                          SDL_Rect* out_rect) const {
    if (!renderer || text.empty()) {
        if (out_rect) {
            *out_rect = SDL_Rect{x, y, 0, 0};
        }
        return false;
    }
    TTF_Font* font = get_font(style.font_path, style.font_size);
    if (!font) {
        return false;
    }
    SurfacePtr surf(TTF_RenderUTF8_Blended(font, text.c_str(), style.color));
    if (!surf) {
        return false;
    }
    TexturePtr tex(SDL_CreateTextureFromSurface(renderer, surf.get()));
    if (!tex) {
        return false;
    }
    SDL_Rect dst{x, y, surf->w, surf->h};
    SDL_RenderCopy(renderer, tex.get(), nullptr, &dst);
    if (out_rect) {
        *out_rect = dst;
    }
    return true;
}

void FontCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : fonts_) {
        if (entry.second && TTF_WasInit() != 0) {
            TTF_CloseFont(entry.second);
        }
    }
    fonts_.clear();
}
