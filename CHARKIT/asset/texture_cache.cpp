#include "texture_cache.hpp"

#include <memory>

#include <SDL_image.h>

#include "utils/log.hpp"

namespace {

const charkit::log::Channel kLog("TextureCache");

struct SurfaceDeleter { void operator()(SDL_Surface* s) const { if (s) SDL_FreeSurface(s); } };
using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;

}

TextureCache::TextureCache(SDL_Renderer* renderer)
: renderer_(renderer) {}

TextureCache::~TextureCache() {
    clear();
}

bool TextureCache::contains(const std::string& path) const {
    return textures_.find(path) != textures_.end();
}

SDL_Texture* TextureCache::get(const std::string& path) {
    if (!renderer_) {
        return nullptr;
    }
    auto it = textures_.find(path);
    if (it != textures_.end()) {
        return it->second;
    }
    SDL_Texture* tex = load(path);
    textures_.emplace(path, tex);
    return tex;
}

SDL_Texture* TextureCache::load(const std::string& path) const {
    SurfacePtr surface(IMG_Load(path.c_str()));
    if (!surface) {
        kLog.warn("Failed to load '" + path + "': " + IMG_GetError());
        return nullptr;
    }
    SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer_, surface.get());
    if (!tex) {
        kLog.warn("Failed to create texture for '" + path + "': " + SDL_GetError());
        return nullptr;
    }
    SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
    kLog.debug("Loaded '" + path + "' (" + std::to_string(surface->w) + "x" +
               std::to_string(surface->h) + ").");
    return tex;
}

void TextureCache::clear() {
    for (auto& entry : textures_) {
        if (entry.second) {
            SDL_DestroyTexture(entry.second);
        }
    }
    textures_.clear();
}
