#pragma once

#include <SDL.h>

#include <string>
#include <unordered_map>

// Owns the textures decoded for character frames, keyed by file path.
// Failed loads are remembered so a missing file is reported once.
class TextureCache {
public:
    explicit TextureCache(SDL_Renderer* renderer);
    ~TextureCache();

    TextureCache(const TextureCache&) = delete;
    TextureCache& operator=(const TextureCache&) = delete;

    // Null when the file cannot be decoded or there is no renderer.
    SDL_Texture* get(const std::string& path);

    bool contains(const std::string& path) const;
    std::size_t size() const { return textures_.size(); }
    SDL_Renderer* renderer() const { return renderer_; }

    void clear();

private:
    SDL_Texture* load(const std::string& path) const;

    SDL_Renderer* renderer_ = nullptr;
    std::unordered_map<std::string, SDL_Texture*> textures_;
};
