#pragma once

#include <SDL.h>
#include <SDL_ttf.h>

#include <mutex>
#include <string>
#include <unordered_map>

struct TextStyle;

class FontCache {
public:
    static FontCache& instance();

    TTF_Font* get_font(const std::string& path, int size) const;

    SDL_Point measure_text(const TextStyle& style, const std::string& text) const;

    bool draw_text(SDL_Renderer* renderer, const TextStyle& style, const std::string& text, int x, int y, SDL_Rect* out_rect = nullptr) const;

    void clear();

private:
    struct FontKey {
        std::string path;
        int size = 0;

        bool operator==(const FontKey& other) const;
};

    struct FontKeyHash {
        std::size_t operator()(const FontKey& key) const noexcept;
};

    FontCache() = default;
    ~FontCache();

    FontCache(const FontCache&) = delete;
    FontCache& operator=(const FontCache&) = delete;

    TTF_Font* load_font(const std::string& path, int size) const;

    mutable std::unordered_map<FontKey, TTF_Font*, FontKeyHash> fonts_;
    mutable std::mutex mutex_;
};
