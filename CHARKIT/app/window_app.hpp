#pragma once

#include <SDL.h>

#include "app/app_config.hpp"
#include "asset/texture_cache.hpp"
#include "utils/timer_queue.hpp"

// Fixed-size window driven by a single loop: poll events, dispatch key
// presses, run due timers, render, pace to the configured frame rate.
class WindowApp {

        public:
    WindowApp(SDL_Renderer* renderer,
              int screen_w,
              int screen_h,
              AppConfig config,
              charkit::TimerQueue::Clock clock = {});
    virtual ~WindowApp();

    WindowApp(const WindowApp&) = delete;
    WindowApp& operator=(const WindowApp&) = delete;

    // setup() then game_loop().
    virtual void init();
    virtual void game_loop();
    virtual void setup() = 0;

    // Routes one event: SDL_QUIT ends the loop, SDL_KEYDOWN reaches
    // on_key_press(), every event reaches handle_event().
    void dispatch_event(const SDL_Event& e);
    // Runs due timers and draws one frame.
    void update_and_render();

    void request_quit() { quit_ = true; }
    bool quit_requested() const { return quit_; }

    charkit::TimerQueue& timers() { return timers_; }
    TextureCache& textures() { return textures_; }
    const AppConfig& config() const { return config_; }
    int screen_width() const { return screen_w_; }
    int screen_height() const { return screen_h_; }

        protected:
    virtual void handle_event(const SDL_Event& e);
    virtual void on_key_press(SDL_Keycode key);
    virtual void render() = 0;
    virtual SDL_Color background() const;

    SDL_Renderer*       renderer_ = nullptr;
    int                 screen_w_ = 0;
    int                 screen_h_ = 0;
    AppConfig           config_;
    charkit::TimerQueue timers_;
    TextureCache        textures_;

        private:
    bool quit_ = false;
};
