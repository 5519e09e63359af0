#include "launcher.hpp"

#include <SDL_image.h>
#include <SDL_ttf.h>

#include <exception>
#include <string>

#include "ui/font_cache.hpp"
#include "utils/log.hpp"

namespace {

const charkit::log::Channel kLog("Main");

void shutdown_libraries() {
        FontCache::instance().clear();
        IMG_Quit();
        TTF_Quit();
        SDL_Quit();
}

int run_app(SDL_Renderer* renderer, const WindowSpec& window, const AppConfig& config, const AppFactory& factory) {
        try {
                std::unique_ptr<WindowApp> app = factory(renderer, window, config);
                if (!app) {
                        kLog.error("No application was created for '" + window.title + "'.");
                        return 1;
                }
                app->init();
        } catch (const std::exception& ex) {
                kLog.error(window.title + " failed: " + ex.what());
                return 1;
        }
        return 0;
}

}

int run_window_app(int argc, char* argv[], const WindowSpec& window, const AppFactory& factory) {
        const AppConfig config = AppConfig::from_command_line(argc, argv);
        charkit::log::reset_time_origin();
        config.apply_log_level();
        kLog.info("Starting " + window.title + "...");
        kLog.info("Images path: " + config.images_path);

        if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) < 0) {
                kLog.error(std::string("SDL_Init failed: ") + SDL_GetError());
                return 1;
        }

        if (SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "best") != SDL_TRUE) {
                if (SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "2") != SDL_TRUE) {
                        SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "1");
                }
        }

        if (TTF_Init() < 0) {
                kLog.error(std::string("TTF_Init failed: ") + TTF_GetError());
                SDL_Quit();
                return 1;
        }

        if (!(IMG_Init(IMG_INIT_PNG) & IMG_INIT_PNG)) {
                kLog.error(std::string("IMG_Init failed: ") + IMG_GetError());
                TTF_Quit();
                SDL_Quit();
                return 1;
        }

        SDL_Window* sdl_window = SDL_CreateWindow(window.title.c_str(),
                                                  SDL_WINDOWPOS_CENTERED,
                                                  SDL_WINDOWPOS_CENTERED,
                                                  window.width,
                                                  window.height,
                                                  SDL_WINDOW_SHOWN);
        if (!sdl_window) {
                kLog.error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                shutdown_libraries();
                return 1;
        }
        SDL_SetWindowResizable(sdl_window, SDL_FALSE);

        Uint32 renderer_flags = SDL_RENDERER_ACCELERATED;
        if (config.vsync) {
                renderer_flags |= SDL_RENDERER_PRESENTVSYNC;
        }
        SDL_Renderer* renderer = SDL_CreateRenderer(sdl_window, -1, renderer_flags);
        if (!renderer) {
                kLog.error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
                SDL_DestroyWindow(sdl_window);
                shutdown_libraries();
                return 1;
        }

        SDL_RendererInfo info;
        if (SDL_GetRendererInfo(renderer, &info) == 0) {
                kLog.info(std::string("Renderer: ") + (info.name ? info.name : "Unknown"));
        }

        const int exit_code = run_app(renderer, window, config, factory);

        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(sdl_window);
        shutdown_libraries();
        if (exit_code == 0) {
                kLog.info(window.title + " exited cleanly.");
        }
        return exit_code;
}
