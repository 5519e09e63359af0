#pragma once

#include <SDL.h>

#include <functional>
#include <memory>
#include <string>

#include "app/app_config.hpp"
#include "app/window_app.hpp"

struct WindowSpec {
    std::string title;
    int         width = 640;
    int         height = 480;
};

using AppFactory =
    std::function<std::unique_ptr<WindowApp>(SDL_Renderer* renderer, const WindowSpec& window, const AppConfig& config)>;

// Brings up SDL, SDL_image and SDL_ttf, opens a fixed-size centred window,
// runs the app built by the factory and tears everything down in reverse.
// Returns the process exit code.
int run_window_app(int argc, char* argv[], const WindowSpec& window, const AppFactory& factory);
