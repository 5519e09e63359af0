#include "app/launcher.hpp"
#include "apps/grid_movement/grid_game_app.hpp"

int main(int argc, char* argv[]) {
        const WindowSpec window{GridGameApp::kTitle, GridGameApp::kWindowWidth, GridGameApp::kWindowHeight};
        return run_window_app(argc, argv, window, [](SDL_Renderer* renderer, const WindowSpec&, const AppConfig& config) {
                return std::make_unique<GridGameApp>(renderer, config);
        });
}
