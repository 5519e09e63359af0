#include "app/launcher.hpp"
#include "apps/free_movement/free_movement_app.hpp"

int main(int argc, char* argv[]) {
        const WindowSpec window{FreeMovementApp::kTitle, FreeMovementApp::kWindowWidth, FreeMovementApp::kWindowHeight};
        return run_window_app(argc, argv, window, [](SDL_Renderer* renderer, const WindowSpec&, const AppConfig& config) {
                return std::make_unique<FreeMovementApp>(renderer, config);
        });
}
