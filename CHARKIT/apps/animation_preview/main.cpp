#include "app/launcher.hpp"
#include "apps/animation_preview/animations_demo_app.hpp"

int main(int argc, char* argv[]) {
        const WindowSpec window{AnimationsDemoApp::kTitle, AnimationsDemoApp::kWindowWidth, AnimationsDemoApp::kWindowHeight};
        return run_window_app(argc, argv, window, [](SDL_Renderer* renderer, const WindowSpec&, const AppConfig& config) {
                return std::make_unique<AnimationsDemoApp>(renderer, config);
        });
}
