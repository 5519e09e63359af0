#pragma once

#include <memory>
#include <string>
#include <vector>

#include "app/window_app.hpp"
#include "character/character.hpp"
#include "ui/button.hpp"
#include "ui/frame.hpp"
#include "ui/label.hpp"

// Card with a stage and one button per animation; clicking a button plays
// that animation on the sprite in the stage.
class AnimationsDemoApp : public WindowApp {

        public:
    static constexpr int kWindowWidth = 560;
    static constexpr int kWindowHeight = 620;
    static constexpr int kCharacterSize = 120;
    static constexpr int kStageWidth = 320;
    static constexpr int kStageHeight = 260;
    static constexpr int kButtonHeight = 44;
    static constexpr const char* kTitle = "Character Animations";

    AnimationsDemoApp(SDL_Renderer* renderer, AppConfig config, charkit::TimerQueue::Clock clock = {});

    void setup() override;

    const Character* character() const { return character_.get(); }
    const Frame& stage() const { return stage_; }
    const std::vector<Button>& buttons() const { return buttons_; }

        protected:
    void handle_event(const SDL_Event& e) override;
    void render() override;
    SDL_Color background() const override;

        private:
    void spawn_character();
    void create_buttons();
    void layout();

    Frame  card_;
    Label  title_;
    Label  subtitle_;
    Frame  stage_;
    Frame  divider_;
    std::vector<Button>        buttons_;
    std::unique_ptr<Character> character_;
};
