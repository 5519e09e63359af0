#include "animations_demo_app.hpp"

#include <stdexcept>

#include "apps/animation_preview/preview_animations.hpp"
#include "ui/styles.hpp"
#include "utils/color.hpp"
#include "utils/log.hpp"

namespace {

const charkit::log::Channel kLog("AnimationPreview");

namespace theme {
const SDL_Color& bg_main()    { static const SDL_Color c = charkit::color::hex("#0B1020"); return c; }
const SDL_Color& bg_card()    { static const SDL_Color c = charkit::color::hex("#0F172A"); return c; }
const SDL_Color& bg_stage()   { static const SDL_Color c = charkit::color::hex("#020617"); return c; }
const SDL_Color& btn_main()   { static const SDL_Color c = charkit::color::hex("#1F2937"); return c; }
const SDL_Color& btn_hover()  { static const SDL_Color c = charkit::color::hex("#374151"); return c; }
const SDL_Color& text_main()  { static const SDL_Color c = charkit::color::hex("#E5E7EB"); return c; }
const SDL_Color& text_muted() { static const SDL_Color c = charkit::color::hex("#9CA3AF"); return c; }
const SDL_Color& outline()    { static const SDL_Color c = charkit::color::hex("#1E293B"); return c; }
}

constexpr int kCardMargin = 24;
constexpr int kButtonColumns = 2;

ButtonStyle preview_button_style() {
        ButtonStyle style;
        style.label = Styles::BoldText(13, theme::text_main());
        style.fill = theme::btn_main();
        style.fill_hover = theme::btn_hover();
        style.border = theme::outline();
        style.border_width = 1;
        style.corner_radius = AnimationsDemoApp::kButtonHeight / 2;
        return style;
}

}

AnimationsDemoApp::AnimationsDemoApp(SDL_Renderer* renderer, AppConfig config, charkit::TimerQueue::Clock clock)
: WindowApp(renderer, kWindowWidth, kWindowHeight, std::move(config), std::move(clock)),
  card_(SDL_Rect{kCardMargin, kCardMargin, kWindowWidth - 2 * kCardMargin, kWindowHeight - 2 * kCardMargin},
        FrameStyle{theme::bg_card(), 24, charkit::color::kTransparent, 0}),
  title_("Animation Preview", Styles::BoldText(20, theme::text_main())),
  subtitle_("Click a button to preview each animation", Styles::Text(13, theme::text_muted())),
  stage_(SDL_Rect{0, 0, kStageWidth, kStageHeight}, FrameStyle{theme::bg_stage(), 18, theme::outline(), 1}),
  divider_(SDL_Rect{0, 0, 0, 1}, FrameStyle{theme::outline(), 0, charkit::color::kTransparent, 0}) {}

SDL_Color AnimationsDemoApp::background() const {
        return theme::bg_main();
}

void AnimationsDemoApp::setup() {
        spawn_character();
        create_buttons();
        layout();
}

void AnimationsDemoApp::spawn_character() {
        CharacterOptions options;
        options.frame = &stage_;
        options.size = kCharacterSize;
        options.images_path = config_.images_path;
        options.bg_color = theme::bg_stage();
        options.animations = preview::load_or_builtin(config_.animations_file);

        try {
                character_ = std::make_unique<Character>(timers_, textures_, options);
        } catch (const std::invalid_argument& ex) {
                kLog.error(std::string(ex.what()) + " Using built-in set.");
                options.animations = preview::builtin_animations();
                character_ = std::make_unique<Character>(timers_, textures_, options);
        }

        character_->set_position(Character::Position{(kStageWidth - kCharacterSize) / 2,
                                                     (kStageHeight - kCharacterSize) / 2});
        kLog.info(std::to_string(character_->animation_names().size()) +
                  " animation(s) ready.");
}

void AnimationsDemoApp::create_buttons() {
        buttons_.clear();
        const ButtonStyle style = preview_button_style();
        for (const std::string& name : character_->animation_names()) {
                Button button(preview::button_caption(name), style, 0, kButtonHeight);
                button.set_on_click([this, name]() {
                        if (character_) {
                                character_->play_animation(name);
                        }
                });
                buttons_.push_back(std::move(button));
        }
}

void AnimationsDemoApp::layout() {
        const SDL_Rect& card = card_.rect();
        const int center_x = card.x + card.w / 2;
        int y = card.y + 20;

        const int title_h = title_.line_height();
        title_.set_center(SDL_Point{center_x, y + title_h / 2});
        y += title_h + 4;

        const int subtitle_h = subtitle_.line_height();
        subtitle_.set_center(SDL_Point{center_x, y + subtitle_h / 2});
        y += subtitle_h + 16;

        y += 12;
        stage_.set_position(SDL_Point{center_x - kStageWidth / 2, y});
        y += kStageHeight + 12;

        y += 16;
        divider_.set_rect(SDL_Rect{card.x + 32, y, card.w - 64, 1});
        y += 1 + 12;

        // The stage moved, so re-place the character inside it.
        if (character_) {
                character_->set_position(character_->current_position());
        }

        const int controls_x = card.x + 20;
        const int column_w = (card.w - 40) / kButtonColumns;
        for (std::size_t i = 0; i < buttons_.size(); ++i) {
                const int column = static_cast<int>(i) % kButtonColumns;
                const int row = static_cast<int>(i) / kButtonColumns;
                buttons_[i].set_rect(SDL_Rect{controls_x + column * column_w + 8,
                                              y + row * (kButtonHeight + 16) + 8,
                                              column_w - 16,
                                              kButtonHeight});
        }
}

void AnimationsDemoApp::handle_event(const SDL_Event& e) {
        for (Button& button : buttons_) {
                button.handle_event(e);
        }
}

void AnimationsDemoApp::render() {
        card_.render(renderer_);
        title_.render(renderer_);
        subtitle_.render(renderer_);
        stage_.render(renderer_);
        if (character_) {
                character_->render(renderer_);
        }
        divider_.render(renderer_);
        for (const Button& button : buttons_) {
                button.render(renderer_);
        }
}
