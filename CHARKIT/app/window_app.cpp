#include "window_app.hpp"

#include <string>
#include <utility>

#include "ui/styles.hpp"
#include "utils/log.hpp"

namespace {

const charkit::log::Channel kLog("WindowApp");

charkit::TimerQueue::Clock resolve_clock(charkit::TimerQueue::Clock clock) {
    if (clock) {
        return clock;
    }
    return [] { return SDL_GetTicks64(); };
}

}

WindowApp::WindowApp(SDL_Renderer* renderer,
                     int screen_w,
                     int screen_h,
                     AppConfig config,
                     charkit::TimerQueue::Clock clock)
: renderer_(renderer),
  screen_w_(screen_w),
  screen_h_(screen_h),
  config_(std::move(config)),
  timers_(resolve_clock(std::move(clock))),
  textures_(renderer) {}

WindowApp::~WindowApp() {
        timers_.clear();
        textures_.clear();
}

void WindowApp::init() {
        setup();
        game_loop();
}

void WindowApp::handle_event(const SDL_Event&) {}

void WindowApp::on_key_press(SDL_Keycode) {}

SDL_Color WindowApp::background() const {
        return Styles::WindowBackground();
}

void WindowApp::dispatch_event(const SDL_Event& e) {
        if (e.type == SDL_QUIT) {
                request_quit();
                return;
        }
        if (e.type == SDL_KEYDOWN) {
                on_key_press(e.key.keysym.sym);
        }
        handle_event(e);
}

void WindowApp::update_and_render() {
        timers_.run_due();
        if (!renderer_) {
                return;
        }
        const SDL_Color bg = background();
        SDL_SetRenderDrawColor(renderer_, bg.r, bg.g, bg.b, 255);
        SDL_RenderClear(renderer_);
        render();
        SDL_RenderPresent(renderer_);
}

void WindowApp::game_loop() {
        const double target_fps     = static_cast<double>(config_.target_fps > 0 ? config_.target_fps : 60);
        const double perf_frequency = static_cast<double>(SDL_GetPerformanceFrequency());
        const double target_counts  = perf_frequency / target_fps;

        double idle_counts_accum = 0.0;
        int idle_frame_counter   = 0;
        constexpr int IDLE_REPORT_INTERVAL = 240;
        SDL_Event e;

        kLog.info("Loop started at " + std::to_string(config_.target_fps) + " FPS.");

        while (!quit_) {
                const Uint64 frame_begin = SDL_GetPerformanceCounter();

                while (SDL_PollEvent(&e)) {
                        dispatch_event(e);
                }
                if (quit_) {
                        break;
                }

                update_and_render();

                const Uint64 frame_end = SDL_GetPerformanceCounter();
                const double work_counts = static_cast<double>(frame_end - frame_begin);

                if (work_counts < target_counts) {
                        const double remaining_counts = target_counts - work_counts;
                        idle_counts_accum += remaining_counts;
                        ++idle_frame_counter;
                        const double remaining_ms = (remaining_counts * 1000.0) / perf_frequency;
                        if (remaining_ms >= 1.0) {
                                SDL_Delay(static_cast<Uint32>(remaining_ms));
                        }
                }

                if (idle_frame_counter >= IDLE_REPORT_INTERVAL) {
                        const double total_idle_ms = (idle_counts_accum * 1000.0) / perf_frequency;
                        const double average_idle_ms = total_idle_ms / static_cast<double>(idle_frame_counter);
                        kLog.debug("Idle pacing: avg " + std::to_string(average_idle_ms) +
                                   "ms over " + std::to_string(idle_frame_counter) + " frame(s).");
                        idle_counts_accum = 0.0;
                        idle_frame_counter = 0;
                }
        }

        kLog.info("Loop finished.");
}
