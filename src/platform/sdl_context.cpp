#include "platform/sdl_context.h"

#include "core/logger.h"

#include <algorithm>
#include <string>

namespace pitchsync::platform {
namespace {

std::string SdlError() {
    const char* error = SDL_GetError();
    return error == nullptr ? std::string("unknown error") : std::string(error);
}

bool IsQuitEvent(Uint32 event_type) {
    return event_type == SDL_EVENT_QUIT ||
        event_type == SDL_EVENT_WINDOW_CLOSE_REQUESTED;
}

struct RgbaColor final {
    Uint8 r = 0;
    Uint8 g = 0;
    Uint8 b = 0;
    Uint8 a = 255;
};

float AxisValue(bool negative, bool positive) {
    return (positive ? 1.0F : 0.0F) - (negative ? 1.0F : 0.0F);
}

RgbaColor SlotColor(std::uint8_t player_slot) {
    if (player_slot == 0) {
        return RgbaColor{.r = 64, .g = 140, .b = 240, .a = 255};
    }

    return RgbaColor{.r = 240, .g = 136, .b = 48, .a = 255};
}

void DrawFilledRect(
    SDL_Renderer* renderer,
    int x,
    int y,
    int width,
    int height,
    const RgbaColor& color) {
    if (renderer == nullptr || width <= 0 || height <= 0) {
        return;
    }

    (void)SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    const SDL_FRect rect{
        static_cast<float>(x),
        static_cast<float>(y),
        static_cast<float>(width),
        static_cast<float>(height),
    };
    (void)SDL_RenderFillRect(renderer, &rect);
}

// Maps arena metres to window pixels, keeping the pitch centred and uniformly scaled.
struct PitchViewport final {
    float pixels_per_metre = 1.0F;
    int centre_x = 0;
    int centre_y = 0;

    int ScreenX(float world_x) const {
        return centre_x + static_cast<int>(world_x * pixels_per_metre);
    }

    int ScreenY(float world_z) const {
        return centre_y - static_cast<int>(world_z * pixels_per_metre);
    }

    int Pixels(float metres) const {
        return std::max(1, static_cast<int>(metres * pixels_per_metre));
    }
};

void DrawCenteredRect(
    SDL_Renderer* renderer,
    const PitchViewport& viewport,
    float world_x,
    float world_z,
    float size_metres,
    const RgbaColor& color) {
    const int size = viewport.Pixels(size_metres);
    DrawFilledRect(
        renderer,
        viewport.ScreenX(world_x) - size / 2,
        viewport.ScreenY(world_z) - size / 2,
        size,
        size,
        color);
}

void DrawCar(SDL_Renderer* renderer, const PitchViewport& viewport, const RenderCar& car) {
    RgbaColor body_color = SlotColor(car.player_slot);
    float body_size = 2.0F;
    if (car.kind == RenderCarKind::LocalServerGhost) {
        body_color.a = 90;
        body_size = 2.2F;
    }

    // Airborne cars are drawn slightly larger.
    body_size += std::clamp(car.height, 0.0F, 10.0F) * 0.08F;
    DrawCenteredRect(renderer, viewport, car.x, car.z, body_size, body_color);
    DrawCenteredRect(
        renderer,
        viewport,
        car.x + car.heading_x * body_size * 0.6F,
        car.z + car.heading_z * body_size * 0.6F,
        body_size * 0.4F,
        RgbaColor{.r = 240, .g = 240, .b = 240, .a = body_color.a});
}

}  // namespace

SdlContext::~SdlContext() {
    Shutdown();
}

bool SdlContext::Initialize(const core::SyncConfig& config) {
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        core::Logger::Error("platform", "SDL_Init failed: " + SdlError());
        return false;
    }

    window_ = SDL_CreateWindow(
        config.window_title.c_str(),
        config.window_width,
        config.window_height,
        SDL_WINDOW_RESIZABLE);
    if (window_ == nullptr) {
        core::Logger::Error("platform", "SDL_CreateWindow failed: " + SdlError());
        SDL_Quit();
        return false;
    }

    renderer_ = SDL_CreateRenderer(window_, nullptr);
    if (renderer_ == nullptr) {
        core::Logger::Error("platform", "SDL_CreateRenderer failed: " + SdlError());
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        SDL_Quit();
        return false;
    }

    const int vsync = config.vsync ? 1 : 0;
    (void)SDL_SetRenderVSync(renderer_, vsync);
    (void)SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);

    core::Logger::Info("platform", "SDL3 context initialized.");
    return true;
}

bool SdlContext::PumpEvents(bool& quit_requested, InputActions& out_actions) {
    SDL_Event event{};
    while (SDL_PollEvent(&event)) {
        if (IsQuitEvent(event.type)) {
            quit_requested = true;
        }

        if (event.type == SDL_EVENT_KEY_DOWN && !event.key.repeat) {
            if (event.key.scancode == SDL_SCANCODE_F1) {
                out_actions.toggle_debug_overlay = true;
            }

            if (event.key.scancode == SDL_SCANCODE_F5) {
                out_actions.debug_net_connect = true;
            }

            if (event.key.scancode == SDL_SCANCODE_F6) {
                out_actions.debug_net_disconnect = true;
            }

            if (event.key.scancode == SDL_SCANCODE_ESCAPE) {
                quit_requested = true;
            }
        }
    }

    SDL_PumpEvents();
    const bool* keyboard_state = SDL_GetKeyboardState(nullptr);
    if (keyboard_state == nullptr) {
        out_actions.frame = sim::InputFrame{};
        return true;
    }

    const float throttle = AxisValue(
        keyboard_state[SDL_SCANCODE_S],
        keyboard_state[SDL_SCANCODE_W]);
    const float steer = AxisValue(
        keyboard_state[SDL_SCANCODE_A],
        keyboard_state[SDL_SCANCODE_D]);
    const float pitch = AxisValue(
        keyboard_state[SDL_SCANCODE_UP],
        keyboard_state[SDL_SCANCODE_DOWN]);
    const float roll = AxisValue(
        keyboard_state[SDL_SCANCODE_Q],
        keyboard_state[SDL_SCANCODE_E]);
    const bool air_roll = keyboard_state[SDL_SCANCODE_LCTRL] ||
        keyboard_state[SDL_SCANCODE_RCTRL];

    out_actions.frame = sim::InputFrame{
        .throttle = throttle,
        .steer = steer,
        .yaw = air_roll ? 0.0F : steer,
        .pitch = pitch,
        .roll = air_roll ? steer : roll,
        .boost = keyboard_state[SDL_SCANCODE_LSHIFT] || keyboard_state[SDL_SCANCODE_RSHIFT],
        .drift = air_roll,
        .air_roll = air_roll,
        .jump = keyboard_state[SDL_SCANCODE_SPACE],
    };
    return true;
}

void SdlContext::RenderFrame(const RenderScene& scene) {
    if (renderer_ == nullptr) {
        return;
    }

    (void)SDL_SetRenderDrawColor(renderer_, 14, 18, 26, 255);
    (void)SDL_RenderClear(renderer_);

    int window_width = 0;
    int window_height = 0;
    if (window_ != nullptr) {
        (void)SDL_GetWindowSize(window_, &window_width, &window_height);
    }
    if (window_width <= 0 || window_height <= 0 ||
        scene.arena_half_width <= 0.0F || scene.arena_half_length <= 0.0F) {
        SDL_RenderPresent(renderer_);
        return;
    }

    const float margin = 0.9F;
    PitchViewport viewport{};
    viewport.pixels_per_metre = std::min(
        static_cast<float>(window_width) * margin / (scene.arena_half_width * 2.0F),
        static_cast<float>(window_height) * margin / (scene.arena_half_length * 2.0F));
    viewport.centre_x = window_width / 2;
    viewport.centre_y = window_height / 2;

    DrawFilledRect(
        renderer_,
        viewport.ScreenX(-scene.arena_half_width),
        viewport.ScreenY(scene.arena_half_length),
        viewport.Pixels(scene.arena_half_width * 2.0F),
        viewport.Pixels(scene.arena_half_length * 2.0F),
        RgbaColor{.r = 38, .g = 96, .b = 54, .a = 255});
    DrawFilledRect(
        renderer_,
        viewport.ScreenX(-scene.arena_half_width),
        viewport.ScreenY(0.0F),
        viewport.Pixels(scene.arena_half_width * 2.0F),
        2,
        RgbaColor{.r = 200, .g = 220, .b = 200, .a = 160});

    // Goal mouths: +z is player one's target.
    const int goal_width = viewport.Pixels(scene.goal_half_width * 2.0F);
    DrawFilledRect(
        renderer_,
        viewport.ScreenX(-scene.goal_half_width),
        viewport.ScreenY(scene.arena_half_length) - 6,
        goal_width,
        6,
        SlotColor(1));
    DrawFilledRect(
        renderer_,
        viewport.ScreenX(-scene.goal_half_width),
        viewport.ScreenY(-scene.arena_half_length),
        goal_width,
        6,
        SlotColor(0));

    for (const RenderCar& car : scene.cars) {
        DrawCar(renderer_, viewport, car);
    }

    if (scene.ball.visible) {
        const float ball_size = 1.8F + std::clamp(scene.ball.height, 0.0F, 15.0F) * 0.06F;
        DrawCenteredRect(
            renderer_,
            viewport,
            scene.ball.x,
            scene.ball.z,
            ball_size,
            scene.ball.extrapolating && scene.hud.show_debug_overlay
                ? RgbaColor{.r = 240, .g = 96, .b = 96, .a = 255}
                : RgbaColor{.r = 236, .g = 236, .b = 220, .a = 255});
    }

    const int hud_x = 12;
    const int hud_y = 12;
    DrawFilledRect(
        renderer_,
        hud_x,
        hud_y,
        220,
        scene.hud.show_debug_overlay ? 86 : 44,
        RgbaColor{.r = 18, .g = 18, .b = 22, .a = 214});
    DrawFilledRect(
        renderer_,
        hud_x + 8,
        hud_y + 8,
        10,
        10,
        scene.hud.connected ? RgbaColor{.r = 104, .g = 188, .b = 98, .a = 255}
                            : RgbaColor{.r = 188, .g = 64, .b = 64, .a = 255});

    const int pip_size = 8;
    for (int index = 0; index < std::min<int>(scene.hud.score_player_one, 10); ++index) {
        DrawFilledRect(renderer_, hud_x + 28 + index * (pip_size + 3), hud_y + 8, pip_size, pip_size, SlotColor(0));
    }
    for (int index = 0; index < std::min<int>(scene.hud.score_player_two, 10); ++index) {
        DrawFilledRect(renderer_, hud_x + 28 + index * (pip_size + 3), hud_y + 20, pip_size, pip_size, SlotColor(1));
    }

    if (scene.hud.match_duration_seconds > 0.0F) {
        const float remaining_fraction = std::clamp(
            scene.hud.remaining_seconds / scene.hud.match_duration_seconds,
            0.0F,
            1.0F);
        DrawFilledRect(
            renderer_,
            hud_x + 8,
            hud_y + 34,
            static_cast<int>(200.0F * remaining_fraction),
            4,
            RgbaColor{.r = 220, .g = 214, .b = 108, .a = 255});
    }

    if (scene.hud.show_debug_overlay) {
        const int error_width = static_cast<int>(
            std::clamp(scene.hud.last_position_error, 0.0F, 4.0F) * 50.0F);
        DrawFilledRect(
            renderer_,
            hud_x + 8,
            hud_y + 48,
            error_width,
            8,
            RgbaColor{.r = 240, .g = 96, .b = 96, .a = 255});
        const int rtt_width = static_cast<int>(
            std::clamp(scene.hud.rtt_seconds, 0.0F, 0.4F) * 500.0F);
        DrawFilledRect(
            renderer_,
            hud_x + 8,
            hud_y + 62,
            rtt_width,
            8,
            RgbaColor{.r = 96, .g = 176, .b = 240, .a = 255});
        const int blend_count = static_cast<int>(std::min<std::uint32_t>(scene.hud.blended_correction_count, 100));
        const int snap_count = static_cast<int>(std::min<std::uint32_t>(scene.hud.snapped_correction_count, 40));
        DrawFilledRect(
            renderer_,
            hud_x + 8,
            hud_y + 74,
            blend_count * 2,
            3,
            RgbaColor{.r = 160, .g = 220, .b = 120, .a = 255});
        DrawFilledRect(
            renderer_,
            hud_x + 8,
            hud_y + 79,
            snap_count * 5,
            3,
            RgbaColor{.r = 240, .g = 160, .b = 64, .a = 255});
    }

    SDL_RenderPresent(renderer_);
}

void SdlContext::Shutdown() {
    if (renderer_ != nullptr) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }

    if (window_ != nullptr) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }

    if (SDL_WasInit(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
        SDL_Quit();
    }
}

}  // namespace pitchsync::platform
