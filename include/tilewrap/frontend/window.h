#pragma once

#include <functional>
#include <string>
#include <SDL2/SDL.h>

namespace tilewrap {

// Resizable HiDPI window plus its renderer. When no accelerated renderer is
// available the software one is used instead.
class Window {
public:
    static constexpr int kMinWidth  = 160;
    static constexpr int kMinHeight = 120;

    Window(const std::string& title, int width, int height);
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    // Drain pending events into handler. Returns false once SDL_QUIT arrives.
    bool poll_events(const std::function<void(const SDL_Event&)>& handler);

    void present();

    SDL_Renderer* sdl_renderer() const { return renderer_; }

    // Logical size; physical size is this times dpi_scale().
    int   width_px()    const { return width_; }
    int   height_px()   const { return height_; }
    float dpi_scale()   const { return dpi_scale_; }
    bool  accelerated() const { return accelerated_; }

private:
    void refresh_metrics();
    void release();

    SDL_Window*   window_{};
    SDL_Renderer* renderer_{};
    int   width_{};
    int   height_{};
    float dpi_scale_{1.0f};
    bool  accelerated_{false};
};

} // namespace tilewrap
