#include <tilewrap/frontend/window.h>

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace tilewrap {

namespace {

SDL_Renderer* create_renderer(SDL_Window* window, bool& accelerated) {
    SDL_Renderer* r = SDL_CreateRenderer(
        window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    accelerated = r != nullptr;
    if (r) return r;

    std::fprintf(stderr, "tilewrap: no accelerated renderer (%s), using software\n",
                 SDL_GetError());
    return SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
}

} // namespace

Window::Window(const std::string& title, int width, int height) {
    if (SDL_InitSubSystem(SDL_INIT_VIDEO) != 0)
        throw std::runtime_error(std::string("SDL video init failed: ") + SDL_GetError());

    const Uint32 flags = SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI;
    window_ = SDL_CreateWindow(title.c_str(),
                               SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               std::max(width, kMinWidth), std::max(height, kMinHeight),
                               flags);
    if (!window_) {
        std::string err = SDL_GetError();
        release();
        throw std::runtime_error("SDL_CreateWindow failed: " + err);
    }
    // The grid view needs a non-empty viewport at all times.
    SDL_SetWindowMinimumSize(window_, kMinWidth, kMinHeight);

    renderer_ = create_renderer(window_, accelerated_);
    if (!renderer_) {
        std::string err = SDL_GetError();
        release();
        throw std::runtime_error("SDL_CreateRenderer failed: " + err);
    }

    refresh_metrics();
}

Window::~Window() {
    release();
}

void Window::release() {
    if (renderer_) SDL_DestroyRenderer(renderer_);
    if (window_)   SDL_DestroyWindow(window_);
    renderer_ = nullptr;
    window_   = nullptr;
    SDL_QuitSubSystem(SDL_INIT_VIDEO);
}

void Window::refresh_metrics() {
    SDL_GetWindowSize(window_, &width_, &height_);

    int out_w = 0;
    if (SDL_GetRendererOutputSize(renderer_, &out_w, nullptr) == 0 &&
        out_w > 0 && width_ > 0)
        dpi_scale_ = static_cast<float>(out_w) / static_cast<float>(width_);
}

bool Window::poll_events(const std::function<void(const SDL_Event&)>& handler) {
    SDL_Event ev;
    while (SDL_PollEvent(&ev)) {
        if (ev.type == SDL_QUIT)
            return false;
        if (ev.type == SDL_WINDOWEVENT &&
            (ev.window.event == SDL_WINDOWEVENT_SIZE_CHANGED ||
             ev.window.event == SDL_WINDOWEVENT_DISPLAY_CHANGED))
            refresh_metrics();
        handler(ev);
    }
    return true;
}

void Window::present() {
    SDL_RenderPresent(renderer_);
}

} // namespace tilewrap
