#include <tilewrap/frontend/application.h>
#include <tilewrap/frontend/input_handler.h>
#include <tilewrap/frontend/renderer.h>
#include <tilewrap/frontend/window.h>
#include <tilewrap/labels.h>

#include "font_face.h"
#include "sdl_surface.h"

#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tilewrap {

namespace {

constexpr Color kBackground{0x10, 0x10, 0x10, 255};

// Forward one host command to the view. Returns false on Quit.
bool apply_command(GridView& view, const PointerCommand& cmd) {
    return std::visit([&view](const auto& c) {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, PointerMove>) {
            view.on_move(c.x, c.y);
        } else if constexpr (std::is_same_v<T, PointerDown>) {
            view.on_press(true, Point{c.x, c.y});
        } else if constexpr (std::is_same_v<T, PointerUp>) {
            view.on_press(false, Point{c.x, c.y});
            view.on_click(c.x, c.y);
        } else if constexpr (std::is_same_v<T, Wheel>) {
            view.on_wheel(c.dx, c.dy);
        } else if constexpr (std::is_same_v<T, Resize>) {
            if (c.width > 0 && c.height > 0)
                view.on_resize(c.width, c.height);
        } else if constexpr (std::is_same_v<T, ToggleDebug>) {
            view.set_debug_visible(!view.debug_visible());
        } else if constexpr (std::is_same_v<T, Quit>) {
            return false;
        }
        return true;
    }, cmd);
}

} // namespace

bool run_application(const AppConfig& config) {
    std::vector<std::string> labels;
    if (!config.labels_path.empty()) {
        try {
            labels = load_labels(config.labels_path);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "tilewrap: cannot load labels '%s': %s\n",
                         config.labels_path.c_str(), e.what());
            return false;
        }
    } else {
        labels = default_labels();
    }

    std::filesystem::path font_path = config.font_path.empty()
        ? find_system_sans_font()
        : std::filesystem::path(config.font_path);
    if (font_path.empty()) {
        std::fprintf(stderr, "tilewrap: no usable font found, pass --font\n");
        return false;
    }

    try {
        Window window(config.title, config.window_width, config.window_height);
        Renderer renderer(window.sdl_renderer());

        // Draw in logical pixels; glyphs are rasterized at physical size.
        float scale = window.dpi_scale();
        SDL_RenderSetScale(renderer.raw(), scale, scale);

        SdlSurface surface(renderer, font_path, find_fallback_fonts(), scale);
        surface.set_background(kBackground);

        GridView view(surface, window.width_px(), window.height_px(),
                      std::move(labels), config.grid);
        InputHandler input;

        const Uint64 start = SDL_GetPerformanceCounter();
        const double ticks_per_ms =
            static_cast<double>(SDL_GetPerformanceFrequency()) / 1000.0;

        bool quit = false;
        while (!quit) {
            bool open = window.poll_events([&](const SDL_Event& ev) {
                if (ev.type == SDL_WINDOWEVENT &&
                    ev.window.event == SDL_WINDOWEVENT_SIZE_CHANGED)
                {
                    float new_scale = window.dpi_scale();
                    if (new_scale != scale) {
                        scale = new_scale;
                        SDL_RenderSetScale(renderer.raw(), scale, scale);
                        surface.set_dpi_scale(scale);
                    }
                }
                if (auto cmd = input.translate(ev)) {
                    if (!apply_command(view, *cmd))
                        quit = true;
                }
            });
            if (!open || quit) break;

            double now_ms = static_cast<double>(SDL_GetPerformanceCounter() - start)
                          / ticks_per_ms;
            renderer.begin_frame(kBackground);
            view.render(now_ms);
            renderer.end_frame();
            window.present();
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "tilewrap: fatal error: %s\n", e.what());
        return false;
    }

    return true;
}

} // namespace tilewrap
