#include <tilewrap/frontend/input_handler.h>

namespace tilewrap {

std::optional<PointerCommand> InputHandler::translate(const SDL_Event& ev) const {
    switch (ev.type) {

    case SDL_MOUSEMOTION:
        return PointerMove{static_cast<float>(ev.motion.x),
                           static_cast<float>(ev.motion.y)};

    case SDL_MOUSEBUTTONDOWN:
        if (ev.button.button == SDL_BUTTON_LEFT)
            return PointerDown{static_cast<float>(ev.button.x),
                               static_cast<float>(ev.button.y)};
        break;

    case SDL_MOUSEBUTTONUP:
        if (ev.button.button == SDL_BUTTON_LEFT)
            return PointerUp{static_cast<float>(ev.button.x),
                             static_cast<float>(ev.button.y)};
        break;

    case SDL_MOUSEWHEEL: {
        // SDL: y > 0 scrolls away from the user. Wheel uses the DOM
        // convention, positive dy = scroll down.
        float dx =  ev.wheel.preciseX * kWheelStepPx;
        float dy = -ev.wheel.preciseY * kWheelStepPx;
        if (ev.wheel.direction == SDL_MOUSEWHEEL_FLIPPED) {
            dx = -dx;
            dy = -dy;
        }
        return Wheel{dx, dy};
    }

    case SDL_WINDOWEVENT:
        if (ev.window.event == SDL_WINDOWEVENT_RESIZED ||
            ev.window.event == SDL_WINDOWEVENT_SIZE_CHANGED)
            return Resize{ev.window.data1, ev.window.data2};
        break;

    case SDL_KEYDOWN: {
        const auto& k = ev.key.keysym;
        if ((k.mod & KMOD_CTRL) && k.sym == SDLK_q) return Quit{};
        switch (k.sym) {
        case SDLK_ESCAPE: return Quit{};
        case SDLK_F1:     [[fallthrough]];
        case SDLK_d:      return ToggleDebug{};
        default: break;
        }
        break;
    }

    default:
        break;
    }

    return std::nullopt;
}

} // namespace tilewrap
