#pragma once

#include "events.h"

#include <SDL2/SDL.h>
#include <optional>

namespace tilewrap {

// Stateless translator: raw SDL event → typed PointerCommand.
class InputHandler {
public:
    static constexpr float kWheelStepPx = 48.0f;

    std::optional<PointerCommand> translate(const SDL_Event& ev) const;
};

} // namespace tilewrap
