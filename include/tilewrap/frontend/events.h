#pragma once

#include <variant>

namespace tilewrap {

// Typed host commands produced by InputHandler from raw SDL events.
// Coordinates are logical window pixels.

struct PointerMove  { float x; float y; };
struct PointerDown  { float x; float y; };
struct PointerUp    { float x; float y; };   // release, then click
struct Wheel        { float dx; float dy; }; // pixels, positive = right/down
struct Resize       { int width; int height; };
struct ToggleDebug  {};
struct Quit         {};

using PointerCommand = std::variant<
    PointerMove, PointerDown, PointerUp, Wheel, Resize, ToggleDebug, Quit
>;

} // namespace tilewrap
