#pragma once

#include <cstdint>

namespace tilewrap {

struct Color { uint8_t r, g, b, a; };
struct RectF { float x, y, w, h; };

} // namespace tilewrap
