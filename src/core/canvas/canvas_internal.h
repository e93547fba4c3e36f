// Internal helpers shared across LayeredCanvas implementation units.
// Not part of the public API.
#pragma once

#include "core/canvas.h"

#include <cstdint>
#include <vector>

namespace rustique
{
// Largest accepted edge length. Keeps width*height*4 comfortably inside size_t
// on 32-bit targets and rejects absurd dimensions from corrupt documents.
static constexpr int kMaxCanvasDimension = 16384;

static inline int ClampCanvasDimension(int v)
{
    if (v < 1) return 1;
    if (v > kMaxCanvasDimension) return kMaxCanvasDimension;
    return v;
}

static inline void WriteRgbaPixel(std::vector<std::uint8_t>& out, size_t pixel_index, const Rgba8& c)
{
    const size_t o = pixel_index * 4u;
    out[o + 0] = c.r;
    out[o + 1] = c.g;
    out[o + 2] = c.b;
    out[o + 3] = c.a;
}
} // namespace rustique
