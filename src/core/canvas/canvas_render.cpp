#include "core/canvas/canvas_internal.h"

#include <cstdint>
#include <vector>

namespace rustique
{
namespace
{
// Checkerboard greys used for "nothing painted here".
static constexpr Rgba8 kCheckerLight{200, 200, 200, 255};
static constexpr Rgba8 kCheckerDark{160, 160, 160, 255};
} // namespace

void LayeredCanvas::RenderToRgba(std::vector<std::uint8_t>& out) const
{
    out.assign((size_t)m_width * (size_t)m_height * 4u, 0u);
    for (int y = 0; y < m_height; ++y)
    {
        for (int x = 0; x < m_width; ++x)
        {
            const Cell c = Get(x, y);
            if (c)
                WriteRgbaPixel(out, CellIndex(x, y), *c);
        }
    }
}

void LayeredCanvas::RenderToRgbaCheckerboard(std::vector<std::uint8_t>& out, int cell_px) const
{
    if (cell_px <= 0)
        cell_px = 8;
    out.assign((size_t)m_width * (size_t)m_height * 4u, 0u);
    for (int y = 0; y < m_height; ++y)
    {
        for (int x = 0; x < m_width; ++x)
        {
            const Cell c = Get(x, y);
            if (c)
            {
                WriteRgbaPixel(out, CellIndex(x, y), *c);
                continue;
            }
            const bool light = ((x / cell_px) + (y / cell_px)) % 2 == 0;
            WriteRgbaPixel(out, CellIndex(x, y), light ? kCheckerLight : kCheckerDark);
        }
    }
}
} // namespace rustique
