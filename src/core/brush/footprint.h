// Local-frame footprint rasterization shared by the rotated brush shapes.
//
// A footprint is tested per candidate pixel: the pixel is translated so the shape
// centre is the origin, rotated into the shape's local axes, and handed to an
// axis-aligned predicate (rectangle bound, ellipse equation, sheared rectangle...).
#pragma once

#include <algorithm>
#include <cmath>

namespace rustique::brush
{
struct Point
{
    int x = 0;
    int y = 0;

    bool operator==(const Point&) const = default;
};

inline float DegreesToRadians(float deg)
{
    return deg * 3.14159265358979323846f / 180.0f;
}

// Rotation of canvas-space offsets into a shape's local axes.
struct LocalFrame
{
    float cx = 0.0f;
    float cy = 0.0f;
    float cos_a = 1.0f;
    float sin_a = 0.0f;

    static LocalFrame Make(float centre_x, float centre_y, float angle_rad)
    {
        LocalFrame f;
        f.cx = centre_x;
        f.cy = centre_y;
        f.cos_a = std::cos(angle_rad);
        f.sin_a = std::sin(angle_rad);
        return f;
    }

    void ToLocal(int px, int py, float& out_x, float& out_y) const
    {
        const float rel_x = (float)px - cx;
        const float rel_y = (float)py - cy;
        out_x = rel_x * cos_a + rel_y * sin_a;
        out_y = -rel_x * sin_a + rel_y * cos_a;
    }
};

// Visits every canvas pixel in the square [anchor - half_extent, anchor + half_extent]
// whose local-frame coordinates satisfy `inside(lx, ly)`, calling `emit(px, py, lx, ly)`.
// The square is clipped to [0,width) x [0,height) before iterating, so the work is
// bounded by the canvas size however large the footprint is.
template <typename Inside, typename Emit>
void RasterizeInLocalFrame(int width,
                           int height,
                           Point anchor,
                           float half_extent,
                           const LocalFrame& frame,
                           Inside&& inside,
                           Emit&& emit)
{
    if (width <= 0 || height <= 0 || !(half_extent >= 0.0f))
        return;

    // Clip in double: a huge or infinite extent must not overflow int.
    const double reach = std::ceil((double)half_extent);
    const int x0 = (int)std::max(0.0, (double)anchor.x - reach);
    const int y0 = (int)std::max(0.0, (double)anchor.y - reach);
    const int x1 = (int)std::min((double)width - 1.0, (double)anchor.x + reach);
    const int y1 = (int)std::min((double)height - 1.0, (double)anchor.y + reach);

    for (int py = y0; py <= y1; ++py)
    {
        for (int px = x0; px <= x1; ++px)
        {
            float lx = 0.0f;
            float ly = 0.0f;
            frame.ToLocal(px, py, lx, ly);
            if (inside(lx, ly))
                emit(px, py, lx, ly);
        }
    }
}

// Axis-aligned predicates used in the local frame.
inline bool InsideRect(float lx, float ly, float half_w, float half_h)
{
    return std::fabs(lx) <= half_w && std::fabs(ly) <= half_h;
}

inline bool InsideEllipse(float lx, float ly, float semi_major, float semi_minor)
{
    return (lx * lx) / (semi_major * semi_major) + (ly * ly) / (semi_minor * semi_minor) <= 1.0f;
}

// Rectangle sheared along local y by `shear_tan` per unit of local x (a parallelogram).
inline bool InsideShearedRect(float lx, float ly, float half_w, float half_h, float shear_tan)
{
    if (std::fabs(lx) > half_w)
        return false;
    return std::fabs(ly - lx * shear_tan) <= half_h;
}
} // namespace rustique::brush
