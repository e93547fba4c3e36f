#include "core/brush/brush_engine.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace rustique::brush
{
namespace
{
static constexpr float kPi = 3.14159265358979323846f;
static constexpr float kHalfPi = kPi * 0.5f;

// Flat/Angle thickness is a quarter of the width at hardness 1.
static constexpr float kFlatThicknessRatio = 0.25f;
static constexpr float kBrightThicknessRatio = 0.20f;
static constexpr float kAngleShearDeg = 45.0f;
static constexpr float kFanSpreadDeg = 90.0f;
static constexpr std::uint32_t kFanDefaultBristles = 10;
static constexpr float kMopOpacity = 0.3f;
static constexpr float kRiggerRadius = 1.0f;

static inline std::uint8_t ScaleAlpha(std::uint8_t a, float mul)
{
    const long v = std::lround((float)a * mul);
    return (std::uint8_t)std::clamp<long>(v, 0, 255);
}

// Linear falloff between the fully-opaque core (hard_radius) and the outer radius.
static inline float RadialFalloff(float distance, float radius, float hard_radius)
{
    if (distance <= hard_radius)
        return 1.0f;
    if (radius <= hard_radius)
        return 0.0f;
    return std::clamp((radius - distance) / (radius - hard_radius), 0.0f, 1.0f);
}
} // namespace

template <typename Stamp>
void BrushEngine::WalkLine(Point start, Point end, Stamp&& stamp)
{
    int x0 = start.x;
    int y0 = start.y;
    const int x1 = end.x;
    const int y1 = end.y;
    const int dx = std::abs(x1 - x0);
    const int sx = (x0 < x1) ? 1 : -1;
    const int dy = -std::abs(y1 - y0);
    const int sy = (y0 < y1) ? 1 : -1;
    int err = dx + dy;

    for (;;)
    {
        stamp(Point{x0, y0});
        if (x0 == x1 && y0 == y1)
            break;
        const int e2 = 2 * err;
        if (e2 >= dy)
        {
            err += dy;
            x0 += sx;
        }
        if (e2 <= dx)
        {
            err += dx;
            y0 += sy;
        }
    }
}

BrushStyle BrushEngine::AdaptToStrokeDirection(const BrushStyle& style, Point start, Point end)
{
    if (style.shape != BrushShape::Flat && style.shape != BrushShape::Angle && style.shape != BrushShape::Filbert)
        return style;

    const float stroke_dx = (float)(end.x - start.x);
    const float stroke_dy = (float)(end.y - start.y);
    if (std::hypot(stroke_dx, stroke_dy) <= 0.1f)
        return style; // a dot has no direction

    const float stroke_rad = std::atan2(stroke_dy, stroke_dx);
    const float brush_rad = DegreesToRadians(style.angle);

    // Fold the difference into [0, pi/2]: 0 = parallel to the brush axis, pi/2 = perpendicular.
    float diff = std::fabs(stroke_rad - brush_rad);
    if (diff > kPi)
        diff = 2.0f * kPi - diff;
    if (diff > kHalfPi)
        diff = kPi - diff;

    const float thickness_factor = std::sin(diff / kHalfPi);
    const float h = style.hardness;

    BrushStyle out = style;
    if (style.shape == BrushShape::Filbert)
        out.hardness = std::clamp(h * (1.0f - thickness_factor) + thickness_factor, 0.1f, 1.0f);
    else
        out.hardness = std::clamp(h * std::max(thickness_factor, 0.1f), 0.01f, 1.0f);
    return out;
}

void BrushEngine::DrawLine(BrushStyle style, Point start, Point end, const Cell& fill, bool follow_direction)
{
    const BrushStyle line_style = follow_direction ? AdaptToStrokeDirection(style, start, end) : style;
    WalkLine(start, end, [&](Point p) { DrawPoint(line_style, p, fill); });
}

void BrushEngine::EraseLine(int eraser_size, Point start, Point end)
{
    WalkLine(start, end, [&](Point p) { ErasePoint(eraser_size, p); });
}

void BrushEngine::ErasePoint(int eraser_size, Point centre)
{
    if (eraser_size < 0)
        return;
    DrawHardDisk((float)eraser_size, centre, std::nullopt);
}

void BrushEngine::DrawPoint(BrushStyle style, Point centre, const Cell& fill)
{
    switch (style.shape)
    {
        case BrushShape::Round:
            DrawRound(style, centre, fill);
            return;
        case BrushShape::Mop:
            DrawMop(style, centre, fill);
            return;
        case BrushShape::Flat:
        {
            const float thickness = std::max(style.hardness * style.size * kFlatThicknessRatio, 1.0f);
            DrawRectangle(style.size, thickness, style.angle, centre, fill);
            return;
        }
        case BrushShape::Bright:
        {
            const float thickness = std::max(style.size * kBrightThicknessRatio, 1.0f);
            DrawRectangle(style.size, thickness, style.angle, centre, fill);
            return;
        }
        case BrushShape::Angle:
            DrawAngle(style, centre, fill);
            return;
        case BrushShape::Filbert:
            DrawFilbert(style, centre, fill);
            return;
        case BrushShape::Fan:
            DrawFan(style, centre, fill);
            return;
        case BrushShape::Rigger:
            DrawHardDisk(kRiggerRadius, centre, fill);
            return;
    }
}

void BrushEngine::DrawSinglePixel(Point c, const Cell& fill)
{
    if (c.x >= 0 && c.y >= 0 && c.x < m_target.GetWidth() && c.y < m_target.GetHeight())
        m_target.RecordChange(c.x, c.y, fill);
}

void BrushEngine::DrawHardDisk(float radius, Point c, const Cell& fill)
{
    const float r2 = radius * radius;
    const LocalFrame frame = LocalFrame::Make((float)c.x, (float)c.y, 0.0f);
    RasterizeInLocalFrame(
        m_target.GetWidth(), m_target.GetHeight(), c, radius, frame,
        [&](float lx, float ly) { return lx * lx + ly * ly <= r2; },
        [&](int px, int py, float, float) { m_target.RecordChange(px, py, fill); });
}

void BrushEngine::DrawRound(const BrushStyle& style, Point c, const Cell& fill)
{
    const float radius = style.size / 2.0f;
    const float hard_radius = radius * style.hardness;
    const float r2 = radius * radius;
    const LocalFrame frame = LocalFrame::Make((float)c.x, (float)c.y, 0.0f);

    RasterizeInLocalFrame(
        m_target.GetWidth(), m_target.GetHeight(), c, radius, frame,
        [&](float lx, float ly) { return lx * lx + ly * ly <= r2; },
        [&](int px, int py, float lx, float ly) {
            Cell out = fill;
            if (out)
            {
                const float d = std::sqrt(lx * lx + ly * ly);
                out->a = ScaleAlpha(out->a, RadialFalloff(d, radius, hard_radius));
            }
            m_target.RecordChange(px, py, out);
        });
}

void BrushEngine::DrawMop(const BrushStyle& style, Point c, const Cell& fill)
{
    const float radius = style.size / 2.0f;
    // Re-scale user hardness into a narrow, very soft range.
    const float mop_hardness = std::clamp(style.hardness * 0.24f + 0.01f, 0.01f, 0.25f);

    if (radius < 0.5f)
    {
        if (!fill)
            return;
        const std::uint8_t a = ScaleAlpha(fill->a, kMopOpacity);
        if (a > 0)
            DrawSinglePixel(c, WithAlpha(*fill, a));
        return;
    }

    const float hard_radius = radius * mop_hardness;
    const float r2 = radius * radius;
    const LocalFrame frame = LocalFrame::Make((float)c.x, (float)c.y, 0.0f);

    RasterizeInLocalFrame(
        m_target.GetWidth(), m_target.GetHeight(), c, radius, frame,
        [&](float lx, float ly) { return lx * lx + ly * ly <= r2; },
        [&](int px, int py, float lx, float ly) {
            if (!fill)
                return;
            const float d = std::sqrt(lx * lx + ly * ly);
            const std::uint8_t a = ScaleAlpha(fill->a, kMopOpacity * RadialFalloff(d, radius, hard_radius));
            if (a > 0)
                m_target.RecordChange(px, py, WithAlpha(*fill, a));
        });
}

void BrushEngine::DrawRectangle(float width, float thickness, float angle_deg, Point c, const Cell& fill)
{
    const float half_w = width / 2.0f;
    const float half_t = thickness / 2.0f;
    const float half_extent = std::hypot(width, thickness) / 2.0f;
    const LocalFrame frame = LocalFrame::Make((float)c.x, (float)c.y, DegreesToRadians(angle_deg));

    RasterizeInLocalFrame(
        m_target.GetWidth(), m_target.GetHeight(), c, half_extent, frame,
        [&](float lx, float ly) { return InsideRect(lx, ly, half_w, half_t); },
        [&](int px, int py, float, float) { m_target.RecordChange(px, py, fill); });
}

void BrushEngine::DrawAngle(const BrushStyle& style, Point c, const Cell& fill)
{
    const float width = style.size;
    const float thickness = std::max(style.hardness * width * kFlatThicknessRatio, 1.0f);
    const float shear_tan = std::tan(DegreesToRadians(kAngleShearDeg));

    const float max_shear_offset = (width / 2.0f) * std::fabs(shear_tan);
    const float half_extent = std::hypot(width, thickness) / 2.0f + max_shear_offset;
    const LocalFrame frame = LocalFrame::Make((float)c.x, (float)c.y, DegreesToRadians(style.angle));

    RasterizeInLocalFrame(
        m_target.GetWidth(), m_target.GetHeight(), c, half_extent, frame,
        [&](float lx, float ly) { return InsideShearedRect(lx, ly, width / 2.0f, thickness / 2.0f, shear_tan); },
        [&](int px, int py, float, float) { m_target.RecordChange(px, py, fill); });
}

void BrushEngine::DrawFilbert(const BrushStyle& style, Point c, const Cell& fill)
{
    const float major = style.size;
    const float minor = major * std::clamp(style.hardness, 0.1f, 1.0f);
    const float semi_major = major / 2.0f;
    const float semi_minor = minor / 2.0f;

    if (semi_major < 0.5f || semi_minor < 0.5f)
    {
        DrawSinglePixel(c, fill);
        return;
    }

    const float half_extent = std::max(semi_major, semi_minor);
    const LocalFrame frame = LocalFrame::Make((float)c.x, (float)c.y, DegreesToRadians(style.angle));

    RasterizeInLocalFrame(
        m_target.GetWidth(), m_target.GetHeight(), c, half_extent, frame,
        [&](float lx, float ly) { return InsideEllipse(lx, ly, semi_major, semi_minor); },
        [&](int px, int py, float, float) { m_target.RecordChange(px, py, fill); });
}

void BrushEngine::DrawFan(const BrushStyle& style, Point c, const Cell& fill)
{
    const std::uint32_t bristles =
        std::clamp<std::uint32_t>(style.bristle_count.value_or(kFanDefaultBristles), 2u, kMaxFanBristles);
    const float length = std::max(style.size, 1.0f);
    const float thickness = std::min(std::max(style.hardness * length * 0.05f, 1.0f), length * 0.2f);
    const float spread_rad = DegreesToRadians(kFanSpreadDeg);
    const float rotation_rad = DegreesToRadians(style.angle);
    // Every bristle starts at the brush centre, so one window around it covers them all.
    const float half_extent = length + thickness;

    for (std::uint32_t i = 0; i < bristles; ++i)
    {
        const float t = (float)i / (float)(bristles - 1);
        const float bristle_rad = (t - 0.5f) * spread_rad + rotation_rad;

        // Test in a frame centred on the bristle's midpoint.
        const float mid_x = (float)c.x + (length / 2.0f) * std::cos(bristle_rad);
        const float mid_y = (float)c.y + (length / 2.0f) * std::sin(bristle_rad);
        const LocalFrame frame = LocalFrame::Make(mid_x, mid_y, bristle_rad);

        RasterizeInLocalFrame(
            m_target.GetWidth(), m_target.GetHeight(), c, half_extent, frame,
            [&](float lx, float ly) { return InsideRect(lx, ly, length / 2.0f, thickness / 2.0f); },
            [&](int px, int py, float, float) { m_target.RecordChange(px, py, fill); });
    }
}
} // namespace rustique::brush
