#pragma once

#include "core/brush/footprint.h"
#include "core/brush_style.h"
#include "core/colour.h"
#include "core/paint_target.h"

namespace rustique::brush
{
// Converts brush applications into per-pixel writes on an IPaintTarget.
//
// Stateless apart from the target reference: every call receives the BrushStyle by
// value, so a style edited by the UI between calls never affects pixels that were
// already written.
class BrushEngine
{
public:
    explicit BrushEngine(IPaintTarget& target) : m_target(target) {}

    // Stamps one footprint of `style` centred at `centre`.
    // `fill` == nullopt erases within the footprint.
    void DrawPoint(BrushStyle style, Point centre, const Cell& fill);

    // Walks the integer Bresenham path from start to end (inclusive) stamping a
    // footprint at every lattice point. With `follow_direction`, Flat/Angle/Filbert
    // brushes get the stroke-direction adjustment for the duration of the line.
    void DrawLine(BrushStyle style, Point start, Point end, const Cell& fill, bool follow_direction = true);

    // Eraser tool: hard disk of radius `eraser_size` that clears cells to nullopt.
    void ErasePoint(int eraser_size, Point centre);
    void EraseLine(int eraser_size, Point start, Point end);

    // Returns `style` with hardness adjusted for a stroke from start to end:
    // strokes parallel to the brush axis stay thin, perpendicular ones become full.
    // Only Flat, Angle and Filbert are affected; other shapes are returned unchanged.
    static BrushStyle AdaptToStrokeDirection(const BrushStyle& style, Point start, Point end);

private:
    template <typename Stamp>
    static void WalkLine(Point start, Point end, Stamp&& stamp);

    void DrawRound(const BrushStyle& style, Point c, const Cell& fill);
    void DrawMop(const BrushStyle& style, Point c, const Cell& fill);
    void DrawRectangle(float width, float thickness, float angle_deg, Point c, const Cell& fill);
    void DrawAngle(const BrushStyle& style, Point c, const Cell& fill);
    void DrawFilbert(const BrushStyle& style, Point c, const Cell& fill);
    void DrawFan(const BrushStyle& style, Point c, const Cell& fill);
    void DrawHardDisk(float radius, Point c, const Cell& fill);
    void DrawSinglePixel(Point c, const Cell& fill);

    IPaintTarget& m_target;
};
} // namespace rustique::brush
