// Brush shape definitions shared by the brush engine, tool state and the document codec.
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace rustique
{
enum class BrushShape : std::uint8_t
{
    Round = 0,
    Flat,
    Bright,
    Filbert,
    Fan,
    Angle,
    Mop,
    Rigger,
};

inline constexpr BrushShape kAllBrushShapes[] = {
    BrushShape::Round,
    BrushShape::Flat,
    BrushShape::Bright,
    BrushShape::Filbert,
    BrushShape::Fan,
    BrushShape::Angle,
    BrushShape::Mop,
    BrushShape::Rigger,
};

// Persisted spelling (matches the variant names written by earlier releases).
inline constexpr const char* BrushShapeToString(BrushShape s)
{
    switch (s)
    {
        case BrushShape::Round:   return "Round";
        case BrushShape::Flat:    return "Flat";
        case BrushShape::Bright:  return "Bright";
        case BrushShape::Filbert: return "Filbert";
        case BrushShape::Fan:     return "Fan";
        case BrushShape::Angle:   return "Angle";
        case BrushShape::Mop:     return "Mop";
        case BrushShape::Rigger:  return "Rigger";
    }
    return "Round";
}

inline bool BrushShapeFromString(std::string_view s, BrushShape& out)
{
    for (BrushShape shape : kAllBrushShapes)
    {
        if (s == BrushShapeToString(shape))
        {
            out = shape;
            return true;
        }
    }
    // CLI convenience: lowercase names.
    if (s == "round")   { out = BrushShape::Round; return true; }
    if (s == "flat")    { out = BrushShape::Flat; return true; }
    if (s == "bright")  { out = BrushShape::Bright; return true; }
    if (s == "filbert") { out = BrushShape::Filbert; return true; }
    if (s == "fan")     { out = BrushShape::Fan; return true; }
    if (s == "angle")   { out = BrushShape::Angle; return true; }
    if (s == "mop")     { out = BrushShape::Mop; return true; }
    if (s == "rigger")  { out = BrushShape::Rigger; return true; }
    return false;
}

// Upper bound on Fan bristles; larger counts are clamped when drawing and rejected on load.
inline constexpr std::uint32_t kMaxFanBristles = 1024;

// Parametric brush description.
//
// Tools hold one of these and mutate it live; the brush engine always receives a
// copy so edits made mid-stroke never alter pixels that were already rasterized.
struct BrushStyle
{
    BrushShape shape = BrushShape::Round;
    float      size = 10.0f;    // > 0, pixels
    float      angle = 0.0f;    // degrees, [-180, 180]
    float      hardness = 1.0f; // [0, 1]; meaning depends on shape

    // Fan only.
    std::optional<std::uint32_t> bristle_count = 10u;
    // Reserved; persisted but not used by any footprint yet.
    std::optional<float> taper_strength;

    bool operator==(const BrushStyle&) const = default;
};
} // namespace rustique
