// Straight-alpha RGBA8 colour used by every canvas cell.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rustique
{
struct Rgba8
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    bool operator==(const Rgba8&) const = default;
};

// A canvas cell. std::nullopt means "nothing painted here" (lower layers show through),
// which is distinct from a painted pixel whose alpha happens to be 0.
using Cell = std::optional<Rgba8>;

namespace colours
{
inline constexpr Rgba8 kBlack{0, 0, 0, 255};
inline constexpr Rgba8 kWhite{255, 255, 255, 255};
inline constexpr Rgba8 kTransparent{0, 0, 0, 0};
} // namespace colours

inline Rgba8 WithAlpha(const Rgba8& c, std::uint8_t a)
{
    return Rgba8{c.r, c.g, c.b, a};
}

// Accepts RRGGBB or RRGGBBAA with an optional leading '#'. RRGGBB is opaque.
inline bool ParseHexRgba(std::string_view s, Rgba8& out)
{
    if (!s.empty() && s[0] == '#')
        s.remove_prefix(1);
    if (s.size() != 6 && s.size() != 8)
        return false;

    auto nyb = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    };
    auto byte_at = [&](size_t i) -> int {
        const int hi = nyb(s[i + 0]);
        const int lo = nyb(s[i + 1]);
        if (hi < 0 || lo < 0)
            return -1;
        return (hi << 4) | lo;
    };

    const int r = byte_at(0);
    const int g = byte_at(2);
    const int b = byte_at(4);
    const int a = (s.size() == 8) ? byte_at(6) : 255;
    if (r < 0 || g < 0 || b < 0 || a < 0)
        return false;

    out = Rgba8{(std::uint8_t)r, (std::uint8_t)g, (std::uint8_t)b, (std::uint8_t)a};
    return true;
}

inline std::string ToHexRgba(const Rgba8& c)
{
    static const char* k = "0123456789abcdef";
    std::string s;
    s.reserve(8);
    for (std::uint8_t v : {c.r, c.g, c.b, c.a})
    {
        s.push_back(k[(v >> 4) & 0xFu]);
        s.push_back(k[v & 0xFu]);
    }
    return s;
}
} // namespace rustique
