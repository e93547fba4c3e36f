// Tool selection, colours and brush parameters owned by one editing session.
#pragma once

#include "core/brush_style.h"
#include "core/colour.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace rustique
{
enum class Tool : std::uint8_t
{
    AdvancedBrush = 0,
    Eraser,
    PaintBucket,
    ColourPicker,
    Line,
};

inline constexpr const char* ToolToString(Tool t)
{
    switch (t)
    {
        case Tool::AdvancedBrush: return "brush";
        case Tool::Eraser:        return "eraser";
        case Tool::PaintBucket:   return "bucket";
        case Tool::ColourPicker:  return "picker";
        case Tool::Line:          return "line";
    }
    return "brush";
}

inline bool ToolFromString(std::string_view s, Tool& out)
{
    if (s == "brush") { out = Tool::AdvancedBrush; return true; }
    if (s == "eraser") { out = Tool::Eraser; return true; }
    if (s == "bucket") { out = Tool::PaintBucket; return true; }
    if (s == "picker") { out = Tool::ColourPicker; return true; }
    if (s == "line") { out = Tool::Line; return true; }
    return false;
}

// Bounded list of user-saved swatches. Oldest entries are evicted first and exact
// duplicates are rejected.
class SavedPalette
{
public:
    static constexpr size_t kDefaultCapacity = 16;

    explicit SavedPalette(size_t capacity = kDefaultCapacity)
        : m_capacity(std::max<size_t>(capacity, 1))
    {
    }

    // Returns false if `c` is already saved.
    bool Add(const Rgba8& c)
    {
        if (Contains(c))
            return false;
        if (m_colours.size() >= m_capacity)
            m_colours.erase(m_colours.begin());
        m_colours.push_back(c);
        return true;
    }

    bool Remove(size_t index)
    {
        if (index >= m_colours.size())
            return false;
        m_colours.erase(m_colours.begin() + (std::ptrdiff_t)index);
        return true;
    }

    bool Contains(const Rgba8& c) const
    {
        return std::find(m_colours.begin(), m_colours.end(), c) != m_colours.end();
    }

    // Replaces the contents (document load). Keeps the newest `capacity` unique entries.
    void Assign(const std::vector<Rgba8>& colours)
    {
        m_colours.clear();
        for (const Rgba8& c : colours)
            Add(c);
    }

    void SetCapacity(size_t capacity)
    {
        m_capacity = std::max<size_t>(capacity, 1);
        if (m_colours.size() > m_capacity)
            m_colours.erase(m_colours.begin(), m_colours.begin() + (std::ptrdiff_t)(m_colours.size() - m_capacity));
    }

    size_t                    GetCapacity() const { return m_capacity; }
    size_t                    Size() const { return m_colours.size(); }
    bool                      Empty() const { return m_colours.empty(); }
    const Rgba8&              operator[](size_t i) const { return m_colours[i]; }
    const std::vector<Rgba8>& GetColours() const { return m_colours; }

private:
    size_t             m_capacity = kDefaultCapacity;
    std::vector<Rgba8> m_colours;
};

// Plain mutable state read by the editor on every pointer event.
struct ToolState
{
    static constexpr int kDefaultEraserSize = 3;

    Tool         tool = Tool::AdvancedBrush;
    Rgba8        primary = colours::kBlack;
    Rgba8        secondary = colours::kWhite;
    BrushStyle   brush;
    int          eraser_size = kDefaultEraserSize;
    SavedPalette saved;
};
} // namespace rustique
