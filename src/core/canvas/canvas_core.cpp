#include "core/canvas/canvas_internal.h"

#include <string>
#include <utility>

namespace rustique
{
LayeredCanvas::LayeredCanvas(int width, int height)
    : m_width(ClampCanvasDimension(width))
    , m_height(ClampCanvasDimension(height))
{
    m_layers.push_back(MakeEmptyLayer(kDefaultLayerName));
    m_active_layer = 0;
}

PixelLayer LayeredCanvas::MakeEmptyLayer(const std::string& name) const
{
    PixelLayer layer;
    layer.name = name;
    layer.visible = true;
    layer.cells.assign((size_t)m_width * (size_t)m_height, std::nullopt);
    return layer;
}

Cell LayeredCanvas::Get(int x, int y) const
{
    if (!InBounds(x, y))
        return std::nullopt;
    const size_t idx = CellIndex(x, y);
    for (int i = (int)m_layers.size() - 1; i >= 0; --i)
    {
        const PixelLayer& layer = m_layers[(size_t)i];
        if (!layer.visible)
            continue;
        if (layer.cells[idx].has_value())
            return layer.cells[idx];
    }
    return std::nullopt;
}

Cell LayeredCanvas::GetActive(int x, int y) const
{
    return GetLayerCell(m_active_layer, x, y);
}

bool LayeredCanvas::SetActive(int x, int y, const Cell& c)
{
    return SetLayerCell(m_active_layer, x, y, c);
}

Cell LayeredCanvas::GetLayerCell(int layer_index, int x, int y) const
{
    if (!ValidLayer(layer_index) || !InBounds(x, y))
        return std::nullopt;
    return m_layers[(size_t)layer_index].cells[CellIndex(x, y)];
}

bool LayeredCanvas::SetLayerCell(int layer_index, int x, int y, const Cell& c)
{
    if (!ValidLayer(layer_index) || !InBounds(x, y))
        return false;
    Cell& dst = m_layers[(size_t)layer_index].cells[CellIndex(x, y)];
    if (dst == c)
        return true;
    dst = c;
    TouchContent();
    return true;
}

bool LayeredCanvas::TakeDirty()
{
    const bool was = m_dirty;
    m_dirty = false;
    return was;
}

void LayeredCanvas::TouchContent()
{
    ++m_content_revision;
    m_dirty = true;
}
} // namespace rustique
