#include "core/canvas/canvas_internal.h"

#include <string>
#include <utility>
#include <vector>

namespace rustique
{
std::string LayeredCanvas::GetLayerName(int index) const
{
    if (!ValidLayer(index))
        return {};
    return m_layers[(size_t)index].name;
}

bool LayeredCanvas::IsLayerVisible(int index) const
{
    if (!ValidLayer(index))
        return false;
    return m_layers[(size_t)index].visible;
}

int LayeredCanvas::AddLayer(const std::string& name)
{
    const std::string n = name.empty() ? ("Layer " + std::to_string((int)m_layers.size() + 1)) : name;
    m_layers.push_back(MakeEmptyLayer(n));
    m_active_layer = (int)m_layers.size() - 1;
    TouchContent();
    return m_active_layer;
}

bool LayeredCanvas::RemoveLayer(int index)
{
    if (m_layers.size() <= 1)
        return false; // must keep at least one layer
    if (!ValidLayer(index))
        return false;

    m_layers.erase(m_layers.begin() + index);
    if (m_active_layer >= (int)m_layers.size())
        m_active_layer = (int)m_layers.size() - 1;
    if (m_active_layer < 0)
        m_active_layer = 0;
    TouchContent();
    return true;
}

bool LayeredCanvas::SetActiveLayerIndex(int index)
{
    if (!ValidLayer(index))
        return false;
    m_active_layer = index;
    return true;
}

bool LayeredCanvas::SetLayerVisible(int index, bool visible)
{
    if (!ValidLayer(index))
        return false;
    if (m_layers[(size_t)index].visible == visible)
        return true;
    m_layers[(size_t)index].visible = visible;
    TouchContent();
    return true;
}

bool LayeredCanvas::ToggleLayerVisibility(int index)
{
    if (!ValidLayer(index))
        return false;
    return SetLayerVisible(index, !m_layers[(size_t)index].visible);
}

bool LayeredCanvas::RenameLayer(int index, const std::string& name)
{
    if (!ValidLayer(index))
        return false;
    m_layers[(size_t)index].name = name;
    return true;
}

bool LayeredCanvas::MoveLayer(int index, LayerDirection direction)
{
    const int other = index + (int)direction;
    if (!ValidLayer(index) || !ValidLayer(other))
        return false;

    std::swap(m_layers[(size_t)index], m_layers[(size_t)other]);

    // Keep the active index pointing at the same logical layer.
    if (m_active_layer == index)
        m_active_layer = other;
    else if (m_active_layer == other)
        m_active_layer = index;

    TouchContent();
    return true;
}

bool LayeredCanvas::SetLayers(int width, int height, std::vector<PixelLayer> layers, int active_layer, std::string& err)
{
    err.clear();
    if (width <= 0 || height <= 0 || width > kMaxCanvasDimension || height > kMaxCanvasDimension)
    {
        err = "Canvas dimensions are out of range.";
        return false;
    }
    if (layers.empty())
    {
        err = "Document has no layers.";
        return false;
    }
    const size_t expected = (size_t)width * (size_t)height;
    for (size_t i = 0; i < layers.size(); ++i)
    {
        if (layers[i].cells.size() != expected)
        {
            err = "Layer " + std::to_string(i) + " has " + std::to_string(layers[i].cells.size()) +
                  " cells, expected " + std::to_string(expected) + ".";
            return false;
        }
    }
    if (active_layer < 0 || active_layer >= (int)layers.size())
    {
        err = "Active layer index is out of range.";
        return false;
    }

    m_width = width;
    m_height = height;
    m_layers = std::move(layers);
    m_active_layer = active_layer;
    TouchContent();
    return true;
}
} // namespace rustique
