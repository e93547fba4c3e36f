// Layered raster canvas for the rustique editing core.
//
// The canvas is a fixed-size grid of optionally-painted RGBA cells, organised as an
// ordered stack of layers. Index 0 is the bottom layer; the last layer is drawn on top.
// Compositing picks the first visible, painted cell scanning from the top down.

#pragma once

#include "core/colour.h"

#include <cstdint>
#include <string>
#include <vector>

namespace rustique
{
// A single named raster plane. Owned exclusively by LayeredCanvas.
struct PixelLayer
{
    std::string       name;
    bool              visible = true;
    std::vector<Cell> cells; // size == width * height, row-major
};

enum class LayerDirection : int
{
    Down = -1, // toward the back (index - 1)
    Up = 1,    // toward the front (index + 1)
};

class LayeredCanvas
{
public:
    static constexpr const char* kDefaultLayerName = "Background";

    // Creates a canvas with a single empty "Background" layer.
    // Non-positive dimensions are clamped to 1.
    explicit LayeredCanvas(int width = 1, int height = 1);

    int  GetWidth() const { return m_width; }
    int  GetHeight() const { return m_height; }
    bool InBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_width && y < m_height; }

    // ---------------------------------------------------------------------
    // Cell access
    // ---------------------------------------------------------------------
    // All accessors treat out-of-range coordinates/layers as "nothing here" and
    // all mutators ignore them (returning false). Interactive tools routinely
    // produce such input, so it is never an error.

    // Composited colour: first visible painted cell, top to bottom.
    Cell Get(int x, int y) const;
    Cell GetActive(int x, int y) const;
    bool SetActive(int x, int y, const Cell& c);

    Cell GetLayerCell(int layer_index, int x, int y) const;
    bool SetLayerCell(int layer_index, int x, int y, const Cell& c);

    // ---------------------------------------------------------------------
    // Layers
    // ---------------------------------------------------------------------
    int         GetLayerCount() const { return (int)m_layers.size(); }
    int         GetActiveLayerIndex() const { return m_active_layer; }
    std::string GetLayerName(int index) const;
    bool        IsLayerVisible(int index) const;
    bool        IsActiveLayerVisible() const { return IsLayerVisible(m_active_layer); }

    // Appends a new empty layer on top and makes it active.
    // An empty name becomes "Layer N". Returns the new layer's index.
    int  AddLayer(const std::string& name);
    // Fails if attempting to remove the last remaining layer.
    bool RemoveLayer(int index);
    bool SetActiveLayerIndex(int index);
    bool SetLayerVisible(int index, bool visible);
    bool ToggleLayerVisibility(int index);
    bool RenameLayer(int index, const std::string& name);

    // Swaps the layer with its neighbour in `direction`. If the active layer was
    // one of the two swapped slots, the active index follows it.
    bool MoveLayer(int index, LayerDirection direction);
    bool MoveLayerUp(int index) { return MoveLayer(index, LayerDirection::Up); }
    bool MoveLayerDown(int index) { return MoveLayer(index, LayerDirection::Down); }

    const std::vector<PixelLayer>& GetLayers() const { return m_layers; }

    // Replaces the whole layer stack (used by document load/import).
    // Validates dimensions, cell counts and the active index; on failure the
    // canvas is left untouched and `err` is set.
    bool SetLayers(int width, int height, std::vector<PixelLayer> layers, int active_layer, std::string& err);

    // ---------------------------------------------------------------------
    // Renderer readout
    // ---------------------------------------------------------------------
    // Row-major RGBA8, 4 bytes per pixel. Unpainted pixels are written as (0,0,0,0).
    void RenderToRgba(std::vector<std::uint8_t>& out) const;
    // Same, but unpainted pixels are resolved to a grey checkerboard placeholder
    // with square cells of `cell_px` pixels.
    void RenderToRgbaCheckerboard(std::vector<std::uint8_t>& out, int cell_px = 8) const;

    // ---------------------------------------------------------------------
    // Content revision / dirty flag
    // ---------------------------------------------------------------------
    // Revision is bumped on every visible change. The dirty flag is set by any
    // mutation and consumed once by the renderer via TakeDirty().
    std::uint64_t GetContentRevision() const { return m_content_revision; }
    bool          IsDirty() const { return m_dirty; }
    bool          TakeDirty();
    void          TouchContent();

private:
    size_t CellIndex(int x, int y) const { return (size_t)y * (size_t)m_width + (size_t)x; }
    bool   ValidLayer(int index) const { return index >= 0 && index < (int)m_layers.size(); }
    PixelLayer MakeEmptyLayer(const std::string& name) const;

    int m_width = 1;
    int m_height = 1;
    std::vector<PixelLayer> m_layers;
    int m_active_layer = 0;

    std::uint64_t m_content_revision = 1;
    bool          m_dirty = true;
};
} // namespace rustique
