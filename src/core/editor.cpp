#include "core/editor.h"

#include "core/brush/brush_engine.h"
#include "core/fill/flood_fill.h"

#include <utility>

namespace rustique
{
Editor::Editor(int width, int height)
    : m_canvas(width, height)
{
}

void Editor::RecordChange(int x, int y, const Cell& colour)
{
    if (m_history.Record(m_canvas, x, y, colour))
        m_unsaved = true;
}

Cell Editor::StrokeColour(bool use_secondary) const
{
    return use_secondary ? m_tools.secondary : m_tools.primary;
}

// ---------------------------------------------------------------------------
// Freehand strokes
// ---------------------------------------------------------------------------

void Editor::BeginStroke()
{
    m_stroke_open = true;
}

bool Editor::DrawPoint(int x, int y, bool use_secondary)
{
    if (!m_canvas.IsActiveLayerVisible())
        return false;

    m_stroke_open = true;
    const size_t before = m_history.GetPendingStroke().size();
    brush::BrushEngine engine(*this);
    if (m_tools.tool == Tool::Eraser)
        engine.ErasePoint(m_tools.eraser_size, brush::Point{x, y});
    else
        engine.DrawPoint(m_tools.brush, brush::Point{x, y}, StrokeColour(use_secondary));
    return m_history.GetPendingStroke().size() != before;
}

bool Editor::DrawLine(int x0, int y0, int x1, int y1, bool use_secondary)
{
    if (!m_canvas.IsActiveLayerVisible())
        return false;

    m_stroke_open = true;
    const size_t before = m_history.GetPendingStroke().size();
    brush::BrushEngine engine(*this);
    const brush::Point a{x0, y0};
    const brush::Point b{x1, y1};
    if (m_tools.tool == Tool::Eraser)
        engine.EraseLine(m_tools.eraser_size, a, b);
    else
        engine.DrawLine(m_tools.brush, a, b, StrokeColour(use_secondary), m_tools.tool == Tool::AdvancedBrush);
    return m_history.GetPendingStroke().size() != before;
}

bool Editor::EndStroke()
{
    m_stroke_open = false;
    return m_history.CommitStroke();
}

bool Editor::CancelStroke()
{
    m_stroke_open = false;
    return m_history.AbandonStroke(m_canvas);
}

// ---------------------------------------------------------------------------
// One-shot tools
// ---------------------------------------------------------------------------

bool Editor::PaintBucket(int x, int y, bool use_secondary)
{
    if (!m_canvas.IsActiveLayerVisible())
        return false;
    if (m_stroke_open)
        EndStroke();

    const bool wrote = ::rustique::PaintBucket(*this, x, y, StrokeColour(use_secondary));
    m_history.CommitStroke();
    return wrote;
}

bool Editor::PickColour(int x, int y, bool use_secondary)
{
    const Cell c = m_canvas.Get(x, y);
    if (!c)
        return false;
    if (use_secondary)
        m_tools.secondary = *c;
    else
        m_tools.primary = *c;
    return true;
}

void Editor::BeginLine(int x, int y)
{
    m_line_start = brush::Point{x, y};
}

bool Editor::CommitLine(int x, int y, bool use_secondary)
{
    if (!m_line_start)
        return false;
    const brush::Point start = *m_line_start;
    m_line_start.reset();

    if (!m_canvas.IsActiveLayerVisible())
        return false;
    if (m_stroke_open)
        EndStroke();

    brush::BrushEngine engine(*this);
    engine.DrawLine(m_tools.brush, start, brush::Point{x, y}, StrokeColour(use_secondary), false);
    return m_history.CommitStroke();
}

bool Editor::Undo()
{
    if (m_stroke_open)
        EndStroke();
    if (!m_history.Undo(m_canvas))
        return false;
    m_unsaved = true;
    return true;
}

bool Editor::Redo()
{
    if (m_stroke_open)
        EndStroke();
    if (!m_history.Redo(m_canvas))
        return false;
    m_unsaved = true;
    return true;
}

// ---------------------------------------------------------------------------
// Layers
// ---------------------------------------------------------------------------

int Editor::AddLayer(const std::string& name)
{
    const int index = m_canvas.AddLayer(name);
    m_unsaved = true;
    return index;
}

bool Editor::RemoveLayer(int index)
{
    if (!m_canvas.RemoveLayer(index))
        return false;
    m_history.OnLayerRemoved(index);
    m_unsaved = true;
    return true;
}

bool Editor::ToggleLayerVisibility(int index)
{
    if (!m_canvas.ToggleLayerVisibility(index))
        return false;
    m_unsaved = true;
    return true;
}

bool Editor::RenameLayer(int index, const std::string& name)
{
    if (!m_canvas.RenameLayer(index, name))
        return false;
    m_unsaved = true;
    return true;
}

bool Editor::MoveLayer(int index, LayerDirection direction)
{
    if (!m_canvas.MoveLayer(index, direction))
        return false;
    m_history.OnLayersSwapped(index, index + (int)direction);
    m_unsaved = true;
    return true;
}

// ---------------------------------------------------------------------------
// Saved colours
// ---------------------------------------------------------------------------

bool Editor::UseSavedAsPrimary(size_t index)
{
    if (index >= m_tools.saved.Size())
        return false;
    m_tools.primary = m_tools.saved[index];
    return true;
}

bool Editor::UseSavedAsSecondary(size_t index)
{
    if (index >= m_tools.saved.Size())
        return false;
    m_tools.secondary = m_tools.saved[index];
    return true;
}

// ---------------------------------------------------------------------------
// Document state
// ---------------------------------------------------------------------------

Document Editor::ToDocument() const
{
    Document doc;
    doc.width = m_canvas.GetWidth();
    doc.height = m_canvas.GetHeight();
    doc.layers = m_canvas.GetLayers();
    doc.active_layer_index = m_canvas.GetActiveLayerIndex();
    doc.primary = m_tools.primary;
    doc.secondary = m_tools.secondary;
    doc.saved_colours = m_tools.saved.GetColours();
    doc.brush = m_tools.brush;
    doc.eraser_size = m_tools.eraser_size;
    return doc;
}

bool Editor::LoadDocument(Document doc, std::string& err)
{
    if (!m_canvas.SetLayers(doc.width, doc.height, std::move(doc.layers), doc.active_layer_index, err))
        return false;

    m_tools.primary = doc.primary;
    m_tools.secondary = doc.secondary;
    m_tools.saved.Assign(doc.saved_colours);
    m_tools.brush = doc.brush;
    m_tools.eraser_size = doc.eraser_size;

    m_history.Clear();
    m_stroke_open = false;
    m_line_start.reset();
    m_unsaved = false;
    return true;
}

void Editor::MarkSaved(const std::string& path)
{
    m_unsaved = false;
    m_last_save_path = path;
}
} // namespace rustique
