// Editing session: one canvas, its undo history and the tool state driving it.
//
// The UI layer forwards pointer events here; every pixel write goes through
// RecordChange() so it lands in the History stroke buffer. Strokes are bracketed
// by BeginStroke()/EndStroke(); bucket fills and line commits are self-contained.

#pragma once

#include "core/brush/footprint.h"
#include "core/canvas.h"
#include "core/document.h"
#include "core/history.h"
#include "core/paint_target.h"
#include "core/tool_state.h"

#include <cstddef>
#include <optional>
#include <string>

namespace rustique
{
class Editor final : public IPaintTarget
{
public:
    static constexpr int kDefaultWidth = 800;
    static constexpr int kDefaultHeight = 600;

    explicit Editor(int width = kDefaultWidth, int height = kDefaultHeight);

    // IPaintTarget
    int  GetWidth() const override { return m_canvas.GetWidth(); }
    int  GetHeight() const override { return m_canvas.GetHeight(); }
    Cell GetTargetCell(int x, int y) const override { return m_canvas.GetActive(x, y); }
    void RecordChange(int x, int y, const Cell& colour) override;

    LayeredCanvas&       GetCanvas() { return m_canvas; }
    const LayeredCanvas& GetCanvas() const { return m_canvas; }
    History&             GetHistory() { return m_history; }
    const History&       GetHistory() const { return m_history; }
    ToolState&           GetToolState() { return m_tools; }
    const ToolState&     GetToolState() const { return m_tools; }

    // ---------------------------------------------------------------------
    // Freehand strokes (brush / eraser)
    // ---------------------------------------------------------------------
    // Draw calls are ignored while the active layer is hidden.
    void BeginStroke();
    bool DrawPoint(int x, int y, bool use_secondary = false);
    bool DrawLine(int x0, int y0, int x1, int y1, bool use_secondary = false);
    // Commits the buffered writes as one undo step.
    bool EndStroke();
    // Reverts the buffered writes (cancel key).
    bool CancelStroke();
    bool IsStrokeOpen() const { return m_stroke_open; }

    // ---------------------------------------------------------------------
    // One-shot tools
    // ---------------------------------------------------------------------
    bool PaintBucket(int x, int y, bool use_secondary = false);
    // Copies the composited colour at (x, y) into primary/secondary. Empty pixels are ignored.
    bool PickColour(int x, int y, bool use_secondary = false);

    // Line tool: first click stores the start, second click draws and commits.
    void BeginLine(int x, int y);
    bool CommitLine(int x, int y, bool use_secondary = false);
    void CancelLine() { m_line_start.reset(); }
    bool HasPendingLine() const { return m_line_start.has_value(); }
    std::optional<brush::Point> GetLineStart() const { return m_line_start; }

    bool Undo();
    bool Redo();
    void SetUndoLimit(size_t limit) { m_history.SetLimit(limit); }

    // ---------------------------------------------------------------------
    // Layers (forwarded to the canvas; successful edits mark the document unsaved)
    // ---------------------------------------------------------------------
    int  AddLayer(const std::string& name);
    bool RemoveLayer(int index);
    bool SetActiveLayer(int index) { return m_canvas.SetActiveLayerIndex(index); }
    bool ToggleLayerVisibility(int index);
    bool RenameLayer(int index, const std::string& name);
    bool MoveLayerUp(int index) { return MoveLayer(index, LayerDirection::Up); }
    bool MoveLayerDown(int index) { return MoveLayer(index, LayerDirection::Down); }
    bool MoveLayer(int index, LayerDirection direction);

    // ---------------------------------------------------------------------
    // Saved colours
    // ---------------------------------------------------------------------
    bool AddSavedColour(const Rgba8& c) { return m_tools.saved.Add(c); }
    bool RemoveSavedColour(size_t index) { return m_tools.saved.Remove(index); }
    bool UseSavedAsPrimary(size_t index);
    bool UseSavedAsSecondary(size_t index);

    // ---------------------------------------------------------------------
    // Document state
    // ---------------------------------------------------------------------
    Document ToDocument() const;
    // Replaces canvas and tool state, clears history and the unsaved flag.
    // On failure nothing changes.
    bool LoadDocument(Document doc, std::string& err);

    bool               HasUnsavedChanges() const { return m_unsaved; }
    void               MarkUnsaved() { m_unsaved = true; }
    void               MarkSaved(const std::string& path);
    const std::string& GetLastSavePath() const { return m_last_save_path; }

private:
    Cell StrokeColour(bool use_secondary) const;

    LayeredCanvas m_canvas;
    History       m_history;
    ToolState     m_tools;

    bool                        m_stroke_open = false;
    std::optional<brush::Point> m_line_start;

    bool        m_unsaved = false;
    std::string m_last_save_path;
};
} // namespace rustique
