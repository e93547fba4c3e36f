// Change-log based undo/redo for LayeredCanvas.
//
// Every pixel write made by a tool goes through History::Record(), which stores a
// (x, y, layer, old, new) delta in the in-progress stroke and then mutates the canvas.
// CommitStroke() turns the buffered deltas into one atomic undo step.

#pragma once

#include "core/canvas.h"
#include "core/colour.h"

#include <cstddef>
#include <vector>

namespace rustique
{
// A single-cell delta. Only recorded when old_colour != new_colour.
struct CanvasChange
{
    int  x = 0;
    int  y = 0;
    int  layer_index = 0;
    Cell old_colour;
    Cell new_colour;
};

// One undo-atomic sequence of deltas, in application order.
using Stroke = std::vector<CanvasChange>;

class History
{
public:
    static constexpr size_t kDefaultLimit = 20;

    // limit: maximum number of undo steps kept (0 = unlimited).
    explicit History(size_t limit = kDefaultLimit);

    // Writes `colour` into the canvas's active layer at (x, y), logging the delta.
    // Returns false (and logs nothing) if the coordinate is outside the canvas or
    // the cell already holds `colour`.
    bool Record(LayeredCanvas& canvas, int x, int y, const Cell& colour);

    // Closes the in-progress stroke. Returns false if it was empty (no undo step is created).
    bool CommitStroke();
    // Reverts every uncommitted delta and discards the buffer, as if the stroke was
    // committed and immediately undone (without touching the redo stack).
    bool AbandonStroke(LayeredCanvas& canvas);

    bool CanUndo() const { return !m_undo_stack.empty(); }
    bool CanRedo() const { return !m_redo_stack.empty(); }
    bool Undo(LayeredCanvas& canvas);
    bool Redo(LayeredCanvas& canvas);

    bool          HasPendingChanges() const { return !m_current.empty(); }
    const Stroke& GetPendingStroke() const { return m_current; }
    size_t        GetUndoDepth() const { return m_undo_stack.size(); }
    size_t        GetRedoDepth() const { return m_redo_stack.size(); }

    // Changing the limit trims existing undo/redo stacks (oldest first).
    size_t GetLimit() const { return m_limit; }
    void   SetLimit(size_t limit);

    // Drops all history (e.g. after loading a new document).
    void Clear();

    // Keep recorded layer indices pointing at the same layers after the canvas
    // layer stack changes shape. A removed layer's changes are dropped, together
    // with any stroke left empty.
    void OnLayersSwapped(int a, int b);
    void OnLayerRemoved(int index);

private:
    void TrimToLimit(std::vector<Stroke>& stack) const;
    template <typename Fn>
    void ForEachStroke(Fn&& fn);

    size_t              m_limit = kDefaultLimit;
    Stroke              m_current;
    std::vector<Stroke> m_undo_stack;
    std::vector<Stroke> m_redo_stack;
};
} // namespace rustique
