#include "core/history.h"

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Undo / Redo
// ---------------------------------------------------------------------------

namespace rustique
{
History::History(size_t limit)
    : m_limit(limit)
{
}

bool History::Record(LayeredCanvas& canvas, int x, int y, const Cell& colour)
{
    if (!canvas.InBounds(x, y))
        return false;

    const int layer = canvas.GetActiveLayerIndex();
    const Cell old_colour = canvas.GetLayerCell(layer, x, y);
    if (old_colour == colour)
        return false;

    CanvasChange ch;
    ch.x = x;
    ch.y = y;
    ch.layer_index = layer;
    ch.old_colour = old_colour;
    ch.new_colour = colour;
    m_current.push_back(std::move(ch));

    canvas.SetLayerCell(layer, x, y, colour);
    return true;
}

bool History::CommitStroke()
{
    if (m_current.empty())
        return false;

    m_undo_stack.push_back(std::move(m_current));
    m_current.clear();
    TrimToLimit(m_undo_stack);
    m_redo_stack.clear();
    return true;
}

bool History::AbandonStroke(LayeredCanvas& canvas)
{
    if (m_current.empty())
        return false;

    for (auto it = m_current.rbegin(); it != m_current.rend(); ++it)
        canvas.SetLayerCell(it->layer_index, it->x, it->y, it->old_colour);
    m_current.clear();
    canvas.TouchContent();
    return true;
}

bool History::Undo(LayeredCanvas& canvas)
{
    if (m_undo_stack.empty())
        return false;

    Stroke prev = std::move(m_undo_stack.back());
    m_undo_stack.pop_back();

    // Replay in reverse so a cell touched several times within the stroke ends up
    // at its pre-stroke value. Writes go to each change's own layer, not to the
    // currently active one.
    Stroke mirror;
    mirror.reserve(prev.size());
    for (auto it = prev.rbegin(); it != prev.rend(); ++it)
    {
        CanvasChange m;
        m.x = it->x;
        m.y = it->y;
        m.layer_index = it->layer_index;
        m.old_colour = it->old_colour;
        m.new_colour = canvas.GetLayerCell(it->layer_index, it->x, it->y);
        mirror.push_back(std::move(m));

        canvas.SetLayerCell(it->layer_index, it->x, it->y, it->old_colour);
    }
    // Store the redo step in original application order.
    std::reverse(mirror.begin(), mirror.end());

    m_redo_stack.push_back(std::move(mirror));
    TrimToLimit(m_redo_stack);
    canvas.TouchContent();
    return true;
}

bool History::Redo(LayeredCanvas& canvas)
{
    if (m_redo_stack.empty())
        return false;

    Stroke next = std::move(m_redo_stack.back());
    m_redo_stack.pop_back();

    Stroke inverse;
    inverse.reserve(next.size());
    for (const CanvasChange& ch : next)
    {
        CanvasChange inv;
        inv.x = ch.x;
        inv.y = ch.y;
        inv.layer_index = ch.layer_index;
        inv.old_colour = canvas.GetLayerCell(ch.layer_index, ch.x, ch.y);
        inv.new_colour = ch.new_colour;
        inverse.push_back(std::move(inv));

        canvas.SetLayerCell(ch.layer_index, ch.x, ch.y, ch.new_colour);
    }

    m_undo_stack.push_back(std::move(inverse));
    TrimToLimit(m_undo_stack);
    canvas.TouchContent();
    return true;
}

void History::SetLimit(size_t limit)
{
    m_limit = limit;
    TrimToLimit(m_undo_stack);
    TrimToLimit(m_redo_stack);
}

void History::Clear()
{
    m_current.clear();
    m_undo_stack.clear();
    m_redo_stack.clear();
}

template <typename Fn>
void History::ForEachStroke(Fn&& fn)
{
    fn(m_current);
    for (Stroke& s : m_undo_stack)
        fn(s);
    for (Stroke& s : m_redo_stack)
        fn(s);
}

void History::OnLayersSwapped(int a, int b)
{
    if (a == b)
        return;
    ForEachStroke([&](Stroke& stroke) {
        for (CanvasChange& ch : stroke)
        {
            if (ch.layer_index == a)
                ch.layer_index = b;
            else if (ch.layer_index == b)
                ch.layer_index = a;
        }
    });
}

void History::OnLayerRemoved(int index)
{
    ForEachStroke([&](Stroke& stroke) {
        stroke.erase(std::remove_if(stroke.begin(), stroke.end(),
                                    [&](const CanvasChange& ch) { return ch.layer_index == index; }),
                     stroke.end());
        for (CanvasChange& ch : stroke)
        {
            if (ch.layer_index > index)
                --ch.layer_index;
        }
    });

    auto is_empty = [](const Stroke& s) { return s.empty(); };
    m_undo_stack.erase(std::remove_if(m_undo_stack.begin(), m_undo_stack.end(), is_empty), m_undo_stack.end());
    m_redo_stack.erase(std::remove_if(m_redo_stack.begin(), m_redo_stack.end(), is_empty), m_redo_stack.end());
}

void History::TrimToLimit(std::vector<Stroke>& stack) const
{
    if (m_limit > 0 && stack.size() > m_limit)
        stack.erase(stack.begin(), stack.begin() + (std::ptrdiff_t)(stack.size() - m_limit));
}
} // namespace rustique
