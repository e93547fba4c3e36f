#pragma once

#include "core/colour.h"

namespace rustique
{
// Sink for per-pixel writes produced by the brush and fill engines.
//
// The editor implements this by routing every write through its History so each
// change is logged for undo; tests may implement it directly over a canvas.
class IPaintTarget
{
public:
    virtual ~IPaintTarget() = default;

    virtual int GetWidth() const = 0;
    virtual int GetHeight() const = 0;

    // Current colour of the target (active) layer.
    virtual Cell GetTargetCell(int x, int y) const = 0;
    // Writes `colour` at (x, y). Out-of-range coordinates and no-op writes are ignored.
    virtual void RecordChange(int x, int y, const Cell& colour) = 0;
};
} // namespace rustique
