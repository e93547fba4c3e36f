#pragma once

#include "core/colour.h"
#include "core/paint_target.h"

namespace rustique
{
// Contiguous-region fill on the active layer of an IPaintTarget.
//
// The region is every cell 4-connected to the seed whose active-layer colour equals
// the seed's colour exactly (nullopt matches nullopt). Cells are replaced with
// `fill`. Returns false when nothing was written: seed outside the target, or the
// seed already holds `fill`.
bool PaintBucket(IPaintTarget& target, int seed_x, int seed_y, const Cell& fill);
} // namespace rustique
