// Persistable snapshot of an editing session: canvas content plus tool state.
#pragma once

#include "core/brush_style.h"
#include "core/canvas.h"
#include "core/colour.h"
#include "core/tool_state.h"

#include <vector>

namespace rustique
{
struct Document
{
    int width = 1;
    int height = 1;
    std::vector<PixelLayer> layers;
    int active_layer_index = 0;

    Rgba8              primary = colours::kBlack;
    Rgba8              secondary = colours::kWhite;
    std::vector<Rgba8> saved_colours;
    BrushStyle         brush;
    int                eraser_size = ToolState::kDefaultEraserSize;
};
} // namespace rustique
