#include "core/canvas.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace rustique;
using namespace rustique::test;

TEST(LayeredCanvas, NewCanvasHasOneEmptyBackgroundLayer)
{
    LayeredCanvas canvas(4, 3);
    EXPECT_EQ(canvas.GetWidth(), 4);
    EXPECT_EQ(canvas.GetHeight(), 3);
    ASSERT_EQ(canvas.GetLayerCount(), 1);
    EXPECT_EQ(canvas.GetLayerName(0), "Background");
    EXPECT_TRUE(canvas.IsLayerVisible(0));
    EXPECT_EQ(canvas.GetActiveLayerIndex(), 0);
    EXPECT_EQ(CountPainted(canvas), 0);
}

TEST(LayeredCanvas, NonPositiveDimensionsClampToOne)
{
    LayeredCanvas canvas(0, -5);
    EXPECT_EQ(canvas.GetWidth(), 1);
    EXPECT_EQ(canvas.GetHeight(), 1);
}

TEST(LayeredCanvas, CompositeIsTopmostVisiblePaintedCell)
{
    LayeredCanvas canvas(2, 1);
    canvas.SetActive(0, 0, kRed);
    canvas.AddLayer("top");
    canvas.SetActive(0, 0, kBlue);

    EXPECT_EQ(canvas.Get(0, 0), Cell(kBlue));
    // Unpainted top cell lets the lower layer through.
    EXPECT_EQ(canvas.Get(1, 0), Cell());
    canvas.SetLayerCell(0, 1, 0, kGreen);
    EXPECT_EQ(canvas.Get(1, 0), Cell(kGreen));

    ASSERT_TRUE(canvas.ToggleLayerVisibility(1));
    EXPECT_EQ(canvas.Get(0, 0), Cell(kRed));

    ASSERT_TRUE(canvas.ToggleLayerVisibility(0));
    EXPECT_EQ(canvas.Get(0, 0), Cell());
}

TEST(LayeredCanvas, AddLayerAppendsOnTopAndBecomesActive)
{
    LayeredCanvas canvas(2, 2);
    EXPECT_EQ(canvas.AddLayer("Ink"), 1);
    EXPECT_EQ(canvas.GetActiveLayerIndex(), 1);
    EXPECT_EQ(canvas.GetLayerName(1), "Ink");

    EXPECT_EQ(canvas.AddLayer(""), 2);
    EXPECT_EQ(canvas.GetLayerName(2), "Layer 3");
}

TEST(LayeredCanvas, RemoveLayerRefusesLastAndClampsActive)
{
    LayeredCanvas canvas(2, 2);
    EXPECT_FALSE(canvas.RemoveLayer(0));

    canvas.AddLayer("a");
    canvas.AddLayer("b");
    ASSERT_EQ(canvas.GetActiveLayerIndex(), 2);
    ASSERT_TRUE(canvas.RemoveLayer(2));
    EXPECT_EQ(canvas.GetLayerCount(), 2);
    EXPECT_EQ(canvas.GetActiveLayerIndex(), 1);
    EXPECT_EQ(canvas.GetLayerName(1), "a");
}

TEST(LayeredCanvas, MoveLayerSwapsAndActiveFollows)
{
    LayeredCanvas canvas(1, 1);
    canvas.AddLayer("ink");
    ASSERT_EQ(canvas.GetActiveLayerIndex(), 1);

    ASSERT_TRUE(canvas.MoveLayerDown(1));
    EXPECT_EQ(canvas.GetLayerName(0), "ink");
    EXPECT_EQ(canvas.GetLayerName(1), "Background");
    EXPECT_EQ(canvas.GetActiveLayerIndex(), 0);

    // The other swapped slot is remapped too.
    canvas.SetActiveLayerIndex(1);
    ASSERT_TRUE(canvas.MoveLayerUp(0));
    EXPECT_EQ(canvas.GetLayerName(1), "ink");
    EXPECT_EQ(canvas.GetActiveLayerIndex(), 0);

    EXPECT_FALSE(canvas.MoveLayerUp(1));
    EXPECT_FALSE(canvas.MoveLayerDown(0));
}

TEST(LayeredCanvas, OutOfRangeInputIsSilentNoOp)
{
    LayeredCanvas canvas(3, 3);
    EXPECT_FALSE(canvas.SetActive(-1, 0, kRed));
    EXPECT_FALSE(canvas.SetActive(3, 0, kRed));
    EXPECT_EQ(canvas.Get(10, 10), Cell());
    EXPECT_FALSE(canvas.RemoveLayer(7));
    EXPECT_FALSE(canvas.SetActiveLayerIndex(-1));
    EXPECT_FALSE(canvas.RenameLayer(4, "x"));
    EXPECT_FALSE(canvas.ToggleLayerVisibility(4));
    EXPECT_EQ(CountPainted(canvas), 0);
}

TEST(LayeredCanvas, RenderToRgbaLeavesUnpaintedTransparent)
{
    LayeredCanvas canvas(2, 1);
    canvas.SetActive(1, 0, Rgba8{10, 20, 30, 40});

    std::vector<std::uint8_t> rgba;
    canvas.RenderToRgba(rgba);
    const std::vector<std::uint8_t> expected = {0, 0, 0, 0, 10, 20, 30, 40};
    EXPECT_EQ(rgba, expected);
}

TEST(LayeredCanvas, CheckerboardFillsUnpaintedPixels)
{
    LayeredCanvas canvas(16, 1);
    canvas.SetActive(15, 0, kRed);

    std::vector<std::uint8_t> rgba;
    canvas.RenderToRgbaCheckerboard(rgba, 8);
    EXPECT_EQ(rgba[0], 200);
    EXPECT_EQ(rgba[7 * 4], 200);
    EXPECT_EQ(rgba[8 * 4], 160);
    EXPECT_EQ(rgba[8 * 4 + 3], 255);
    EXPECT_EQ(rgba[15 * 4], 255);
    EXPECT_EQ(rgba[15 * 4 + 1], 0);
}

TEST(LayeredCanvas, DirtyFlagIsConsumedOnce)
{
    LayeredCanvas canvas(2, 2);
    EXPECT_TRUE(canvas.TakeDirty());
    EXPECT_FALSE(canvas.TakeDirty());

    const auto rev = canvas.GetContentRevision();
    canvas.SetActive(0, 0, kRed);
    EXPECT_GT(canvas.GetContentRevision(), rev);
    EXPECT_TRUE(canvas.TakeDirty());

    // Writing the value already present is not a change.
    canvas.SetActive(0, 0, kRed);
    EXPECT_FALSE(canvas.IsDirty());
}

TEST(LayeredCanvas, SetLayersValidatesShape)
{
    LayeredCanvas canvas(2, 2);
    std::string err;

    std::vector<PixelLayer> bad(1);
    bad[0].name = "short";
    bad[0].cells.resize(3);
    EXPECT_FALSE(canvas.SetLayers(2, 2, bad, 0, err));
    EXPECT_FALSE(err.empty());

    EXPECT_FALSE(canvas.SetLayers(2, 2, {}, 0, err));

    std::vector<PixelLayer> good(2);
    good[0].cells.resize(6);
    good[1].cells.resize(6);
    good[1].cells[5] = kRed;
    EXPECT_FALSE(canvas.SetLayers(3, 2, good, 2, err));
    // Canvas untouched on failure.
    EXPECT_EQ(canvas.GetWidth(), 2);

    ASSERT_TRUE(canvas.SetLayers(3, 2, good, 1, err)) << err;
    EXPECT_EQ(canvas.GetWidth(), 3);
    EXPECT_EQ(canvas.GetLayerCount(), 2);
    EXPECT_EQ(canvas.Get(2, 1), Cell(kRed));
}
