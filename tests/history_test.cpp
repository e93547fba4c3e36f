#include "core/history.h"

#include "test_support.h"

#include <gtest/gtest.h>

using namespace rustique;
using namespace rustique::test;

TEST(History, UndoRestoresPreStrokeValues)
{
    LayeredCanvas canvas(4, 4);
    canvas.SetActive(1, 1, kGreen);
    History history;

    history.Record(canvas, 0, 0, kRed);
    history.Record(canvas, 1, 1, kRed);
    history.Record(canvas, 1, 1, kBlue); // same cell twice in one stroke
    history.Record(canvas, 2, 2, std::nullopt);
    ASSERT_TRUE(history.CommitStroke());

    ASSERT_TRUE(history.Undo(canvas));
    EXPECT_EQ(canvas.GetActive(0, 0), Cell());
    EXPECT_EQ(canvas.GetActive(1, 1), Cell(kGreen));
    EXPECT_EQ(canvas.GetActive(2, 2), Cell());
}

TEST(History, UndoThenRedoRoundTrips)
{
    LayeredCanvas canvas(4, 4);
    History history;

    history.Record(canvas, 0, 0, kRed);
    history.Record(canvas, 0, 0, kBlue);
    history.Record(canvas, 3, 3, kGreen);
    history.CommitStroke();

    ASSERT_TRUE(history.Undo(canvas));
    ASSERT_TRUE(history.Redo(canvas));
    EXPECT_EQ(canvas.GetActive(0, 0), Cell(kBlue));
    EXPECT_EQ(canvas.GetActive(3, 3), Cell(kGreen));

    // And back again.
    ASSERT_TRUE(history.Undo(canvas));
    EXPECT_EQ(canvas.GetActive(0, 0), Cell());
    EXPECT_EQ(canvas.GetActive(3, 3), Cell());
}

TEST(History, NoOpWritesAreElided)
{
    LayeredCanvas canvas(2, 2);
    History history;

    EXPECT_FALSE(history.Record(canvas, 0, 0, std::nullopt));
    EXPECT_FALSE(history.Record(canvas, 5, 5, kRed));
    EXPECT_FALSE(history.HasPendingChanges());
    EXPECT_FALSE(history.CommitStroke());
    EXPECT_FALSE(history.CanUndo());

    EXPECT_TRUE(history.Record(canvas, 0, 0, kRed));
    EXPECT_FALSE(history.Record(canvas, 0, 0, kRed));
    EXPECT_EQ(history.GetPendingStroke().size(), 1u);
}

TEST(History, EmptyStacksAreNoOps)
{
    LayeredCanvas canvas(2, 2);
    History history;
    EXPECT_FALSE(history.Undo(canvas));
    EXPECT_FALSE(history.Redo(canvas));
}

TEST(History, CapacityDropsOldestStroke)
{
    LayeredCanvas canvas(8, 1);
    History history(3);

    for (int i = 0; i < 5; ++i)
    {
        history.Record(canvas, i, 0, kRed);
        history.CommitStroke();
        EXPECT_LE(history.GetUndoDepth(), 3u);
    }
    EXPECT_EQ(history.GetUndoDepth(), 3u);

    while (history.Undo(canvas))
    {
    }
    // The two oldest strokes can no longer be undone; the newest three were.
    EXPECT_EQ(canvas.GetActive(0, 0), Cell(kRed));
    EXPECT_EQ(canvas.GetActive(1, 0), Cell(kRed));
    EXPECT_EQ(canvas.GetActive(2, 0), Cell());
    EXPECT_EQ(canvas.GetActive(3, 0), Cell());
    EXPECT_EQ(canvas.GetActive(4, 0), Cell());
}

TEST(History, DefaultCapacityIsTwenty)
{
    LayeredCanvas canvas(32, 1);
    History history;
    for (int i = 0; i < 25; ++i)
    {
        history.Record(canvas, i, 0, kRed);
        history.CommitStroke();
    }
    EXPECT_EQ(history.GetUndoDepth(), 20u);
}

TEST(History, NewStrokeClearsRedo)
{
    LayeredCanvas canvas(2, 2);
    History history;
    history.Record(canvas, 0, 0, kRed);
    history.CommitStroke();
    history.Undo(canvas);
    ASSERT_TRUE(history.CanRedo());

    history.Record(canvas, 1, 1, kBlue);
    history.CommitStroke();
    EXPECT_FALSE(history.CanRedo());
}

TEST(History, UndoWritesToRecordedLayer)
{
    LayeredCanvas canvas(2, 2);
    History history;
    history.Record(canvas, 0, 0, kRed); // layer 0
    history.CommitStroke();

    canvas.AddLayer("top");
    ASSERT_EQ(canvas.GetActiveLayerIndex(), 1);
    ASSERT_TRUE(history.Undo(canvas));
    EXPECT_EQ(canvas.GetLayerCell(0, 0, 0), Cell());
    EXPECT_EQ(canvas.GetActiveLayerIndex(), 1);

    ASSERT_TRUE(history.Redo(canvas));
    EXPECT_EQ(canvas.GetLayerCell(0, 0, 0), Cell(kRed));
    EXPECT_EQ(canvas.GetLayerCell(1, 0, 0), Cell());
}

TEST(History, UndoAndRedoMarkCanvasDirty)
{
    LayeredCanvas canvas(2, 2);
    History history;
    history.Record(canvas, 0, 0, kRed);
    history.CommitStroke();

    canvas.TakeDirty();
    history.Undo(canvas);
    EXPECT_TRUE(canvas.TakeDirty());
    history.Redo(canvas);
    EXPECT_TRUE(canvas.TakeDirty());
}

TEST(History, AbandonStrokeRevertsPendingWrites)
{
    LayeredCanvas canvas(3, 1);
    canvas.SetActive(2, 0, kGreen);
    History history;
    history.Record(canvas, 0, 0, kRed);
    history.Record(canvas, 2, 0, kRed);
    history.Record(canvas, 2, 0, kBlue);

    ASSERT_TRUE(history.AbandonStroke(canvas));
    EXPECT_EQ(canvas.GetActive(0, 0), Cell());
    EXPECT_EQ(canvas.GetActive(2, 0), Cell(kGreen));
    EXPECT_FALSE(history.HasPendingChanges());
    EXPECT_FALSE(history.CanUndo());
    EXPECT_FALSE(history.AbandonStroke(canvas));
}

TEST(History, SetLimitTrimsExistingStacks)
{
    LayeredCanvas canvas(8, 1);
    History history(0);
    for (int i = 0; i < 6; ++i)
    {
        history.Record(canvas, i, 0, kRed);
        history.CommitStroke();
    }
    EXPECT_EQ(history.GetUndoDepth(), 6u);
    history.SetLimit(2);
    EXPECT_EQ(history.GetLimit(), 2u);
    EXPECT_EQ(history.GetUndoDepth(), 2u);

    history.Undo(canvas);
    history.Undo(canvas);
    EXPECT_EQ(history.GetRedoDepth(), 2u);
    EXPECT_FALSE(history.Undo(canvas));
    EXPECT_EQ(canvas.GetActive(3, 0), Cell(kRed));
    EXPECT_FALSE(canvas.GetActive(4, 0).has_value());
}

TEST(History, LayerSwapKeepsChangesOnTheirLayer)
{
    LayeredCanvas canvas(1, 1);
    canvas.AddLayer("ink");
    History history;
    history.Record(canvas, 0, 0, kRed); // layer 1 ("ink")
    history.CommitStroke();

    canvas.MoveLayerDown(1);
    history.OnLayersSwapped(1, 0);
    ASSERT_EQ(canvas.GetLayerName(0), "ink");

    ASSERT_TRUE(history.Undo(canvas));
    EXPECT_EQ(canvas.GetLayerCell(0, 0, 0), Cell());
    ASSERT_TRUE(history.Redo(canvas));
    EXPECT_EQ(canvas.GetLayerCell(0, 0, 0), Cell(kRed));
    EXPECT_EQ(canvas.GetLayerCell(1, 0, 0), Cell());
}

TEST(History, LayerRemovalDropsItsChanges)
{
    LayeredCanvas canvas(2, 1);
    canvas.AddLayer("a"); // 1
    canvas.AddLayer("b"); // 2
    History history;

    canvas.SetActiveLayerIndex(1);
    history.Record(canvas, 0, 0, kRed);
    history.CommitStroke();
    canvas.SetActiveLayerIndex(2);
    history.Record(canvas, 1, 0, kBlue);
    history.CommitStroke();

    canvas.RemoveLayer(1);
    history.OnLayerRemoved(1);
    EXPECT_EQ(history.GetUndoDepth(), 1u);

    // The surviving stroke now addresses layer 1 ("b").
    ASSERT_TRUE(history.Undo(canvas));
    EXPECT_EQ(canvas.GetLayerCell(1, 1, 0), Cell());
    EXPECT_FALSE(history.Undo(canvas));
}
