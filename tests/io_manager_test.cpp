#include "io/io_manager.h"

#include "io/formats/image.h"
#include "io/image_loader.h"
#include "io/project_file.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace rustique;
using namespace rustique::test;

namespace
{
void PaintSample(Editor& editor)
{
    editor.GetCanvas().SetActive(0, 0, kRed);
    editor.GetCanvas().SetActive(1, 0, kBlue);
    editor.MarkUnsaved();
}
} // namespace

TEST(IoManager, ClassifiesByExtension)
{
    EXPECT_EQ(IoManager::Classify("a.rustiq"), IoManager::FileKind::Project);
    EXPECT_EQ(IoManager::Classify("a.RUSTIQ"), IoManager::FileKind::Project);
    EXPECT_EQ(IoManager::Classify("a.png"), IoManager::FileKind::Raster);
    EXPECT_EQ(IoManager::Classify("a.JPeG"), IoManager::FileKind::Raster);
    EXPECT_EQ(IoManager::Classify("a.tiff"), IoManager::FileKind::Raster);
    EXPECT_EQ(IoManager::Classify("a.xyz"), IoManager::FileKind::Unknown);
    EXPECT_EQ(IoManager::Classify("noext"), IoManager::FileKind::Unknown);
}

TEST(IoManager, UnknownExtensionLeavesEditorUnsaved)
{
    ScratchDir dir;
    Editor editor(4, 4);
    PaintSample(editor);

    IoManager io;
    IoError err;
    const std::string path = dir.File("x.xyz");
    EXPECT_FALSE(io.Save(path, editor, err));
    EXPECT_EQ(err.kind, IoErrorKind::UnknownExtension);
    EXPECT_EQ(err.message, "Unsupported file format: " + path);
    EXPECT_EQ(io.GetLastError(), err.message);
    EXPECT_TRUE(editor.HasUnsavedChanges());
    EXPECT_TRUE(editor.GetLastSavePath().empty());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(IoManager, ProjectSaveThenOpenRestoresDocument)
{
    ScratchDir dir;
    const std::string path = dir.File("drawing.rustiq");

    Editor editor(4, 3);
    PaintSample(editor);
    editor.AddLayer("Ink");
    editor.GetCanvas().SetActive(2, 2, kGreen);
    editor.ToggleLayerVisibility(1);
    editor.GetToolState().brush.shape = BrushShape::Angle;
    editor.AddSavedColour(kGreen);

    IoManager io;
    IoError err;
    ASSERT_TRUE(io.Save(path, editor, err)) << err.message;
    EXPECT_FALSE(editor.HasUnsavedChanges());
    EXPECT_EQ(editor.GetLastSavePath(), path);
    EXPECT_TRUE(io.GetLastError().empty());

    Editor reopened;
    ASSERT_TRUE(io.Open(path, reopened, err)) << err.message;
    EXPECT_EQ(reopened.GetCanvas().GetWidth(), 4);
    EXPECT_EQ(reopened.GetCanvas().GetHeight(), 3);
    ASSERT_EQ(reopened.GetCanvas().GetLayerCount(), 2);
    EXPECT_EQ(reopened.GetCanvas().GetLayerName(1), "Ink");
    EXPECT_FALSE(reopened.GetCanvas().IsLayerVisible(1));
    EXPECT_EQ(reopened.GetCanvas().GetLayerCell(0, 1, 0), Cell(kBlue));
    EXPECT_EQ(reopened.GetCanvas().GetLayerCell(1, 2, 2), Cell(kGreen));
    EXPECT_EQ(reopened.GetToolState().brush.shape, BrushShape::Angle);
    EXPECT_TRUE(reopened.GetToolState().saved.Contains(kGreen));
    EXPECT_FALSE(reopened.HasUnsavedChanges());
    EXPECT_EQ(reopened.GetLastSavePath(), path);
}

TEST(IoManager, QuickSaveNeedsAPath)
{
    Editor editor(2, 2);
    PaintSample(editor);

    IoManager io;
    IoError err;
    EXPECT_FALSE(io.QuickSave(editor, err));
    EXPECT_EQ(err.kind, IoErrorKind::NoSavePath);
    EXPECT_TRUE(editor.HasUnsavedChanges());
}

TEST(IoManager, QuickSaveReusesLastPath)
{
    ScratchDir dir;
    const std::string path = dir.File("quick.rustiq");
    Editor editor(2, 2);
    IoManager io;
    IoError err;
    ASSERT_TRUE(io.Save(path, editor, err));

    PaintSample(editor);
    ASSERT_TRUE(io.QuickSave(editor, err)) << err.message;
    EXPECT_FALSE(editor.HasUnsavedChanges());

    Document doc;
    ASSERT_TRUE(IoManager::ReadDocument(path, doc, err));
    EXPECT_EQ(doc.layers[0].cells[0], Cell(kRed));
}

TEST(IoManager, RecognisedButUnsupportedRasterFormat)
{
    ScratchDir dir;
    Editor editor(2, 2);
    PaintSample(editor);

    IoManager io;
    IoError err;
    EXPECT_FALSE(io.Save(dir.File("x.tiff"), editor, err));
    EXPECT_EQ(err.kind, IoErrorKind::UnsupportedFormat);
    EXPECT_TRUE(editor.HasUnsavedChanges());

    EXPECT_FALSE(io.Open(dir.File("x.webp"), editor, err));
    EXPECT_EQ(err.kind, IoErrorKind::UnsupportedFormat);
}

TEST(IoManager, PngExportFlattensAndImportRestoresPixels)
{
    ScratchDir dir;
    const std::string path = dir.File("flat.png");

    Editor editor(3, 2);
    PaintSample(editor);
    editor.AddLayer("top");
    editor.GetCanvas().SetActive(1, 0, kGreen); // covers the blue below

    IoManager io;
    IoError err;
    ASSERT_TRUE(io.Save(path, editor, err)) << err.message;
    EXPECT_EQ(editor.GetLastSavePath(), path);

    Editor imported;
    ASSERT_TRUE(io.Open(path, imported, err)) << err.message;
    const LayeredCanvas& c = imported.GetCanvas();
    EXPECT_EQ(c.GetWidth(), 3);
    EXPECT_EQ(c.GetHeight(), 2);
    ASSERT_EQ(c.GetLayerCount(), 1);
    EXPECT_EQ(c.GetLayerName(0), "Background");
    EXPECT_EQ(c.Get(0, 0), Cell(kRed));
    EXPECT_EQ(c.Get(1, 0), Cell(kGreen));
    EXPECT_FALSE(c.Get(2, 1).has_value());
    EXPECT_EQ(imported.GetLastSavePath(), path);
}

TEST(IoManager, JpgAndBmpExportWriteFiles)
{
    ScratchDir dir;
    Editor editor(8, 8);
    editor.GetToolState().primary = kBlue;
    editor.PaintBucket(0, 0);

    IoManager io(formats::image::ExportOptions{6, 80});
    IoError err;
    ASSERT_TRUE(io.Save(dir.File("out.jpg"), editor, err)) << err.message;
    ASSERT_TRUE(io.Save(dir.File("out.bmp"), editor, err)) << err.message;
    EXPECT_GT(std::filesystem::file_size(dir.File("out.jpg")), 0u);
    EXPECT_GT(std::filesystem::file_size(dir.File("out.bmp")), 0u);

    Editor imported;
    ASSERT_TRUE(io.Open(dir.File("out.bmp"), imported, err)) << err.message;
    EXPECT_EQ(imported.GetCanvas().Get(4, 4), Cell(kBlue));
}

TEST(IoManager, FailedOpenLeavesEditorUntouched)
{
    ScratchDir dir;
    const std::string path = dir.File("broken.rustiq");
    {
        std::ofstream out(path, std::ios::binary);
        out << "RSQZ";
    }

    Editor editor(5, 5);
    PaintSample(editor);

    IoManager io;
    IoError err;
    EXPECT_FALSE(io.Open(path, editor, err));
    EXPECT_EQ(err.kind, IoErrorKind::Decode);
    EXPECT_FALSE(io.GetLastError().empty());
    EXPECT_EQ(editor.GetCanvas().GetWidth(), 5);
    EXPECT_EQ(editor.GetCanvas().Get(0, 0), Cell(kRed));
    EXPECT_TRUE(editor.HasUnsavedChanges());
    EXPECT_TRUE(editor.GetLastSavePath().empty());

    EXPECT_FALSE(io.Open(dir.File("missing.png"), editor, err));
    EXPECT_EQ(err.kind, IoErrorKind::Io);
    EXPECT_EQ(editor.GetCanvas().GetWidth(), 5);
}

TEST(IoManager, ExportedPngDecodesFromMemory)
{
    ScratchDir dir;
    const std::string path = dir.File("mem.png");
    Editor editor(2, 2);
    editor.GetCanvas().SetActive(1, 1, kGreen);

    IoManager io;
    IoError err;
    ASSERT_TRUE(io.Save(path, editor, err)) << err.message;

    std::vector<std::uint8_t> bytes;
    ASSERT_TRUE(project_file::ReadAllBytes(path, bytes, err)) << err.message;

    image_loader::DecodedImage img;
    std::string load_err;
    ASSERT_TRUE(image_loader::DecodeRgba8(bytes, 16, img, load_err)) << load_err;
    EXPECT_EQ(img.width, 2);
    EXPECT_EQ(img.height, 2);
    ASSERT_EQ(img.rgba.size(), 16u);
    EXPECT_EQ(img.rgba[12], 0);
    EXPECT_EQ(img.rgba[13], 255);
    EXPECT_EQ(img.rgba[15], 255);
    EXPECT_EQ(img.rgba[3], 0); // unpainted pixel stays transparent

    image_loader::DecodedImage untouched;
    EXPECT_FALSE(image_loader::DecodeRgba8({}, 16, untouched, load_err));
    EXPECT_FALSE(load_err.empty());
    EXPECT_EQ(untouched.width, 0);

    // Over the per-side limit: refused from the header.
    EXPECT_FALSE(image_loader::DecodeRgba8(bytes, 1, untouched, load_err));
    EXPECT_NE(load_err.find("limit"), std::string::npos);
    EXPECT_TRUE(untouched.rgba.empty());
}

TEST(IoManager, ExportRgbaWritesPreviewBuffers)
{
    ScratchDir dir;
    LayeredCanvas canvas(4, 2);
    canvas.SetActive(0, 0, kRed);
    std::vector<std::uint8_t> rgba;
    canvas.RenderToRgbaCheckerboard(rgba, 1);

    IoError err;
    const std::string path = dir.File("preview.png");
    ASSERT_TRUE(formats::image::ExportRgbaToFile(path, 4, 2, rgba, err)) << err.message;

    std::vector<std::uint8_t> bytes;
    ASSERT_TRUE(project_file::ReadAllBytes(path, bytes, err)) << err.message;
    image_loader::DecodedImage img;
    std::string load_err;
    ASSERT_TRUE(image_loader::DecodeRgba8(bytes, 16, img, load_err)) << load_err;
    EXPECT_EQ(img.rgba, rgba);

    EXPECT_FALSE(formats::image::ExportRgbaToFile(dir.File("short.png"), 4, 2, {1, 2, 3}, err));
    EXPECT_EQ(err.kind, IoErrorKind::Encode);
    EXPECT_FALSE(formats::image::ExportRgbaToFile(dir.File("preview.tiff"), 4, 2, rgba, err));
    EXPECT_EQ(err.kind, IoErrorKind::UnsupportedFormat);
}
