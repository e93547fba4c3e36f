// rustique-cli: headless driver over the editing core.
//
// Exit codes: 0 success, 1 operation failed, 2 usage error.

#include "core/brush_style.h"
#include "core/colour.h"
#include "core/editor.h"
#include "io/formats/image.h"
#include "io/io_manager.h"
#include "io/session/editor_settings.h"

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

using namespace rustique;

namespace
{
static void PrintUsage(const char* argv0)
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  %s new [<width> <height>] <out>\n"
                 "  %s info <file>\n"
                 "  %s export <in> <out>\n"
                 "  %s preview <in> <image-out>\n"
                 "  %s fill <in> <x> <y> <rrggbb[aa]> <out>\n"
                 "  %s stroke <in> <shape> <size> <x0> <y0> <x1> <y1> <rrggbb[aa]> <out>\n"
                 "\n"
                 "Formats are chosen by extension: .rustiq, .png, .jpg/.jpeg, .bmp (.gif import only).\n"
                 "Shapes: Round Flat Bright Filbert Fan Angle Mop Rigger\n",
                 argv0, argv0, argv0, argv0, argv0, argv0);
}

static bool ParseInt(std::string_view s, int& out)
{
    const char* first = s.data();
    const char* last = s.data() + s.size();
    const auto res = std::from_chars(first, last, out);
    return res.ec == std::errc() && res.ptr == last;
}

static bool ParseFloat(const std::string& s, float& out)
{
    char* end = nullptr;
    out = std::strtof(s.c_str(), &end);
    return !s.empty() && end == s.c_str() + s.size();
}

struct Context
{
    EditorSettings settings;
    IoManager      io;
};

static void ApplySettings(const EditorSettings& st, Editor& editor)
{
    editor.SetUndoLimit((size_t)st.undo_limit);
    editor.GetToolState().saved.SetCapacity((size_t)st.max_saved_colours);
}

static bool OpenInto(Context& ctx, const std::string& path, Editor& editor)
{
    ApplySettings(ctx.settings, editor);
    IoError err;
    if (!ctx.io.Open(path, editor, err))
    {
        std::fprintf(stderr, "[io] open '%s' failed (%s): %s\n", path.c_str(), IoErrorKindToString(err.kind),
                     err.message.c_str());
        return false;
    }
    return true;
}

static bool SaveFrom(Context& ctx, const std::string& path, Editor& editor)
{
    IoError err;
    if (!ctx.io.Save(path, editor, err))
    {
        std::fprintf(stderr, "[io] save '%s' failed (%s): %s\n", path.c_str(), IoErrorKindToString(err.kind),
                     err.message.c_str());
        return false;
    }
    return true;
}

static int CmdNew(Context& ctx, const std::vector<std::string>& args)
{
    int w = ctx.settings.default_width;
    int h = ctx.settings.default_height;
    if (args.size() == 3)
    {
        if (!ParseInt(args[0], w) || !ParseInt(args[1], h) || w <= 0 || h <= 0)
            return 2;
    }
    else if (args.size() != 1)
    {
        return 2;
    }

    Editor editor(w, h);
    ApplySettings(ctx.settings, editor);
    return SaveFrom(ctx, args.back(), editor) ? 0 : 1;
}

static int CmdInfo(Context&, const std::vector<std::string>& args)
{
    if (args.size() != 1)
        return 2;

    Document doc;
    IoError  err;
    if (!IoManager::ReadDocument(args[0], doc, err))
    {
        std::fprintf(stderr, "[io] open '%s' failed (%s): %s\n", args[0].c_str(), IoErrorKindToString(err.kind),
                     err.message.c_str());
        return 1;
    }

    std::printf("size: %dx%d\n", doc.width, doc.height);
    std::printf("layers: %zu (active %d)\n", doc.layers.size(), doc.active_layer_index);
    for (size_t i = 0; i < doc.layers.size(); ++i)
    {
        const PixelLayer& l = doc.layers[i];
        size_t painted = 0;
        for (const Cell& c : l.cells)
            painted += c.has_value() ? 1u : 0u;
        std::printf("  [%zu] %s%s painted=%zu\n", i, l.name.c_str(), l.visible ? "" : " (hidden)", painted);
    }
    std::printf("primary: #%s secondary: #%s\n", ToHexRgba(doc.primary).c_str(), ToHexRgba(doc.secondary).c_str());
    std::printf("saved colours: %zu\n", doc.saved_colours.size());
    std::printf("brush: %s size=%g angle=%g hardness=%g\n",
                BrushShapeToString(doc.brush.shape),
                (double)doc.brush.size,
                (double)doc.brush.angle,
                (double)doc.brush.hardness);
    std::printf("eraser: %d\n", doc.eraser_size);
    return 0;
}

static int CmdExport(Context& ctx, const std::vector<std::string>& args)
{
    if (args.size() != 2)
        return 2;

    Editor editor(1, 1);
    if (!OpenInto(ctx, args[0], editor))
        return 1;
    return SaveFrom(ctx, args[1], editor) ? 0 : 1;
}

// Composite over the transparency checkerboard, as an editor viewport shows it.
static int CmdPreview(Context& ctx, const std::vector<std::string>& args)
{
    if (args.size() != 2)
        return 2;

    Editor editor(1, 1);
    if (!OpenInto(ctx, args[0], editor))
        return 1;

    const LayeredCanvas& canvas = editor.GetCanvas();
    std::vector<std::uint8_t> rgba;
    canvas.RenderToRgbaCheckerboard(rgba, ctx.settings.checkerboard_size);

    IoError err;
    if (!formats::image::ExportRgbaToFile(args[1], canvas.GetWidth(), canvas.GetHeight(), rgba, err,
                                          ctx.io.GetExportOptions()))
    {
        std::fprintf(stderr, "[io] preview '%s' failed (%s): %s\n", args[1].c_str(), IoErrorKindToString(err.kind),
                     err.message.c_str());
        return 1;
    }
    return 0;
}

static int CmdFill(Context& ctx, const std::vector<std::string>& args)
{
    int   x = 0, y = 0;
    Rgba8 colour;
    if (args.size() != 5 || !ParseInt(args[1], x) || !ParseInt(args[2], y) || !ParseHexRgba(args[3], colour))
        return 2;

    Editor editor(1, 1);
    if (!OpenInto(ctx, args[0], editor))
        return 1;

    editor.GetToolState().tool = Tool::PaintBucket;
    editor.GetToolState().primary = colour;
    if (!editor.PaintBucket(x, y))
        std::fprintf(stderr, "[cli] fill at (%d,%d) changed nothing\n", x, y);
    return SaveFrom(ctx, args[4], editor) ? 0 : 1;
}

static int CmdStroke(Context& ctx, const std::vector<std::string>& args)
{
    BrushShape shape = BrushShape::Round;
    float      size = 0.0f;
    int        x0 = 0, y0 = 0, x1 = 0, y1 = 0;
    Rgba8      colour;
    if (args.size() != 9 || !BrushShapeFromString(args[1], shape) || !ParseFloat(args[2], size) || size <= 0.0f ||
        !ParseInt(args[3], x0) || !ParseInt(args[4], y0) || !ParseInt(args[5], x1) || !ParseInt(args[6], y1) ||
        !ParseHexRgba(args[7], colour))
        return 2;

    Editor editor(1, 1);
    if (!OpenInto(ctx, args[0], editor))
        return 1;

    ToolState& tools = editor.GetToolState();
    tools.tool = Tool::AdvancedBrush;
    tools.brush.shape = shape;
    tools.brush.size = size;
    tools.primary = colour;

    editor.BeginStroke();
    editor.DrawLine(x0, y0, x1, y1);
    if (!editor.EndStroke())
        std::fprintf(stderr, "[cli] stroke changed nothing\n");
    return SaveFrom(ctx, args[8], editor) ? 0 : 1;
}
} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        PrintUsage(argv[0]);
        return 2;
    }

    const std::string_view cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
    {
        PrintUsage(argv[0]);
        return 0;
    }

    Context     ctx;
    std::string settings_err;
    if (!LoadEditorSettings(ctx.settings, settings_err))
        std::fprintf(stderr, "[settings] %s (using defaults)\n", settings_err.c_str());

    formats::image::ExportOptions export_options;
    export_options.jpg_quality = ctx.settings.jpg_quality;
    ctx.io.SetExportOptions(export_options);

    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i)
        args.emplace_back(argv[i]);

    int rc = 2;
    if (cmd == "new")
        rc = CmdNew(ctx, args);
    else if (cmd == "info")
        rc = CmdInfo(ctx, args);
    else if (cmd == "export")
        rc = CmdExport(ctx, args);
    else if (cmd == "preview")
        rc = CmdPreview(ctx, args);
    else if (cmd == "fill")
        rc = CmdFill(ctx, args);
    else if (cmd == "stroke")
        rc = CmdStroke(ctx, args);
    else
        std::fprintf(stderr, "[cli] unknown command: %s\n", argv[1]);

    if (rc == 2)
        PrintUsage(argv[0]);
    return rc;
}
