#include "io/formats/image.h"

#include "core/canvas/canvas_internal.h"
#include "io/image_loader.h"
#include "io/image_writer.h"
#include "io/project_file.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>

#include <lodepng.h>

namespace rustique::formats::image
{
namespace
{
static std::string ToLowerAscii(std::string s)
{
    for (char& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static bool Contains(const std::vector<std::string_view>& list, std::string_view ext)
{
    return std::find(list.begin(), list.end(), ext) != list.end();
}

struct PngDeflateTier
{
    unsigned windowsize;
    unsigned nicematch;
};

// lodepng has no single level knob; levels 1..9 map onto three LZ77 tiers.
static constexpr PngDeflateTier kPngTiers[] = {
    {2048u, 128u},   // 1..5
    {32768u, 128u},  // 6
    {32768u, 258u},  // 7..9
};

static bool EncodePngRgba(int w, int h, const std::vector<std::uint8_t>& rgba, int level,
                          std::vector<std::uint8_t>& out, IoError& err)
{
    LodePNGState state;
    lodepng_state_init(&state);
    state.info_raw.colortype = LCT_RGBA;
    state.info_raw.bitdepth = 8;
    state.info_png.color.colortype = LCT_RGBA;
    state.info_png.color.bitdepth = 8;
    state.encoder.auto_convert = 0;

    LodePNGCompressSettings& z = state.encoder.zlibsettings;
    level = std::clamp(level, 0, 9);
    if (level == 0)
    {
        z.btype = 0;
        z.use_lz77 = 0;
    }
    else
    {
        const PngDeflateTier& tier = kPngTiers[level <= 5 ? 0 : (level == 6 ? 1 : 2)];
        z.btype = 2;
        z.use_lz77 = 1;
        z.windowsize = tier.windowsize;
        z.minmatch = 3;
        z.nicematch = tier.nicematch;
        z.lazymatching = 1;
    }

    unsigned char* png = nullptr;
    size_t png_size = 0;
    const unsigned code = lodepng_encode(&png, &png_size, rgba.data(), (unsigned)w, (unsigned)h, &state);
    lodepng_state_cleanup(&state);
    if (code != 0)
    {
        std::free(png);
        err.Set(IoErrorKind::Encode, std::string("PNG encoding failed: ") + lodepng_error_text(code));
        return false;
    }
    out.assign(png, png + png_size);
    std::free(png);
    return true;
}
} // namespace

const std::vector<std::string_view>& ImportExtensions()
{
    static const std::vector<std::string_view> exts = {"png", "jpg", "jpeg", "gif", "bmp"};
    return exts;
}

const std::vector<std::string_view>& ExportExtensions()
{
    static const std::vector<std::string_view> exts = {"png", "jpg", "jpeg", "bmp"};
    return exts;
}

const std::vector<std::string_view>& RecognisedExtensions()
{
    static const std::vector<std::string_view> exts = {"png", "jpg", "jpeg", "bmp", "gif", "tif", "tiff", "webp"};
    return exts;
}

bool IsRecognisedExtension(std::string_view ext)
{
    return Contains(RecognisedExtensions(), ext);
}

std::string FileExtLower(const std::string& path)
{
    std::string ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.')
        ext.erase(ext.begin());
    return ToLowerAscii(ext);
}

bool DocumentFromRgba(int width, int height, const std::vector<std::uint8_t>& rgba, Document& out, IoError& err)
{
    err.Clear();
    if (width <= 0 || height <= 0 || width > kMaxCanvasDimension || height > kMaxCanvasDimension)
    {
        err.Set(IoErrorKind::Decode, "Image dimensions are out of range.");
        return false;
    }
    const size_t count = (size_t)width * (size_t)height;
    if (rgba.size() < count * 4u)
    {
        err.Set(IoErrorKind::Decode, "Invalid RGBA buffer size.");
        return false;
    }

    PixelLayer layer;
    layer.name = LayeredCanvas::kDefaultLayerName;
    layer.visible = true;
    layer.cells.resize(count);
    for (size_t i = 0; i < count; ++i)
    {
        const std::uint8_t a = rgba[i * 4u + 3];
        if (a == 0)
            continue;
        layer.cells[i] = Rgba8{rgba[i * 4u + 0], rgba[i * 4u + 1], rgba[i * 4u + 2], a};
    }

    Document doc;
    doc.width = width;
    doc.height = height;
    doc.layers.push_back(std::move(layer));
    doc.active_layer_index = 0;
    out = std::move(doc);
    return true;
}

bool ImportFileToDocument(const std::string& path, Document& out, IoError& err)
{
    err.Clear();
    const std::string ext = FileExtLower(path);
    if (!Contains(ImportExtensions(), ext))
    {
        if (IsRecognisedExtension(ext))
            err.Set(IoErrorKind::UnsupportedFormat, "Importing ." + ext + " images is not supported.");
        else
            err.Set(IoErrorKind::UnknownExtension, "Unknown image extension '" + ext + "'.");
        return false;
    }

    std::vector<std::uint8_t> encoded;
    if (!project_file::ReadAllBytes(path, encoded, err))
        return false;

    image_loader::DecodedImage img;
    std::string decode_err;
    if (!image_loader::DecodeRgba8(encoded, kMaxCanvasDimension, img, decode_err))
    {
        err.Set(IoErrorKind::Decode, "'" + path + "': " + decode_err);
        return false;
    }
    return DocumentFromRgba(img.width, img.height, img.rgba, out, err);
}

bool ExportRgbaToFile(const std::string& path,
                      int width,
                      int height,
                      const std::vector<std::uint8_t>& rgba,
                      IoError& err,
                      const ExportOptions& options)
{
    err.Clear();
    if (width <= 0 || height <= 0 || rgba.size() != (size_t)width * (size_t)height * 4u)
    {
        err.Set(IoErrorKind::Encode, "Pixel buffer does not match " + std::to_string(width) + "x" +
                                         std::to_string(height) + ".");
        return false;
    }

    const std::string ext = FileExtLower(path);
    if (ext.empty())
    {
        err.Set(IoErrorKind::UnknownExtension, "Missing file extension.");
        return false;
    }
    if (!Contains(ExportExtensions(), ext))
    {
        if (IsRecognisedExtension(ext))
            err.Set(IoErrorKind::UnsupportedFormat, "Exporting ." + ext + " images is not supported.");
        else
            err.Set(IoErrorKind::UnknownExtension, "Unknown image extension '" + ext + "'.");
        return false;
    }

    if (ext == "png")
    {
        std::vector<std::uint8_t> png;
        if (!EncodePngRgba(width, height, rgba, options.png_compression, png, err))
            return false;
        return project_file::WriteAllBytesAtomic(path, png, err);
    }

    std::string werr;
    bool ok = false;
    if (ext == "jpg" || ext == "jpeg")
        ok = image_writer::WriteJpgFromRgba32(path, width, height, rgba, options.jpg_quality, werr);
    else if (ext == "bmp")
        ok = image_writer::WriteBmpFromRgba32(path, width, height, rgba, werr);

    if (!ok)
    {
        err.Set(IoErrorKind::Io, werr.empty() ? "Image export failed." : werr);
        return false;
    }
    return true;
}

bool ExportCanvasToFile(const std::string& path,
                        const LayeredCanvas& canvas,
                        IoError& err,
                        const ExportOptions& options)
{
    std::vector<std::uint8_t> rgba;
    canvas.RenderToRgba(rgba);
    return ExportRgbaToFile(path, canvas.GetWidth(), canvas.GetHeight(), rgba, err, options);
}
} // namespace rustique::formats::image
