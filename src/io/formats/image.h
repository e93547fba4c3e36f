#pragma once

#include "core/canvas.h"
#include "core/document.h"
#include "io/io_error.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rustique::formats::image
{
// ---------------------------------------------------------------------------
// File extensions (single source of truth for dispatch)
// ---------------------------------------------------------------------------
// Lowercase extensions (no leading dot).
const std::vector<std::string_view>& ImportExtensions();
const std::vector<std::string_view>& ExportExtensions();
// Every raster extension the editor recognises, including ones it cannot
// encode/decode (reported as UnsupportedFormat rather than UnknownExtension).
const std::vector<std::string_view>& RecognisedExtensions();

bool IsRecognisedExtension(std::string_view ext);

// Lowercased extension of `path` without the dot ("" if none).
std::string FileExtLower(const std::string& path);

// ---------------------------------------------------------------------------
// Import (image file -> single-layer document)
// ---------------------------------------------------------------------------
// Builds a document with one "Background" layer from row-major RGBA8 pixels.
// Pixels with alpha 0 become unpainted cells. Tool state takes its defaults.
bool DocumentFromRgba(int width, int height, const std::vector<std::uint8_t>& rgba, Document& out, IoError& err);

// Unreadable files report Io; undecodable or oversized images report Decode.
bool ImportFileToDocument(const std::string& path, Document& out, IoError& err);

// ---------------------------------------------------------------------------
// Export (flattened composite -> image file)
// ---------------------------------------------------------------------------
struct ExportOptions
{
    // PNG compression level (lodepng zlib settings; 0..9).
    int png_compression = 6;
    // JPEG quality 1..100.
    int jpg_quality = 95;
};

// Writes a row-major RGBA8 buffer in the format named by the extension of `path`.
bool ExportRgbaToFile(const std::string& path,
                      int width,
                      int height,
                      const std::vector<std::uint8_t>& rgba,
                      IoError& err,
                      const ExportOptions& options = {});

// Flattened composite; unpainted cells become transparent.
bool ExportCanvasToFile(const std::string& path,
                        const LayeredCanvas& canvas,
                        IoError& err,
                        const ExportOptions& options = {});
} // namespace rustique::formats::image
