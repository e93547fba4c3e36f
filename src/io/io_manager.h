#pragma once

#include "core/document.h"
#include "core/editor.h"
#include "io/formats/image.h"
#include "io/io_error.h"

#include <string>

namespace rustique
{
// Extension-based dispatch for File -> Open / Save / Quick Save.
//
// - .rustiq goes through the project container (full document, all layers)
// - raster extensions import/export a flattened single-layer image
// - anything else is reported as UnknownExtension
//
// On failure the editor is left exactly as it was, including its unsaved flag.
class IoManager
{
public:
    enum class FileKind
    {
        Project,
        Raster,
        Unknown,
    };

    IoManager() = default;
    explicit IoManager(const formats::image::ExportOptions& export_options)
        : m_export_options(export_options)
    {
    }

    static FileKind Classify(const std::string& path);

    // Reads `path` into a document without touching any editor.
    static bool ReadDocument(const std::string& path, Document& out, IoError& err);

    // Replaces the editor's document with the file's contents. The path becomes
    // the editor's quick-save target.
    bool Open(const std::string& path, Editor& editor, IoError& err);

    // Writes the editor's document to `path` (format from the extension), then
    // clears the unsaved flag and remembers the path.
    bool Save(const std::string& path, Editor& editor, IoError& err);

    // Save() to the last path used by Open/Save.
    bool QuickSave(Editor& editor, IoError& err);

    // Last failure message (empty after a success).
    const std::string& GetLastError() const { return m_last_error; }

    const formats::image::ExportOptions& GetExportOptions() const { return m_export_options; }
    void SetExportOptions(const formats::image::ExportOptions& o) { m_export_options = o; }

private:
    bool Finish(bool ok, const IoError& err);

    formats::image::ExportOptions m_export_options;
    std::string                   m_last_error;
};
} // namespace rustique
