#include "io/io_manager.h"

#include "io/project_file.h"

#include <utility>

namespace rustique
{
namespace
{
static constexpr const char* kProjectExtension = "rustiq";

static void SetUnknownExtension(const std::string& path, IoError& err)
{
    err.Set(IoErrorKind::UnknownExtension, "Unsupported file format: " + path);
}
} // namespace

IoManager::FileKind IoManager::Classify(const std::string& path)
{
    const std::string ext = formats::image::FileExtLower(path);
    if (ext == kProjectExtension)
        return FileKind::Project;
    if (formats::image::IsRecognisedExtension(ext))
        return FileKind::Raster;
    return FileKind::Unknown;
}

bool IoManager::ReadDocument(const std::string& path, Document& out, IoError& err)
{
    err.Clear();
    switch (Classify(path))
    {
        case FileKind::Project:
            return project_file::LoadDocumentFromFile(path, out, err);
        case FileKind::Raster:
            return formats::image::ImportFileToDocument(path, out, err);
        case FileKind::Unknown:
            break;
    }
    SetUnknownExtension(path, err);
    return false;
}

bool IoManager::Open(const std::string& path, Editor& editor, IoError& err)
{
    Document doc;
    if (!ReadDocument(path, doc, err))
        return Finish(false, err);

    std::string apply_err;
    if (!editor.LoadDocument(std::move(doc), apply_err))
    {
        err.Set(IoErrorKind::Decode, apply_err.empty() ? "Failed to apply document." : apply_err);
        return Finish(false, err);
    }
    editor.MarkSaved(path);
    return Finish(true, err);
}

bool IoManager::Save(const std::string& path, Editor& editor, IoError& err)
{
    err.Clear();
    bool ok = false;
    switch (Classify(path))
    {
        case FileKind::Project:
            ok = project_file::SaveDocumentToFile(path, editor.ToDocument(), err);
            break;
        case FileKind::Raster:
            ok = formats::image::ExportCanvasToFile(path, editor.GetCanvas(), err, m_export_options);
            break;
        case FileKind::Unknown:
            SetUnknownExtension(path, err);
            break;
    }
    if (ok)
        editor.MarkSaved(path);
    return Finish(ok, err);
}

bool IoManager::QuickSave(Editor& editor, IoError& err)
{
    if (editor.GetLastSavePath().empty())
    {
        err.Set(IoErrorKind::NoSavePath, "No previous save path.");
        return Finish(false, err);
    }
    // Copy: Save() rewrites the editor's path on success.
    const std::string path = editor.GetLastSavePath();
    return Save(path, editor, err);
}

bool IoManager::Finish(bool ok, const IoError& err)
{
    if (ok)
        m_last_error.clear();
    else
        m_last_error = err.message;
    return ok;
}
} // namespace rustique
