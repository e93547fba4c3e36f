#include "io/session/editor_settings.h"

#include "core/canvas/canvas_internal.h"
#include "core/paths.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace rustique
{
namespace
{
namespace fs = std::filesystem;
using json = nlohmann::json;

static json ToJson(const EditorSettings& st)
{
    json j;
    j["schema_version"] = EditorSettings::kSchemaVersion;
    j["undo_limit"] = st.undo_limit;
    j["max_saved_colours"] = st.max_saved_colours;
    j["default_width"] = st.default_width;
    j["default_height"] = st.default_height;
    j["checkerboard_size"] = st.checkerboard_size;
    j["jpg_quality"] = st.jpg_quality;
    return j;
}

static void ReadInt(const json& j, const char* key, int lo, int hi, int& inout)
{
    if (j.contains(key) && j[key].is_number_integer())
        inout = (int)std::clamp<long long>(j[key].get<long long>(), lo, hi);
}

static bool FromJson(const json& j, EditorSettings& out, std::string& err)
{
    if (!j.is_object())
    {
        err = "settings root is not an object.";
        return false;
    }

    EditorSettings st = out;
    ReadInt(j, "schema_version", 0, 1 << 30, st.schema_version);
    ReadInt(j, "undo_limit", 0, 1 << 20, st.undo_limit);
    ReadInt(j, "max_saved_colours", 1, 1024, st.max_saved_colours);
    ReadInt(j, "default_width", 1, kMaxCanvasDimension, st.default_width);
    ReadInt(j, "default_height", 1, kMaxCanvasDimension, st.default_height);
    ReadInt(j, "checkerboard_size", 1, 1024, st.checkerboard_size);
    ReadInt(j, "jpg_quality", 1, 100, st.jpg_quality);
    out = st;
    return true;
}
} // namespace

std::string GetEditorSettingsPath()
{
    return RustiqueConfigPath("settings.json");
}

bool LoadEditorSettings(EditorSettings& out, std::string& err)
{
    return LoadEditorSettingsFrom(GetEditorSettingsPath(), out, err);
}

bool LoadEditorSettingsFrom(const std::string& path, EditorSettings& out, std::string& err)
{
    err.clear();

    std::ifstream f(path);
    if (!f)
    {
        std::error_code ec;
        if (fs::exists(path, ec) && !ec)
        {
            err = "Failed to open settings file for reading: " + path;
            return false;
        }
        return true; // first run: keep defaults
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const json::exception& e)
    {
        err = std::string("Failed to parse settings: ") + e.what();
        return false;
    }

    if (j.is_object() && j.contains("schema_version") && j["schema_version"].is_number_integer() &&
        j["schema_version"].get<int>() > EditorSettings::kSchemaVersion)
    {
        // Written by a newer release; ignore rather than misread it.
        return true;
    }

    return FromJson(j, out, err);
}

bool SaveEditorSettings(const EditorSettings& st, std::string& err)
{
    return SaveEditorSettingsTo(GetEditorSettingsPath(), st, err);
}

bool SaveEditorSettingsTo(const std::string& path, const EditorSettings& st, std::string& err)
{
    err.clear();

    std::error_code ec;
    const fs::path p(path);
    if (p.has_parent_path())
    {
        fs::create_directories(p.parent_path(), ec);
        if (ec)
        {
            err = "Failed to create config directory: " + ec.message();
            return false;
        }
    }

    // Atomic write: temp file in the same directory, then rename over the original.
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            err = "Failed to open temp settings file for writing.";
            return false;
        }
        out << ToJson(st).dump(2) << "\n";
        out.close();
        if (!out)
        {
            err = "Failed to finalize settings temp file write.";
            return false;
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec)
    {
        err = "Failed to atomically replace settings file: " + ec.message();
        std::error_code rm_ec;
        fs::remove(tmp_path, rm_ec);
        return false;
    }
    return true;
}
} // namespace rustique
