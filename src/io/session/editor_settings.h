#pragma once

#include <string>

namespace rustique
{
// Small persistent preferences for the editor, stored as pretty-printed JSON in
// "<config_dir>/settings.json". Unknown keys are ignored; missing keys keep
// their defaults; out-of-range values are clamped.
struct EditorSettings
{
    static constexpr int kSchemaVersion = 1;

    int schema_version = kSchemaVersion;

    int undo_limit = 20;        // 0 = unlimited
    int max_saved_colours = 16; // >= 1
    int default_width = 800;
    int default_height = 600;
    int checkerboard_size = 8;  // px per checker square
    int jpg_quality = 95;       // 1..100
};

std::string GetEditorSettingsPath();

// A missing file is not an error: `out` keeps its defaults and true is returned.
// A malformed file returns false with `err` set and leaves `out` untouched.
bool LoadEditorSettings(EditorSettings& out, std::string& err);
bool LoadEditorSettingsFrom(const std::string& path, EditorSettings& out, std::string& err);

bool SaveEditorSettings(const EditorSettings& st, std::string& err);
bool SaveEditorSettingsTo(const std::string& path, const EditorSettings& st, std::string& err);
} // namespace rustique
