#pragma once

#include <string>

namespace rustique
{
// Per-user configuration directory.
//
// Resolution order: $RUSTIQUE_CONFIG_DIR, $XDG_CONFIG_HOME/rustique,
// $HOME/.config/rustique, then the current directory.
std::string GetRustiqueConfigDir();

// Joins the config dir and a relative path within it.
// Example: RustiqueConfigPath("settings.json") -> "<config_dir>/settings.json"
std::string RustiqueConfigPath(const std::string& relative);
} // namespace rustique
