#include "core/paths.h"

#include <cstdlib>
#include <filesystem>

namespace rustique
{
namespace
{
static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}
} // namespace

std::string GetRustiqueConfigDir()
{
    const std::string overridden = EnvOrEmpty("RUSTIQUE_CONFIG_DIR");
    if (!overridden.empty())
        return overridden;

    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/rustique";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/rustique";

    return ".";
}

std::string RustiqueConfigPath(const std::string& relative)
{
    namespace fs = std::filesystem;
    if (relative.empty())
        return GetRustiqueConfigDir();
    return (fs::path(GetRustiqueConfigDir()) / relative).string();
}
} // namespace rustique
