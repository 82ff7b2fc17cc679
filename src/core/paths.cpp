#include "core/paths.h"

#include <cstdlib>
#include <filesystem>

namespace
{
static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}
} // namespace

std::string GetMemeseedConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/memeseed";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/memeseed";

    // Last resort: current directory
    return ".";
}

std::string GetMemeseedConfigPath()
{
    namespace fs = std::filesystem;
    return (fs::path(GetMemeseedConfigDir()) / "config.json").string();
}
