#include "path_utils.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace
{
const char* CONFIG_FILE_NAME = "bigpicture_input.json";
const char* APP_DIRECTORY_NAME = "bigpicture";

// Unset and empty variables are treated alike
const char* nonEmptyEnv(const char* name)
{
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? value : nullptr;
}

std::filesystem::path resolveStateDirectory()
{
    if (const char* explicitDir = nonEmptyEnv("BIGPICTURE_STATE_DIR"))
    {
        return explicitDir;
    }
    if (const char* configHome = nonEmptyEnv("XDG_CONFIG_HOME"))
    {
        return std::filesystem::path(configHome) / APP_DIRECTORY_NAME;
    }
    if (const char* home = nonEmptyEnv("HOME"))
    {
        return std::filesystem::path(home) / ".config" / APP_DIRECTORY_NAME;
    }

    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}
} // namespace

std::filesystem::path getStateDirectory()
{
    std::filesystem::path stateDir = resolveStateDirectory();
    std::error_code ec;
    std::filesystem::create_directories(stateDir, ec);
    if (ec)
    {
        std::cerr << "[PathUtils] Could not create " << stateDir << ": " << ec.message() << std::endl;
    }
    return stateDir;
}

std::filesystem::path getDefaultConfigPath()
{
    return getStateDirectory() / CONFIG_FILE_NAME;
}
