#ifndef PATH_UTILS_H
#define PATH_UTILS_H

#include <filesystem>

/**
 * @brief Returns the directory used to persist input settings.
 *        Ensures the directory exists. BIGPICTURE_STATE_DIR wins, then
 *        $XDG_CONFIG_HOME/bigpicture, then $HOME/.config/bigpicture, then the current directory.
 */
std::filesystem::path getStateDirectory();

/**
 * @brief Default location of the input settings file inside the state directory.
 */
std::filesystem::path getDefaultConfigPath();

#endif // PATH_UTILS_H
