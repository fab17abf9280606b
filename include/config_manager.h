#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include "input_manager.h"
#include "path_utils.h"
#include "url_utils.h"
#include "virtual_pointer.h"

#include <string>

/**
 * @brief Tunables for the input layer and its front end
 */
struct BigPictureConfig
{
    InputDeadzones deadzones;
    float directionTolerance = 10.0f;                  // Spatial navigation tolerance in pixels
    float cursorMargin = VirtualPointer::DEFAULT_MARGIN; // Cursor clamp margin from right/bottom edges
    float scrollStep = 20.0f;                          // Surface scroll per tick at full left-stick deflection
    PointerSpeed cursorSpeed = PointerSpeed::Normal;   // Initial cursor speed tier
    bool navSoundEnabled = true;
    std::string searchUrlPrefix = url::DEFAULT_SEARCH_PREFIX;
    std::string fontPath = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
    int fontSize = 20;
};

/**
 * @brief Loads and saves BigPictureConfig as a flat JSON object
 */
class ConfigManager
{
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    /**
     * @brief Save configuration to file
     * @param config Configuration to save
     * @param configPath Optional override path (defaults to the state directory)
     * @return true if successful, false otherwise
     */
    bool saveConfig(const BigPictureConfig& config, std::string configPath = {}) const;

    /**
     * @brief Load configuration from file
     * @param configPath Optional override path (defaults to the state directory)
     * @return Loaded config with out-of-range values clamped, defaults when missing or unreadable
     */
    BigPictureConfig loadConfig(std::string configPath = {}) const;

    static std::string toJson(const BigPictureConfig& config);
    static BigPictureConfig fromJson(const std::string& json);

    /**
     * @brief Clamp every value into its accepted range
     */
    static void sanitize(BigPictureConfig& config);
};

#endif // CONFIG_MANAGER_H
