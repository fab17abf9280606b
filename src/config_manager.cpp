#include "config_manager.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace
{
std::string escapeJson(const std::string& value)
{
    std::string out;
    for (char ch : value)
    {
        if (ch == '"' || ch == '\\')
        {
            out += '\\';
        }
        out += ch;
    }
    return out;
}

const char* speedKey(PointerSpeed speed)
{
    switch (speed)
    {
    case PointerSpeed::Slow:
        return "slow";
    case PointerSpeed::Fast:
        return "fast";
    case PointerSpeed::Normal:
    default:
        return "normal";
    }
}

// NaN fails every comparison; map it back to the default
float clampOrDefault(float value, float low, float high, float fallback)
{
    if (!(value == value))
        return fallback;
    return std::clamp(value, low, high);
}

constexpr float MIN_FONT_SIZE = 8.0f;
constexpr float MAX_FONT_SIZE = 72.0f;
} // namespace

std::string ConfigManager::toJson(const BigPictureConfig& config)
{
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"stickDeadzone\": " << config.deadzones.stick << ",\n";
    oss << "  \"triggerDeadzone\": " << config.deadzones.trigger << ",\n";
    oss << "  \"pointerDeadzone\": " << config.deadzones.pointer << ",\n";
    oss << "  \"scrollDeadzone\": " << config.deadzones.scroll << ",\n";
    oss << "  \"directionTolerance\": " << config.directionTolerance << ",\n";
    oss << "  \"cursorMargin\": " << config.cursorMargin << ",\n";
    oss << "  \"scrollStep\": " << config.scrollStep << ",\n";
    oss << "  \"cursorSpeed\": \"" << speedKey(config.cursorSpeed) << "\",\n";
    oss << "  \"navSoundEnabled\": " << (config.navSoundEnabled ? "true" : "false") << ",\n";
    oss << "  \"searchUrlPrefix\": \"" << escapeJson(config.searchUrlPrefix) << "\",\n";
    oss << "  \"fontPath\": \"" << escapeJson(config.fontPath) << "\",\n";
    oss << "  \"fontSize\": " << config.fontSize << "\n";
    oss << "}";
    return oss.str();
}

BigPictureConfig ConfigManager::fromJson(const std::string& json)
{
    BigPictureConfig config;

    // Position just after "key":, skipping whitespace; npos when absent
    auto findValueStart = [&json](const std::string& key) -> size_t
    {
        size_t pos = json.find("\"" + key + "\"");
        if (pos == std::string::npos)
            return std::string::npos;
        pos = json.find(':', pos + key.size() + 2);
        if (pos == std::string::npos)
            return std::string::npos;
        return json.find_first_not_of(" \t\n\r", pos + 1);
    };

    auto findStringValue = [&json, &findValueStart](const std::string& key, const std::string& fallback) -> std::string
    {
        size_t start = findValueStart(key);
        if (start == std::string::npos || json[start] != '"')
            return fallback;

        std::string value;
        for (size_t i = start + 1; i < json.size(); ++i)
        {
            if (json[i] == '\\' && i + 1 < json.size())
            {
                value += json[++i];
            }
            else if (json[i] == '"')
            {
                return value;
            }
            else
            {
                value += json[i];
            }
        }
        return fallback; // Unterminated
    };

    auto findNumberValue = [&json, &findValueStart](const std::string& key, float fallback) -> float
    {
        size_t start = findValueStart(key);
        if (start == std::string::npos)
            return fallback;
        size_t end = json.find_first_of(",\n}", start);
        std::string valueStr = json.substr(start, end == std::string::npos ? std::string::npos : end - start);
        try
        {
            return std::stof(valueStr);
        }
        catch (const std::exception&)
        {
            std::cerr << "[ConfigManager] Ignoring invalid value for " << key << ": " << valueStr << std::endl;
            return fallback;
        }
    };

    auto findBoolValue = [&json, &findValueStart](const std::string& key, bool fallback) -> bool
    {
        size_t start = findValueStart(key);
        if (start == std::string::npos)
            return fallback;
        if (json.compare(start, 4, "true") == 0)
            return true;
        if (json.compare(start, 5, "false") == 0)
            return false;
        return fallback;
    };

    config.deadzones.stick = findNumberValue("stickDeadzone", config.deadzones.stick);
    config.deadzones.trigger = findNumberValue("triggerDeadzone", config.deadzones.trigger);
    config.deadzones.pointer = findNumberValue("pointerDeadzone", config.deadzones.pointer);
    config.deadzones.scroll = findNumberValue("scrollDeadzone", config.deadzones.scroll);
    config.directionTolerance = findNumberValue("directionTolerance", config.directionTolerance);
    config.cursorMargin = findNumberValue("cursorMargin", config.cursorMargin);
    config.scrollStep = findNumberValue("scrollStep", config.scrollStep);
    config.navSoundEnabled = findBoolValue("navSoundEnabled", config.navSoundEnabled);
    config.searchUrlPrefix = findStringValue("searchUrlPrefix", config.searchUrlPrefix);
    config.fontPath = findStringValue("fontPath", config.fontPath);
    // Clamped as a float first; out-of-range float to int conversion is undefined
    float fontSize = findNumberValue("fontSize", static_cast<float>(config.fontSize));
    config.fontSize = static_cast<int>(
        clampOrDefault(fontSize, MIN_FONT_SIZE, MAX_FONT_SIZE, static_cast<float>(BigPictureConfig().fontSize)));

    std::string speed = findStringValue("cursorSpeed", speedKey(config.cursorSpeed));
    if (speed == "slow")
        config.cursorSpeed = PointerSpeed::Slow;
    else if (speed == "fast")
        config.cursorSpeed = PointerSpeed::Fast;
    else
        config.cursorSpeed = PointerSpeed::Normal;

    sanitize(config);
    return config;
}

void ConfigManager::sanitize(BigPictureConfig& config)
{
    BigPictureConfig defaults;
    config.deadzones.stick = clampOrDefault(config.deadzones.stick, 0.0f, 0.95f, defaults.deadzones.stick);
    config.deadzones.trigger = clampOrDefault(config.deadzones.trigger, 0.0f, 0.95f, defaults.deadzones.trigger);
    config.deadzones.pointer = clampOrDefault(config.deadzones.pointer, 0.0f, 0.95f, defaults.deadzones.pointer);
    config.deadzones.scroll = clampOrDefault(config.deadzones.scroll, 0.0f, 0.95f, defaults.deadzones.scroll);
    config.directionTolerance = clampOrDefault(config.directionTolerance, 0.0f, 200.0f, defaults.directionTolerance);
    config.cursorMargin = clampOrDefault(config.cursorMargin, 0.0f, 100.0f, defaults.cursorMargin);
    config.scrollStep = clampOrDefault(config.scrollStep, 1.0f, 200.0f, defaults.scrollStep);
    config.fontSize = std::clamp(config.fontSize, static_cast<int>(MIN_FONT_SIZE), static_cast<int>(MAX_FONT_SIZE));

    if (config.searchUrlPrefix.empty())
    {
        config.searchUrlPrefix = defaults.searchUrlPrefix;
    }
}

bool ConfigManager::saveConfig(const BigPictureConfig& config, std::string configPath) const
{
    if (configPath.empty())
    {
        configPath = getDefaultConfigPath().string();
    }

    try
    {
        std::filesystem::path path(configPath);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(configPath);
        if (!file.is_open())
        {
            std::cerr << "[ConfigManager] Failed to open config file for writing: " << configPath << std::endl;
            return false;
        }

        file << toJson(config);
        file.close();

        std::cout << "[ConfigManager] Configuration saved to: " << configPath << std::endl;
        return true;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[ConfigManager] Error saving config: " << e.what() << std::endl;
        return false;
    }
}

BigPictureConfig ConfigManager::loadConfig(std::string configPath) const
{
    BigPictureConfig defaultConfig;

    if (configPath.empty())
    {
        configPath = getDefaultConfigPath().string();
    }

    try
    {
        if (!std::filesystem::exists(configPath))
        {
            std::cout << "[ConfigManager] Config file not found, using defaults: " << configPath << std::endl;
            return defaultConfig;
        }

        std::ifstream file(configPath);
        if (!file.is_open())
        {
            std::cerr << "[ConfigManager] Failed to open config file: " << configPath << std::endl;
            return defaultConfig;
        }

        std::string json((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        file.close();

        BigPictureConfig config = fromJson(json);
        std::cout << "[ConfigManager] Configuration loaded from: " << configPath << std::endl;
        return config;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[ConfigManager] Error loading config: " << e.what() << std::endl;
        return defaultConfig;
    }
}
