#pragma once

#include <optional>
#include <string>

/// Viewer defaults.
struct GlobalConfig
{
    std::string defaultInterpolation = "Nearest";  // Interpolation for new sessions
    std::optional<int> windowWidth;                // Window width (nullopt = 500)
    std::optional<int> windowHeight;               // Window height (nullopt = 500)
    double zoomStep = 1.3;                         // Factor per +/- or wheel notch
    bool fitLargeImages = true;                    // Fit images larger than the viewport on load
    std::optional<std::string> lastDirectory;      // Where the file picker starts
};

/// Top-level config structure.
struct AppConfig
{
    GlobalConfig global;
};

/// Return the global config file path: $HOME/.config/imquick/config.json
std::string globalConfigPath();

/// Load a config from a JSON file.  Returns a default AppConfig if the file
/// does not exist.  Throws std::runtime_error on parse errors.
AppConfig loadConfig(const std::string& path);

/// Save a config to a JSON file.  Creates parent directories as needed.
/// Throws std::runtime_error on I/O errors.
void saveConfig(const AppConfig& config, const std::string& path);

/// Merge a local config on top of a global config.
/// Local values override global values where they differ from the defaults.
AppConfig mergeConfigs(const AppConfig& global, const AppConfig& local);
