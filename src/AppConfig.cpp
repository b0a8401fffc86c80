#include "AppConfig.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <glaze/glaze.hpp>

// ---- Glaze meta for custom JSON field names --------------------------------

template <>
struct glz::meta<GlobalConfig>
{
    using T = GlobalConfig;
    static constexpr auto value = object(
        "default_interpolation", &T::defaultInterpolation,
        "window_width",          &T::windowWidth,
        "window_height",         &T::windowHeight,
        "zoom_step",             &T::zoomStep,
        "fit_large_images",      &T::fitLargeImages,
        "last_directory",        &T::lastDirectory
    );
};

template <>
struct glz::meta<AppConfig>
{
    using T = AppConfig;
    static constexpr auto value = object(
        "global", &T::global
    );
};

// ---- Implementation --------------------------------------------------------

std::string globalConfigPath()
{
    // Prefer XDG_CONFIG_HOME, fall back to $HOME/.config
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    std::filesystem::path dir;
    if (xdg && xdg[0] != '\0')
    {
        dir = std::filesystem::path(xdg) / "imquick";
    }
    else
    {
        const char* home = std::getenv("HOME");
        if (!home || home[0] == '\0')
            throw std::runtime_error("Cannot determine home directory");
        dir = std::filesystem::path(home) / ".config" / "imquick";
    }
    return (dir / "config.json").string();
}

AppConfig loadConfig(const std::string& path)
{
    if (!std::filesystem::exists(path))
        return {};

    std::ifstream ifs(path);
    if (!ifs)
        throw std::runtime_error("Cannot open config file: " + path);

    std::string content((std::istreambuf_iterator<char>(ifs)),
                         std::istreambuf_iterator<char>());

    AppConfig config{};
    auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(config, content);
    if (ec)
    {
        throw std::runtime_error("Failed to parse config file: " + path +
                                 "\n" + glz::format_error(ec, content));
    }
    if (!(config.global.zoomStep > 1.0))
        throw std::runtime_error("Invalid zoom_step in " + path +
                                 ": must be greater than 1");
    return config;
}

void saveConfig(const AppConfig& config, const std::string& path)
{
    std::filesystem::path p(path);
    std::filesystem::path dir = p.parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            throw std::runtime_error("Cannot create config directory: " +
                                     dir.string() + " (" + ec.message() + ")");
    }

    std::string buffer{};
    auto ec = glz::write<glz::opts{.prettify = true}>(config, buffer);
    if (ec)
        throw std::runtime_error("Failed to serialize config to JSON");

    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs)
        throw std::runtime_error("Cannot write config file: " + path);
    ofs << buffer;
}

AppConfig mergeConfigs(const AppConfig& global, const AppConfig& local)
{
    AppConfig merged = global;

    GlobalConfig defaults{};
    if (local.global.defaultInterpolation != defaults.defaultInterpolation)
        merged.global.defaultInterpolation = local.global.defaultInterpolation;
    if (local.global.windowWidth.has_value())
        merged.global.windowWidth = local.global.windowWidth;
    if (local.global.windowHeight.has_value())
        merged.global.windowHeight = local.global.windowHeight;
    if (local.global.zoomStep != defaults.zoomStep)
        merged.global.zoomStep = local.global.zoomStep;
    if (local.global.fitLargeImages != defaults.fitLargeImages)
        merged.global.fitLargeImages = local.global.fitLargeImages;
    if (local.global.lastDirectory.has_value())
        merged.global.lastDirectory = local.global.lastDirectory;

    return merged;
}
