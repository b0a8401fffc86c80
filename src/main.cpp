#include <imgui.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include "AppConfig.h"
#include "GraphicsBackend.h"
#include "Interface.h"
#include "TileRenderer.h"
#include "ViewManager.h"

namespace {

constexpr int kDefaultWindowSize = 500;

void printUsage()
{
    std::cerr << "Usage: imquick [options] [image ...]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>   Load config from <path>\n"
              << "  -i, --interp <mode>   Interpolation for new windows\n"
              << "                        (Nearest, Bilinear, Bicubic, Lanczos)\n"
              << "  -h, --help            Show this help message\n"
              << "\nEach image opens in its own window.  Supported: .tif .tiff .png\n"
              << ".jpg .jpeg .bmp .gif .npz\n";
}

void glfwErrorCallback(int code, const char* description)
{
    std::cerr << "[glfw] error " << code << ": " << description << "\n";
}

} // namespace

int main(int argc, char** argv)
{
    try
    {

    // --- Parse CLI arguments ---
    std::string cliConfigPath;
    std::optional<std::string> cliInterpolation;
    std::vector<std::string> imageFiles;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];

        if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            cliConfigPath = argv[++i];
            continue;
        }

        if ((arg == "--interp" || arg == "-i") && i + 1 < argc)
        {
            std::string name = argv[++i];
            auto mode = interpolationModeByName(name);
            if (!mode)
            {
                std::cerr << "Unknown interpolation mode: " << name << "\n"
                          << "Available modes:";
                for (int m = 0; m < interpolationModeCount(); ++m)
                    std::cerr << " " << interpolationModeName(static_cast<InterpolationMode>(m));
                std::cerr << "\n";
                return 1;
            }
            cliInterpolation = std::string(interpolationModeName(*mode));
            continue;
        }

        if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }

        if (arg.size() > 1 && arg[0] == '-')
        {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage();
            return 1;
        }

        imageFiles.emplace_back(arg);
    }

    // --- Load and merge configs ---
    AppConfig globalCfg;
    try { globalCfg = loadConfig(globalConfigPath()); }
    catch (const std::exception& e)
    {
        std::cerr << "Warning: " << e.what() << "\n";
    }

    // --config takes priority, else ./imquick.json
    std::string localConfigPath = cliConfigPath;
    if (localConfigPath.empty() && std::filesystem::exists("imquick.json"))
        localConfigPath = "imquick.json";

    AppConfig localCfg;
    if (!localConfigPath.empty())
    {
        try { localCfg = loadConfig(localConfigPath); }
        catch (const std::exception& e)
        {
            std::cerr << "Warning: " << e.what() << "\n";
        }
    }

    AppConfig config = mergeConfigs(globalCfg, localCfg);
    if (cliInterpolation)
        config.global.defaultInterpolation = *cliInterpolation;
    if (!interpolationModeByName(config.global.defaultInterpolation))
    {
        std::cerr << "Warning: unknown default_interpolation '"
                  << config.global.defaultInterpolation << "', using Nearest\n";
        config.global.defaultInterpolation = "Nearest";
    }

    // --- Setup GLFW ---
    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit())
    {
        std::cerr << "Failed to initialize GLFW\n";
        return 1;
    }

    auto backend = GraphicsBackend::create();
    backend->setWindowHints();
    glfwWindowHint(GLFW_SCALE_TO_MONITOR, GLFW_TRUE);

    float initScale = 1.0f;
    int monWorkX = 0, monWorkY = 0, monWorkW = 1280, monWorkH = 720;
    {
        float sx = 1.0f, sy = 1.0f;
        GLFWmonitor* primary = glfwGetPrimaryMonitor();
        if (primary)
        {
            glfwGetMonitorContentScale(primary, &sx, &sy);
            glfwGetMonitorWorkarea(primary, &monWorkX, &monWorkY, &monWorkW, &monWorkH);
        }
        initScale = (sx > sy) ? sx : sy;
        if (initScale < 1.0f) initScale = 1.0f;
    }

    int initW = config.global.windowWidth.value_or(static_cast<int>(kDefaultWindowSize * initScale));
    int initH = config.global.windowHeight.value_or(static_cast<int>(kDefaultWindowSize * initScale));

    // Clamp to 90% of the monitor work area
    int maxW = static_cast<int>(monWorkW * 0.9f);
    int maxH = static_cast<int>(monWorkH * 0.9f);
    if (initW > maxW) initW = maxW;
    if (initH > maxH) initH = maxH;

    GLFWwindow* window = glfwCreateWindow(initW, initH, "ImQuick", nullptr, nullptr);
    if (!window)
    {
        std::cerr << "Failed to create GLFW window.\n";
        glfwTerminate();
        return 1;
    }

    backend->initialize(window);
    backend->initImGui(window);

    {
        ViewManager viewManager(*backend);
        Interface ui(config, viewManager, window);

        if (imageFiles.empty())
        {
            ui.openSession();
        }
        else
        {
            for (const auto& path : imageFiles)
                ui.openSession(path, LoadOrigin::CommandLine);
        }

        glfwSetWindowUserPointer(window, &ui);
        glfwSetDropCallback(window, [](GLFWwindow* w, int count, const char** paths) {
            auto* iface = static_cast<Interface*>(glfwGetWindowUserPointer(w));
            if (iface && count > 0 && paths)
                iface->queueDrop(std::vector<std::string>(paths, paths + count));
        });

        // Main loop
        while (!glfwWindowShouldClose(window))
        {
            glfwPollEvents();
            if (glfwGetWindowAttrib(window, GLFW_ICONIFIED))
            {
                glfwWaitEventsTimeout(0.1);
                continue;
            }

            backend->beginFrame();
            backend->imguiNewFrame();
            ImGui::NewFrame();

            ui.render();
            if (ui.wantsQuit())
                glfwSetWindowShouldClose(window, GLFW_TRUE);

            ImGui::Render();
            backend->endFrame();
        }

        glfwSetDropCallback(window, nullptr);
        glfwSetWindowUserPointer(window, nullptr);

        backend->waitIdle();
        viewManager.destroyAllTextures();
    }

    backend->shutdownTextureSystem();
    backend->shutdownImGui();
    backend->shutdown();
    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;

    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
