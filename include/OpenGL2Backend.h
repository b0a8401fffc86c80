#pragma once

#include "GraphicsBackend.h"

#include <map>

struct GLFWwindow;

/// OpenGL 2 (fixed-function pipeline) backend on imgui_impl_opengl2.
/// Runs on software renderers and over X11 forwarding, which is where a
/// quick image viewer tends to be used.
class OpenGL2Backend : public GraphicsBackend
{
public:
    OpenGL2Backend() = default;
    ~OpenGL2Backend() override = default;

    // --- Lifecycle ---
    void setWindowHints() override;
    void initialize(GLFWwindow* window) override;
    void shutdown() override;
    void waitIdle() override;

    // --- Frame cycle ---
    void beginFrame() override;
    void endFrame() override;

    // --- ImGui integration ---
    void initImGui(GLFWwindow* window) override;
    void shutdownImGui() override;
    void imguiNewFrame() override;

    // --- DPI ---
    float contentScale() const override { return contentScale_; }

    // --- Texture management ---
    std::unique_ptr<Texture> createTexture(int w, int h, const void* data) override;
    void updateTexture(Texture* tex, int w, int h, const void* data) override;
    void destroyTexture(Texture* tex) override;
    void shutdownTextureSystem() override;

private:
    GLFWwindow* window_ = nullptr;
    float contentScale_ = 1.0f;
    int fbWidth_ = 0;
    int fbHeight_ = 0;

    /// ImTextureID -> GL texture name, for cleanup.
    std::map<ImTextureID, unsigned int> glTextures_;
};
