#pragma once

#include <memory>

#include <imgui.h>  // for ImTextureID

struct GLFWwindow;

/// Backend-agnostic texture handle.
/// `id` is only meaningful to the backend that created it; application code
/// passes it to ImGui::Image() and nothing else.
struct Texture
{
    ImTextureID id = 0;
    int width  = 0;
    int height = 0;
};

/// Abstract graphics backend interface.
/// Owns GPU setup, the frame cycle, the ImGui renderer binding and the
/// textures the image viewports draw from.
class GraphicsBackend
{
public:
    virtual ~GraphicsBackend() = default;

    // --- Lifecycle ---

    /// GLFW window hints required before glfwCreateWindow().
    virtual void setWindowHints() = 0;

    /// Bind the backend to a freshly created window.
    /// @throws std::runtime_error on failure.
    virtual void initialize(GLFWwindow* window) = 0;

    virtual void shutdown() = 0;

    /// Wait for the GPU to finish pending work before releasing textures.
    virtual void waitIdle() = 0;

    // --- Frame cycle ---

    virtual void beginFrame() = 0;

    /// Render ImGui draw data and present.  Call after ImGui::Render().
    virtual void endFrame() = 0;

    // --- ImGui integration ---

    virtual void initImGui(GLFWwindow* window) = 0;
    virtual void shutdownImGui() = 0;
    virtual void imguiNewFrame() = 0;

    /// Window content scale (1.0 on standard displays, 2.0 on HiDPI).
    virtual float contentScale() const = 0;

    // --- Texture management ---

    /// Create a texture from w*h*4 bytes of RGBA8 data.  Texels are sampled
    /// with nearest filtering: tiles arrive already resampled to screen size.
    virtual std::unique_ptr<Texture> createTexture(int w, int h, const void* data) = 0;

    /// Replace the contents of a texture.  The visible tile changes size
    /// with every zoom step, so a different w/h re-specifies the storage in
    /// place and keeps tex->id stable.
    virtual void updateTexture(Texture* tex, int w, int h, const void* data) = 0;

    /// Release the GPU side of a texture; tex->id becomes invalid.
    virtual void destroyTexture(Texture* tex) = 0;

    /// Release every remaining texture.  Called once before shutdownImGui().
    virtual void shutdownTextureSystem() = 0;

    // --- Factory ---

    /// Create the backend compiled into this build.
    /// @throws std::runtime_error if none is available.
    static std::unique_ptr<GraphicsBackend> create();
};
