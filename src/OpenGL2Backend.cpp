#include "OpenGL2Backend.h"

#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl2.h>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include <GL/gl.h>

#include <cstdint>
#include <iostream>

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void OpenGL2Backend::setWindowHints()
{
    glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_API);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
}

void OpenGL2Backend::initialize(GLFWwindow* window)
{
    window_ = window;

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    float xscale = 1.0f, yscale = 1.0f;
    glfwGetWindowContentScale(window, &xscale, &yscale);
    contentScale_ = (xscale > yscale) ? xscale : yscale;
    if (contentScale_ < 1.0f)
        contentScale_ = 1.0f;

    glfwGetFramebufferSize(window, &fbWidth_, &fbHeight_);

    // Tile rows are tightly packed RGBA.
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);

    std::cerr << "[opengl2] " << glGetString(GL_RENDERER)
              << " (" << glGetString(GL_VERSION) << ")\n";
}

void OpenGL2Backend::shutdown()
{
    // The context goes away with the GLFW window.
    window_ = nullptr;
}

void OpenGL2Backend::waitIdle()
{
    glFinish();
}

// ---------------------------------------------------------------------------
// Frame cycle
// ---------------------------------------------------------------------------

void OpenGL2Backend::beginFrame()
{
    glfwGetFramebufferSize(window_, &fbWidth_, &fbHeight_);
    glViewport(0, 0, fbWidth_, fbHeight_);
}

void OpenGL2Backend::endFrame()
{
    ImDrawData* drawData = ImGui::GetDrawData();
    if (!drawData)
        return;

    glViewport(0, 0, fbWidth_, fbHeight_);
    // Same grey as the empty viewport background.
    glClearColor(20.0f / 255.0f, 20.0f / 255.0f, 20.0f / 255.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    ImGui_ImplOpenGL2_RenderDrawData(drawData);

    glfwSwapBuffers(window_);
}

// ---------------------------------------------------------------------------
// ImGui integration
// ---------------------------------------------------------------------------

void OpenGL2Backend::initImGui(GLFWwindow* window)
{
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
    io.IniFilename = nullptr;  // window layout is not persisted

    ImGui::StyleColorsDark();

    if (contentScale_ > 1.0f)
        ImGui::GetStyle().ScaleAllSizes(contentScale_);

    ImFontConfig fontCfg;
    fontCfg.SizePixels = 13.0f * contentScale_;
    fontCfg.OversampleH = 1;
    fontCfg.OversampleV = 1;
    fontCfg.PixelSnapH = true;
    io.Fonts->AddFontDefault(&fontCfg);

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL2_Init();
}

void OpenGL2Backend::shutdownImGui()
{
    ImGui_ImplOpenGL2_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
}

void OpenGL2Backend::imguiNewFrame()
{
    ImGui_ImplOpenGL2_NewFrame();
    ImGui_ImplGlfw_NewFrame();
}

// ---------------------------------------------------------------------------
// Texture management
// ---------------------------------------------------------------------------

std::unique_ptr<Texture> OpenGL2Backend::createTexture(int w, int h, const void* data)
{
    GLuint texId = 0;
    glGenTextures(1, &texId);
    glBindTexture(GL_TEXTURE_2D, texId);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, w, h, 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, data);
    glBindTexture(GL_TEXTURE_2D, 0);

    auto tex = std::make_unique<Texture>();
    tex->id     = static_cast<ImTextureID>(static_cast<intptr_t>(texId));
    tex->width  = w;
    tex->height = h;

    glTextures_[tex->id] = texId;
    return tex;
}

void OpenGL2Backend::updateTexture(Texture* tex, int w, int h, const void* data)
{
    if (!tex) return;
    auto it = glTextures_.find(tex->id);
    if (it == glTextures_.end())
    {
        std::cerr << "[opengl2] update of unknown texture ignored\n";
        return;
    }

    glBindTexture(GL_TEXTURE_2D, it->second);
    if (w == tex->width && h == tex->height)
    {
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, w, h, GL_RGBA, GL_UNSIGNED_BYTE, data);
    }
    else
    {
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, w, h, 0, GL_RGBA, GL_UNSIGNED_BYTE, data);
        tex->width = w;
        tex->height = h;
    }
    glBindTexture(GL_TEXTURE_2D, 0);
}

void OpenGL2Backend::destroyTexture(Texture* tex)
{
    if (!tex) return;
    auto it = glTextures_.find(tex->id);
    if (it != glTextures_.end())
    {
        glDeleteTextures(1, &it->second);
        glTextures_.erase(it);
    }
    tex->id = 0;
}

void OpenGL2Backend::shutdownTextureSystem()
{
    for (auto& pair : glTextures_)
        glDeleteTextures(1, &pair.second);
    glTextures_.clear();
}
