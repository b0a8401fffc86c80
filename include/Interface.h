#pragma once

#include <memory>
#include <string>
#include <vector>

#include <imgui.h>

#include "AppConfig.h"
#include "Dialogs.h"
#include "FilePicker.h"
#include "ViewerSession.h"

struct GLFWwindow;
class ViewManager;

/// All ImGui windows of the application: one viewer window per session,
/// the dialogs attached to each session and the shared file picker.
class Interface {
public:
    Interface(AppConfig& config, ViewManager& viewManager, GLFWwindow* window);
    ~Interface();

    /// Create a session and optionally load a file into it.
    ViewerSession& openSession(const std::string& path = {},
                               LoadOrigin origin = LoadOrigin::CommandLine);

    /// Paths dropped onto the OS window; routed to a session next frame.
    void queueDrop(std::vector<std::string> paths);

    void render();

    /// True once the last session window was closed.
    bool wantsQuit() const { return quitRequested_; }

    size_t sessionCount() const { return sessions_.size(); }

private:
    struct SessionView
    {
        int id = 0;
        ViewerSession session;
        bool open = true;
        bool dockOnFirstShow = false;

        std::unique_ptr<InfoDialog> info;
        std::unique_ptr<ContrastDialog> contrast;
        std::unique_ptr<AboutDialog> about;

        char planeBuf[16] = "0";
        int planeBufFor = -1;  ///< Plane the entry text was last synced to.

        std::string status = "-";
        int scrollDragAxis = -1;  ///< Scrollbar held by the mouse, or -1.
    };

    template <typename D>
    static void openOrFocus(std::unique_ptr<D>& handle, const SessionView& view)
    {
        if (handle)
            handle->focus();
        else
            handle = std::make_unique<D>(view.session, view.id);
    }

    void renderSession(SessionView& view);
    void renderMenuBar(SessionView& view);
    void renderStackControls(SessionView& view);
    void renderViewport(SessionView& view);
    void renderDialogs(SessionView& view);
    void handleKeys(SessionView& view);

    /// Load paths into `target` if it is empty, the rest into new sessions.
    void routePaths(SessionView* target, const std::vector<std::string>& paths, LoadOrigin origin);
    void pasteFromClipboard(SessionView& view);
    void saveSettings(const SessionView& view);
    void closeFinishedSessions();
    SessionView* findSession(int id);

    AppConfig& config_;
    ViewManager& viewManager_;
    GLFWwindow* window_;

    std::vector<std::unique_ptr<SessionView>> sessions_;
    int nextSessionId_ = 1;
    int hoveredSession_ = -1;
    int focusedSession_ = -1;

    std::vector<std::string> pendingDrop_;

    ImGuiID dockspaceId_ = 0;

    FilePicker picker_;
    int pickerTarget_ = -1;

    bool quitRequested_ = false;
};
