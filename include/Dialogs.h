#pragma once

#include <optional>
#include <string>

class ViewerSession;

/// Changes requested by the contrast dialog during one frame.  The caller
/// applies them through the session API.
struct ContrastEdit
{
    std::optional<int> channel;  ///< -1 = All
    std::optional<int> min;
    std::optional<int> max;
    bool autoContrast = false;
};

/// Small satellite window bound to one session.  At most one instance per
/// kind and session exists; re-opening focuses it instead.
class Dialog {
public:
    Dialog(const ViewerSession& session, int sessionId)
        : session_(session), sessionId_(sessionId) {}
    virtual ~Dialog() = default;

    bool isOpen() const { return open_; }
    void focus() { focusRequested_ = true; }

protected:
    /// ImGui::Begin with a per-session id; honours pending focus requests.
    bool begin(const char* title, float width);
    void end();

    const ViewerSession& session_;
    int sessionId_;
    bool open_ = true;
    bool focusRequested_ = true;
};

/// Image statistics: type, shape, value range, unique values.
class InfoDialog : public Dialog {
public:
    using Dialog::Dialog;
    void render();
};

/// Channel selector, min / max sliders and auto-contrast.
class ContrastDialog : public Dialog {
public:
    using Dialog::Dialog;
    ContrastEdit render();
};

/// Name, version and library versions.
class AboutDialog : public Dialog {
public:
    using Dialog::Dialog;
    void render();
};

/// Library versions compiled in, one per line.
std::string libraryVersions();
