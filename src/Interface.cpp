#include "Interface.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include "FileSeries.h"
#include "ViewManager.h"

Interface::Interface(AppConfig& config, ViewManager& viewManager, GLFWwindow* window)
    : config_(config), viewManager_(viewManager), window_(window) {}

Interface::~Interface()
{
    for (const auto& view : sessions_)
        viewManager_.release(view->session);
}

ViewerSession& Interface::openSession(const std::string& path, LoadOrigin origin)
{
    auto view = std::make_unique<SessionView>();
    view->id = nextSessionId_++;
    view->dockOnFirstShow = sessions_.empty();

    view->session.setPreferences(config_.global.zoomStep, config_.global.fitLargeImages);
    auto mode = interpolationModeByName(config_.global.defaultInterpolation);
    view->session.setInterpolation(mode.value_or(InterpolationMode::Nearest));

    if (!path.empty())
        view->session.loadFile(path, origin);

    sessions_.push_back(std::move(view));
    return sessions_.back()->session;
}

void Interface::queueDrop(std::vector<std::string> paths)
{
    pendingDrop_.insert(pendingDrop_.end(), paths.begin(), paths.end());
}

Interface::SessionView* Interface::findSession(int id)
{
    for (auto& view : sessions_)
        if (view->id == id)
            return view.get();
    return nullptr;
}

void Interface::render()
{
    dockspaceId_ = ImGui::DockSpaceOverViewport(0, ImGui::GetMainViewport());

    if (!pendingDrop_.empty())
    {
        std::vector<std::string> paths = filterSupported(pendingDrop_);
        if (paths.size() < pendingDrop_.size())
            std::cerr << "Ignored " << (pendingDrop_.size() - paths.size())
                      << " dropped file(s) with an unsupported extension\n";
        pendingDrop_.clear();

        SessionView* target = findSession(hoveredSession_);
        if (!target)
            target = findSession(focusedSession_);
        routePaths(target, paths, LoadOrigin::Drop);
    }

    hoveredSession_ = -1;

    // Sessions opened during this loop are drawn from the next frame on.
    const size_t count = sessions_.size();
    for (size_t i = 0; i < count; ++i)
        renderSession(*sessions_[i]);

    if (auto chosen = picker_.render())
    {
        if (SessionView* target = findSession(pickerTarget_))
            target->session.loadFile(*chosen, LoadOrigin::Picker);
        config_.global.lastDirectory = picker_.directory();
    }

    closeFinishedSessions();
}

void Interface::closeFinishedSessions()
{
    auto it = std::remove_if(sessions_.begin(), sessions_.end(),
        [this](const std::unique_ptr<SessionView>& view) {
            if (view->open)
                return false;
            viewManager_.release(view->session);
            return true;
        });
    sessions_.erase(it, sessions_.end());

    if (sessions_.empty())
        quitRequested_ = true;
}

void Interface::routePaths(SessionView* target, const std::vector<std::string>& paths,
                           LoadOrigin origin)
{
    for (size_t i = 0; i < paths.size(); ++i)
    {
        if (i == 0 && target && !target->session.hasImage())
            target->session.loadFile(paths[i], origin);
        else
            openSession(paths[i], origin);
    }
}

void Interface::pasteFromClipboard(SessionView& view)
{
    const char* text = ImGui::GetClipboardText();
    if (!text || !*text)
        return;
    std::vector<std::string> paths = filterSupported(parseDropPayload(text));
    if (paths.empty())
    {
        std::cerr << "Clipboard holds no supported image paths\n";
        return;
    }
    routePaths(&view, paths, LoadOrigin::Clipboard);
}

void Interface::saveSettings(const SessionView& view)
{
    config_.global.defaultInterpolation =
        std::string(interpolationModeName(view.session.interpolation()));
    int w = 0, h = 0;
    glfwGetWindowSize(window_, &w, &h);
    if (w > 0 && h > 0)
    {
        config_.global.windowWidth = w;
        config_.global.windowHeight = h;
    }
    if (!picker_.directory().empty())
        config_.global.lastDirectory = picker_.directory();

    try
    {
        std::string path = globalConfigPath();
        saveConfig(config_, path);
        std::cerr << "Saved settings to " << path << "\n";
    }
    catch (const std::exception& e)
    {
        std::cerr << "Failed to save settings: " << e.what() << "\n";
    }
}

// --- Session window ---

void Interface::renderSession(SessionView& view)
{
    char title[512];
    std::snprintf(title, sizeof(title), "%s###session_%d",
                  view.session.title().c_str(), view.id);

    if (view.dockOnFirstShow)
    {
        ImGui::SetNextWindowDockID(dockspaceId_, ImGuiCond_FirstUseEver);
    }
    else
    {
        ImVec2 base = ImGui::GetMainViewport()->WorkPos;
        float offset = 30.0f * static_cast<float>(view.id % 8);
        ImGui::SetNextWindowPos(ImVec2(base.x + 40.0f + offset, base.y + 40.0f + offset),
                                ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(500.0f, 500.0f), ImGuiCond_FirstUseEver);
    }

    if (ImGui::Begin(title, &view.open,
                     ImGuiWindowFlags_MenuBar | ImGuiWindowFlags_NoScrollbar |
                     ImGuiWindowFlags_NoScrollWithMouse))
    {
        if (ImGui::IsWindowFocused(ImGuiFocusedFlags_RootAndChildWindows))
            focusedSession_ = view.id;
        if (ImGui::IsWindowHovered(ImGuiHoveredFlags_RootAndChildWindows |
                                   ImGuiHoveredFlags_AllowWhenBlockedByActiveItem))
            hoveredSession_ = view.id;

        renderMenuBar(view);
        renderStackControls(view);
        renderViewport(view);
        ImGui::TextUnformatted(view.status.c_str());

        if (focusedSession_ == view.id)
            handleKeys(view);
    }
    ImGui::End();

    renderDialogs(view);
}

void Interface::renderMenuBar(SessionView& view)
{
    if (!ImGui::BeginMenuBar())
        return;

    ViewerSession& s = view.session;
    const bool loaded = s.hasImage();

    if (ImGui::BeginMenu("File"))
    {
        if (ImGui::MenuItem("Open...", "Ctrl+O"))
        {
            pickerTarget_ = view.id;
            picker_.open(config_.global.lastDirectory.value_or(""));
        }
        if (ImGui::MenuItem("Paste paths", "Ctrl+V"))
            pasteFromClipboard(view);
        ImGui::Separator();
        if (ImGui::MenuItem("Next file", "Right", false, !s.currentPath().empty()))
            s.nextFile();
        if (ImGui::MenuItem("Previous file", "Left", false, !s.currentPath().empty()))
            s.previousFile();
        ImGui::Separator();
        if (ImGui::MenuItem("New window"))
            openSession();
        if (ImGui::MenuItem("Close window"))
            view.open = false;
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu("View"))
    {
        if (ImGui::MenuItem("Fit to window", "F", false, loaded))
            s.fitToWindow();
        if (ImGui::MenuItem("Actual size", "R", false, loaded))
            s.resetToActualSize();
        if (ImGui::MenuItem("Zoom in", "+", false, loaded))
            s.zoomIn();
        if (ImGui::MenuItem("Zoom out", "-", false, loaded))
            s.zoomOut();
        ImGui::Separator();
        if (ImGui::BeginMenu("Interpolation"))
        {
            for (int m = 0; m < interpolationModeCount(); ++m)
            {
                auto mode = static_cast<InterpolationMode>(m);
                std::string name(interpolationModeName(mode));
                if (ImGui::MenuItem(name.c_str(), nullptr, s.interpolation() == mode))
                    s.setInterpolation(mode);
            }
            ImGui::EndMenu();
        }
        ImGui::Separator();
        if (ImGui::MenuItem("Save settings"))
            saveSettings(view);
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu("Image"))
    {
        if (ImGui::MenuItem("Info..."))
            openOrFocus(view.info, view);
        if (ImGui::MenuItem("Adjust contrast..."))
            openOrFocus(view.contrast, view);
        if (ImGui::MenuItem("Auto contrast", "A", false, loaded))
            s.autoContrast();
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu("Help"))
    {
        if (ImGui::MenuItem("About ImQuick"))
            openOrFocus(view.about, view);
        ImGui::EndMenu();
    }

    ImGui::EndMenuBar();
}

void Interface::renderStackControls(SessionView& view)
{
    ViewerSession& s = view.session;
    if (!s.hasImage() || s.stackMode() != StackMode::MultiPlane)
        return;

    if (view.planeBufFor != s.plane())
    {
        std::snprintf(view.planeBuf, sizeof(view.planeBuf), "%d", s.plane());
        view.planeBufFor = s.plane();
    }

    const float entryWidth = ImGui::CalcTextSize("00000").x + ImGui::GetStyle().FramePadding.x * 2.0f;

    int plane = s.plane();
    ImGui::SetNextItemWidth(ImGui::GetContentRegionAvail().x - entryWidth -
                            ImGui::GetStyle().ItemSpacing.x);
    if (ImGui::SliderInt("##plane", &plane, 0, s.maxPlane()))
        s.setPlane(plane);

    ImGui::SameLine();
    ImGui::SetNextItemWidth(entryWidth);
    bool submitted = ImGui::InputText("##planeEntry", view.planeBuf, sizeof(view.planeBuf),
                                      ImGuiInputTextFlags_EnterReturnsTrue |
                                      ImGuiInputTextFlags_AutoSelectAll);
    if (submitted)
    {
        if (!s.submitPlaneEntry(view.planeBuf))
            std::cerr << "Rejected plane '" << view.planeBuf << "' (0-" << s.maxPlane() << ")\n";
        view.planeBufFor = -1;  // resync, reverting rejected text
    }
    else if (ImGui::IsItemDeactivated())
    {
        view.planeBufFor = -1;
    }
}

void Interface::renderViewport(SessionView& view)
{
    ViewerSession& s = view.session;
    const float statusHeight = ImGui::GetTextLineHeightWithSpacing();

    ImGui::BeginChild("##viewport", ImVec2(0.0f, -statusHeight), ImGuiChildFlags_Borders,
                      ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse |
                      ImGuiWindowFlags_NoMove);

    ImVec2 pos = ImGui::GetCursorScreenPos();
    ImVec2 size = ImGui::GetContentRegionAvail();
    if (size.x < 1.0f || size.y < 1.0f)
    {
        ImGui::EndChild();
        return;
    }
    s.resizeContainer(static_cast<int>(size.x), static_cast<int>(size.y));

    ImGui::InvisibleButton("##canvas", size,
                           ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonMiddle);
    const bool hovered = ImGui::IsItemHovered();
    const bool active = ImGui::IsItemActive();
    ImGuiIO& io = ImGui::GetIO();
    const float barThickness = 8.0f;

    if (!active)
        view.scrollDragAxis = -1;
    else if (ImGui::IsItemActivated() && s.hasImage())
    {
        // A press on a visible scrollbar grabs it instead of the image.
        for (int axis = 0; axis < 2; ++axis)
        {
            glm::dvec2 f = s.viewport().scrollFraction(axis);
            if (f.x <= 0.0 && f.y >= 1.0)
                continue;
            bool onBar = axis == 0 ? io.MousePos.y >= pos.y + size.y - barThickness
                                   : io.MousePos.x >= pos.x + size.x - barThickness;
            if (onBar)
            {
                view.scrollDragAxis = axis;
                break;
            }
        }
    }

    if (active && view.scrollDragAxis >= 0)
    {
        const int axis = view.scrollDragAxis;
        double delta = axis == 0 ? io.MouseDelta.x / size.x : io.MouseDelta.y / size.y;
        if (delta != 0.0)
            s.scrollToFraction(axis, s.viewport().scrollFraction(axis).x + delta);
    }
    else if (active && (ImGui::IsMouseDragging(ImGuiMouseButton_Left, 0.0f) ||
                        ImGui::IsMouseDragging(ImGuiMouseButton_Middle, 0.0f)))
    {
        // The image follows the cursor.
        s.panBy(-io.MouseDelta.x, -io.MouseDelta.y);
    }

    const double mx = io.MousePos.x - pos.x;
    const double my = io.MousePos.y - pos.y;

    if (hovered && io.MouseWheel != 0.0f)
    {
        double step = s.viewport().zoomStep();
        s.zoomAtScreen(mx, my, io.MouseWheel > 0.0f ? step : 1.0 / step);
    }

    ImDrawList* dl = ImGui::GetWindowDrawList();
    ImVec2 end(pos.x + size.x, pos.y + size.y);
    dl->PushClipRect(pos, end, true);
    dl->AddRectFilled(pos, end, IM_COL32(20, 20, 20, 255));

    if (const Texture* tex = viewManager_.updateTileTexture(s))
    {
        const TilePlan* plan = viewManager_.tilePlan(s);
        const glm::dvec2& origin = s.viewport().scrollOrigin();
        ImVec2 p0(pos.x + static_cast<float>(plan->anchor.x - origin.x),
                  pos.y + static_cast<float>(plan->anchor.y - origin.y));
        ImVec2 p1(p0.x + static_cast<float>(tex->width), p0.y + static_cast<float>(tex->height));
        dl->AddImage(tex->id, p0, p1);
    }

    if (!s.hasImage())
    {
        const char* text = s.placeholder().c_str();
        ImVec2 ts = ImGui::CalcTextSize(text);
        dl->AddText(ImVec2(pos.x + (size.x - ts.x) * 0.5f, pos.y + (size.y - ts.y) * 0.5f),
                    IM_COL32(200, 200, 200, 255), text);
    }
    else
    {
        // Scrollbars; hidden when the whole axis is visible.
        for (int axis = 0; axis < 2; ++axis)
        {
            glm::dvec2 f = s.viewport().scrollFraction(axis);
            if (f.x <= 0.0 && f.y >= 1.0)
                continue;
            if (axis == 0)
            {
                float y0 = end.y - barThickness;
                dl->AddRectFilled(ImVec2(pos.x, y0), end, IM_COL32(60, 60, 60, 160));
                dl->AddRectFilled(ImVec2(pos.x + static_cast<float>(f.x) * size.x, y0),
                                  ImVec2(pos.x + static_cast<float>(f.y) * size.x, end.y),
                                  IM_COL32(170, 170, 170, 200));
            }
            else
            {
                float x0 = end.x - barThickness;
                dl->AddRectFilled(ImVec2(x0, pos.y), end, IM_COL32(60, 60, 60, 160));
                dl->AddRectFilled(ImVec2(x0, pos.y + static_cast<float>(f.x) * size.y),
                                  ImVec2(end.x, pos.y + static_cast<float>(f.y) * size.y),
                                  IM_COL32(170, 170, 170, 200));
            }
        }
    }

    dl->PopClipRect();

    view.status = hovered ? s.statusText(mx, my) : std::string("-");

    ImGui::EndChild();
}

void Interface::renderDialogs(SessionView& view)
{
    if (view.info)
    {
        view.info->render();
        if (!view.info->isOpen())
            view.info.reset();
    }

    if (view.contrast)
    {
        ContrastEdit edit = view.contrast->render();
        if (edit.channel)
            view.session.selectLevelsChannel(*edit.channel);
        if (edit.min)
            view.session.setLevelMin(*edit.min);
        if (edit.max)
            view.session.setLevelMax(*edit.max);
        if (edit.autoContrast)
            view.session.autoContrast();
        if (!view.contrast->isOpen())
            view.contrast.reset();
    }

    if (view.about)
    {
        view.about->render();
        if (!view.about->isOpen())
            view.about.reset();
    }
}

void Interface::handleKeys(SessionView& view)
{
    ImGuiIO& io = ImGui::GetIO();
    if (io.WantTextInput || picker_.isOpen())
        return;

    ViewerSession& s = view.session;

    if (io.KeyCtrl)
    {
        if (ImGui::IsKeyPressed(ImGuiKey_O, false))
        {
            pickerTarget_ = view.id;
            picker_.open(config_.global.lastDirectory.value_or(""));
        }
        if (ImGui::IsKeyPressed(ImGuiKey_V, false))
            pasteFromClipboard(view);
        return;
    }

    if (ImGui::IsKeyPressed(ImGuiKey_A, false))
        s.autoContrast();
    if (ImGui::IsKeyPressed(ImGuiKey_RightArrow))
        s.nextFile();
    if (ImGui::IsKeyPressed(ImGuiKey_LeftArrow))
        s.previousFile();
    if (ImGui::IsKeyPressed(ImGuiKey_Equal) || ImGui::IsKeyPressed(ImGuiKey_KeypadAdd))
        s.zoomIn();
    if (ImGui::IsKeyPressed(ImGuiKey_Minus) || ImGui::IsKeyPressed(ImGuiKey_KeypadSubtract))
        s.zoomOut();
    if (ImGui::IsKeyPressed(ImGuiKey_R, false))
        s.resetToActualSize();
    if (ImGui::IsKeyPressed(ImGuiKey_F, false))
        s.fitToWindow();
}
