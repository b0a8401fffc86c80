#include "Dialogs.h"

#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>

#include <imgui.h>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <opencv2/core/version.hpp>
#include <tiffio.h>
#include <zlib.h>

#include "ViewerSession.h"

#ifndef IMQUICK_VERSION
#define IMQUICK_VERSION "dev"
#endif

namespace {

std::string fileNameOf(const ViewerSession& session)
{
    if (session.currentPath().empty())
        return "(no file)";
    return std::filesystem::path(session.currentPath()).filename().string();
}

std::string formatValue(double v, bool integer)
{
    char buf[64];
    if (integer)
        std::snprintf(buf, sizeof(buf), "%.0f", v);
    else
        std::snprintf(buf, sizeof(buf), "%g", v);
    return buf;
}

} // namespace

// --- Dialog ---

bool Dialog::begin(const char* title, float width)
{
    char id[96];
    std::snprintf(id, sizeof(id), "%s###%s_%d", title, title, sessionId_);

    if (focusRequested_)
    {
        ImGui::SetNextWindowFocus();
        focusRequested_ = false;
    }
    ImGui::SetNextWindowSize(ImVec2(width, 0.0f), ImGuiCond_FirstUseEver);
    return ImGui::Begin(id, &open_,
                        ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_AlwaysAutoResize |
                        ImGuiWindowFlags_NoDocking);
}

void Dialog::end()
{
    ImGui::End();
}

// --- InfoDialog ---

void InfoDialog::render()
{
    if (begin("Info", 250.0f))
    {
        ImGui::TextUnformatted(fileNameOf(session_).c_str());
        ImGui::Separator();

        if (!session_.hasImage())
        {
            ImGui::TextDisabled("No image loaded");
        }
        else
        {
            ImageStatistics s = session_.imageStatistics();
            bool integer = sampleTypeIsInteger(session_.pixels().sampleType);
            ImGui::Text("Format: %s", s.sampleType.c_str());
            ImGui::Text("Width: %dpx", s.width);
            ImGui::Text("Height: %dpx", s.height);
            if (session_.pixels().hasChannelAxis)
                ImGui::Text("Channels: %d", s.channels);
            if (s.planeCount > 1)
                ImGui::Text("Plane: %d of %d", s.planeIndex, s.planeCount - 1);
            ImGui::Text("Minimum: %s", formatValue(s.min, integer).c_str());
            ImGui::Text("Maximum: %s", formatValue(s.max, integer).c_str());
            ImGui::Text("Unique Values: %zu", s.uniqueValues);
            ImGui::TextDisabled("Decoder: %s", s.backend.c_str());
        }
    }
    end();
}

// --- ContrastDialog ---

ContrastEdit ContrastDialog::render()
{
    ContrastEdit edit;
    if (begin("Adjust Contrast", 220.0f))
    {
        ImGui::TextUnformatted(fileNameOf(session_).c_str());
        ImGui::Separator();

        const LevelsWindow& levels = session_.levels();

        std::string current = levels.selected() < 0
            ? std::string("All")
            : "Channel " + std::to_string(levels.selected());
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::BeginCombo("##channel", current.c_str()))
        {
            if (ImGui::Selectable("All", levels.selected() < 0))
                edit.channel = -1;
            for (int k = 0; k < levels.channelCount(); ++k)
            {
                std::string label = "Channel " + std::to_string(k);
                if (ImGui::Selectable(label.c_str(), levels.selected() == k))
                    edit.channel = k;
            }
            ImGui::EndCombo();
        }

        int lo = levels.active().min;
        int hi = levels.active().max;
        if (ImGui::SliderInt("Min", &lo, 0, 255))
            edit.min = lo;
        if (ImGui::SliderInt("Max", &hi, 0, 255))
            edit.max = hi;

        if (ImGui::Button("Auto"))
            edit.autoContrast = true;
        if (ImGui::IsItemHovered())
            ImGui::SetTooltip("Stretch the full display range over the image (a)");
    }
    end();
    return edit;
}

// --- AboutDialog ---

void AboutDialog::render()
{
    if (begin("About ImQuick", 280.0f))
    {
        ImGui::TextUnformatted("ImQuick");
        ImGui::Text("Version %s", IMQUICK_VERSION);
        ImGui::Spacing();
        ImGui::TextWrapped("A quick viewer for scientific images: TIFF stacks, "
                           "PNG, GIF, BMP, JPEG and NumPy .npz archives.");
        ImGui::Separator();
        ImGui::TextDisabled("%s", libraryVersions().c_str());
    }
    end();
}

std::string libraryVersions()
{
    std::ostringstream os;
    os << "Dear ImGui " << IMGUI_VERSION << "\n"
       << "GLFW " << glfwGetVersionString() << "\n"
       << "OpenCV " << CV_VERSION << "\n"
       << "zlib " << zlibVersion() << "\n";

    // First line of the libtiff banner holds the version.
    std::string tiff = TIFFGetVersion();
    auto nl = tiff.find('\n');
    os << tiff.substr(0, nl);
    return os.str();
}
