#include "FilePicker.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <imgui.h>

#include "FileSeries.h"

namespace fs = std::filesystem;

void FilePicker::open(const std::string& directory)
{
    std::error_code ec;
    if (!directory.empty() && fs::is_directory(directory, ec))
        changeDirectory(directory);
    else
        changeDirectory(fs::current_path(ec).string());
    openRequested_ = true;
    open_ = true;
}

void FilePicker::changeDirectory(const std::string& dir)
{
    directory_ = FileSeries::normalizePath(dir);
    entries_.clear();
    error_.clear();
    selected_ = -1;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec))
    {
        std::error_code entryEc;
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.')
            continue;
        if (entry.is_directory(entryEc))
            entries_.push_back({name, true});
        else if (entry.is_regular_file(entryEc) && isSupportedImage(name))
            entries_.push_back({name, false});
    }
    if (ec)
        error_ = ec.message();

    std::sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) {
        if (a.isDirectory != b.isDirectory)
            return a.isDirectory;
        return a.name < b.name;
    });

    std::snprintf(pathBuf_, sizeof(pathBuf_), "%s", directory_.c_str());
}

std::optional<std::string> FilePicker::render()
{
    if (openRequested_)
    {
        ImGui::OpenPopup("Open image");
        openRequested_ = false;
    }
    if (!open_)
        return std::nullopt;

    std::optional<std::string> chosen;
    ImGui::SetNextWindowSize(ImVec2(520.0f, 420.0f), ImGuiCond_Appearing);
    if (ImGui::BeginPopupModal("Open image", &open_))
    {
        ImGui::SetNextItemWidth(-60.0f);
        if (ImGui::InputText("##path", pathBuf_, sizeof(pathBuf_),
                             ImGuiInputTextFlags_EnterReturnsTrue))
        {
            std::error_code ec;
            if (fs::is_directory(pathBuf_, ec))
                changeDirectory(pathBuf_);
            else if (fs::is_regular_file(pathBuf_, ec))
                chosen = FileSeries::normalizePath(pathBuf_);
            else
                error_ = std::string("No such file or directory: ") + pathBuf_;
        }
        ImGui::SameLine();
        if (ImGui::Button("Up"))
            changeDirectory(fs::path(directory_).parent_path().string());

        if (!error_.empty())
            ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.4f, 1.0f), "%s", error_.c_str());

        float footer = ImGui::GetFrameHeightWithSpacing();
        if (ImGui::BeginChild("##entries", ImVec2(0.0f, -footer), ImGuiChildFlags_Borders))
        {
            std::string enterDir;
            for (int i = 0; i < static_cast<int>(entries_.size()); ++i)
            {
                const Entry& e = entries_[i];
                std::string label = e.isDirectory ? "[" + e.name + "]" : e.name;
                if (ImGui::Selectable(label.c_str(), selected_ == i,
                                      ImGuiSelectableFlags_AllowDoubleClick))
                {
                    selected_ = i;
                    if (ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left))
                    {
                        if (e.isDirectory)
                            enterDir = (fs::path(directory_) / e.name).string();
                        else
                            chosen = (fs::path(directory_) / e.name).string();
                    }
                }
            }
            if (!enterDir.empty())
                changeDirectory(enterDir);
        }
        ImGui::EndChild();

        bool fileSelected = selected_ >= 0 && selected_ < static_cast<int>(entries_.size()) &&
                            !entries_[selected_].isDirectory;
        ImGui::BeginDisabled(!fileSelected);
        if (ImGui::Button("Open") && fileSelected)
            chosen = (fs::path(directory_) / entries_[selected_].name).string();
        ImGui::EndDisabled();
        ImGui::SameLine();
        if (ImGui::Button("Cancel"))
            open_ = false;

        if (chosen)
            open_ = false;
        if (!open_)
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
    else
    {
        open_ = false;
    }
    return chosen;
}
