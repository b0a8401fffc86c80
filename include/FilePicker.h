#pragma once

#include <optional>
#include <string>
#include <vector>

/// Modal ImGui directory browser listing sub-directories and supported
/// image files.
class FilePicker {
public:
    /// Show the picker starting in `directory` (falls back to the working
    /// directory when it does not exist).
    void open(const std::string& directory);

    /// Draw the picker if open.  Returns the chosen file in the frame the
    /// user confirms it.
    std::optional<std::string> render();

    bool isOpen() const { return open_; }
    const std::string& directory() const { return directory_; }

private:
    struct Entry
    {
        std::string name;
        bool isDirectory = false;
    };

    void changeDirectory(const std::string& dir);

    std::string directory_;
    std::vector<Entry> entries_;
    std::string error_;
    int selected_ = -1;
    bool open_ = false;
    bool openRequested_ = false;
    char pathBuf_[1024] = "";
};
