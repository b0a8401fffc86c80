#include "FileSeries.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::string lowerExtension(const std::string& path)
{
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return ext;
}

void splitWords(std::string_view text, std::vector<std::string>& out)
{
    size_t i = 0;
    while (i < text.size())
    {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
            ++i;
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i])))
            ++i;
        if (i > start)
            out.emplace_back(text.substr(start, i - start));
    }
}

} // namespace

const std::vector<std::string>& supportedExtensions()
{
    static const std::vector<std::string> exts = {
        ".tif", ".tiff", ".gif", ".png", ".jpeg", ".jpg", ".bmp", ".npz", ".itk"};
    return exts;
}

bool isSupportedImage(const std::string& path)
{
    const auto& exts = supportedExtensions();
    return std::find(exts.begin(), exts.end(), lowerExtension(path)) != exts.end();
}

std::vector<std::string> parseDropPayload(std::string_view text)
{
    std::vector<std::string> paths;
    size_t pos = 0;
    while (pos < text.size())
    {
        size_t open = text.find('{', pos);
        if (open == std::string_view::npos)
        {
            splitWords(text.substr(pos), paths);
            break;
        }
        size_t close = text.find('}', open + 1);
        if (close == std::string_view::npos)
        {
            // Unbalanced brace: treat the rest as plain words.
            splitWords(text.substr(pos), paths);
            break;
        }
        splitWords(text.substr(pos, open - pos), paths);
        std::string_view group = text.substr(open + 1, close - open - 1);
        if (!group.empty())
            paths.emplace_back(group);
        pos = close + 1;
    }
    return paths;
}

std::vector<std::string> filterSupported(const std::vector<std::string>& paths)
{
    std::vector<std::string> out;
    std::copy_if(paths.begin(), paths.end(), std::back_inserter(out), isSupportedImage);
    return out;
}

std::string FileSeries::normalizePath(const std::string& path)
{
    std::error_code ec;
    fs::path p = fs::absolute(path, ec);
    if (ec)
        p = fs::path(path);
    return p.lexically_normal().string();
}

void FileSeries::rebuild(const std::string& currentPath)
{
    files_.clear();
    std::error_code ec;
    if (!fs::is_regular_file(currentPath, ec))
        return;

    fs::path dir = fs::path(normalizePath(currentPath)).parent_path();
    for (const auto& entry : fs::directory_iterator(dir, ec))
    {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc))
            continue;
        std::string p = entry.path().string();
        if (isSupportedImage(p))
            files_.push_back(normalizePath(p));
    }
    if (ec)
        std::cerr << "Cannot list " << dir.string() << ": " << ec.message() << "\n";

    std::sort(files_.begin(), files_.end());
}

void FileSeries::clear()
{
    files_.clear();
}

int FileSeries::indexOf(const std::string& path) const
{
    auto it = std::find(files_.begin(), files_.end(), normalizePath(path));
    return it == files_.end() ? -1 : static_cast<int>(it - files_.begin());
}

std::optional<std::string> FileSeries::next(const std::string& currentPath)
{
    return step(currentPath, +1);
}

std::optional<std::string> FileSeries::previous(const std::string& currentPath)
{
    return step(currentPath, -1);
}

std::optional<std::string> FileSeries::step(const std::string& currentPath, int delta)
{
    if (currentPath.empty())
        return std::nullopt;
    if (files_.empty())
        rebuild(currentPath);
    if (files_.size() <= 1)
        return std::nullopt;

    int idx = indexOf(currentPath);
    if (idx < 0)
        return std::nullopt;

    const int n = static_cast<int>(files_.size());
    return files_[static_cast<size_t>((idx + delta + n) % n)];
}
