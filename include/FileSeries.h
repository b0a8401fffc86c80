#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// Lower-case extensions (with dot) that the viewer lists and tries to open.
const std::vector<std::string>& supportedExtensions();

/// Case-insensitive extension check against supportedExtensions().
bool isSupportedImage(const std::string& path);

/// Split a drag-and-drop / clipboard payload into paths.  Brace groups
/// `{...}` hold paths containing spaces; the rest is split on whitespace.
/// Empty fragments are dropped.
std::vector<std::string> parseDropPayload(std::string_view text);

/// Keep only paths with a supported extension, preserving order.
std::vector<std::string> filterSupported(const std::vector<std::string>& paths);

/// Ordered list of sibling image files used for next / previous browsing.
///
/// The list is built lazily from the directory of the current file the
/// first time navigation is requested, and reused until cleared.
class FileSeries {
public:
    /// Re-scan the directory of `currentPath`.  Leaves the series empty if
    /// the file no longer exists.
    void rebuild(const std::string& currentPath);

    void clear();

    bool empty() const { return files_.empty(); }
    size_t size() const { return files_.size(); }

    /// Index of a path in the series, or -1.
    int indexOf(const std::string& path) const;

    /// Following / preceding file with wrap-around.  Builds the list on
    /// first use.  nullopt when the series has fewer than two entries or
    /// the current file is not part of it.
    std::optional<std::string> next(const std::string& currentPath);
    std::optional<std::string> previous(const std::string& currentPath);

    /// Absolute, lexically normal form used for all comparisons.
    static std::string normalizePath(const std::string& path);

private:
    std::optional<std::string> step(const std::string& currentPath, int delta);

    std::vector<std::string> files_;
};
