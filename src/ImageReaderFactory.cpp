#include "ImageReader.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

#include "NpzReader.h"
#include "StbReader.h"
#include "TiffReader.h"

std::unique_ptr<ImageReader> ImageReader::open(const std::string& path)
{
    if (!std::filesystem::is_regular_file(path))
        throw std::runtime_error("No such file: " + path);

    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return std::tolower(c); });

    if (ext == ".tif" || ext == ".tiff")
        return std::make_unique<TiffReader>(path, TiffReader::detectStrategy(path));
    if (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".gif")
        return std::make_unique<StbReader>(path);
    if (ext == ".npz")
        return std::make_unique<NpzReader>(path);

    throw std::runtime_error("Unsupported image format '" + ext + "': " + path);
}
