#pragma once

#include <vector>

#include "ImageReader.h"

/// stb_image reader for PNG, JPEG, BMP and GIF files.
/// Animated GIFs expose every frame as a plane; all other formats have a
/// single plane.  16-bit PNGs keep their full range.
class StbReader : public ImageReader
{
public:
    /// Decodes the whole file up front.
    /// @throws std::runtime_error if the file cannot be read or decoded.
    explicit StbReader(const std::string& path);

    int planeCount() const override { return static_cast<int>(planes_.size()); }
    PixelBuffer readPlane(int index) override;
    std::string backendName() const override { return "stb_image"; }

private:
    void decodeStill(const std::vector<unsigned char>& bytes);
    void decodeAnimatedGif(const std::vector<unsigned char>& bytes);

    std::string path_;
    std::vector<PixelBuffer> planes_;
};
