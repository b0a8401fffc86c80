#pragma once

#include "ImageReader.h"

typedef struct tiff TIFF;

/// libtiff reader for single images and multi-page stacks.
///
/// Two strategies exist.  Uncompressed strip images are read scanline by
/// scanline.  Compressed (LZW, Deflate, ...) or tiled images go through
/// libtiff's encoded strip/tile API, which decodes whole blocks at once.
/// ImageReader::open() chooses the strategy from the first directory.
class TiffReader : public ImageReader
{
public:
    enum class Strategy
    {
        Scanline,
        EncodedBlocks
    };

    /// @throws std::runtime_error if the file cannot be opened.
    TiffReader(const std::string& path, Strategy strategy);
    ~TiffReader() override;

    TiffReader(const TiffReader&) = delete;
    TiffReader& operator=(const TiffReader&) = delete;

    int planeCount() const override { return planeCount_; }
    PixelBuffer readPlane(int index) override;
    std::string backendName() const override;

    /// Open `path` just long enough to decide which strategy it needs.
    static Strategy detectStrategy(const std::string& path);

private:
    PixelBuffer readScanlines();
    PixelBuffer readEncodedStrips();
    PixelBuffer readEncodedTiles();

    std::string path_;
    TIFF* tif_ = nullptr;
    Strategy strategy_;
    int planeCount_ = 0;
};
