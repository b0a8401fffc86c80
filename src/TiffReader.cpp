#include "TiffReader.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <tiffio.h>

namespace {

struct TiffLayout
{
    uint32_t width = 0;
    uint32_t height = 0;
    uint16_t samplesPerPixel = 1;
    uint16_t bitsPerSample = 8;
    uint16_t sampleFormat = SAMPLEFORMAT_UINT;
    uint16_t planarConfig = PLANARCONFIG_CONTIG;
    uint16_t compression = COMPRESSION_NONE;
};

TiffLayout readLayout(TIFF* tif)
{
    TiffLayout l;
    TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &l.width);
    TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &l.height);
    TIFFGetFieldDefaulted(tif, TIFFTAG_SAMPLESPERPIXEL, &l.samplesPerPixel);
    TIFFGetFieldDefaulted(tif, TIFFTAG_BITSPERSAMPLE, &l.bitsPerSample);
    TIFFGetFieldDefaulted(tif, TIFFTAG_SAMPLEFORMAT, &l.sampleFormat);
    TIFFGetFieldDefaulted(tif, TIFFTAG_PLANARCONFIG, &l.planarConfig);
    TIFFGetFieldDefaulted(tif, TIFFTAG_COMPRESSION, &l.compression);
    return l;
}

SampleType sampleTypeFor(const TiffLayout& l)
{
    bool isFloat = l.sampleFormat == SAMPLEFORMAT_IEEEFP;
    bool isSigned = l.sampleFormat == SAMPLEFORMAT_INT;
    switch (l.bitsPerSample)
    {
    case 8:
        if (!isFloat) return isSigned ? SampleType::Int8 : SampleType::UInt8;
        break;
    case 16:
        if (!isFloat) return isSigned ? SampleType::Int16 : SampleType::UInt16;
        break;
    case 32:
        if (isFloat) return SampleType::Float32;
        return isSigned ? SampleType::Int32 : SampleType::UInt32;
    case 64:
        if (isFloat) return SampleType::Float64;
        break;
    default:
        break;
    }
    throw std::runtime_error("Unsupported TIFF sample layout: " +
                             std::to_string(l.bitsPerSample) + " bits, format " +
                             std::to_string(l.sampleFormat));
}

template <typename T>
void widen(const uint8_t* src, double* dst, size_t count)
{
    for (size_t i = 0; i < count; ++i)
    {
        T v;
        std::memcpy(&v, src + i * sizeof(T), sizeof(T));
        dst[i] = static_cast<double>(v);
    }
}

/// Convert `count` decoded samples (native byte order) to double.
void convertSamples(const uint8_t* src, double* dst, size_t count, SampleType type)
{
    switch (type)
    {
    case SampleType::UInt8:   widen<uint8_t>(src, dst, count); break;
    case SampleType::Int8:    widen<int8_t>(src, dst, count); break;
    case SampleType::UInt16:  widen<uint16_t>(src, dst, count); break;
    case SampleType::Int16:   widen<int16_t>(src, dst, count); break;
    case SampleType::UInt32:  widen<uint32_t>(src, dst, count); break;
    case SampleType::Int32:   widen<int32_t>(src, dst, count); break;
    case SampleType::Float32: widen<float>(src, dst, count); break;
    case SampleType::Float64: widen<double>(src, dst, count); break;
    }
}

size_t bytesPerSample(SampleType type)
{
    switch (type)
    {
    case SampleType::UInt8:
    case SampleType::Int8:    return 1;
    case SampleType::UInt16:
    case SampleType::Int16:   return 2;
    case SampleType::UInt32:
    case SampleType::Int32:
    case SampleType::Float32: return 4;
    case SampleType::Float64: return 8;
    }
    return 1;
}

PixelBuffer allocateFor(const TiffLayout& l)
{
    if (l.width == 0 || l.height == 0)
        throw std::runtime_error("TIFF directory has no image data");
    if (l.planarConfig != PLANARCONFIG_CONTIG && l.samplesPerPixel > 1)
        throw std::runtime_error("Separate-plane TIFF layouts are not supported");

    PixelBuffer buf(static_cast<int>(l.width), static_cast<int>(l.height),
                    l.samplesPerPixel, sampleTypeFor(l));
    buf.hasChannelAxis = l.samplesPerPixel > 1;
    return buf;
}

} // namespace

TiffReader::TiffReader(const std::string& path, Strategy strategy)
    : path_(path), strategy_(strategy)
{
    tif_ = TIFFOpen(path.c_str(), "r");
    if (!tif_)
        throw std::runtime_error("Failed to open TIFF file: " + path);
    planeCount_ = static_cast<int>(TIFFNumberOfDirectories(tif_));
    if (planeCount_ < 1)
    {
        TIFFClose(tif_);
        tif_ = nullptr;
        throw std::runtime_error("TIFF file has no images: " + path);
    }
}

TiffReader::~TiffReader()
{
    if (tif_)
        TIFFClose(tif_);
}

std::string TiffReader::backendName() const
{
    return strategy_ == Strategy::Scanline ? "libtiff (scanline)"
                                           : "libtiff (encoded blocks)";
}

TiffReader::Strategy TiffReader::detectStrategy(const std::string& path)
{
    TIFF* tif = TIFFOpen(path.c_str(), "r");
    if (!tif)
        throw std::runtime_error("Failed to open TIFF file: " + path);

    uint16_t compression = COMPRESSION_NONE;
    TIFFGetFieldDefaulted(tif, TIFFTAG_COMPRESSION, &compression);
    bool tiled = TIFFIsTiled(tif) != 0;
    TIFFClose(tif);

    if (compression == COMPRESSION_NONE && !tiled)
        return Strategy::Scanline;
    return Strategy::EncodedBlocks;
}

PixelBuffer TiffReader::readPlane(int index)
{
    if (index < 0 || index >= planeCount_)
        throw std::runtime_error("Plane index out of range: " + std::to_string(index));
    if (!TIFFSetDirectory(tif_, static_cast<tdir_t>(index)))
        throw std::runtime_error("Cannot select TIFF directory " + std::to_string(index) +
                                 " in " + path_);

    // Individual pages of a stack may differ from the first one.
    PixelBuffer buf;
    if (TIFFIsTiled(tif_))
        buf = readEncodedTiles();
    else if (strategy_ == Strategy::Scanline && readLayout(tif_).compression == COMPRESSION_NONE)
        buf = readScanlines();
    else
        buf = readEncodedStrips();

    buf.planeIndex = index;
    buf.planeCount = planeCount_;
    return buf;
}

PixelBuffer TiffReader::readScanlines()
{
    TiffLayout l = readLayout(tif_);
    PixelBuffer buf = allocateFor(l);
    const size_t rowSamples = static_cast<size_t>(l.width) * l.samplesPerPixel;

    std::vector<uint8_t> line(static_cast<size_t>(TIFFScanlineSize(tif_)));
    for (uint32_t row = 0; row < l.height; ++row)
    {
        if (TIFFReadScanline(tif_, line.data(), row, 0) < 0)
            throw std::runtime_error("Failed to read scanline " + std::to_string(row) +
                                     " of " + path_);
        convertSamples(line.data(), buf.data.data() + row * rowSamples, rowSamples,
                       buf.sampleType);
    }
    return buf;
}

PixelBuffer TiffReader::readEncodedStrips()
{
    TiffLayout l = readLayout(tif_);
    PixelBuffer buf = allocateFor(l);
    const size_t rowSamples = static_cast<size_t>(l.width) * l.samplesPerPixel;
    const size_t rowBytes = rowSamples * bytesPerSample(buf.sampleType);

    uint32_t rowsPerStrip = l.height;
    TIFFGetFieldDefaulted(tif_, TIFFTAG_ROWSPERSTRIP, &rowsPerStrip);
    rowsPerStrip = std::min(std::max(rowsPerStrip, 1u), l.height);

    tmsize_t stripSize = TIFFStripSize(tif_);
    std::vector<uint8_t> strip(static_cast<size_t>(stripSize));
    tstrip_t nStrips = TIFFNumberOfStrips(tif_);
    for (tstrip_t s = 0; s < nStrips; ++s)
    {
        tmsize_t got = TIFFReadEncodedStrip(tif_, s, strip.data(), stripSize);
        if (got < 0)
            throw std::runtime_error("Failed to decode strip " + std::to_string(s) +
                                     " of " + path_);

        uint32_t row0 = s * rowsPerStrip;
        if (row0 >= l.height)
            break;
        uint32_t rows = std::min(rowsPerStrip, l.height - row0);
        rows = std::min<uint32_t>(rows, static_cast<uint32_t>(static_cast<size_t>(got) / rowBytes));
        convertSamples(strip.data(), buf.data.data() + row0 * rowSamples,
                       rows * rowSamples, buf.sampleType);
    }
    return buf;
}

PixelBuffer TiffReader::readEncodedTiles()
{
    TiffLayout l = readLayout(tif_);
    PixelBuffer buf = allocateFor(l);
    const int spp = l.samplesPerPixel;

    uint32_t tileW = 0, tileH = 0;
    TIFFGetField(tif_, TIFFTAG_TILEWIDTH, &tileW);
    TIFFGetField(tif_, TIFFTAG_TILELENGTH, &tileH);
    if (tileW == 0 || tileH == 0)
        throw std::runtime_error("Invalid TIFF tile size in " + path_);

    std::vector<uint8_t> tile(static_cast<size_t>(TIFFTileSize(tif_)));
    std::vector<double> tileSamples(static_cast<size_t>(tileW) * tileH * spp);

    for (uint32_t y0 = 0; y0 < l.height; y0 += tileH)
    {
        for (uint32_t x0 = 0; x0 < l.width; x0 += tileW)
        {
            if (TIFFReadTile(tif_, tile.data(), x0, y0, 0, 0) < 0)
                throw std::runtime_error("Failed to decode tile at " + std::to_string(x0) +
                                         "," + std::to_string(y0) + " of " + path_);
            convertSamples(tile.data(), tileSamples.data(), tileSamples.size(), buf.sampleType);

            uint32_t rows = std::min(tileH, l.height - y0);
            uint32_t cols = std::min(tileW, l.width - x0);
            for (uint32_t ty = 0; ty < rows; ++ty)
            {
                const double* src = tileSamples.data() + static_cast<size_t>(ty) * tileW * spp;
                double* dst = &buf.at(static_cast<int>(x0), static_cast<int>(y0 + ty));
                std::copy(src, src + static_cast<size_t>(cols) * spp, dst);
            }
        }
    }
    return buf;
}
