#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/// Sample type of the decoded source, named the way numpy names dtypes.
enum class SampleType
{
    UInt8,
    Int8,
    UInt16,
    Int16,
    UInt32,
    Int32,
    Float32,
    Float64
};

std::string_view sampleTypeName(SampleType type);

/// Whether samples of this type are printed as integers.
bool sampleTypeIsInteger(SampleType type);

/// Decoded samples of one image plane.
///
/// Samples are stored row-major with channels interleaved, converted to
/// double, which holds every supported sample type exactly.  `hasChannelAxis`
/// records whether the source was a 3-D array (height x width x channels);
/// a 2-D source always has `channels == 1` and `hasChannelAxis == false`.
class PixelBuffer {
public:
    int width = 0;
    int height = 0;
    int channels = 1;
    bool hasChannelAxis = false;
    SampleType sampleType = SampleType::UInt8;

    /// Index of this plane within its stack, and the stack depth.
    int planeIndex = 0;
    int planeCount = 1;

    std::vector<double> data;

    PixelBuffer() = default;
    PixelBuffer(int w, int h, int c, SampleType type);

    bool empty() const { return data.empty(); }

    double at(int x, int y, int c = 0) const
    {
        return data[(static_cast<size_t>(y) * width + x) * channels + c];
    }

    double& at(int x, int y, int c = 0)
    {
        return data[(static_cast<size_t>(y) * width + x) * channels + c];
    }

    /// Minimum and maximum over all samples.  (0, 0) for an empty buffer.
    std::pair<double, double> valueRange() const;

    /// Number of distinct sample values.
    size_t uniqueValueCount() const;

    /// True when `other` has the same width, height and channel layout.
    bool sameGeometry(const PixelBuffer& other) const;

    /// Format the raw value(s) at (x, y) for the status bar: a single
    /// number for 2-D data, "[a b c]" for multi-channel data.
    std::string describePixel(int x, int y) const;
};

/// 8-bit interleaved image produced by the levels pipeline.
struct ByteImage
{
    int width = 0;
    int height = 0;
    int channels = 1;
    std::vector<uint8_t> data;

    bool empty() const { return data.empty(); }

    uint8_t at(int x, int y, int c = 0) const
    {
        return data[(static_cast<size_t>(y) * width + x) * channels + c];
    }
};
