#include "PixelBuffer.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>

std::string_view sampleTypeName(SampleType type)
{
    switch (type)
    {
    case SampleType::UInt8:   return "uint8";
    case SampleType::Int8:    return "int8";
    case SampleType::UInt16:  return "uint16";
    case SampleType::Int16:   return "int16";
    case SampleType::UInt32:  return "uint32";
    case SampleType::Int32:   return "int32";
    case SampleType::Float32: return "float32";
    case SampleType::Float64: return "float64";
    }
    return "unknown";
}

bool sampleTypeIsInteger(SampleType type)
{
    return type != SampleType::Float32 && type != SampleType::Float64;
}

PixelBuffer::PixelBuffer(int w, int h, int c, SampleType type)
    : width(w),
      height(h),
      channels(c),
      hasChannelAxis(c > 1),
      sampleType(type),
      data(static_cast<size_t>(w) * h * c, 0.0)
{
}

std::pair<double, double> PixelBuffer::valueRange() const
{
    if (data.empty())
        return {0.0, 0.0};
    auto [lo, hi] = std::minmax_element(data.begin(), data.end());
    return {*lo, *hi};
}

size_t PixelBuffer::uniqueValueCount() const
{
    std::unordered_set<double> seen(data.begin(), data.end());
    return seen.size();
}

bool PixelBuffer::sameGeometry(const PixelBuffer& other) const
{
    return width == other.width && height == other.height &&
           channels == other.channels &&
           hasChannelAxis == other.hasChannelAxis;
}

std::string PixelBuffer::describePixel(int x, int y) const
{
    std::ostringstream os;
    auto put = [&](double v) {
        if (sampleTypeIsInteger(sampleType))
            os << static_cast<long long>(std::llround(v));
        else
            os << v;
    };

    if (!hasChannelAxis)
    {
        put(at(x, y));
        return os.str();
    }

    os << "[";
    for (int c = 0; c < channels; ++c)
    {
        if (c > 0)
            os << " ";
        put(at(x, y, c));
    }
    os << "]";
    return os.str();
}
