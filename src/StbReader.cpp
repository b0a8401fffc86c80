#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include "StbReader.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>

namespace {

struct StbFree
{
    void operator()(void* p) const { stbi_image_free(p); }
};

template <typename T>
PixelBuffer toPixelBuffer(const T* pixels, int w, int h, int comp, SampleType type)
{
    PixelBuffer buf(w, h, comp, type);
    buf.hasChannelAxis = comp > 1;
    for (size_t i = 0; i < buf.data.size(); ++i)
        buf.data[i] = static_cast<double>(pixels[i]);
    return buf;
}

bool isGif(const std::string& path)
{
    std::string ext = std::filesystem::path(path).extension().string();
    for (auto& ch : ext)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return ext == ".gif";
}

} // namespace

StbReader::StbReader(const std::string& path)
    : path_(path)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        throw std::runtime_error("Cannot open image file: " + path);
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(ifs)),
                                     std::istreambuf_iterator<char>());
    if (bytes.empty())
        throw std::runtime_error("Image file is empty: " + path);

    if (isGif(path))
        decodeAnimatedGif(bytes);
    else
        decodeStill(bytes);
}

void StbReader::decodeStill(const std::vector<unsigned char>& bytes)
{
    const int len = static_cast<int>(bytes.size());
    int w = 0, h = 0, comp = 0;

    if (stbi_is_16_bit_from_memory(bytes.data(), len))
    {
        std::unique_ptr<stbi_us, StbFree> px(
            stbi_load_16_from_memory(bytes.data(), len, &w, &h, &comp, 0));
        if (!px)
            throw std::runtime_error("Failed to decode " + path_ + ": " + stbi_failure_reason());
        planes_.push_back(toPixelBuffer(px.get(), w, h, comp, SampleType::UInt16));
    }
    else
    {
        std::unique_ptr<stbi_uc, StbFree> px(
            stbi_load_from_memory(bytes.data(), len, &w, &h, &comp, 0));
        if (!px)
            throw std::runtime_error("Failed to decode " + path_ + ": " + stbi_failure_reason());
        planes_.push_back(toPixelBuffer(px.get(), w, h, comp, SampleType::UInt8));
    }
}

void StbReader::decodeAnimatedGif(const std::vector<unsigned char>& bytes)
{
    int* delays = nullptr;
    int w = 0, h = 0, frames = 0, comp = 0;
    std::unique_ptr<stbi_uc, StbFree> px(
        stbi_load_gif_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                  &delays, &w, &h, &frames, &comp, 4));
    std::unique_ptr<int, StbFree> delayGuard(delays);
    if (!px || frames < 1)
        throw std::runtime_error("Failed to decode " + path_ + ": " + stbi_failure_reason());

    const size_t frameSamples = static_cast<size_t>(w) * h * 4;
    for (int f = 0; f < frames; ++f)
        planes_.push_back(toPixelBuffer(px.get() + f * frameSamples, w, h, 4, SampleType::UInt8));
}

PixelBuffer StbReader::readPlane(int index)
{
    if (index < 0 || index >= planeCount())
        throw std::runtime_error("Plane index out of range: " + std::to_string(index));
    PixelBuffer buf = planes_[index];
    buf.planeIndex = index;
    buf.planeCount = planeCount();
    return buf;
}
