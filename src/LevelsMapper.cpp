#include "LevelsMapper.h"

#include <algorithm>
#include <cmath>

// --- LevelsWindow ---

void LevelsWindow::reset(int channelCount)
{
    global_ = LevelsPair{};
    channels_.assign(static_cast<size_t>(std::max(channelCount, 0)), LevelsPair{});
    selected_ = -1;
}

void LevelsWindow::select(int channel)
{
    if (channel < 0)
        selected_ = -1;
    else if (channel < channelCount())
        selected_ = channel;
}

void LevelsWindow::setMin(int value)
{
    LevelsPair& p = activeMut();
    p.min = std::clamp(value, 0, 254);
    if (p.min >= p.max)
        p.max = p.min + 1;
}

void LevelsWindow::setMax(int value)
{
    LevelsPair& p = activeMut();
    p.max = std::clamp(value, 1, 255);
    if (p.min >= p.max)
        p.min = p.max - 1;
}

void LevelsWindow::setGlobal(int lo, int hi)
{
    global_.min = std::clamp(lo, 0, 254);
    global_.max = std::clamp(hi, 1, 255);
    if (global_.min >= global_.max)
        global_.max = global_.min + 1;
}

// --- Mapping ---

double normalizeScale(double rawMax)
{
    if (rawMax >= 4096.0)
        return 1.0 / 265.0;
    if (rawMax >= 1024.0)
        return 1.0 / 16.0;
    if (rawMax >= 256.0)
        return 1.0 / 4.0;
    if (rawMax <= 1.0)
        return 256.0;
    return 1.0;
}

static uint8_t wrapToByte(double v)
{
    if (std::isnan(v))
        return 0;
    // Truncate toward zero, keep the low 8 bits.
    auto i = static_cast<long long>(v);
    return static_cast<uint8_t>(i & 0xFF);
}

ByteImage normalize(const PixelBuffer& raw)
{
    ByteImage out;
    out.width = raw.width;
    out.height = raw.height;
    out.channels = raw.channels;
    out.data.resize(raw.data.size());
    if (raw.data.empty())
        return out;

    double rawMax = raw.valueRange().second;

    // Divide rather than multiply by a reciprocal so that results sitting
    // exactly on an integer boundary truncate the same way.
    const double* src = raw.data.data();
    uint8_t* dst = out.data.data();
    size_t n = raw.data.size();

    if (rawMax >= 4096.0)
        for (size_t i = 0; i < n; ++i) dst[i] = wrapToByte(src[i] / 265.0);
    else if (rawMax >= 1024.0)
        for (size_t i = 0; i < n; ++i) dst[i] = wrapToByte(src[i] / 16.0);
    else if (rawMax >= 256.0)
        for (size_t i = 0; i < n; ++i) dst[i] = wrapToByte(src[i] / 4.0);
    else if (rawMax <= 1.0)
        for (size_t i = 0; i < n; ++i) dst[i] = wrapToByte(src[i] * 256.0);
    else
        for (size_t i = 0; i < n; ++i) dst[i] = wrapToByte(src[i]);

    return out;
}

/// Build the 256-entry lookup table for one (min, max) pair.
static void buildWindowLut(const LevelsPair& p, uint8_t lut[256])
{
    double span = static_cast<double>(p.max - p.min);
    for (int v = 0; v < 256; ++v)
    {
        int t = std::max(v, p.min);
        double r = static_cast<double>(t - p.min) / span;
        if (r > 1.0)
            r = 1.0;
        lut[v] = static_cast<uint8_t>(r * 255.0);
    }
}

ByteImage applyWindow(const ByteImage& normalized, const LevelsWindow& window)
{
    ByteImage out;
    out.width = normalized.width;
    out.height = normalized.height;
    out.channels = normalized.channels;
    out.data.resize(normalized.data.size());
    if (normalized.data.empty())
        return out;

    const int nc = std::max(normalized.channels, 1);
    std::vector<uint8_t> luts(static_cast<size_t>(nc) * 256);
    for (int c = 0; c < nc; ++c)
    {
        const LevelsPair& p = (window.perChannel() && c < window.channelCount())
                                  ? window.channel(c)
                                  : window.global();
        buildWindowLut(p, luts.data() + static_cast<size_t>(c) * 256);
    }

    const uint8_t* src = normalized.data.data();
    uint8_t* dst = out.data.data();
    size_t n = normalized.data.size();
    for (size_t i = 0; i < n; ++i)
    {
        size_t c = i % static_cast<size_t>(nc);
        dst[i] = luts[c * 256 + src[i]];
    }
    return out;
}

std::pair<int, int> valueRange(const ByteImage& image)
{
    if (image.data.empty())
        return {0, 0};
    auto [lo, hi] = std::minmax_element(image.data.begin(), image.data.end());
    return {*lo, *hi};
}
