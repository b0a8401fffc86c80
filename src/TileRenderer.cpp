#include "TileRenderer.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

std::string_view interpolationModeName(InterpolationMode mode)
{
    switch (mode)
    {
    case InterpolationMode::Nearest:  return "Nearest";
    case InterpolationMode::Bilinear: return "Bilinear";
    case InterpolationMode::Bicubic:  return "Bicubic";
    case InterpolationMode::Lanczos:  return "Lanczos";
    case InterpolationMode::Count:    break;
    }
    return "Unknown";
}

std::optional<InterpolationMode> interpolationModeByName(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return std::tolower(c); });

    for (int i = 0; i < interpolationModeCount(); ++i)
    {
        auto mode = static_cast<InterpolationMode>(i);
        std::string candidate(interpolationModeName(mode));
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
            [](unsigned char c) { return std::tolower(c); });
        if (candidate == lower)
            return mode;
    }
    return std::nullopt;
}

static int toCvInterpolation(InterpolationMode mode)
{
    switch (mode)
    {
    case InterpolationMode::Bilinear: return cv::INTER_LINEAR;
    case InterpolationMode::Bicubic:  return cv::INTER_CUBIC;
    case InterpolationMode::Lanczos:  return cv::INTER_LANCZOS4;
    default:                          return cv::INTER_NEAREST;
    }
}

TilePlan planTile(const ViewportTransform& viewport)
{
    TilePlan plan;
    const CanvasRect& box = viewport.imageBounds();
    CanvasRect vis = viewport.visibleRect();
    double zoom = viewport.zoom();
    if (zoom <= 0.0 || viewport.imageWidth() <= 0 || viewport.imageHeight() <= 0)
        return plan;

    // Intersection of the image box and the visible rect, relative to the
    // image box origin, in screen pixels.
    double x1 = std::max(vis.min.x - box.min.x, 0.0);
    double y1 = std::max(vis.min.y - box.min.y, 0.0);
    double x2 = std::min(vis.max.x, box.max.x) - box.min.x;
    double y2 = std::min(vis.max.y, box.max.y) - box.min.y;

    plan.targetWidth = static_cast<int>(x2 - x1);
    plan.targetHeight = static_cast<int>(y2 - y1);
    if (plan.targetWidth <= 0 || plan.targetHeight <= 0)
    {
        plan.targetWidth = plan.targetHeight = 0;
        return plan;
    }

    plan.desX1 = x1 / zoom;
    plan.desY1 = y1 / zoom;
    plan.desX2 = x2 / zoom;
    plan.desY2 = y2 / zoom;

    plan.cropX1 = std::clamp(static_cast<int>(std::floor(plan.desX1)), 0, viewport.imageWidth() - 1);
    plan.cropY1 = std::clamp(static_cast<int>(std::floor(plan.desY1)), 0, viewport.imageHeight() - 1);
    plan.cropX2 = std::clamp(static_cast<int>(std::ceil(plan.desX2)), plan.cropX1 + 1, viewport.imageWidth());
    plan.cropY2 = std::clamp(static_cast<int>(std::ceil(plan.desY2)), plan.cropY1 + 1, viewport.imageHeight());

    // Scale by the ratio of screen extent to whole-pixel crop extent, not
    // by the zoom factor: the crop is wider than the fractional region.
    double realW = std::max(plan.sourceWidth(), 1e-9);
    double realH = std::max(plan.sourceHeight(), 1e-9);
    plan.resizedWidth = std::max(1, static_cast<int>(plan.targetWidth / realW * plan.cropWidth()));
    plan.resizedHeight = std::max(1, static_cast<int>(plan.targetHeight / realH * plan.cropHeight()));

    double scaleX = static_cast<double>(plan.resizedWidth) / plan.cropWidth();
    double scaleY = static_cast<double>(plan.resizedHeight) / plan.cropHeight();
    plan.offsetX = static_cast<int>(std::lround((plan.desX1 - plan.cropX1) * scaleX));
    plan.offsetY = static_cast<int>(std::lround((plan.desY1 - plan.cropY1) * scaleY));

    plan.anchor = glm::max(vis.min, box.min);
    plan.visible = true;
    return plan;
}

ByteImage renderTile(const ByteImage& display, const TilePlan& plan, InterpolationMode mode)
{
    ByteImage out;
    if (!plan.visible || display.empty())
        return out;
    if (plan.cropX2 > display.width || plan.cropY2 > display.height)
        return out;

    const int type = CV_8UC(display.channels);
    cv::Mat src(display.height, display.width, type,
                const_cast<uint8_t*>(display.data.data()));

    cv::Mat crop = src(cv::Rect(plan.cropX1, plan.cropY1, plan.cropWidth(), plan.cropHeight()));
    cv::Mat resized;
    cv::resize(crop, resized, cv::Size(plan.resizedWidth, plan.resizedHeight),
               0.0, 0.0, toCvInterpolation(mode));

    // Pixels past the resampled edge stay black.
    cv::Mat tile = cv::Mat::zeros(plan.targetHeight, plan.targetWidth, type);
    cv::Rect wanted(plan.offsetX, plan.offsetY, plan.targetWidth, plan.targetHeight);
    cv::Rect avail = wanted & cv::Rect(0, 0, resized.cols, resized.rows);
    if (avail.area() > 0)
    {
        resized(avail).copyTo(tile(cv::Rect(avail.x - plan.offsetX, avail.y - plan.offsetY,
                                            avail.width, avail.height)));
    }

    out.width = plan.targetWidth;
    out.height = plan.targetHeight;
    out.channels = display.channels;
    out.data.assign(tile.data, tile.data + tile.total() * tile.elemSize());
    return out;
}

// --- TileRenderer ---

bool TileRenderer::Key::operator==(const Key& o) const
{
    return bounds.min == o.bounds.min && bounds.max == o.bounds.max &&
           visible.min == o.visible.min && visible.max == o.visible.max &&
           zoom == o.zoom && generation == o.generation && mode == o.mode;
}

const Tile& TileRenderer::render(const ByteImage& display, uint64_t displayGeneration,
                                 const ViewportTransform& viewport, InterpolationMode mode)
{
    Key key{viewport.imageBounds(), viewport.visibleRect(), viewport.zoom(),
            displayGeneration, mode};
    if (lastKey_ && *lastKey_ == key)
        return tile_;

    tile_.plan = planTile(viewport);
    tile_.bitmap = renderTile(display, tile_.plan, mode);
    ++tile_.serial;
    lastKey_ = key;
    return tile_;
}
