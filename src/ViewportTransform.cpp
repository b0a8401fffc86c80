#include "ViewportTransform.h"

#include <algorithm>
#include <cmath>

void ViewportTransform::setImageSize(int width, int height)
{
    imageWidth_ = std::max(width, 0);
    imageHeight_ = std::max(height, 0);
}

void ViewportTransform::setContainerSize(int width, int height)
{
    containerWidth_ = std::max(width, 0);
    containerHeight_ = std::max(height, 0);
    if (fitMode_)
        fitToWindow(containerWidth_, containerHeight_);
}

CanvasRect ViewportTransform::visibleRect() const
{
    CanvasRect r;
    r.min = origin_;
    r.max = origin_ + glm::dvec2(containerWidth_, containerHeight_);
    return r;
}

CanvasRect ViewportTransform::scrollRegion() const
{
    CanvasRect vis = visibleRect();
    CanvasRect region;
    region.min = glm::min(bounds_.min, vis.min);
    region.max = glm::max(bounds_.max, vis.max);

    for (int axis = 0; axis < 2; ++axis)
    {
        if (region.min[axis] == vis.min[axis] && region.max[axis] == vis.max[axis])
        {
            region.min[axis] = bounds_.min[axis];
            region.max[axis] = bounds_.max[axis];
        }
    }
    return region;
}

glm::dvec2 ViewportTransform::scrollFraction(int axis) const
{
    CanvasRect region = scrollRegion();
    CanvasRect vis = visibleRect();
    double span = region.max[axis] - region.min[axis];
    if (span <= 0.0)
        return {0.0, 1.0};
    return {(vis.min[axis] - region.min[axis]) / span,
            (vis.max[axis] - region.min[axis]) / span};
}

void ViewportTransform::scrollToFraction(int axis, double fraction)
{
    CanvasRect region = scrollRegion();
    CanvasRect vis = visibleRect();
    double span = region.max[axis] - region.min[axis];
    if (span <= 0.0)
        return;
    double thumb = (vis.max[axis] - vis.min[axis]) / span;
    fraction = std::clamp(fraction, 0.0, std::max(0.0, 1.0 - thumb));
    origin_[axis] += region.min[axis] + fraction * span - vis.min[axis];
}

bool ViewportTransform::zoomAt(double anchorX, double anchorY, double scale)
{
    if (imageWidth_ <= 0 || imageHeight_ <= 0)
        return false;
    if (scale <= 0.0 || scale == 1.0)
        return false;

    if (scale > 1.0)
    {
        double minContainer = std::min(containerWidth_, containerHeight_);
        if (minContainer / kZoomInRatio < zoom_)
            return false;
    }
    else
    {
        double minImage = std::min(imageWidth_, imageHeight_);
        if (static_cast<int>(minImage * zoom_ * scale) < kMinScreenExtent)
            return false;
    }

    glm::dvec2 anchor(anchorX, anchorY);
    bounds_.min = anchor + (bounds_.min - anchor) * scale;
    bounds_.max = anchor + (bounds_.max - anchor) * scale;
    zoom_ *= scale;
    fitMode_ = false;
    return true;
}

bool ViewportTransform::zoomIn()
{
    glm::dvec2 c = screenToCanvas(containerWidth_ / 2.0, containerHeight_ / 2.0);
    return zoomAt(c.x, c.y, zoomStep_);
}

bool ViewportTransform::zoomOut()
{
    glm::dvec2 c = screenToCanvas(containerWidth_ / 2.0, containerHeight_ / 2.0);
    return zoomAt(c.x, c.y, 1.0 / zoomStep_);
}

void ViewportTransform::panBy(double dx, double dy)
{
    origin_.x += dx;
    origin_.y += dy;
}

void ViewportTransform::centreImage()
{
    origin_ = glm::dvec2(0.0, 0.0);
    int x0 = containerWidth_ / 2 - imageWidth_ / 2;
    int y0 = containerHeight_ / 2 - imageHeight_ / 2;
    bounds_.min = glm::dvec2(x0, y0);
    bounds_.max = glm::dvec2(x0 + imageWidth_, y0 + imageHeight_);
}

void ViewportTransform::fitToWindow(int containerWidth, int containerHeight)
{
    containerWidth_ = std::max(containerWidth, 0);
    containerHeight_ = std::max(containerHeight, 0);
    centreImage();
    zoom_ = 1.0;
    fitMode_ = false;
    if (imageWidth_ <= 0 || imageHeight_ <= 0)
        return;

    double scale = std::min((containerWidth_ - 4.0) / imageWidth_,
                            (containerHeight_ - 4.0) / imageHeight_);
    if (scale <= 0.0)
        return;

    glm::dvec2 anchor(containerWidth_ / 2.0, containerHeight_ / 2.0);
    bounds_.min = anchor + (bounds_.min - anchor) * scale;
    bounds_.max = anchor + (bounds_.max - anchor) * scale;
    zoom_ = scale;
    fitMode_ = true;
}

void ViewportTransform::resetToActualSize()
{
    zoom_ = 1.0;
    fitMode_ = false;
    centreImage();
}

std::optional<glm::ivec2> ViewportTransform::screenToImage(double sx, double sy) const
{
    if (imageWidth_ <= 0 || imageHeight_ <= 0)
        return std::nullopt;

    glm::dvec2 canvas = screenToCanvas(sx, sy);
    int ix = static_cast<int>(std::floor((canvas.x - bounds_.min.x) / zoom_));
    int iy = static_cast<int>(std::floor((canvas.y - bounds_.min.y) / zoom_));
    if (ix < 0 || iy < 0 || ix >= imageWidth_ || iy >= imageHeight_)
        return std::nullopt;
    return glm::ivec2(ix, iy);
}

bool ViewportTransform::containsCanvasPoint(double x, double y) const
{
    return bounds_.min.x < x && x < bounds_.max.x &&
           bounds_.min.y < y && y < bounds_.max.y;
}
