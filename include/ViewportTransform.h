#pragma once

#include <optional>

#include <glm/glm.hpp>

/// Axis-aligned rectangle in canvas coordinates.
struct CanvasRect
{
    glm::dvec2 min{0.0, 0.0};
    glm::dvec2 max{0.0, 0.0};

    double width() const { return max.x - min.x; }
    double height() const { return max.y - min.y; }
};

/// Zoom and pan state of one image viewport.
///
/// Three coordinate spaces are involved:
///   screen  - pixels relative to the top-left of the container;
///   canvas  - an unbounded plane the container scrolls over;
///   image   - pixel indices into the decoded buffer.
/// screen -> canvas adds the scroll origin; canvas -> image subtracts the
/// image box origin and divides by the zoom factor.
class ViewportTransform {
public:
    /// On-screen minor image dimension below which zooming out stops.
    static constexpr int kMinScreenExtent = 30;
    /// Zooming in stops once the zoom factor exceeds min(container) / 5.
    static constexpr double kZoomInRatio = 5.0;
    static constexpr double kDefaultZoomStep = 1.3;

    void setImageSize(int width, int height);
    int imageWidth() const { return imageWidth_; }
    int imageHeight() const { return imageHeight_; }

    /// Record the container size.  In fit mode the image is re-fitted.
    void setContainerSize(int width, int height);
    int containerWidth() const { return containerWidth_; }
    int containerHeight() const { return containerHeight_; }

    void setZoomStep(double step) { zoomStep_ = step > 1.0 ? step : kDefaultZoomStep; }
    double zoomStep() const { return zoomStep_; }

    double zoom() const { return zoom_; }
    bool fitMode() const { return fitMode_; }
    const CanvasRect& imageBounds() const { return bounds_; }
    const glm::dvec2& scrollOrigin() const { return origin_; }

    /// Canvas rectangle currently covered by the container.
    CanvasRect visibleRect() const;

    /// Region the host scrollbars span: the union of the image box and the
    /// visible rect, collapsed to the image extent on any axis where the
    /// whole image is already visible.
    CanvasRect scrollRegion() const;

    /// Scrollbar thumb position (start, end) in [0, 1] along an axis
    /// (0 = x, 1 = y).  A thumb covering [0, 1] means the bar can hide.
    glm::dvec2 scrollFraction(int axis) const;

    /// Move the visible rect so its start sits at `fraction` of the scroll
    /// region along an axis, the way dragging a scrollbar thumb does.  The
    /// thumb is kept inside the bar.
    void scrollToFraction(int axis, double fraction);

    /// Scale the image box about a canvas anchor and multiply the zoom
    /// factor by `scale`.  Zooming in is refused when the current factor
    /// already exceeds min(container) / 5; zooming out is refused when the
    /// image's on-screen minor dimension would drop below 30 px.
    /// @return true if the zoom was applied.
    bool zoomAt(double anchorX, double anchorY, double scale);

    /// Zoom by one step about the container centre.
    bool zoomIn();
    bool zoomOut();

    /// Shift the scroll origin.  No bounds: the image may be panned away.
    void panBy(double dx, double dy);

    /// Scale the image to the container less a 2 px margin on each side,
    /// and centre it.  Turns fit mode on.
    void fitToWindow(int containerWidth, int containerHeight);

    /// Zoom 1.0, centred.  Turns fit mode off.
    void resetToActualSize();

    glm::dvec2 screenToCanvas(double sx, double sy) const { return {sx + origin_.x, sy + origin_.y}; }

    /// Image pixel under a screen position, or nullopt outside the image.
    std::optional<glm::ivec2> screenToImage(double sx, double sy) const;

    /// Whether a canvas point lies strictly inside the image box.
    bool containsCanvasPoint(double x, double y) const;

private:
    /// Box at native size centred in the container; scroll origin reset.
    void centreImage();

    int imageWidth_ = 0;
    int imageHeight_ = 0;
    int containerWidth_ = 0;
    int containerHeight_ = 0;
    double zoom_ = 1.0;
    double zoomStep_ = kDefaultZoomStep;
    bool fitMode_ = false;
    CanvasRect bounds_;
    glm::dvec2 origin_{0.0, 0.0};
};
