#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <glm/glm.hpp>

#include "PixelBuffer.h"
#include "ViewportTransform.h"

/// Resampling kernel used when the visible tile is scaled to screen size.
enum class InterpolationMode
{
    Nearest,
    Bilinear,
    Bicubic,
    Lanczos,

    Count  // sentinel, must be last
};

std::string_view interpolationModeName(InterpolationMode mode);

/// Case-insensitive lookup by display name.
std::optional<InterpolationMode> interpolationModeByName(std::string_view name);

constexpr int interpolationModeCount()
{
    return static_cast<int>(InterpolationMode::Count);
}

/// Geometry of one visible tile, derived from the viewport alone.
struct TilePlan
{
    bool visible = false;

    /// Visible part of the image in fractional image-pixel coordinates.
    double desX1 = 0.0, desY1 = 0.0, desX2 = 0.0, desY2 = 0.0;

    /// Whole-pixel superset of the fractional region (floor / ceil).
    int cropX1 = 0, cropY1 = 0, cropX2 = 0, cropY2 = 0;

    /// Size of the crop after resampling.
    int resizedWidth = 0, resizedHeight = 0;

    /// Sub-pixel offset into the resampled crop where the tile starts.
    int offsetX = 0, offsetY = 0;

    /// Final tile size in screen pixels.
    int targetWidth = 0, targetHeight = 0;

    /// Canvas position of the tile's top-left corner.
    glm::dvec2 anchor{0.0, 0.0};

    double sourceWidth() const { return desX2 - desX1; }
    double sourceHeight() const { return desY2 - desY1; }
    int cropWidth() const { return cropX2 - cropX1; }
    int cropHeight() const { return cropY2 - cropY1; }
};

/// Work out which part of the image is visible and how it maps to screen
/// pixels.  Returns a plan with visible == false when the image box and the
/// visible rect do not overlap by at least one screen pixel.
TilePlan planTile(const ViewportTransform& viewport);

/// Crop the display image to the plan's whole-pixel region, resample it
/// with the given kernel, and crop the sub-pixel offset away so that the
/// result is exactly targetWidth x targetHeight.
ByteImage renderTile(const ByteImage& display, const TilePlan& plan, InterpolationMode mode);

struct Tile
{
    TilePlan plan;
    ByteImage bitmap;
    uint64_t serial = 0;  ///< Incremented every time the bitmap is rebuilt.
};

/// Keeps the last rendered tile and rebuilds it whenever anything that
/// affects it changed: image box, visible rect, zoom, display contents
/// (tracked by a generation counter) or interpolation mode.
class TileRenderer {
public:
    const Tile& render(const ByteImage& display, uint64_t displayGeneration,
                       const ViewportTransform& viewport, InterpolationMode mode);

    const Tile& tile() const { return tile_; }

    /// Force the next render() to rebuild.
    void invalidate() { lastKey_.reset(); }

private:
    struct Key
    {
        CanvasRect bounds;
        CanvasRect visible;
        double zoom = 1.0;
        uint64_t generation = 0;
        InterpolationMode mode = InterpolationMode::Nearest;

        bool operator==(const Key& o) const;
    };

    std::optional<Key> lastKey_;
    Tile tile_;
};
