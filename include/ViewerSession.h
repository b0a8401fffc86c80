#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <glm/glm.hpp>

#include "FileSeries.h"
#include "ImageReader.h"
#include "LevelsMapper.h"
#include "PixelBuffer.h"
#include "TileRenderer.h"
#include "ViewportTransform.h"

/// Whether the loaded file offers a plane slider.  Decided on load only.
enum class StackMode
{
    SinglePlane,
    MultiPlane
};

/// Where a load request came from.  Picker loads start a fresh file series.
enum class LoadOrigin
{
    CommandLine,
    Navigation,
    Drop,
    Picker,
    Clipboard
};

/// Summary shown by the info dialog.
struct ImageStatistics
{
    std::string sampleType;
    std::string backend;
    int width = 0;
    int height = 0;
    int channels = 1;
    int planeIndex = 0;
    int planeCount = 1;
    double min = 0.0;
    double max = 0.0;
    size_t uniqueValues = 0;
};

/// Raw value(s) under a screen position.
struct PixelProbe
{
    glm::ivec2 pixel{0, 0};
    std::string value;
};

/// One image viewer: the decoded buffer, its contrast window, the viewport
/// it is shown through and the sibling files it can step to.
///
/// Every mutating operation leaves the display image consistent with the
/// buffer and the window; displayGeneration() changes whenever the display
/// image does, so the renderer knows when to rebuild its tile.
class ViewerSession {
public:
    using ReaderFactory = std::function<std::unique_ptr<ImageReader>(const std::string&)>;

    static constexpr const char* kEmptyMessage = "[Drag a file here to open]";
    static constexpr const char* kFailedMessage = "[Unable to open file]";

    explicit ViewerSession(ReaderFactory factory = &ImageReader::open);

    /// Zoom step for +/- and the wheel, and whether images larger than the
    /// container are fitted on load.
    void setPreferences(double zoomStep, bool fitLargeImages);

    // --- Loading ---

    /// Open a file and show its middle plane.  On failure the session is
    /// cleared, the placeholder switches to kFailedMessage and false is
    /// returned; the path is still remembered so navigation can move on.
    bool loadFile(const std::string& path, LoadOrigin origin);

    /// Step to the next / previous sibling file (wrap-around).
    /// @return false when there is nowhere to go.
    bool nextFile();
    bool previousFile();

    /// Drop the image and reader; the series is kept.
    void clear();

    bool hasImage() const { return !pixels_.empty(); }
    const std::string& currentPath() const { return currentPath_; }
    const std::string& placeholder() const { return placeholder_; }

    /// Window title: file name, plus "[plane/max]" for stacks.
    std::string title() const;

    // --- Stack planes ---

    StackMode stackMode() const { return maxPlane_ > 0 ? StackMode::MultiPlane : StackMode::SinglePlane; }
    int plane() const { return plane_; }
    int maxPlane() const { return maxPlane_; }

    /// Slider input: clamped to [0, maxPlane].
    void setPlane(int plane);

    /// Typed plane number.  Non-numeric or out-of-range text is rejected and
    /// the current plane kept; empty text means plane 0.
    /// @return true if the text was accepted.
    bool submitPlaneEntry(std::string_view text);

    // --- Levels ---

    const LevelsWindow& levels() const { return levels_; }
    void setLevelMin(int value);
    void setLevelMax(int value);
    void selectLevelsChannel(int channel);

    /// Set the global pair to the range of the normalised image.
    void autoContrast();

    // --- Interpolation ---

    InterpolationMode interpolation() const { return interpolation_; }
    void setInterpolation(InterpolationMode mode) { interpolation_ = mode; }

    // --- Viewport ---

    const ViewportTransform& viewport() const { return viewport_; }
    void resizeContainer(int width, int height);
    bool zoomIn();
    bool zoomOut();

    /// Zoom about a screen point; ignored when the point is outside the image.
    bool zoomAtScreen(double sx, double sy, double scale);
    void panBy(double dx, double dy);
    void scrollToFraction(int axis, double fraction);
    void fitToWindow();
    void resetToActualSize();

    // --- Inspection ---

    std::optional<PixelProbe> probePixel(double sx, double sy) const;

    /// Status bar text: "X: x Y: y  value", or "-" off the image.
    std::string statusText(double sx, double sy) const;

    ImageStatistics imageStatistics() const;

    const PixelBuffer& pixels() const { return pixels_; }
    const ByteImage& normalized() const { return normalized_; }
    const ByteImage& display() const { return display_; }
    uint64_t displayGeneration() const { return displayGeneration_; }

    const FileSeries& series() const { return series_; }

private:
    bool readPlane(int plane);
    void refreshDisplay();
    void placeImage();

    ReaderFactory readerFactory_;
    std::unique_ptr<ImageReader> reader_;

    std::string currentPath_;
    std::string placeholder_ = kEmptyMessage;

    PixelBuffer pixels_;
    ByteImage normalized_;
    ByteImage display_;
    uint64_t displayGeneration_ = 0;

    LevelsWindow levels_;
    ViewportTransform viewport_;
    FileSeries series_;
    InterpolationMode interpolation_ = InterpolationMode::Nearest;

    int plane_ = 0;
    int maxPlane_ = 0;

    bool fitLargeImages_ = true;
    bool placementPending_ = false;  ///< Image loaded before the container had a size.

    mutable std::optional<ImageStatistics> statsCache_;
};
