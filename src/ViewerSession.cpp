#include "ViewerSession.h"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <iostream>
#include <stdexcept>

ViewerSession::ViewerSession(ReaderFactory factory)
    : readerFactory_(std::move(factory))
{
}

void ViewerSession::setPreferences(double zoomStep, bool fitLargeImages)
{
    viewport_.setZoomStep(zoomStep);
    fitLargeImages_ = fitLargeImages;
}

// --- Loading ---

bool ViewerSession::loadFile(const std::string& path, LoadOrigin origin)
{
    const std::string normalized = FileSeries::normalizePath(path);

    if (origin == LoadOrigin::Picker)
        series_.clear();
    else if (origin != LoadOrigin::Navigation && !series_.empty() && series_.indexOf(normalized) < 0)
        series_.clear();  // different directory; rebuilt on the next step

    clear();
    currentPath_ = normalized;

    try
    {
        reader_ = readerFactory_(normalized);
        int planes = reader_->planeCount();
        if (planes < 1)
            throw std::runtime_error("file has no image planes");
        maxPlane_ = planes - 1;
        plane_ = maxPlane_ / 2;
        pixels_ = reader_->readPlane(plane_);
        if (pixels_.empty())
            throw std::runtime_error("decoded image is empty");
    }
    catch (const std::exception& e)
    {
        std::cerr << "Failed to open " << normalized << ": " << e.what() << "\n";
        clear();
        placeholder_ = kFailedMessage;
        return false;
    }

    levels_.reset(pixels_.hasChannelAxis ? pixels_.channels : 0);
    normalized_ = normalize(pixels_);
    refreshDisplay();

    viewport_.setImageSize(pixels_.width, pixels_.height);
    placeImage();
    return true;
}

bool ViewerSession::nextFile()
{
    auto next = series_.next(currentPath_);
    if (!next)
        return false;
    loadFile(*next, LoadOrigin::Navigation);
    return true;
}

bool ViewerSession::previousFile()
{
    auto prev = series_.previous(currentPath_);
    if (!prev)
        return false;
    loadFile(*prev, LoadOrigin::Navigation);
    return true;
}

void ViewerSession::clear()
{
    reader_.reset();
    pixels_ = PixelBuffer{};
    normalized_ = ByteImage{};
    display_ = ByteImage{};
    ++displayGeneration_;
    levels_.reset(0);
    viewport_.setImageSize(0, 0);
    plane_ = 0;
    maxPlane_ = 0;
    placementPending_ = false;
    placeholder_ = kEmptyMessage;
    statsCache_.reset();
}

std::string ViewerSession::title() const
{
    if (currentPath_.empty())
        return "ImQuick";
    std::string name = std::filesystem::path(currentPath_).filename().string();
    if (stackMode() == StackMode::MultiPlane)
        name += " [" + std::to_string(plane_) + "/" + std::to_string(maxPlane_) + "]";
    return name;
}

void ViewerSession::placeImage()
{
    int cw = viewport_.containerWidth();
    int ch = viewport_.containerHeight();
    if (cw <= 0 || ch <= 0)
    {
        placementPending_ = true;
        return;
    }
    placementPending_ = false;

    if (fitLargeImages_ && (pixels_.width > cw || pixels_.height > ch))
        viewport_.fitToWindow(cw, ch);
    else
        viewport_.resetToActualSize();
}

// --- Stack planes ---

bool ViewerSession::readPlane(int plane)
{
    if (!reader_)
        return false;
    try
    {
        PixelBuffer next = reader_->readPlane(plane);
        if (!next.sameGeometry(pixels_))
        {
            std::cerr << "Plane " << plane << " of " << currentPath_
                      << " has a different shape (" << next.width << "x" << next.height
                      << "x" << next.channels << "); keeping plane " << plane_ << "\n";
            return false;
        }
        pixels_ = std::move(next);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Failed to read plane " << plane << " of " << currentPath_
                  << ": " << e.what() << "\n";
        return false;
    }

    plane_ = plane;
    normalized_ = normalize(pixels_);
    refreshDisplay();
    return true;
}

void ViewerSession::setPlane(int plane)
{
    if (!hasImage())
        return;
    plane = std::clamp(plane, 0, maxPlane_);
    if (plane == plane_)
        return;
    readPlane(plane);
}

bool ViewerSession::submitPlaneEntry(std::string_view text)
{
    if (!hasImage())
        return false;

    while (!text.empty() && text.front() == ' ')
        text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ')
        text.remove_suffix(1);

    int value = 0;
    if (!text.empty())
    {
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size())
            return false;
    }
    if (value < 0 || value > maxPlane_)
        return false;

    if (value != plane_)
        return readPlane(value);
    return true;
}

// --- Levels ---

void ViewerSession::refreshDisplay()
{
    display_ = normalized_.empty() ? ByteImage{} : applyWindow(normalized_, levels_);
    ++displayGeneration_;
    statsCache_.reset();
}

void ViewerSession::setLevelMin(int value)
{
    levels_.setMin(value);
    if (hasImage())
        refreshDisplay();
}

void ViewerSession::setLevelMax(int value)
{
    levels_.setMax(value);
    if (hasImage())
        refreshDisplay();
}

void ViewerSession::selectLevelsChannel(int channel)
{
    if (channel == levels_.selected())
        return;
    levels_.select(channel);
    if (hasImage())
        refreshDisplay();
}

void ViewerSession::autoContrast()
{
    if (!hasImage())
        return;
    auto [lo, hi] = valueRange(normalized_);
    levels_.select(-1);
    levels_.setGlobal(lo, hi);
    refreshDisplay();
}

// --- Viewport ---

void ViewerSession::resizeContainer(int width, int height)
{
    if (width == viewport_.containerWidth() && height == viewport_.containerHeight())
        return;
    viewport_.setContainerSize(width, height);
    if (placementPending_ && hasImage())
        placeImage();
}

bool ViewerSession::zoomIn()
{
    return hasImage() && viewport_.zoomIn();
}

bool ViewerSession::zoomOut()
{
    return hasImage() && viewport_.zoomOut();
}

bool ViewerSession::zoomAtScreen(double sx, double sy, double scale)
{
    if (!hasImage())
        return false;
    glm::dvec2 c = viewport_.screenToCanvas(sx, sy);
    if (!viewport_.containsCanvasPoint(c.x, c.y))
        return false;
    return viewport_.zoomAt(c.x, c.y, scale);
}

void ViewerSession::panBy(double dx, double dy)
{
    if (hasImage())
        viewport_.panBy(dx, dy);
}

void ViewerSession::scrollToFraction(int axis, double fraction)
{
    if (hasImage())
        viewport_.scrollToFraction(axis, fraction);
}

void ViewerSession::fitToWindow()
{
    if (hasImage())
        viewport_.fitToWindow(viewport_.containerWidth(), viewport_.containerHeight());
}

void ViewerSession::resetToActualSize()
{
    if (hasImage())
        viewport_.resetToActualSize();
}

// --- Inspection ---

std::optional<PixelProbe> ViewerSession::probePixel(double sx, double sy) const
{
    if (!hasImage())
        return std::nullopt;
    auto px = viewport_.screenToImage(sx, sy);
    if (!px)
        return std::nullopt;
    return PixelProbe{*px, pixels_.describePixel(px->x, px->y)};
}

std::string ViewerSession::statusText(double sx, double sy) const
{
    auto probe = probePixel(sx, sy);
    if (!probe)
        return "-";
    return "X: " + std::to_string(probe->pixel.x) + " Y: " + std::to_string(probe->pixel.y) +
           "  " + probe->value;
}

ImageStatistics ViewerSession::imageStatistics() const
{
    if (statsCache_)
        return *statsCache_;

    ImageStatistics s;
    if (hasImage())
    {
        s.sampleType = std::string(sampleTypeName(pixels_.sampleType));
        s.backend = reader_ ? reader_->backendName() : std::string();
        s.width = pixels_.width;
        s.height = pixels_.height;
        s.channels = pixels_.channels;
        s.planeIndex = plane_;
        s.planeCount = maxPlane_ + 1;
        auto [lo, hi] = pixels_.valueRange();
        s.min = lo;
        s.max = hi;
        s.uniqueValues = pixels_.uniqueValueCount();
    }
    statsCache_ = s;
    return s;
}
