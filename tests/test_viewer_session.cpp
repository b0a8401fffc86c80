// test_viewer_session.cpp: tests for the per-window viewer state: loading,
// stack planes, levels, placement and pixel inspection.
//
// Uses an in-memory reader so no image files have to be decoded.

#include "ViewerSession.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;

static void check(bool cond, const char* msg, int line)
{
    if (!cond)
    {
        std::cerr << "FAIL (line " << line << "): " << msg << "\n";
        ++failures;
    }
}

#define CHECK(cond, msg) check((cond), (msg), __LINE__)

/// Stack of `planes` uint16 planes; pixel (x, y) of plane p holds p * 100 + x.
/// Plane `oddPlane` (if >= 0) is one pixel narrower than the others.
class FakeStackReader : public ImageReader
{
public:
    FakeStackReader(int width, int height, int planes, int channels = 1, int oddPlane = -1)
        : width_(width), height_(height), planes_(planes), channels_(channels), oddPlane_(oddPlane)
    {}

    int planeCount() const override { return planes_; }

    PixelBuffer readPlane(int index) override
    {
        if (index < 0 || index >= planes_)
            throw std::runtime_error("plane index out of range");
        int w = index == oddPlane_ ? width_ - 1 : width_;
        PixelBuffer buf(w, height_, channels_, SampleType::UInt16);
        for (int y = 0; y < height_; ++y)
            for (int x = 0; x < w; ++x)
                for (int c = 0; c < channels_; ++c)
                    buf.at(x, y, c) = static_cast<float>(index * 100 + x + c);
        buf.planeIndex = index;
        buf.planeCount = planes_;
        return buf;
    }

    std::string backendName() const override { return "fake"; }

private:
    int width_, height_, planes_, channels_, oddPlane_;
};

/// Picks the fake reader from the file name; "broken*" fails to open.
static std::unique_ptr<ImageReader> fakeFactory(const std::string& path)
{
    std::string name = fs::path(path).filename().string();
    if (name.rfind("broken", 0) == 0)
        throw std::runtime_error("cannot decode");
    if (name.rfind("stack", 0) == 0)
        return std::make_unique<FakeStackReader>(10, 8, 5);
    if (name.rfind("odd", 0) == 0)
        return std::make_unique<FakeStackReader>(10, 8, 3, 1, 2);
    if (name.rfind("rgb", 0) == 0)
        return std::make_unique<FakeStackReader>(4, 4, 1, 3);
    if (name.rfind("big", 0) == 0)
        return std::make_unique<FakeStackReader>(400, 300, 1);
    return std::make_unique<FakeStackReader>(10, 8, 1);
}

static ViewerSession makeSession()
{
    ViewerSession s(fakeFactory);
    s.resizeContainer(200, 200);
    return s;
}

static void testEmptySession()
{
    std::cout << "  testEmptySession...";

    ViewerSession s(fakeFactory);
    CHECK(!s.hasImage(), "no image");
    CHECK(s.placeholder() == ViewerSession::kEmptyMessage, "drag-here placeholder");
    CHECK(s.title() == "ImQuick", "application title");
    CHECK(s.statusText(10.0, 10.0) == "-", "status is a dash");
    CHECK(!s.zoomIn() && !s.nextFile(), "operations are no-ops");
    CHECK(!s.submitPlaneEntry("1"), "no plane entry without an image");

    std::cout << " done\n";
}

static void testLoadShowsMiddlePlane()
{
    std::cout << "  testLoadShowsMiddlePlane...";

    ViewerSession s = makeSession();
    CHECK(s.loadFile("/data/stack.tif", LoadOrigin::CommandLine), "load succeeds");
    CHECK(s.hasImage(), "image present");
    CHECK(s.stackMode() == StackMode::MultiPlane, "five planes is a stack");
    CHECK(s.maxPlane() == 4 && s.plane() == 2, "middle plane shown");
    CHECK(s.pixels().at(3, 0) == 203.0f, "plane 2 data decoded");
    CHECK(s.title() == "stack.tif [2/4]", "title carries the plane");
    CHECK(s.currentPath() == FileSeries::normalizePath("/data/stack.tif"), "path normalised");

    ViewerSession single = makeSession();
    single.loadFile("/data/plain.png", LoadOrigin::CommandLine);
    CHECK(single.stackMode() == StackMode::SinglePlane, "one plane is not a stack");
    CHECK(single.title() == "plain.png", "plain title");

    std::cout << " done\n";
}

static void testLoadFailure()
{
    std::cout << "  testLoadFailure...";

    ViewerSession s = makeSession();
    s.loadFile("/data/stack.tif", LoadOrigin::CommandLine);
    uint64_t gen = s.displayGeneration();

    CHECK(!s.loadFile("/data/broken.tif", LoadOrigin::Drop), "load reports failure");
    CHECK(!s.hasImage(), "previous image dropped");
    CHECK(s.placeholder() == ViewerSession::kFailedMessage, "failure placeholder");
    CHECK(s.currentPath() == FileSeries::normalizePath("/data/broken.tif"),
          "failed path remembered");
    CHECK(s.displayGeneration() != gen, "display generation bumped");
    CHECK(s.maxPlane() == 0, "stack state reset");

    CHECK(s.loadFile("/data/plain.png", LoadOrigin::Drop), "next load recovers");
    CHECK(s.placeholder() == ViewerSession::kEmptyMessage, "placeholder restored");

    std::cout << " done\n";
}

static void testPlaneEntry()
{
    std::cout << "  testPlaneEntry...";

    ViewerSession s = makeSession();
    s.loadFile("/data/stack.tif", LoadOrigin::CommandLine);

    CHECK(s.submitPlaneEntry("4"), "valid plane accepted");
    CHECK(s.plane() == 4 && s.pixels().at(0, 0) == 400.0f, "plane 4 shown");

    CHECK(!s.submitPlaneEntry("7"), "out of range rejected");
    CHECK(!s.submitPlaneEntry("-1"), "negative rejected");
    CHECK(!s.submitPlaneEntry("2x"), "trailing garbage rejected");
    CHECK(!s.submitPlaneEntry("abc"), "non-numeric rejected");
    CHECK(s.plane() == 4, "rejections keep the plane");

    CHECK(s.submitPlaneEntry(" 1 "), "surrounding spaces trimmed");
    CHECK(s.plane() == 1, "plane 1 shown");

    CHECK(s.submitPlaneEntry(""), "empty text accepted");
    CHECK(s.plane() == 0, "empty text means plane 0");

    s.setPlane(99);
    CHECK(s.plane() == 4, "slider input clamps high");
    s.setPlane(-3);
    CHECK(s.plane() == 0, "slider input clamps low");

    std::cout << " done\n";
}

static void testPlaneWithDifferentShape()
{
    std::cout << "  testPlaneWithDifferentShape...";

    ViewerSession s = makeSession();
    s.loadFile("/data/odd.tif", LoadOrigin::CommandLine);
    CHECK(s.plane() == 1, "middle of three planes");

    CHECK(!s.submitPlaneEntry("2"), "mismatched plane refused");
    CHECK(s.plane() == 1 && s.pixels().width == 10, "current plane kept");

    s.setPlane(0);
    CHECK(s.plane() == 0, "matching plane still loads");

    std::cout << " done\n";
}

static void testLevelsAndAutoContrast()
{
    std::cout << "  testLevelsAndAutoContrast...";

    ViewerSession s = makeSession();
    s.loadFile("/data/plain.png", LoadOrigin::CommandLine);
    // Raw values 0..9, below 256: normalisation leaves them unchanged.
    CHECK(s.normalized().at(9, 0) == 9, "normalised copy");
    CHECK(s.display().at(9, 0) == 9, "default window is the identity");

    uint64_t gen = s.displayGeneration();
    s.autoContrast();
    CHECK(s.levels().global().min == 0 && s.levels().global().max == 9, "range of the image");
    CHECK(s.display().at(9, 0) == 255, "top value stretched to white");
    CHECK(s.displayGeneration() != gen, "display changed");

    s.setLevelMin(5);
    CHECK(s.display().at(4, 0) == 0, "below min is black");

    ViewerSession rgb = makeSession();
    rgb.loadFile("/data/rgb.png", LoadOrigin::CommandLine);
    CHECK(rgb.levels().channelCount() == 3, "colour image has channel pairs");
    rgb.selectLevelsChannel(2);
    rgb.setLevelMax(4);
    CHECK(rgb.levels().channel(2).max == 4, "channel 2 pair edited");
    CHECK(rgb.display().at(3, 0, 2) == 255, "channel 2 windowed");
    CHECK(rgb.display().at(0, 0, 0) == 0, "channel 0 unchanged");

    // Auto-contrast leaves per-channel mode so the global stretch shows.
    uint64_t rgbGen = rgb.displayGeneration();
    rgb.autoContrast();
    CHECK(!rgb.levels().perChannel(), "back on All");
    CHECK(rgb.levels().global().min == 0 && rgb.levels().global().max == 5,
          "global pair spans every channel");
    CHECK(rgb.display().at(3, 0, 2) == 255, "brightest sample white");
    CHECK(rgb.display().at(2, 0, 1) == 153, "channel 1 stretched by the global pair");
    CHECK(rgb.displayGeneration() != rgbGen, "display changed");

    std::cout << " done\n";
}

static void testPlacementAndZoom()
{
    std::cout << "  testPlacementAndZoom...";

    ViewerSession big = makeSession();
    big.loadFile("/data/big.png", LoadOrigin::CommandLine);
    CHECK(big.viewport().fitMode(), "large image fitted on load");

    ViewerSession actual(fakeFactory);
    actual.setPreferences(2.0, false);
    actual.resizeContainer(200, 200);
    actual.loadFile("/data/big.png", LoadOrigin::CommandLine);
    CHECK(!actual.viewport().fitMode() && actual.viewport().zoom() == 1.0,
          "fitting disabled by preference");

    ViewerSession pending(fakeFactory);
    pending.loadFile("/data/big.png", LoadOrigin::CommandLine);
    CHECK(!pending.viewport().fitMode(), "no container yet");
    pending.resizeContainer(200, 200);
    CHECK(pending.viewport().fitMode(), "placement applied once the container has a size");

    ViewerSession small = makeSession();
    small.loadFile("/data/plain.png", LoadOrigin::CommandLine);
    CHECK(small.viewport().zoom() == 1.0, "small image at actual size");
    // Image box is (95, 96)-(105, 104) in a 200x200 container.
    CHECK(!small.zoomAtScreen(10.0, 10.0, 1.3), "wheel outside the image ignored");
    CHECK(small.zoomAtScreen(100.0, 100.0, 1.3), "wheel over the image zooms");

    std::cout << " done\n";
}

static void testInspection()
{
    std::cout << "  testInspection...";

    ViewerSession s = makeSession();
    s.loadFile("/data/plain.png", LoadOrigin::CommandLine);
    CHECK(s.statusText(98.0, 97.0) == "X: 3 Y: 1  3", "value under the cursor");
    CHECK(s.statusText(0.0, 0.0) == "-", "outside the image");

    ViewerSession rgb = makeSession();
    rgb.loadFile("/data/rgb.png", LoadOrigin::CommandLine);
    auto probe = rgb.probePixel(99.0, 99.0);
    CHECK(probe && probe->pixel.x == 1 && probe->value == "[1 2 3]", "channels listed");

    ImageStatistics st = s.imageStatistics();
    CHECK(st.sampleType == "uint16" && st.backend == "fake", "format and backend");
    CHECK(st.width == 10 && st.height == 8, "dimensions");
    CHECK(st.min == 0.0 && st.max == 9.0 && st.uniqueValues == 10, "value statistics");

    std::cout << " done\n";
}

static void testFileNavigation()
{
    std::cout << "  testFileNavigation...";

    fs::path dir = fs::temp_directory_path() / "imquick_session_nav";
    fs::remove_all(dir);
    fs::create_directories(dir);
    for (const char* name : {"a.png", "broken.png", "c.png"})
        std::ofstream(dir / name) << "x";

    ViewerSession s = makeSession();
    s.loadFile((dir / "a.png").string(), LoadOrigin::CommandLine);

    CHECK(s.nextFile(), "step forward");
    CHECK(!s.hasImage() && s.placeholder() == ViewerSession::kFailedMessage,
          "undecodable sibling shows the failure placeholder");
    CHECK(s.nextFile(), "navigation continues past a failed file");
    CHECK(fs::path(s.currentPath()).filename() == "c.png" && s.hasImage(), "c.png loaded");
    CHECK(s.nextFile(), "wrap forward");
    CHECK(fs::path(s.currentPath()).filename() == "a.png", "back to a.png");
    CHECK(s.previousFile(), "wrap backward");
    CHECK(fs::path(s.currentPath()).filename() == "c.png", "previous of a.png is c.png");
    CHECK(s.series().size() == 3, "series kept across navigation");

    s.loadFile("/elsewhere/plain.png", LoadOrigin::Drop);
    CHECK(s.series().empty(), "loading from another directory resets the series");

    fs::remove_all(dir);

    std::cout << " done\n";
}

int main()
{
    std::cout << "=== ViewerSession Tests ===\n";

    testEmptySession();
    testLoadShowsMiddlePlane();
    testLoadFailure();
    testPlaneEntry();
    testPlaneWithDifferentShape();
    testLevelsAndAutoContrast();
    testPlacementAndZoom();
    testInspection();
    testFileNavigation();

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All ViewerSession tests PASSED.\n";
        return 0;
    }
    else
    {
        std::cout << failures << " ViewerSession test(s) FAILED.\n";
        return 1;
    }
}
