// test_tile_renderer.cpp: tests for visible-tile planning, resampling and
// the render cache.

#include "TileRenderer.h"

#include <cmath>
#include <iostream>

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

static bool approxEq(double a, double b, double tol = 1e-9)
{
    return std::fabs(a - b) < tol;
}

/// Single-channel ramp where every pixel holds its column index.
static ByteImage makeColumnRamp(int w, int h)
{
    ByteImage img;
    img.width = w;
    img.height = h;
    img.channels = 1;
    img.data.resize(static_cast<size_t>(w) * h);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x)
            img.data[static_cast<size_t>(y) * w + x] = static_cast<uint8_t>(x);
    return img;
}

/// 100x100 image zoomed 2x about its corner, seen through a 40x40 window
/// scrolled by (60, 60): image pixels 5..25 are visible.
static ViewportTransform makeZoomedViewport()
{
    ViewportTransform vp;
    vp.setImageSize(100, 100);
    vp.setContainerSize(200, 200);
    vp.resetToActualSize();
    vp.zoomAt(50.0, 50.0, 2.0);
    vp.setContainerSize(40, 40);
    vp.panBy(60.0, 60.0);
    return vp;
}

static void testInterpolationNames()
{
    std::cout << "  testInterpolationNames...";

    CHECK(interpolationModeCount() == 4, "four modes");
    CHECK(interpolationModeName(InterpolationMode::Bicubic) == "Bicubic", "Bicubic name");
    auto m = interpolationModeByName("lanczos");
    CHECK(m && *m == InterpolationMode::Lanczos, "lookup is case-insensitive");
    CHECK(!interpolationModeByName("area"), "unknown name rejected");

    std::cout << " done\n";
}

static void testPlanZoomedRegion()
{
    std::cout << "  testPlanZoomedRegion...";

    ViewportTransform vp = makeZoomedViewport();
    TilePlan plan = planTile(vp);
    CHECK(plan.visible, "tile visible");
    CHECK(approxEq(plan.desX1, 5.0) && approxEq(plan.desY1, 5.0), "region starts at (5, 5)");
    CHECK(approxEq(plan.sourceWidth(), 20.0) && approxEq(plan.sourceHeight(), 20.0),
          "20 image pixels across");
    CHECK(plan.cropX1 == 5 && plan.cropX2 == 25, "whole-pixel crop");
    CHECK(plan.targetWidth == 40 && plan.targetHeight == 40, "fills the container");
    CHECK(plan.resizedWidth == 40 && plan.offsetX == 0, "no sub-pixel offset");
    CHECK(approxEq(plan.anchor.x, 60.0) && approxEq(plan.anchor.y, 60.0),
          "anchored at the visible rect corner");

    std::cout << " done\n";
}

static void testPlanFractionalOffset()
{
    std::cout << "  testPlanFractionalOffset...";

    ViewportTransform vp = makeZoomedViewport();
    vp.panBy(1.0, 0.0);
    TilePlan plan = planTile(vp);
    CHECK(approxEq(plan.desX1, 5.5), "half-pixel start");
    CHECK(plan.cropX1 == 5 && plan.cropX2 == 26, "crop widened to whole pixels");
    CHECK(plan.resizedWidth == 42, "crop scaled by screen / source ratio");
    CHECK(plan.offsetX == 1, "one screen pixel trimmed from the left");

    std::cout << " done\n";
}

static void testPlanNotVisible()
{
    std::cout << "  testPlanNotVisible...";

    ViewportTransform vp = makeZoomedViewport();
    vp.panBy(-60.0, -60.0);
    TilePlan plan = planTile(vp);
    CHECK(!plan.visible, "image scrolled out of view");
    CHECK(renderTile(makeColumnRamp(100, 100), plan, InterpolationMode::Nearest).empty(),
          "invisible plan renders nothing");

    ViewportTransform empty;
    CHECK(!planTile(empty).visible, "no image, no tile");

    std::cout << " done\n";
}

static void testRenderNearest()
{
    std::cout << "  testRenderNearest...";

    ByteImage display = makeColumnRamp(100, 100);
    ViewportTransform vp = makeZoomedViewport();
    TilePlan plan = planTile(vp);
    ByteImage tile = renderTile(display, plan, InterpolationMode::Nearest);

    CHECK(tile.width == 40 && tile.height == 40 && tile.channels == 1, "tile size");
    CHECK(tile.at(0, 0) == 5 && tile.at(1, 0) == 5, "first source column doubled");
    CHECK(tile.at(2, 0) == 6, "second source column");
    CHECK(tile.at(39, 39) == 24, "last visible column");

    std::cout << " done\n";
}

static void testRenderMultiChannel()
{
    std::cout << "  testRenderMultiChannel...";

    ByteImage display;
    display.width = 10;
    display.height = 10;
    display.channels = 3;
    display.data.assign(10 * 10 * 3, 0);
    for (size_t i = 0; i < display.data.size(); i += 3)
    {
        display.data[i] = 200;
        display.data[i + 2] = 50;
    }

    ViewportTransform vp;
    vp.setImageSize(10, 10);
    vp.setContainerSize(20, 20);
    vp.resetToActualSize();
    TilePlan plan = planTile(vp);
    ByteImage tile = renderTile(display, plan, InterpolationMode::Bilinear);
    CHECK(tile.width == 10 && tile.height == 10 && tile.channels == 3, "channels preserved");
    CHECK(tile.at(4, 4, 0) == 200 && tile.at(4, 4, 1) == 0 && tile.at(4, 4, 2) == 50,
          "constant colour survives resampling");

    std::cout << " done\n";
}

static void testRendererCache()
{
    std::cout << "  testRendererCache...";

    ByteImage display = makeColumnRamp(100, 100);
    ViewportTransform vp = makeZoomedViewport();
    TileRenderer renderer;

    uint64_t s1 = renderer.render(display, 1, vp, InterpolationMode::Nearest).serial;
    uint64_t s2 = renderer.render(display, 1, vp, InterpolationMode::Nearest).serial;
    CHECK(s1 == s2, "unchanged inputs reuse the tile");

    uint64_t s3 = renderer.render(display, 2, vp, InterpolationMode::Nearest).serial;
    CHECK(s3 != s2, "new display generation rebuilds");

    uint64_t s4 = renderer.render(display, 2, vp, InterpolationMode::Bicubic).serial;
    CHECK(s4 != s3, "interpolation change rebuilds");

    vp.panBy(3.0, 0.0);
    uint64_t s5 = renderer.render(display, 2, vp, InterpolationMode::Bicubic).serial;
    CHECK(s5 != s4, "pan rebuilds");

    renderer.invalidate();
    uint64_t s6 = renderer.render(display, 2, vp, InterpolationMode::Bicubic).serial;
    CHECK(s6 != s5, "invalidate forces a rebuild");

    std::cout << " done\n";
}

int main()
{
    std::cout << "=== TileRenderer Tests ===\n";

    testInterpolationNames();
    testPlanZoomedRegion();
    testPlanFractionalOffset();
    testPlanNotVisible();
    testRenderNearest();
    testRenderMultiChannel();
    testRendererCache();

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All TileRenderer tests PASSED.\n";
        return 0;
    }
    else
    {
        std::cout << failures << " TileRenderer test(s) FAILED.\n";
        return 1;
    }
}
