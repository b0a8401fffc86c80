// test_viewport_transform.cpp: tests for zoom, pan, fit and the
// screen -> canvas -> image coordinate mapping.

#include "ViewportTransform.h"

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

static ViewportTransform makeViewport(int imgW, int imgH, int contW, int contH)
{
    ViewportTransform vp;
    vp.setImageSize(imgW, imgH);
    vp.setContainerSize(contW, contH);
    vp.resetToActualSize();
    return vp;
}

static void testActualSizeCentres()
{
    std::cout << "  testActualSizeCentres...";

    ViewportTransform vp = makeViewport(100, 100, 200, 200);
    CHECK(approxEq(vp.zoom(), 1.0), "zoom 1.0");
    CHECK(!vp.fitMode(), "fit mode off");
    CHECK(approxEq(vp.imageBounds().min.x, 50.0) && approxEq(vp.imageBounds().min.y, 50.0),
          "box starts at (50, 50)");
    CHECK(approxEq(vp.imageBounds().max.x, 150.0) && approxEq(vp.imageBounds().max.y, 150.0),
          "box ends at (150, 150)");
    CHECK(approxEq(vp.scrollOrigin().x, 0.0) && approxEq(vp.scrollOrigin().y, 0.0),
          "scroll origin reset");

    std::cout << " done\n";
}

static void testScreenToImage()
{
    std::cout << "  testScreenToImage...";

    ViewportTransform vp = makeViewport(100, 100, 200, 200);
    auto p = vp.screenToImage(50.0, 50.0);
    CHECK(p && p->x == 0 && p->y == 0, "top-left pixel");
    p = vp.screenToImage(149.9, 120.5);
    CHECK(p && p->x == 99 && p->y == 70, "interior pixel");
    CHECK(!vp.screenToImage(150.0, 100.0), "right edge is outside");
    CHECK(!vp.screenToImage(49.0, 100.0), "left of the image is outside");

    vp.zoomAt(100.0, 100.0, 2.0);
    p = vp.screenToImage(3.0, 5.0);
    CHECK(p && p->x == 1 && p->y == 2, "zoomed pixel floors");

    vp.panBy(10.0, 0.0);
    p = vp.screenToImage(0.0, 0.0);
    CHECK(p && p->x == 5 && p->y == 0, "pan shifts the mapping");

    std::cout << " done\n";
}

static void testZoomAboutAnchor()
{
    std::cout << "  testZoomAboutAnchor...";

    ViewportTransform vp = makeViewport(100, 100, 200, 200);
    CHECK(vp.zoomAt(100.0, 100.0, 2.0), "zoom in applied");
    CHECK(approxEq(vp.zoom(), 2.0), "zoom factor doubled");
    CHECK(approxEq(vp.imageBounds().min.x, 0.0) && approxEq(vp.imageBounds().max.x, 200.0),
          "box scaled about the anchor");

    CHECK(vp.zoomAt(0.0, 0.0, 0.5), "zoom out applied");
    CHECK(approxEq(vp.zoom(), 1.0), "back to 1.0");
    CHECK(approxEq(vp.imageBounds().min.x, 0.0) && approxEq(vp.imageBounds().max.x, 100.0),
          "anchor point stays fixed");

    CHECK(!vp.zoomAt(0.0, 0.0, 1.0), "unit scale is a no-op");

    std::cout << " done\n";
}

static void testZoomLimits()
{
    std::cout << "  testZoomLimits...";

    ViewportTransform vp = makeViewport(100, 100, 200, 200);

    // Zooming in stops once the factor exceeds 200 / 5 = 40.
    int steps = 0;
    while (vp.zoomIn() && steps < 100)
        ++steps;
    CHECK(steps < 100, "zoom in terminates");
    CHECK(vp.zoom() > 40.0, "last accepted step crossed the limit");
    CHECK(vp.zoom() / vp.zoomStep() <= 40.0, "previous factor was within the limit");

    // Zooming out stops before the minor dimension drops below 30 px.
    ViewportTransform out = makeViewport(100, 100, 200, 200);
    steps = 0;
    while (out.zoomOut() && steps < 100)
        ++steps;
    CHECK(steps < 100, "zoom out terminates");
    CHECK(100.0 * out.zoom() >= 30.0, "minor dimension stays >= 30 px");
    CHECK(100.0 * out.zoom() / out.zoomStep() < 30.0, "one more step would drop below 30 px");

    std::cout << " done\n";
}

static void testFitToWindow()
{
    std::cout << "  testFitToWindow...";

    ViewportTransform vp;
    vp.setImageSize(200, 100);
    vp.fitToWindow(104, 104);
    CHECK(vp.fitMode(), "fit mode on");
    CHECK(approxEq(vp.zoom(), 0.5), "scale limited by width less margin");
    CHECK(approxEq(vp.imageBounds().min.x, 2.0) && approxEq(vp.imageBounds().max.x, 102.0),
          "2 px margin horizontally");
    CHECK(approxEq(vp.imageBounds().min.y, 27.0) && approxEq(vp.imageBounds().max.y, 77.0),
          "centred vertically");

    vp.setContainerSize(204, 204);
    CHECK(vp.fitMode(), "still fitting after resize");
    CHECK(approxEq(vp.zoom(), 1.0), "resize refits the image");

    vp.zoomAt(102.0, 102.0, 1.3);
    CHECK(!vp.fitMode(), "zooming leaves fit mode");
    vp.setContainerSize(300, 300);
    CHECK(approxEq(vp.zoom(), 1.3), "resize outside fit mode keeps zoom");

    std::cout << " done\n";
}

static void testScrollFraction()
{
    std::cout << "  testScrollFraction...";

    ViewportTransform vp = makeViewport(100, 100, 200, 200);
    glm::dvec2 fx = vp.scrollFraction(0);
    CHECK(fx.x <= 0.0 && fx.y >= 1.0, "whole image visible: thumb covers the bar");

    vp.zoomAt(100.0, 100.0, 2.0);
    vp.panBy(50.0, 0.0);
    fx = vp.scrollFraction(0);
    CHECK(approxEq(fx.x, 0.2) && approxEq(fx.y, 1.0), "panned right past the image edge");

    glm::dvec2 fy = vp.scrollFraction(1);
    CHECK(approxEq(fy.x, 0.0) && approxEq(fy.y, 1.0), "vertical axis exactly filled");

    CanvasRect region = vp.scrollRegion();
    CHECK(approxEq(region.min.x, 0.0) && approxEq(region.max.x, 250.0),
          "region is the union of box and visible rect");

    std::cout << " done\n";
}

static void testScrollToFraction()
{
    std::cout << "  testScrollToFraction...";

    ViewportTransform vp = makeViewport(100, 100, 200, 200);
    vp.zoomAt(100.0, 100.0, 2.0);
    vp.setContainerSize(100, 100);
    glm::dvec2 f = vp.scrollFraction(0);
    CHECK(approxEq(f.x, 0.0) && approxEq(f.y, 0.5), "thumb covers half the bar");

    vp.scrollToFraction(0, 0.25);
    CHECK(approxEq(vp.scrollOrigin().x, 50.0), "thumb moved a quarter along");
    f = vp.scrollFraction(0);
    CHECK(approxEq(f.x, 0.25) && approxEq(f.y, 0.75), "thumb follows");
    CHECK(approxEq(vp.scrollOrigin().y, 0.0), "other axis untouched");

    vp.scrollToFraction(0, 0.9);
    CHECK(approxEq(vp.scrollOrigin().x, 100.0), "thumb stops at the end of the bar");
    vp.scrollToFraction(0, -1.0);
    CHECK(approxEq(vp.scrollOrigin().x, 0.0), "thumb stops at the start of the bar");

    vp.scrollToFraction(1, 0.5);
    CHECK(approxEq(vp.scrollOrigin().y, 100.0), "vertical bar scrolls the y origin");

    std::cout << " done\n";
}

static void testContainsCanvasPoint()
{
    std::cout << "  testContainsCanvasPoint...";

    ViewportTransform vp = makeViewport(100, 100, 200, 200);
    CHECK(vp.containsCanvasPoint(100.0, 100.0), "centre is inside");
    CHECK(!vp.containsCanvasPoint(50.0, 100.0), "edge is not strictly inside");
    CHECK(!vp.containsCanvasPoint(10.0, 10.0), "margin is outside");

    std::cout << " done\n";
}

int main()
{
    std::cout << "=== ViewportTransform Tests ===\n";

    testActualSizeCentres();
    testScreenToImage();
    testZoomAboutAnchor();
    testZoomLimits();
    testFitToWindow();
    testScrollFraction();
    testScrollToFraction();
    testContainsCanvasPoint();

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All ViewportTransform tests PASSED.\n";
        return 0;
    }
    else
    {
        std::cout << failures << " ViewportTransform test(s) FAILED.\n";
        return 1;
    }
}
