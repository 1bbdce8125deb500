#include <gtest/gtest.h>

#include "geometry/contour.hpp"
#include "test_images.hpp"

using namespace floorplan;

TEST(ContourGeometry, ShoelaceOfSquareIsItsArea)
{
    std::vector<cv::Point> square{{0, 0}, {10, 0}, {10, 10}, {0, 10}};
    EXPECT_DOUBLE_EQ(shoelaceArea(square), 100.0);
}

TEST(ContourGeometry, ShoelaceIgnoresWindingDirection)
{
    std::vector<cv::Point> ccw{{0, 10}, {10, 10}, {10, 0}, {0, 0}};
    EXPECT_DOUBLE_EQ(shoelaceArea(ccw), 100.0);
}

TEST(ContourGeometry, ShoelaceOfDegenerateSetsIsZero)
{
    EXPECT_DOUBLE_EQ(shoelaceArea({}), 0.0);
    EXPECT_DOUBLE_EQ(shoelaceArea({{1, 1}, {5, 5}}), 0.0);
    EXPECT_DOUBLE_EQ(shoelaceArea({{0, 0}, {1, 1}, {2, 2}, {3, 3}}), 0.0);
}

TEST(ContourGeometry, ShoelaceOfPerimeterWalkMatchesRectangle)
{
    auto pts = testimg::rectanglePerimeter(30, 40, 100, 60);
    EXPECT_DOUBLE_EQ(shoelaceArea(pts), 6000.0);
}

TEST(ContourGeometry, BoundsAreCoordinateSpans)
{
    const Bounds b = boundsOf({{5, 7}, {15, 3}, {9, 20}});
    EXPECT_EQ(b.minX, 5);
    EXPECT_EQ(b.maxX, 15);
    EXPECT_EQ(b.minY, 3);
    EXPECT_EQ(b.maxY, 20);
    EXPECT_EQ(b.width(), 10);
    EXPECT_EQ(b.height(), 17);

    const Bounds single = boundsOf({{4, 4}});
    EXPECT_EQ(single.width(), 0);
    EXPECT_EQ(single.height(), 0);
}

TEST(ContourGeometry, BoundsOfEmptySetThrows)
{
    EXPECT_THROW(boundsOf({}), std::invalid_argument);
}

TEST(ContourGeometry, NearBorderUsesInclusiveMargin)
{
    const cv::Size image(100, 80);
    EXPECT_TRUE ((Bounds{5, 40, 50, 50}.nearBorder(image, 5)));
    EXPECT_FALSE((Bounds{6, 6, 94, 74}.nearBorder(image, 5)));
    EXPECT_TRUE ((Bounds{6, 6, 95, 74}.nearBorder(image, 5)));
    EXPECT_TRUE ((Bounds{6, 6, 94, 75}.nearBorder(image, 5)));
}

TEST(ElementTypeNames, RoundTripThroughStrings)
{
    EXPECT_EQ(toString(ElementType::Wall), "wall");
    EXPECT_EQ(toString(ElementType::Door), "door");
    EXPECT_EQ(toString(ElementType::Window), "window");
    EXPECT_EQ(toString(ElementType::Room), "room");

    EXPECT_EQ(elementTypeFromString("window"), ElementType::Window);
    EXPECT_FALSE(elementTypeFromString("stairs").has_value());
}
