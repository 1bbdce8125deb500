#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "preparing/rasterizer.hpp"
#include "test_images.hpp"

using namespace floorplan;

namespace {

/**
 * Insert an APP1 Exif segment carrying only the Orientation tag into a JPEG
 * stream, after SOI and the JFIF APP0 segment.
 */
std::vector<uchar> withExifOrientation(std::vector<uchar> jpeg, std::uint16_t orientation)
{
    const std::vector<uchar> app1 = {
        0xFF, 0xE1, 0x00, 0x22,                         // APP1, length 34
        'E', 'x', 'i', 'f', 0x00, 0x00,
        'M', 'M', 0x00, 0x2A, 0x00, 0x00, 0x00, 0x08,   // big-endian TIFF header, IFD0 at 8
        0x00, 0x01,                                     // one entry
        0x01, 0x12, 0x00, 0x03, 0x00, 0x00, 0x00, 0x01, // Orientation, SHORT, count 1
        static_cast<uchar>(orientation >> 8), static_cast<uchar>(orientation & 0xFF), 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00                          // no next IFD
    };

    std::size_t pos = 2;
    if (jpeg.size() > 6 && jpeg[2] == 0xFF && jpeg[3] == 0xE0)
        pos += 2 + ((static_cast<std::size_t>(jpeg[4]) << 8) | jpeg[5]);
    jpeg.insert(jpeg.begin() + static_cast<std::ptrdiff_t>(pos), app1.begin(), app1.end());
    return jpeg;
}

} // namespace

TEST(Rasterizer, ScaleNeverUpscales)
{
    EXPECT_DOUBLE_EQ(Rasterizer::computeScale({400, 300}, 800), 1.0);
    EXPECT_DOUBLE_EQ(Rasterizer::computeScale({800, 800}, 800), 1.0);
    EXPECT_DOUBLE_EQ(Rasterizer::computeScale({1600, 800}, 800), 0.5);
    EXPECT_DOUBLE_EQ(Rasterizer::computeScale({1000, 2000}, 800), 0.4);
}

TEST(Rasterizer, ScaledSizeRoundsAndKeepsOnePixel)
{
    EXPECT_EQ(Rasterizer::scaledSize({1000, 333}, 0.8), cv::Size(800, 266));
    EXPECT_EQ(Rasterizer::scaledSize({1000, 335}, 0.8), cv::Size(800, 268));
    EXPECT_EQ(Rasterizer::scaledSize({4000, 1}, 0.2), cv::Size(800, 1));
}

TEST(Rasterizer, LargeImageIsBoundedWithAspectPreserved)
{
    auto bytes = testimg::encode(testimg::blank(1600, 1200));
    RasterImage r = Rasterizer::rasterize(bytes, RasterConfig{});

    EXPECT_DOUBLE_EQ(r.scale, 0.5);
    EXPECT_EQ(r.originalSize, cv::Size(1600, 1200));
    EXPECT_EQ(r.rgba.cols, 800);
    EXPECT_EQ(r.rgba.rows, 600);
    EXPECT_EQ(r.rgba.type(), CV_8UC4);
}

TEST(Rasterizer, PortraitImageUsesHeightBound)
{
    auto bytes = testimg::encode(testimg::blank(300, 900));
    RasterConfig cfg;
    cfg.maxDimension = 600;
    RasterImage r = Rasterizer::rasterize(bytes, cfg);

    EXPECT_GT(r.scale, 0.0);
    EXPECT_LE(r.scale, 1.0);
    EXPECT_EQ(r.rgba.rows, 600);
    EXPECT_EQ(r.rgba.cols, 200);
}

TEST(Rasterizer, SmallImageKeepsItsSize)
{
    auto bytes = testimg::encode(testimg::blank(120, 80));
    RasterImage r = Rasterizer::rasterize(bytes, RasterConfig{});
    EXPECT_DOUBLE_EQ(r.scale, 1.0);
    EXPECT_EQ(r.rgba.size(), cv::Size(120, 80));
}

TEST(Rasterizer, ChannelsAreRGBA)
{
    // BGR (0,0,255) is pure red
    auto bytes = testimg::encode(testimg::blank(10, 10, cv::Scalar(0, 0, 255)));
    RasterImage r = Rasterizer::rasterize(bytes, RasterConfig{});
    EXPECT_EQ(r.rgba(0, 0), cv::Vec4b(255, 0, 0, 255));
}

TEST(Rasterizer, GrayscaleSourceIsExpanded)
{
    cv::Mat1b gray(20, 30, uchar(77));
    RasterImage r = Rasterizer::rasterize(testimg::encode(gray), RasterConfig{});
    EXPECT_EQ(r.rgba.type(), CV_8UC4);
    EXPECT_EQ(r.rgba(5, 5), cv::Vec4b(77, 77, 77, 255));
}

TEST(Rasterizer, SixteenBitSourceIsReducedToEightBit)
{
    cv::Mat_<cv::Vec3w> deep(30, 40, cv::Vec3w(65535, 65535, 65535));
    RasterImage r = Rasterizer::rasterize(testimg::encode(deep), RasterConfig{});
    EXPECT_EQ(r.rgba.type(), CV_8UC4);
    EXPECT_EQ(r.rgba.size(), cv::Size(40, 30));
    EXPECT_EQ(r.rgba(10, 10), cv::Vec4b(255, 255, 255, 255));
}

TEST(Rasterizer, ExifOrientationIsApplied)
{
    const auto jpeg = testimg::encode(testimg::blank(60, 40), ".jpg");

    RasterImage plain = Rasterizer::rasterize(jpeg, RasterConfig{});
    EXPECT_EQ(plain.rgba.size(), cv::Size(60, 40));

    // 6: rotate 90 degrees clockwise for display
    RasterImage rotated = Rasterizer::rasterize(withExifOrientation(jpeg, 6), RasterConfig{});
    EXPECT_EQ(rotated.originalSize, cv::Size(40, 60));
    EXPECT_EQ(rotated.rgba.size(), cv::Size(40, 60));
}

TEST(Rasterizer, BmpIsAccepted)
{
    auto bytes = testimg::encode(testimg::blank(40, 30), ".bmp");
    EXPECT_NO_THROW(Rasterizer::rasterize(bytes, RasterConfig{}));
}

TEST(Rasterizer, NonImageBytesRaiseDecodeError)
{
    const std::string text = "definitely not an image";
    std::vector<uchar> bytes(text.begin(), text.end());
    EXPECT_THROW(Rasterizer::rasterize(bytes, RasterConfig{}), DecodeError);
    EXPECT_THROW(Rasterizer::rasterize({}, RasterConfig{}), DecodeError);
}

TEST(Rasterizer, TruncatedPngRaisesDecodeError)
{
    auto bytes = testimg::encode(testimg::samplePlan());
    bytes.resize(16);
    EXPECT_THROW(Rasterizer::rasterize(bytes, RasterConfig{}), DecodeError);
}
