#pragma once
/*-----------------------------------------------------------------------------
 *  test_images.hpp
 *
 *  Synthetic rasters and point sets shared by the unit tests.
 *---------------------------------------------------------------------------*/
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace testimg {

/** Encode a BGR / gray image with the given extension (".png", ".bmp"). */
inline std::vector<uchar> encode(const cv::Mat& img, const std::string& ext = ".png")
{
    std::vector<uchar> buf;
    cv::imencode(ext, img, buf);
    return buf;
}

/** White canvas of the given size (BGR). */
inline cv::Mat3b blank(int width, int height, cv::Scalar color = cv::Scalar(255, 255, 255))
{
    return cv::Mat3b(height, width, cv::Vec3b(static_cast<uchar>(color[0]),
                                              static_cast<uchar>(color[1]),
                                              static_cast<uchar>(color[2])));
}

/** A small plan: outer walls, two rooms split by an inner wall, a door gap. */
inline cv::Mat3b samplePlan(int width = 400, int height = 300)
{
    cv::Mat3b img = blank(width, height);
    const cv::Scalar black(0, 0, 0);
    cv::rectangle(img, cv::Point(20, 20), cv::Point(width - 20, height - 20), black, 6);
    cv::line(img, cv::Point(width / 2, 20), cv::Point(width / 2, height / 2 - 20), black, 4);
    cv::line(img, cv::Point(width / 2, height / 2 + 20), cv::Point(width / 2, height - 20), black, 4);
    cv::rectangle(img, cv::Point(60, 60), cv::Point(140, 120), black, cv::FILLED);
    cv::line(img, cv::Point(250, 60), cv::Point(340, 60), black, 3);
    return img;
}

/**
 * Dark canvas with a one-pixel grey (10) outline around each rectangle and a
 * lighter (20) fill inside it. With the default edge threshold only the
 * outline pixels are edges, so every rectangle traces to one closed
 * one-pixel loop enclosing roughly its area.
 */
inline cv::Mat3b outlinedRects(int width, int height, const std::vector<cv::Rect>& rects)
{
    cv::Mat3b img(height, width, cv::Vec3b(0, 0, 0));
    for (const auto& r : rects)
    {
        img(r).setTo(cv::Scalar::all(10));
        img(cv::Rect(r.x + 1, r.y + 1, r.width - 2, r.height - 2)).setTo(cv::Scalar::all(20));
    }
    return img;
}

/**
 * 400x220 plan with a 100x80 outlined room (x 50..150, y 30..110) and a
 * 300x40 outlined wall (x 40..340, y 140..180).
 */
inline cv::Mat3b roomAndWallPlan()
{
    return outlinedRects(400, 220, {cv::Rect(50, 30, 101, 81), cv::Rect(40, 140, 301, 41)});
}

/**
 * Lattice points along the outline of the axis-aligned rectangle
 * [x0, x0+w] x [y0, y0+h], walked clockwise in image coordinates, so the
 * shoelace area of the sequence is exactly w*h.
 */
inline std::vector<cv::Point> rectanglePerimeter(int x0, int y0, int w, int h)
{
    std::vector<cv::Point> pts;
    for (int x = x0; x < x0 + w; ++x) pts.emplace_back(x, y0);
    for (int y = y0; y < y0 + h; ++y) pts.emplace_back(x0 + w, y);
    for (int x = x0 + w; x > x0; --x) pts.emplace_back(x, y0 + h);
    for (int y = y0 + h; y > y0; --y) pts.emplace_back(x0, y);
    return pts;
}

} // namespace testimg
