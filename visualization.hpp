#pragma once
#include <algorithm>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include "floorplan_processing.hpp"
#include "geometry/contour.hpp"
#include "utils.hpp"

namespace floorplan {

/** BGR drawing colour of a category. */
inline cv::Scalar elementColor(ElementType t)
{
    switch (t)
    {
        case ElementType::Wall:   return cv::Scalar( 96,  96,  96);   // grey
        case ElementType::Door:   return cv::Scalar( 19,  69, 139);   // #8b4513
        case ElementType::Window: return cv::Scalar(246, 181, 100);   // #64b5f6
        case ElementType::Room:   return cv::Scalar( 80, 175,  76);   // green
    }
    return cv::Scalar(0, 0, 255);
}

/**
 * @brief Paint the classified contours over the working image.
 *
 * @param result     Pipeline output.
 * @param rgbaImage  Working image the result was computed on (RGBA).
 * @param alpha      Opacity (0..1) of the painted element pixels.
 * @param labels     Draw the category name next to each bounding box.
 * @return           BGR image of the working size.
 */
inline cv::Mat renderElementsOverlay(const ProcessingResult& result,
                                     const cv::Mat& rgbaImage,
                                     double alpha = 0.8,
                                     bool labels = true)
{
    cv::Mat canvas;
    if (!toDisplayable(rgbaImage, canvas, /*isRGB=*/true))
        canvas = cv::Mat::zeros(result.imageHeight, result.imageWidth, CV_8UC3);
    if (canvas.channels() == 1)
        cv::cvtColor(canvas, canvas, cv::COLOR_GRAY2BGR);

    /* ---------- 1. element pixels ---------------------------------------- */
    cv::Mat painted = canvas.clone();
    cv::Mat1b touched = cv::Mat1b::zeros(canvas.size());
    for (ElementType t : kElementTypes)
    {
        const cv::Vec3b color(static_cast<uchar>(elementColor(t)[0]),
                              static_cast<uchar>(elementColor(t)[1]),
                              static_cast<uchar>(elementColor(t)[2]));
        for (const auto& c : result.elements(t))
            for (const auto& p : c.points)
            {
                if (p.x < 0 || p.y < 0 || p.x >= canvas.cols || p.y >= canvas.rows) continue;
                painted.at<cv::Vec3b>(p) = color;
                touched(p) = 255;
            }
    }

    /* dst = canvas*(1-α) + painted*α, only where an element was drawn */
    cv::Mat blended;
    cv::addWeighted(canvas, 1.0 - alpha, painted, alpha, 0.0, blended);
    blended.copyTo(canvas, touched);

    /* ---------- 2. bounding boxes and labels ------------------------------ */
    for (ElementType t : kElementTypes)
    {
        for (const auto& c : result.elements(t))
        {
            if (c.points.empty()) continue;
            const Bounds b = boundsOf(c.points);
            cv::rectangle(canvas, cv::Point(b.minX, b.minY), cv::Point(b.maxX, b.maxY),
                          elementColor(t), 1, cv::LINE_8);
            if (labels)
                cv::putText(canvas, toString(t), cv::Point(b.minX + 2, std::max(b.minY - 3, 10)),
                            cv::FONT_HERSHEY_PLAIN, 0.8, elementColor(t), 1);
        }
    }
    return canvas;
}

/** Edge mask as a BGR image (white edges on black). */
inline cv::Mat renderEdgeMask(const cv::Mat1b& edges)
{
    cv::Mat vis;
    cv::cvtColor(edges, vis, cv::COLOR_GRAY2BGR);
    return vis;
}

} // namespace floorplan
