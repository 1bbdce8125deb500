#include "edgedetector.hpp"

#include <opencv2/imgproc.hpp>

namespace floorplan {

cv::Mat1d EdgeDetector::luminance(const cv::Mat4b& rgba)
{
    CV_Assert(!rgba.empty());

    cv::Mat rgba64;
    rgba.convertTo(rgba64, CV_64F);

    // alpha does not contribute
    const double third = 1.0 / 3.0;
    cv::Mat lum;
    cv::transform(rgba64, lum, cv::Matx14d(third, third, third, 0.0));
    return lum;
}

cv::Mat1d EdgeDetector::gradientMagnitude(const cv::Mat1d& lum)
{
    // ksize 3: [-1 0 1; -2 0 2; -1 0 1] and its transpose
    cv::Mat1d gx, gy;
    cv::Sobel(lum, gx, CV_64F, 1, 0, 3, 1.0, 0.0, cv::BORDER_REPLICATE);
    cv::Sobel(lum, gy, CV_64F, 0, 1, 3, 1.0, 0.0, cv::BORDER_REPLICATE);

    cv::Mat1d magnitude;
    cv::magnitude(gx, gy, magnitude);
    return magnitude;
}

cv::Mat1b EdgeDetector::detect(const cv::Mat4b& rgba, const EdgeConfig& config)
{
    cv::Mat1b edges = cv::Mat1b::zeros(rgba.size());
    if (rgba.rows < 3 || rgba.cols < 3)
        return edges;                     // no interior pixels

    cv::Mat1d magnitude = gradientMagnitude(luminance(rgba));

    // border pixels use extrapolated neighbours and are excluded below
    const cv::Rect interior(1, 1, rgba.cols - 2, rgba.rows - 2);
    cv::Mat1b inner = edges(interior);
    cv::compare(magnitude(interior), config.magnitudeThreshold, inner, cv::CMP_GT);
    return edges;
}

} // namespace floorplan
