#ifndef EDGEDETECTOR_H
#define EDGEDETECTOR_H

#include <opencv2/core.hpp>
#include "../config.hpp"

namespace floorplan {

/**
 * @brief Gradient-magnitude edge detection on the working raster.
 */
class EdgeDetector {
public:
    /** Per-pixel unweighted mean of R, G and B (CV_64F). */
    static cv::Mat1d luminance(const cv::Mat4b& rgba);

    /** 3x3 Sobel gradient magnitude sqrt(gx^2 + gy^2) of a luminance field. */
    static cv::Mat1d gradientMagnitude(const cv::Mat1d& lum);

    /**
     * Binary edge mask of the same size as @p rgba: 255 where the gradient
     * magnitude exceeds config.magnitudeThreshold, 0 elsewhere. The one-pixel
     * image border is always 0.
     */
    static cv::Mat1b detect(const cv::Mat4b& rgba, const EdgeConfig& config);
};

} // namespace floorplan

#endif // EDGEDETECTOR_H
