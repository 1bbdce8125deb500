#ifndef RASTERIZER_H
#define RASTERIZER_H

#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include "../config.hpp"

namespace floorplan {

/** Raised when the source bytes are not a decodable raster image. */
class DecodeError : public std::runtime_error
{
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

/** Working raster produced from the source image. */
struct RasterImage {
    cv::Mat4b rgba;       ///< R,G,B,A channel order, CV_8UC4
    double    scale{1.0}; ///< working / original size, in (0, 1]
    cv::Size  originalSize; ///< decoded size before downscaling
};

/**
 * @brief Decoding and downscaling of the source image.
 */
class Rasterizer {
public:
    /** Scale factor min(bound/w, bound/h, 1) for an image of the given size. */
    static double computeScale(const cv::Size& original, int maxDimension);

    /** round(original * scale) per axis, never below one pixel. */
    static cv::Size scaledSize(const cv::Size& original, double scale);

    /**
     * Decode an encoded image (PNG, JPEG, BMP, ...) into an RGBA working
     * raster bounded by config.maxDimension. JPEG EXIF orientation is
     * applied, 16-bit sources are reduced to 8 bit.
     * @throws DecodeError if @p bytes is empty or cannot be decoded.
     */
    static RasterImage rasterize(const std::vector<uchar>& bytes, const RasterConfig& config);

    /**
     * Convert a decoded 8-bit BGR image to RGBA (opaque alpha).
     * @throws DecodeError for any other matrix type.
     */
    static cv::Mat4b toRGBA(const cv::Mat& decoded);
};

} // namespace floorplan

#endif // RASTERIZER_H
