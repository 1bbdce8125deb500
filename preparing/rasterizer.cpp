#include "rasterizer.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cmath>

namespace floorplan {

double Rasterizer::computeScale(const cv::Size& original, int maxDimension)
{
    CV_Assert(original.width > 0 && original.height > 0 && maxDimension > 0);
    const double bound = static_cast<double>(maxDimension);
    return std::min({bound / original.width, bound / original.height, 1.0});
}

cv::Size Rasterizer::scaledSize(const cv::Size& original, double scale)
{
    int w = static_cast<int>(std::lround(original.width  * scale));
    int h = static_cast<int>(std::lround(original.height * scale));
    return cv::Size(std::max(w, 1), std::max(h, 1));
}

cv::Mat4b Rasterizer::toRGBA(const cv::Mat& decoded)
{
    if (decoded.type() != CV_8UC3)
        throw DecodeError("Unexpected decoded image type: " + std::to_string(decoded.type()));

    cv::Mat rgba;
    cv::cvtColor(decoded, rgba, cv::COLOR_BGR2RGBA);
    return rgba;
}

RasterImage Rasterizer::rasterize(const std::vector<uchar>& bytes, const RasterConfig& config)
{
    if (bytes.empty())
        throw DecodeError("Could not decode image: empty buffer.");

    cv::Mat decoded;
    try {
        // 8-bit BGR with the EXIF orientation applied
        decoded = cv::imdecode(bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("Could not decode image: ") + e.what());
    }
    if (decoded.empty() || decoded.cols <= 0 || decoded.rows <= 0)
        throw DecodeError("Could not decode image from buffer.");

    RasterImage raster;
    raster.originalSize = decoded.size();
    raster.scale = computeScale(raster.originalSize, config.maxDimension);

    cv::Mat4b rgba = toRGBA(decoded);
    if (raster.scale < 1.0)
    {
        cv::Mat4b resized;
        cv::resize(rgba, resized, scaledSize(raster.originalSize, raster.scale),
                   0, 0, cv::INTER_AREA);
        raster.rgba = resized;
    }
    else
    {
        raster.rgba = rgba;
    }
    return raster;
}

} // namespace floorplan
