#ifndef FLOORPLAN_PROCESSING_HPP
#define FLOORPLAN_PROCESSING_HPP

#include <opencv2/core.hpp>
#include <array>
#include <cstddef>
#include <future>
#include <string>
#include <vector>

#include "config.hpp"
#include "geometry/contour.hpp"
#include "preparing/rasterizer.hpp"
#include "segmentation/elementclassifier.h"

namespace floorplan {

/**
 * @brief Classified elements of one floor plan image.
 *
 * Every contour is stored in exactly one category list, the one matching its
 * type tag. Lists keep the tracer's discovery order.
 */
struct ProcessingResult
{
    std::vector<Contour> walls;
    std::vector<Contour> doors;
    std::vector<Contour> windows;
    std::vector<Contour> rooms;
    double scale{1.0};   ///< working / original image size, in (0, 1]
    int    imageWidth{0};  ///< working image width  (px)
    int    imageHeight{0}; ///< working image height (px)

    /** Category list for @p t. */
    const std::vector<Contour>& elements(ElementType t) const;
    std::vector<Contour>&       elements(ElementType t);

    /** Number of contours over all categories. */
    std::size_t total() const noexcept;
};

/** Per-category summary of a result. */
struct ProcessingStats
{
    struct Entry
    {
        std::size_t count{0};
        double      area{0.0}; ///< summed contour area (px²)
    };

    std::array<Entry, 4> byType{}; ///< indexed in kElementTypes order
    std::size_t          total{0};

    const Entry& operator[](ElementType t) const { return byType[static_cast<std::size_t>(t)]; }
};

/** Result together with the intermediate rasters it was computed from. */
struct ProcessingRun
{
    RasterImage      raster; ///< working RGBA image and scale
    cv::Mat1b        edges;  ///< binary edge mask (255 = edge)
    ProcessingResult result;
};

/** Count and area per category. */
ProcessingStats summarize(const ProcessingResult& result);

/**
 * @brief Image-to-geometry pipeline: rasterize, detect edges, trace regions,
 *        classify and assemble.
 *
 * The processor only holds its configuration, so one instance may serve
 * concurrent calls.
 */
class FloorPlanProcessor
{
public:
    explicit FloorPlanProcessor(PipelineConfig config = {});

    /**
     * @brief Run the full pipeline on encoded image bytes.
     * @throws DecodeError if @p imageBytes is not a decodable raster image.
     */
    ProcessingResult processImage(const std::vector<uchar>& imageBytes) const;

    /** Same as processImage() but also returns the working image and edge mask. */
    ProcessingRun run(const std::vector<uchar>& imageBytes) const;

    /**
     * @brief Read @p path and process its contents.
     * @throws DecodeError if the file cannot be read or decoded.
     */
    ProcessingResult processFile(const std::string& path) const;

    /**
     * @brief Process on a worker thread. The future yields the result or
     *        rethrows the DecodeError; there is no cancellation.
     */
    std::future<ProcessingResult> processImageAsync(std::vector<uchar> imageBytes) const;

    /** Classify traced regions of a @p imageSize working image into a result. */
    ProcessingResult assemble(std::vector<std::vector<cv::Point>> regions,
                              const cv::Size& imageSize,
                              double scale) const;

    const PipelineConfig& config() const noexcept { return config_; }

private:
    PipelineConfig    config_;
    ElementClassifier classifier_;
};

} // namespace floorplan

#endif // FLOORPLAN_PROCESSING_HPP
