#ifndef REGIONTRACER_H
#define REGIONTRACER_H

#include <opencv2/core.hpp>
#include <vector>
#include "../config.hpp"

namespace floorplan {

/**
 * @brief Extraction of 8-connected edge regions from a binary mask.
 *
 * Each call owns its own visited arena; nothing is shared between calls.
 */
class RegionTracer {
public:
    /**
     * Scan @p edges in raster order and flood-fill every unvisited edge pixel
     * (value > 128) into a region.
     *
     * @param edges   CV_8UC1 edge mask.
     * @param config  minPoints: regions of this size or smaller are dropped;
     *                maxPoints: cap on the points collected per region.
     * @return        Point lists of the kept regions, in discovery order.
     */
    static std::vector<std::vector<cv::Point>> trace(const cv::Mat1b& edges,
                                                     const TraceConfig& config);

private:
    /**
     * Depth-first fill starting at @p seed. Stops collecting at
     * @p maxPoints but keeps consuming the component so that its remaining
     * pixels are marked in @p visited and never seed another region.
     */
    static std::vector<cv::Point> fillRegion(const cv::Mat1b& edges,
                                             cv::Mat1b& visited,
                                             cv::Point seed,
                                             int maxPoints);
};

} // namespace floorplan

#endif // REGIONTRACER_H
