#include "floorplan_processing.hpp"

#include <utility>

#include "segmentation/edgedetector.hpp"
#include "segmentation/regiontracer.hpp"
#include "utils.hpp"

namespace floorplan {

const std::vector<Contour>& ProcessingResult::elements(ElementType t) const
{
    switch (t)
    {
        case ElementType::Wall:   return walls;
        case ElementType::Door:   return doors;
        case ElementType::Window: return windows;
        case ElementType::Room:   return rooms;
    }
    return walls;
}

std::vector<Contour>& ProcessingResult::elements(ElementType t)
{
    return const_cast<std::vector<Contour>&>(std::as_const(*this).elements(t));
}

std::size_t ProcessingResult::total() const noexcept
{
    return walls.size() + doors.size() + windows.size() + rooms.size();
}

ProcessingStats summarize(const ProcessingResult& result)
{
    ProcessingStats stats;
    for (ElementType t : kElementTypes)
    {
        auto& entry = stats.byType[static_cast<std::size_t>(t)];
        for (const auto& c : result.elements(t))
        {
            ++entry.count;
            entry.area += c.area;
        }
        stats.total += entry.count;
    }
    return stats;
}

/* ===== FloorPlanProcessor ================================================= */
FloorPlanProcessor::FloorPlanProcessor(PipelineConfig config)
    : config_{std::move(config)}
    , classifier_{config_.classifierConfig}
{
    validate(config_);
}

ProcessingResult FloorPlanProcessor::assemble(std::vector<std::vector<cv::Point>> regions,
                                              const cv::Size& imageSize,
                                              double scale) const
{
    ProcessingResult result;
    result.scale       = scale;
    result.imageWidth  = imageSize.width;
    result.imageHeight = imageSize.height;

    for (auto& points : regions)
    {
        if (points.empty()) continue;

        const double area   = shoelaceArea(points);
        const Bounds bounds = boundsOf(points);
        auto type = classifier_.classify(area, bounds, imageSize);
        if (!type) continue;                        // no category fits

        result.elements(*type).push_back(Contour{std::move(points), area, *type});
    }
    return result;
}

ProcessingRun FloorPlanProcessor::run(const std::vector<uchar>& imageBytes) const
{
    ProcessingRun out;

    /* 1. decode + bound the working size */
    out.raster = Rasterizer::rasterize(imageBytes, config_.rasterConfig);

    /* 2. gradient edges */
    out.edges = EdgeDetector::detect(out.raster.rgba, config_.edgeConfig);

    /* 3. connected regions */
    auto regions = RegionTracer::trace(out.edges, config_.traceConfig);

    /* 4-5. classify and pack */
    out.result = assemble(std::move(regions), out.raster.rgba.size(), out.raster.scale);
    return out;
}

ProcessingResult FloorPlanProcessor::processImage(const std::vector<uchar>& imageBytes) const
{
    return run(imageBytes).result;
}

ProcessingResult FloorPlanProcessor::processFile(const std::string& path) const
{
    std::vector<uchar> bytes;
    if (!readFileBytes(path, bytes))
        throw DecodeError("Could not read image file: " + path);
    return processImage(bytes);
}

std::future<ProcessingResult> FloorPlanProcessor::processImageAsync(std::vector<uchar> imageBytes) const
{
    // the task owns copies of the processor and the bytes
    return std::async(std::launch::async,
                      [self = *this, bytes = std::move(imageBytes)]() {
                          return self.processImage(bytes);
                      });
}

} // namespace floorplan
