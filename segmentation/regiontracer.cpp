#include "regiontracer.hpp"

namespace floorplan {

namespace {

constexpr uchar kEdgeLevel = 128;

inline bool isEdge(const cv::Mat1b& edges, int y, int x)
{
    return edges(y, x) > kEdgeLevel;
}

} // namespace

std::vector<cv::Point> RegionTracer::fillRegion(const cv::Mat1b& edges,
                                                cv::Mat1b& visited,
                                                cv::Point seed,
                                                int maxPoints)
{
    const int rows = edges.rows, cols = edges.cols;

    std::vector<cv::Point> region;
    std::vector<cv::Point> stack;
    stack.push_back(seed);

    while (!stack.empty())
    {
        const cv::Point p = stack.back();
        stack.pop_back();

        if (visited(p.y, p.x)) continue;
        visited(p.y, p.x) = 1;                       // edge or not, consumed once

        if (!isEdge(edges, p.y, p.x)) continue;

        if (static_cast<int>(region.size()) < maxPoints)
            region.push_back(p);

        for (int dy = -1; dy <= 1; ++dy)
            for (int dx = -1; dx <= 1; ++dx)
            {
                const int nx = p.x + dx, ny = p.y + dy;
                if (nx < 0 || nx >= cols || ny < 0 || ny >= rows) continue;
                if (!visited(ny, nx))
                    stack.emplace_back(nx, ny);
            }
    }
    return region;
}

std::vector<std::vector<cv::Point>> RegionTracer::trace(const cv::Mat1b& edges,
                                                        const TraceConfig& config)
{
    std::vector<std::vector<cv::Point>> regions;
    if (edges.empty())
        return regions;
    CV_Assert(edges.type() == CV_8UC1);

    cv::Mat1b visited = cv::Mat1b::zeros(edges.size());

    for (int y = 0; y < edges.rows; ++y)
    {
        for (int x = 0; x < edges.cols; ++x)
        {
            if (visited(y, x) || !isEdge(edges, y, x)) continue;

            auto region = fillRegion(edges, visited, cv::Point(x, y), config.maxPoints);
            if (static_cast<int>(region.size()) > config.minPoints)
                regions.push_back(std::move(region));
        }
    }
    return regions;
}

} // namespace floorplan
