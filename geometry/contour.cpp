/*-----------------------------------------------------------------------------
 *  contour.cpp
 *---------------------------------------------------------------------------*/
#include "contour.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace floorplan {

std::string toString(ElementType t)
{
    switch (t)
    {
        case ElementType::Wall:   return "wall";
        case ElementType::Door:   return "door";
        case ElementType::Window: return "window";
        case ElementType::Room:   return "room";
    }
    return "wall";
}

std::optional<ElementType> elementTypeFromString(const std::string& name)
{
    for (ElementType t : kElementTypes)
        if (toString(t) == name)
            return t;
    return std::nullopt;
}

double shoelaceArea(const std::vector<cv::Point>& points)
{
    if (points.size() < 3)
        return 0.0;

    /* coordinates are bounded by the working image, int64 is exact */
    std::int64_t twice = 0;
    const std::size_t n = points.size();
    for (std::size_t i = 0; i < n; ++i)
    {
        const cv::Point& a = points[i];
        const cv::Point& b = points[(i + 1) % n];
        twice += static_cast<std::int64_t>(a.x) * b.y;
        twice -= static_cast<std::int64_t>(b.x) * a.y;
    }
    return std::abs(static_cast<double>(twice)) / 2.0;
}

Bounds boundsOf(const std::vector<cv::Point>& points)
{
    if (points.empty())
        throw std::invalid_argument("boundsOf(): empty point list");

    Bounds b{points.front().x, points.front().y,
             points.front().x, points.front().y};
    for (const auto& p : points)
    {
        b.minX = std::min(b.minX, p.x);
        b.minY = std::min(b.minY, p.y);
        b.maxX = std::max(b.maxX, p.x);
        b.maxY = std::max(b.maxY, p.y);
    }
    return b;
}

} // namespace floorplan
